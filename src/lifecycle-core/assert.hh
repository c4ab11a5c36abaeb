#pragma once

// Lean header with minimal dependencies, included by every lifecycle-core header that checks contracts.
#include <lifecycle-core/macros.hh>
#include <lifecycle-core/source_location.hh>

// =========================================================================================================
// Lifecycle contract checks
// =========================================================================================================
//
// Two channels report problems in lifecycle-core:
//   - exceptions (<lifecycle-core/error.hh>) for setup, teardown and usage failures of user code,
//     they always reach the caller of build, teardown or use
//   - LC_ASSERT for a caller breaking the lifecycle contract itself:
//       tearing down a built resource twice
//       reaching into an empty resource, managed or unique_function
//       registering an empty shutdown hook
//
// A violated contract is reported to the handler stack (<lifecycle-core/assert-handler.hh>),
// then breaks into an attached debugger and aborts.
//
// LC_ASSERT is compiled out in LC_RELEASE builds unless LC_ENABLE_ASSERT_IN_RELEASE is set,
// the condition then stays type-checked but is never evaluated.
// LC_ASSERT_ALWAYS checks in every configuration.
//
// Usage:
//   LC_ASSERT(_node != nullptr, "cannot access an empty lc::resource");
//

#define LC_ASSERT_ALWAYS(cond, msg)                                                                 \
    do                                                                                              \
    {                                                                                               \
        if (!(cond)) [[unlikely]]                                                                   \
        {                                                                                           \
            ::lc::impl::report_contract_violation(#cond, msg, ::lc::source_location::current());    \
            LC_IMPL_DEBUG_BREAK();                                                                  \
            ::lc::impl::perform_abort();                                                            \
        }                                                                                           \
    } while (false)

#if LC_ASSERT_ENABLED
#define LC_ASSERT(cond, msg) LC_ASSERT_ALWAYS(cond, msg)
#else
#define LC_ASSERT(cond, msg) \
    do                       \
    {                        \
        LC_UNUSED(cond);     \
        LC_UNUSED(msg);      \
    } while (false)
#endif

namespace lc::impl
{
/// hands the violation to the innermost assertion handler, or prints it to stderr
/// returns normally unless the handler throws, the caller aborts afterwards
LC_COLD_FUNC void report_contract_violation(char const* expression, char const* message, lc::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace lc::impl

// breaks at the failed check itself, so this has to stay a macro
#ifdef LC_COMPILER_MSVC
// __debugbreak() kills the process when no debugger listens
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? __debugbreak() : void(0))
#else
// SIGTRAP is 5, declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define LC_IMPL_DEBUG_BREAK() (::lc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#endif
