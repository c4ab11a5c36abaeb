#pragma once

#include <lifecycle-core/macros.hh>
#include <lifecycle-core/source_location.hh>

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

// =========================================================================================================
// Reacting to lifecycle contract violations
// =========================================================================================================
//
// A failed LC_ASSERT is reported to the innermost installed handler, or printed to stderr if there is none.
// The process aborts afterwards unless the handler throws.
//
// Throwing is how tests and embedding applications observe a violation instead of dying:
//
//   auto guard = lc::impl::scoped_assertion_handler(lc::impl::throw_contract_violation);
//   r.teardown();
//   r.teardown(); // throws lc::impl::contract_violation("resource was already torn down")
//
// Handlers may be installed and triggered from any thread.
// A handler runs outside of the registry lock, so it may itself install handlers or trip assertions.
//

namespace lc::impl
{
struct assertion_info
{
    std::string expression;
    std::string message;
    lc::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

/// thrown by throw_contract_violation, what() is the assertion message
struct contract_violation : std::logic_error
{
    assertion_info info;

    explicit contract_violation(assertion_info i) : std::logic_error(i.message), info(std::move(i)) {}
};

/// handler that turns every failed assertion into a contract_violation
[[noreturn]] void throw_contract_violation(assertion_info const& info);

/// handlers form a stack, the most recently pushed one receives the failures
/// every push must be matched by a pop, prefer scoped_assertion_handler
void push_assertion_handler(assertion_handler handler);
void pop_assertion_handler();

struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler) { push_assertion_handler(std::move(handler)); }
    ~scoped_assertion_handler() { pop_assertion_handler(); }

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
};
} // namespace lc::impl
