#include "assert.hh"

#include <lifecycle-core/assert-handler.hh>
#include <lifecycle-core/mutex.hh>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#ifdef LC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef LC_OS_LINUX
#include <fstream>
#include <string>
#endif

namespace
{
// shared_ptr so the innermost handler can be called after the lock is released
// and still survive a pop from inside the handler
using handler_stack = std::vector<std::shared_ptr<lc::impl::assertion_handler>>;

lc::mutex<handler_stack>& handlers()
{
    static lc::mutex<handler_stack> stack;
    return stack;
}

void print_contract_violation(lc::impl::assertion_info const& info)
{
    std::cerr << "lifecycle-core contract violated: " << info.message << '\n'
              << "  check: " << info.expression << '\n'
              << "  at " << info.location.file_name() << ':' << info.location.line() << " in "
              << info.location.function_name() << '\n';
}
} // namespace

void lc::impl::throw_contract_violation(assertion_info const& info)
{
    throw contract_violation(info);
}

void lc::impl::push_assertion_handler(assertion_handler handler)
{
    auto h = std::make_shared<assertion_handler>(std::move(handler));
    handlers().lock([&](handler_stack& s) { s.push_back(std::move(h)); });
}

void lc::impl::pop_assertion_handler()
{
    handlers().lock(
        [](handler_stack& s)
        {
            if (!s.empty())
                s.pop_back();
        });
}

LC_COLD_FUNC void lc::impl::report_contract_violation(char const* expression, char const* message, lc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto const top = handlers().lock(
        [](handler_stack const& s) -> std::shared_ptr<assertion_handler> { return s.empty() ? nullptr : s.back(); });

    if (top != nullptr && *top)
        (*top)(info);
    else
        print_contract_violation(info);
}

bool lc::impl::is_debugger_connected() noexcept
{
#ifdef LC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(LC_OS_LINUX)
    // a traced process has a non-zero "TracerPid:" line
    std::ifstream status("/proc/self/status");
    std::string key;
    while (status >> key)
    {
        if (key == "TracerPid:")
        {
            long pid = 0;
            status >> pid;
            return pid != 0;
        }
        status.ignore(4096, '\n');
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void lc::impl::perform_abort() noexcept
{
    std::cerr.flush();
    std::abort();
}
