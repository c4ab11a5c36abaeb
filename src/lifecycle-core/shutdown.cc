#include "shutdown.hh"

#include <lifecycle-core/error.hh>
#include <lifecycle-core/macros.hh>
#include <lifecycle-core/mutex.hh>
#include <lifecycle-core/utility.hh>

#include <cstdlib>
#include <deque>
#include <exception>
#include <iostream>

#ifdef LC_OS_POSIX
#include <pthread.h>
#include <signal.h>
#else
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#endif

namespace
{
struct hook_state
{
    std::deque<lc::shutdown_hook> hooks;
    bool is_exit_handler_installed = false;
};

lc::mutex<hook_state>& registry()
{
    static lc::mutex<hook_state> r;
    return r;
}

// there is nobody left to rethrow to at exit, so failures are reported on stderr
void run_hooks_at_exit()
{
    try
    {
        lc::run_shutdown_hooks();
    }
    catch (lc::error const& e)
    {
        std::cerr << "shutdown hook failed during process exit\n" << e.to_string();
    }
    catch (...)
    {
        std::cerr << "shutdown hook failed during process exit\nerror: " << lc::describe(std::current_exception()) << '\n';
    }
}

#ifndef LC_OS_POSIX
std::atomic<int> g_received_signal = 0;

void record_termination_signal(int sig)
{
    g_received_signal = sig;
}
#endif
} // namespace

void lc::add_shutdown_hook(shutdown_hook hook)
{
    LC_ASSERT(hook.is_valid(), "cannot register an empty shutdown hook");

    registry().lock(
        [&](hook_state& state)
        {
            if (!state.is_exit_handler_installed)
            {
                if (std::atexit(run_hooks_at_exit) != 0)
                    throw lc::error("could not register the shutdown hooks to run at process exit");
                state.is_exit_handler_installed = true;
            }

            state.hooks.push_back(lc::move(hook));
        });
}

void lc::run_shutdown_hooks()
{
    std::exception_ptr failure;

    while (true)
    {
        // the lock is only held while taking the next hook, so hooks may register further hooks
        auto hook = registry().lock(
            [](hook_state& state)
            {
                auto next = shutdown_hook();
                if (!state.hooks.empty())
                {
                    next = lc::move(state.hooks.front());
                    state.hooks.pop_front();
                }
                return next;
            });

        if (!hook.is_valid())
            break;

        try
        {
            hook();
        }
        catch (...)
        {
            if (failure)
                failure = lc::with_suppressed(lc::move(failure), std::current_exception());
            else
                failure = std::current_exception();
        }
    }

    if (failure)
        std::rethrow_exception(failure);
}

size_t lc::pending_shutdown_hook_count()
{
    return registry().lock([](hook_state const& state) { return state.hooks.size(); });
}

int lc::wait_for_termination_signal()
{
#ifdef LC_OS_POSIX
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);

    if (auto const res = pthread_sigmask(SIG_BLOCK, &signals, nullptr); res != 0)
        throw lc::error("could not block SIGINT and SIGTERM (pthread_sigmask returned " + std::to_string(res) + ")");

    int sig = 0;
    if (auto const res = sigwait(&signals, &sig); res != 0)
        throw lc::error("waiting for SIGINT or SIGTERM failed (sigwait returned " + std::to_string(res) + ")");

    return sig;
#else
    g_received_signal = 0;
    std::signal(SIGINT, record_termination_signal);
    std::signal(SIGTERM, record_termination_signal);

    while (g_received_signal == 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

    return g_received_signal;
#endif
}
