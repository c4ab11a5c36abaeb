#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/unique_function.hh>

#include <cstddef>

// =========================================================================================================
// Process-wide shutdown hooks
// =========================================================================================================
//
// Used by lc::managed<T>::use_until_shutdown for programs that run until they are asked to stop:
//
//   int main()
//   {
//       make_server_stack().use_until_shutdown();
//       lc::wait_for_termination_signal();
//   } // hooks run at exit
//
// Hooks run exactly once, in registration order, when run_shutdown_hooks() is called.
// That happens automatically at normal process exit (std::atexit, installed with the first hook).
// The registry is internally synchronized; hooks may be added from any thread.
//

namespace lc
{
using shutdown_hook = lc::unique_function<void()>;

/// registers a hook to run once at shutdown
void add_shutdown_hook(shutdown_hook hook);

/// runs all pending hooks in registration order and removes them
/// hooks added while this runs are run as well
/// every hook runs even if an earlier one throws, the first failure propagates afterwards
/// with later failures attached as suppressed (see lc::with_suppressed)
void run_shutdown_hooks();

/// number of hooks that are registered and did not run yet
[[nodiscard]] size_t pending_shutdown_hook_count();

/// blocks the calling thread until the process receives SIGINT or SIGTERM and returns the signal number
/// the signals are blocked for the calling thread while waiting, call it from the main thread
/// before other threads are started so they inherit the blocked mask
/// does not run the hooks itself, they run when the process exits normally afterwards
int wait_for_termination_signal();
} // namespace lc
