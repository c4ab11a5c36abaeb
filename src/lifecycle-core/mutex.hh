#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/utility.hh>

#include <functional>
#include <mutex>

/// Data of type T that can only be reached while holding its mutex
/// Used for the process-wide registries of lifecycle-core (shutdown hooks, assertion handlers)
/// Usage:
///   lc::mutex<std::deque<hook>> hooks;
///   hooks.lock([&](std::deque<hook>& h) { h.push_back(lc::move(new_hook)); });
///   auto const n = hooks.lock([](std::deque<hook> const& h) { return h.size(); });
template <class T>
struct lc::mutex
{
    /// invokes f with the protected value while the mutex is held
    /// returns by value (auto) so no reference to the protected value escapes the lock
    /// f must not lock the same mutex again
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return std::invoke(lc::forward<F>(f), _value);
    }

    mutex() = default;

    template <class... Args>
    explicit mutex(Args&&... args) : _value(lc::forward<Args>(args)...)
    {
    }

    mutex(mutex const&) = delete;
    mutex& operator=(mutex const&) = delete;

private:
    T _value;
    std::mutex _mutex;
};
