#pragma once

#include <lifecycle-core/assert.hh>
#include <lifecycle-core/error.hh>
#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/unique_function.hh>
#include <lifecycle-core/utility.hh>

#include <exception>
#include <memory>
#include <type_traits>

/// The value produced by links that exist only for their side effects (lc::eval and friends)
struct lc::unit
{
    friend bool operator==(unit, unit) = default;
};

namespace lc::impl
{
template <class T>
struct resource_node
{
    virtual ~resource_node() = default;

    virtual T& get() = 0;
    virtual void teardown() = 0;
};

// a setup-produced value and the action that releases it
template <class T>
struct value_resource_node final : resource_node<T>
{
    T value;
    lc::unique_function<void(T&)> release;
    bool is_torn_down = false;

    value_resource_node(T v, lc::unique_function<void(T&)> r) : value(lc::move(v)), release(lc::move(r)) {}

    T& get() override { return value; }

    void teardown() override
    {
        LC_ASSERT(!is_torn_down, "resource was already torn down");
        // counts as torn down even if release throws, there is no second attempt
        is_torn_down = true;
        release(value);
    }
};

// a value without teardown, may be torn down any number of times
template <class T>
struct constant_resource_node final : resource_node<T>
{
    T value;

    explicit constant_resource_node(T v) : value(lc::move(v)) {}

    T& get() override { return value; }
    void teardown() override {}
};

// upstream was built first and is released last
// the downstream value is the value of the whole link
template <class T, class U>
struct chained_resource_node final : resource_node<U>
{
    lc::resource<T> upstream;
    lc::resource<U> downstream;
    bool is_torn_down = false;

    chained_resource_node(lc::resource<T> up, lc::resource<U> down) : upstream(lc::move(up)), downstream(lc::move(down))
    {
    }

    U& get() override { return downstream.get(); }

    // both links are always torn down
    // a single failure propagates untouched, two failures become a teardown_double_error(downstream, upstream)
    void teardown() override
    {
        LC_ASSERT(!is_torn_down, "resource was already torn down");
        is_torn_down = true;

        try
        {
            downstream.teardown();
        }
        catch (...)
        {
            auto outer = std::current_exception();

            try
            {
                upstream.teardown();
            }
            catch (...)
            {
                throw lc::teardown_double_error(lc::move(outer), std::current_exception());
            }

            std::rethrow_exception(outer);
        }

        upstream.teardown();
    }
};
} // namespace lc::impl

/// A live value of type T together with the one-shot action that releases it
///
/// resources are usually obtained from lc::managed<T>::build() or lc::managed<T>::use()
/// and rarely created directly.
///
/// A resource is a handle: copies refer to the same value and the same teardown action.
/// This is what allows lc::singleton to hand out the same resource on every build.
///
/// Contract:
///   - get() may be called any number of times and has no side effect
///   - teardown() must be called exactly once per built resource (checked by LC_ASSERT)
///   - teardown() may throw, the resource counts as torn down afterwards anyway
///
/// Usage:
///   auto r = lc::resource<int>::create(open_fd(), [](int& fd) { close_fd(fd); });
///   read_from(r.get());
///   r.teardown();
template <class T>
struct lc::resource
{
    static_assert(!std::is_reference_v<T>, "lc::resource cannot hold references, use pointers or std::reference_wrapper");
    static_assert(!std::is_void_v<T>, "use lc::resource<lc::unit> for resources without a value");

public:
    using value_type = T;

    // access
public:
    [[nodiscard]] T& get() const
    {
        LC_ASSERT(is_valid(), "cannot access an empty lc::resource");
        return _node->get();
    }

    void teardown() const
    {
        LC_ASSERT(is_valid(), "cannot tear down an empty lc::resource");
        _node->teardown();
    }

    [[nodiscard]] bool is_valid() const { return _node != nullptr; }
    explicit operator bool() const { return _node != nullptr; }

    // factories
public:
    /// resource whose teardown does nothing
    [[nodiscard]] static resource constant(T value)
    {
        return resource(std::make_shared<impl::constant_resource_node<T>>(lc::move(value)));
    }

    /// resource that calls release(value) on teardown
    template <class F>
    [[nodiscard]] static resource create(T value, F&& release)
    {
        static_assert(std::is_invocable_v<F&, T&>, "release must be callable with T&");
        return resource(std::make_shared<impl::value_resource_node<T>>(lc::move(value), lc::forward<F>(release)));
    }

    /// resource owning an upstream resource and this downstream one
    /// value of the downstream, teardown releases downstream first and upstream second
    template <class UpstreamT>
    [[nodiscard]] static resource chain(lc::resource<UpstreamT> upstream, resource downstream)
    {
        return resource(
            std::make_shared<impl::chained_resource_node<UpstreamT, T>>(lc::move(upstream), lc::move(downstream)));
    }

    // ctors
public:
    resource() = default;

private:
    explicit resource(std::shared_ptr<impl::resource_node<T>> node) : _node(lc::move(node)) {}

    std::shared_ptr<impl::resource_node<T>> _node;
};
