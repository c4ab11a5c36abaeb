#pragma once

#include <lifecycle-core/assert.hh>
#include <lifecycle-core/error.hh>
#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/resource.hh>
#include <lifecycle-core/shutdown.hh>
#include <lifecycle-core/unique_function.hh>
#include <lifecycle-core/utility.hh>

#include <exception>
#include <functional>
#include <memory>
#include <type_traits>

namespace lc
{
template <class T>
constexpr bool is_managed = false;
template <class T>
constexpr bool is_managed<managed<T>> = true;

namespace impl
{
// tears down r while failure is propagating and rethrows failure
// a teardown failure is attached to it as suppressed, never replacing it
template <class T>
[[noreturn]] void teardown_and_rethrow(lc::resource<T> const& r, std::exception_ptr failure)
{
    try
    {
        r.teardown();
    }
    catch (...)
    {
        std::rethrow_exception(lc::with_suppressed(lc::move(failure), std::current_exception()));
    }

    std::rethrow_exception(failure);
}

template <class Setup>
using setup_result_t = std::decay_t<std::invoke_result_t<Setup&>>;
} // namespace impl
} // namespace lc

/// A lazy, reusable recipe for setting up a resource<T> and later tearing it down
///
/// Nothing happens until build() (or use()) is called.
/// Every build() runs the setup again and produces an independent resource.
/// Copies of a managed share the same immutable recipe and are cheap.
///
/// Composition via flat_map nests resources: the composite resource owns the upstream and
/// the downstream resource and tears them down in reverse setup order, even when teardowns fail.
///
/// Usage:
///   auto config = lc::setup_only([] { return load_config(); });
///   auto server = config.flat_map([](config_t& c) {
///       return lc::make_managed([&] { return start_server(c.port); }, [](server_t& s) { s.stop(); });
///   });
///   server.use([](server_t& s) { s.serve_one(); });
///
/// Failures:
///   - a failing setup tears down everything set up before it, then propagates
///   - a failing teardown does not stop the remaining teardowns
///   - see <lifecycle-core/error.hh> for how simultaneous failures are combined
template <class T>
struct lc::managed
{
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>, "managed values must be objects, use lc::unit for none");

public:
    using value_type = T;
    using failure_handler = lc::unique_function<void(std::exception_ptr)>;

    // building
public:
    /// sets up this managed and every managed it was composed with
    /// the returned resource must be torn down exactly once by the caller
    [[nodiscard]] lc::resource<T> build() const
    {
        LC_ASSERT(is_valid(), "cannot build an empty lc::managed");
        return (*_recipe)();
    }

    [[nodiscard]] bool is_valid() const { return _recipe != nullptr; }

    // composition
public:
    /// composes a managed that depends on the value of this one
    /// f: T& -> managed<U>, called during build() of the result, once per build
    template <class F>
    [[nodiscard]] auto flat_map(F&& f) const
    {
        using M = std::remove_cvref_t<std::invoke_result_t<F&, T&>>;
        static_assert(lc::is_managed<M>, "flat_map requires a function returning an lc::managed");
        using U = typename M::value_type;

        return managed<U>::from_builder(
            [upstream = *this, f = lc::forward<F>(f)]() mutable -> lc::resource<U>
            {
                auto rt = upstream.build();

                auto ru = lc::resource<U>();
                try
                {
                    ru = std::invoke(f, rt.get()).build();
                }
                catch (...)
                {
                    lc::impl::teardown_and_rethrow(rt, std::current_exception());
                }

                return lc::resource<U>::chain(lc::move(rt), lc::move(ru));
            });
    }

    /// composes a managed whose value is f applied to the value of this one
    /// f: T& -> U, no additional teardown
    template <class F>
    [[nodiscard]] auto map(F&& f) const
    {
        using U = std::decay_t<std::invoke_result_t<F&, T&>>;
        static_assert(!std::is_void_v<U>, "map requires a function returning a value");

        return this->flat_map([f = lc::forward<F>(f)](T& t) mutable
                              { return managed<U>::from_resource(lc::resource<U>::constant(std::invoke(f, t))); });
    }

    // consumption
public:
    /// builds, passes the value to f and tears down before returning, also when f throws
    /// a failure of f stays primary, a teardown failure is attached to it as suppressed
    /// returns the result of f by value (auto), a reference into the value would dangle after teardown
    template <class F>
    auto use(F&& f) const
    {
        using R = std::remove_cvref_t<std::invoke_result_t<F&, T&>>;

        auto r = this->build();

        if constexpr (std::is_void_v<R>)
        {
            try
            {
                std::invoke(f, r.get());
            }
            catch (...)
            {
                lc::impl::teardown_and_rethrow(r, std::current_exception());
            }

            r.teardown();
        }
        else
        {
            R result = [&]() -> R
            {
                try
                {
                    return std::invoke(f, r.get());
                }
                catch (...)
                {
                    lc::impl::teardown_and_rethrow(r, std::current_exception());
                }
            }();

            r.teardown();
            return result;
        }
    }

    /// same as use, but for side effects only
    template <class F>
    void for_each(F&& f) const
    {
        this->use([&f](T& t) { std::invoke(f, t); });
    }

    /// builds and immediately tears down, for stacks that only exist for their side effects
    void run() const
        requires std::is_same_v<T, lc::unit>
    {
        this->use(lc::void_function{});
    }

    /// builds and registers the teardown as a shutdown hook (see <lifecycle-core/shutdown.hh>)
    ///
    /// on_setup_failure receives a failing build, on_teardown_failure a failing deferred teardown.
    /// Empty handlers rethrow. If setup fails and on_setup_failure does not rethrow,
    /// there is no resource and therefore no hook is registered.
    void use_until_shutdown(failure_handler on_setup_failure = {}, failure_handler on_teardown_failure = {}) const
    {
        auto r = lc::resource<T>();

        try
        {
            r = this->build();
        }
        catch (...)
        {
            if (!on_setup_failure)
                throw;

            on_setup_failure(std::current_exception());
        }

        if (!r.is_valid())
            return;

        lc::add_shutdown_hook(
            [r = lc::move(r), on_teardown_failure = lc::move(on_teardown_failure)]
            {
                try
                {
                    r.teardown();
                }
                catch (...)
                {
                    if (!on_teardown_failure)
                        throw;

                    on_teardown_failure(std::current_exception());
                }
            });
    }

    // factories
public:
    /// managed from an arbitrary build callable: () -> lc::resource<T>
    /// this is the extension point for adapting other resource abstractions
    template <class F>
    [[nodiscard]] static managed from_builder(F&& build)
    {
        static_assert(std::is_invocable_r_v<lc::resource<T>, F&>, "builder must return lc::resource<T>");

        managed m;
        m._recipe = std::make_shared<lc::unique_function<lc::resource<T>()>>(lc::forward<F>(build));
        return m;
    }

    /// managed whose build returns the given resource itself, every time
    [[nodiscard]] static managed from_resource(lc::resource<T> r)
    {
        LC_ASSERT(r.is_valid(), "cannot create lc::managed from an empty lc::resource");
        return from_builder([r = lc::move(r)] { return r; });
    }

    // ctors
public:
    managed() = default;

private:
    std::shared_ptr<lc::unique_function<lc::resource<T>()> const> _recipe;
};

// =========================================================================================================
// Leaf factories
// =========================================================================================================

namespace lc
{
/// managed that hands out the given resource on every build
template <class T>
[[nodiscard]] managed<T> singleton(resource<T> r)
{
    return managed<T>::from_resource(lc::move(r));
}

/// managed of a value that needs neither setup nor teardown
/// all builds share the same value
template <class T>
[[nodiscard]] managed<std::decay_t<T>> constant(T&& value)
{
    using V = std::decay_t<T>;
    return managed<V>::from_resource(resource<V>::constant(lc::forward<T>(value)));
}

/// managed with setup and teardown
/// setup: () -> T, runs on every build
/// teardown: T& -> void, runs when the built resource is torn down
/// Usage:
///   auto file = lc::make_managed([] { return std::fopen("log.txt", "w"); }, [](std::FILE*& f) { std::fclose(f); });
template <class Setup, class Teardown>
[[nodiscard]] auto make_managed(Setup&& setup, Teardown&& teardown)
{
    static_assert(std::is_invocable_v<Setup&>, "setup must be callable without arguments");
    static_assert(!std::is_void_v<std::invoke_result_t<Setup&>>, "setup must return a value, use lc::eval for side "
                                                                 "effects");
    using T = impl::setup_result_t<Setup>;
    static_assert(std::is_invocable_v<std::decay_t<Teardown>&, T&>, "teardown must be callable with T&");

    // shared by all resources built from this managed, so move-only teardowns work
    auto release = std::make_shared<std::decay_t<Teardown>>(lc::forward<Teardown>(teardown));

    return managed<T>::from_builder(
        [setup = lc::forward<Setup>(setup), release = lc::move(release)]() mutable
        { return resource<T>::create(std::invoke(setup), [release](T& value) { std::invoke(*release, value); }); });
}

/// managed with setup only, teardown does nothing
template <class Setup>
[[nodiscard]] auto setup_only(Setup&& setup)
{
    return lc::make_managed(lc::forward<Setup>(setup), lc::void_function{});
}

/// managed<unit> running side effects on setup and on teardown
/// e.g. to mark a service ready once everything before it is up, and unready before it goes down
template <class SetupRun, class TeardownRun>
[[nodiscard]] managed<unit> eval(SetupRun&& setup_run, TeardownRun&& teardown_run)
{
    static_assert(std::is_invocable_v<std::decay_t<SetupRun>&>, "setup_run must be callable without arguments");
    static_assert(std::is_invocable_v<std::decay_t<TeardownRun>&>, "teardown_run must be callable without arguments");

    return lc::make_managed(
        [run = lc::forward<SetupRun>(setup_run)]() mutable
        {
            std::invoke(run);
            return unit{};
        },
        [run = lc::forward<TeardownRun>(teardown_run)](unit&) mutable { std::invoke(run); });
}

/// managed<unit> running a side effect on setup only
template <class SetupRun>
[[nodiscard]] managed<unit> eval_setup(SetupRun&& run)
{
    return lc::eval(lc::forward<SetupRun>(run), lc::void_function{});
}

/// managed<unit> running a side effect on teardown only
template <class TeardownRun>
[[nodiscard]] managed<unit> eval_teardown(TeardownRun&& run)
{
    return lc::eval(lc::void_function{}, lc::forward<TeardownRun>(run));
}
} // namespace lc
