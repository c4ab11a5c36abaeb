#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/managed.hh>
#include <lifecycle-core/utility.hh>

#include <memory>
#include <type_traits>

namespace lc
{
/// Folds a collection of managed values into one managed of the collection of their values
///
/// The container template is kept: std::vector<managed<A>> becomes managed<std::vector<A>>,
/// std::list<managed<A>> becomes managed<std::list<A>> and so on.
/// The elements are chained in iteration order, so they are set up in that order and torn
/// down in reverse, with the failure rules of managed<T>::flat_map.
/// The values are copied into the result, the resources keep their own values for teardown.
///
/// Usage:
///   auto workers = std::vector<lc::managed<worker*>>{make_worker(0), make_worker(1)};
///   lc::sequence(workers).use([](std::vector<worker*>& ws) { ... });
template <template <class...> class C, class A, class... Rest>
[[nodiscard]] managed<C<A>> sequence(C<managed<A>, Rest...> const& in)
{
    static_assert(std::is_copy_constructible_v<A>, "sequence copies the values into the result collection");

    using collection_t = C<A>;
    using accumulator_t = std::shared_ptr<collection_t>;

    // every build collects into its own fresh collection
    auto acc = managed<accumulator_t>::from_builder(
        [] { return resource<accumulator_t>::constant(std::make_shared<collection_t>()); });

    for (auto const& ma : in)
    {
        acc = acc.flat_map(
            [ma](accumulator_t& out)
            {
                return ma.map(
                    [out](A& value)
                    {
                        if constexpr (requires { out->push_back(value); })
                            out->push_back(value);
                        else
                            out->insert(out->end(), value);
                        return out;
                    });
            });
    }

    return acc.map([](accumulator_t& out) { return lc::move(*out); });
}
} // namespace lc
