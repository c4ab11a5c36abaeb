#pragma once

#include <lifecycle-core/fwd.hh>
#include <lifecycle-core/managed.hh>
#include <lifecycle-core/utility.hh>

#include <type_traits>

// =========================================================================================================
// Default teardown capability
// =========================================================================================================
//
// lc::from(setup) builds a managed whose teardown is looked up statically via lc::teardown_traits<T>.
//
// Provided out of the box:
//   - types with a close() member:                     value.close()
//   - pointer-like types to such types (T*, unique_ptr): value->close(), skipped for null
//
// Custom types specialize the traits:
//
//   template <>
//   struct lc::teardown_traits<my_service>
//   {
//       static void teardown(my_service& s) { s.shutdown(); }
//   };
//
//   auto service = lc::from([] { return my_service(); });
//
// Note: a specialization applies to exactly that type, not to types derived from it.
//

namespace lc
{
template <class T>
concept closeable = requires(T& value) { value.close(); };

template <class T>
concept pointer_to_closeable = requires(T& value) {
    value->close();
    static_cast<bool>(value);
};
} // namespace lc

template <class T>
struct lc::teardown_traits
{
    static void teardown(T& value)
        requires lc::closeable<T> || lc::pointer_to_closeable<T>
    {
        if constexpr (lc::closeable<T>)
            value.close();
        else if (static_cast<bool>(value))
            value->close();
    }
};

namespace lc
{
/// true if lc::teardown_traits<T> knows how to tear down a T
template <class T>
concept has_teardown = requires(T& value) { lc::teardown_traits<T>::teardown(value); };

/// managed with setup and a teardown looked up via lc::teardown_traits
/// setup: () -> T, runs on every build
template <class Setup>
[[nodiscard]] auto from(Setup&& setup)
{
    using T = impl::setup_result_t<Setup>;
    static_assert(lc::has_teardown<T>, "T has no close() member and no lc::teardown_traits<T> specialization");

    return lc::make_managed(lc::forward<Setup>(setup), [](T& value) { lc::teardown_traits<T>::teardown(value); });
}
} // namespace lc
