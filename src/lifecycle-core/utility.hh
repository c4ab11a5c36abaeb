#pragma once

#include <lifecycle-core/assert.hh>
#include <lifecycle-core/fwd.hh>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Callable utilities:
//   void_function               - callable that returns void for any arguments
//
// Template metaprogramming:
//   function_ptr<Signature>     - convert function signature to function pointer type
//

namespace lc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto r = lc::move(other_resource);
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] LC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto node = lc::exchange(_node, nullptr);     // take ownership, leave empty
template <class T, class U = T>
[[nodiscard]] LC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns void for all possible arguments
/// Used as the no-op teardown of constant resources and setup-only links
/// Usage:
///   lc::void_function{}();           // returns void
///   lc::void_function{}(value);      // ignores value
struct void_function
{
    template <class... Args>
    constexpr void operator()(Args&&...) const noexcept
    {
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

namespace impl
{
// only defined for function signatures
template <class T>
struct function_ptr_t;
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   lc::function_ptr<void(void*)>          -> void (*)(void*)
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;
} // namespace lc
