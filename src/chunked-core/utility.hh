#pragma once

#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>

#include <cstddef>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - larger of two values (requires operator<)
//
// Integer division:
//   int_div_round_up(nom, denom) - divide integers and round up (both > 0)
//
// Swapping:
//   swap(a, b)                  - swap values, respects ADL swap overloads
//
// Alignment:
//   is_power_of_two(value)      - check if value is a power of 2
//   align_up(value, alignment)  - increment to next aligned boundary (power of 2)
//
// Object storage:
//   placement_new               - tag for our own placement new (no <new> ambiguity with user overloads)
//   storage_for<T>              - uninitialized storage with size and alignment of T
//
// Callables:
//   invoke_with_optional_idx(idx, f, args...) - calls f(idx, args...) if possible, otherwise f(args...)
//
// Iterators:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace ck
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] CK_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] CK_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] CK_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto p = ck::exchange(rhs._obj_start, nullptr); // steal a pointer
template <class T, class U = T>
[[nodiscard]] CK_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Integer division
// =========================================================================================================

/// Divide integers and round up: ceil(nom / denom)
/// Precondition: nom > 0 && denom > 0
/// Usage:
///   // ck::int_div_round_up(7, 5) == 2
///   // ck::int_div_round_up(10, 5) == 2
template <class T>
[[nodiscard]] constexpr T int_div_round_up(T nom, T denom)
{
    CK_ASSERT(nom > 0 && denom > 0, "int_div_round_up: both nom and denom must be positive");
    return 1 + ((nom - 1) / denom);
}

// =========================================================================================================
// Swapping
// =========================================================================================================

namespace impl
{
struct swap_fn
{
    template <class T>
    constexpr void operator()(T& a, T& b) const;
};
} // namespace impl

/// ADL-aware swap that respects custom swap overloads
/// A function object (not a function) so it is never found by ADL itself,
/// which lets the implementation call unqualified swap(a, b) without recursing.
/// Falls back to a move-based swap.
[[maybe_unused]] constexpr impl::swap_fn swap;

// =========================================================================================================
// Alignment
// =========================================================================================================

/// Check if a positive value is a power of two
/// Precondition: value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    CK_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to the next multiple of alignment
/// Usage:
///   // ck::align_up(300, 16) == 304
///   // ck::align_up(304, 16) == 304
/// Precondition: alignment > 0 and a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    CK_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return (T)(((isize)value + (alignment - 1)) & ~(alignment - 1));
}

// =========================================================================================================
// Object storage
// =========================================================================================================

struct placement_new_tag
{
};

/// Tag for ck's placement new overload
/// Usage:
///   new (ck::placement_new, ptr) T(args...);
constexpr placement_new_tag placement_new = {};

/// Uninitialized storage for exactly one T
/// The member is never constructed or destroyed automatically,
/// the owner manages its lifetime via placement new and explicit destructor calls.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for() {}

    storage_for(storage_for const&) = default;
    storage_for& operator=(storage_for const&) = default;
};

// =========================================================================================================
// Callables
// =========================================================================================================

/// Calls f(idx, args...) if f accepts a leading index, otherwise f(args...)
/// Lets iteration callbacks decide whether they want the element index.
/// Usage:
///   ck::invoke_with_optional_idx(i, [](int& v) { ... }, elem);
///   ck::invoke_with_optional_idx(i, [](isize i, int& v) { ... }, elem);
template <class F, class... Args>
constexpr decltype(auto) invoke_with_optional_idx(isize idx, F&& f, Args&&... args)
{
    if constexpr (std::is_invocable_v<F&&, isize, Args&&...>)
        return ck::forward<F>(f)(idx, ck::forward<Args>(args)...);
    else
    {
        static_assert(std::is_invocable_v<F&&, Args&&...>, "callable must accept (elem...) or (isize, elem...)");
        return ck::forward<F>(f)(ck::forward<Args>(args)...);
    }
}

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Used as a lightweight alternative to a full iterator for range end
/// Usage:
///   struct my_range {
///       my_iterator begin() { return ...; }
///       ck::sentinel end() const { return {}; }
///   };
struct sentinel
{
};

} // namespace ck

// placement new overload with our own tag type
// cannot collide with user-provided global placement overloads for void*
[[nodiscard]] CK_FORCE_INLINE void* operator new(std::size_t, ck::placement_new_tag, void* ptr) noexcept
{
    return ptr;
}
// matching delete, only called by the compiler if a constructor throws
CK_FORCE_INLINE void operator delete(void*, ck::placement_new_tag, void*) noexcept {}

// =========================================================================================================
// Implementation
// =========================================================================================================

// must be done outside of the ck namespace so ck::swap cannot be found anymore
namespace _no_ck_namespace // NOLINT
{
template <class T>
constexpr void do_swap_impl(T& a, T& b)
{
    if constexpr (requires { swap(a, b); })
    {
        swap(a, b);
    }
    else
    {
        T tmp = static_cast<T&&>(a);
        a = static_cast<T&&>(b);
        b = static_cast<T&&>(tmp);
    }
}
} // namespace _no_ck_namespace

template <class T>
constexpr void ck::impl::swap_fn::operator()(T& a, T& b) const
{
    _no_ck_namespace::do_swap_impl(a, b);
}
