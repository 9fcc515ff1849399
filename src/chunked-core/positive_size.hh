#pragma once

#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>

namespace ck::impl
{
// intentionally not constexpr: reaching this during constant evaluation is the compile error
void size_must_be_positive();
} // namespace ck::impl

/// A size that is known to be > 0.
///
/// Constant arguments are checked at compile time, so a non-positive literal never compiles:
///   ck::chunked_vector<int> v(16);  // ok
///   ck::chunked_vector<int> v(0);   // error: not a constant expression
///
/// Runtime values must be checked explicitly (always-on assertion):
///   ck::chunked_vector<int> v(ck::positive_size::from_runtime(n));
struct ck::positive_size
{
    consteval positive_size(isize value) : _value(value) // NOLINT
    {
        if (value <= 0)
            impl::size_must_be_positive();
    }

    /// Precondition: value > 0 (checked in every build configuration).
    [[nodiscard]] static positive_size from_runtime(isize value)
    {
        CK_ASSERT_ALWAYS(value > 0, "size must be positive");
        return positive_size(value, checked_tag{});
    }

    [[nodiscard]] constexpr isize value() const { return _value; }

private:
    struct checked_tag
    {
    };
    constexpr positive_size(isize value, checked_tag) : _value(value) {}

    isize _value;
};
