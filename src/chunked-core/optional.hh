#pragma once

#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>
#include <chunked-core/utility.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as ck::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct ck::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ck
{
/// The canonical instance of nullopt_t.
/// Usage: optional<int> opt = nullopt; or if (opt == nullopt).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ck

/// Sum type representing either a value of type T or no value, similar to std::optional.
/// Safer subset of std::optional: no operator* or operator->, access goes through value().
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
///
/// This is the result type of "defensive" container operations (e.g. chunked_vector::pop_back),
/// where an absent value is an expected outcome and not a contract violation.
template <class T>
struct ck::optional
{
    static_assert(!std::is_reference_v<T>, "reference optionals use the optional<T&> specialization");

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (ck::placement_new, &_storage.value) T(ck::forward<U>(value));
    }

    /// Constructs an empty optional from ck::nullopt.
    optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Move constructor: afterwards rhs.has_value() == false.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (ck::placement_new, &_storage.value) T(ck::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ck::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Move assignment: afterwards rhs.has_value() == false.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this == &rhs)
            return *this;

        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = ck::move(rhs._storage.value);
            else
                new (ck::placement_new, &_storage.value) T(ck::move(rhs._storage.value));

            _has_value = true;
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (ck::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// Returns the held value, preserving the value category of the optional itself.
    /// Precondition: has_value() == true.
    [[nodiscard]] T& value() &
    {
        CK_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        CK_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        CK_ASSERT(_has_value, "attempted to access value of empty optional");
        return ck::move(_storage.value);
    }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    /// Deleted when T is not bool so optional<int> never compares against true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    ck::storage_for<T> _storage;
    bool _has_value = false;
};

namespace ck
{
/// Nullable, rebindable reference: either refers to a T or to nothing.
/// Returned by accessors that may legitimately find nothing, e.g. chunked_vector::get(i).
/// Never owns the referee; the usual reference lifetime rules apply.
/// optional<T&> converts to optional<T const&>.
template <class T>
struct optional<T&>
{
    // construction
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U>
        requires std::is_convertible_v<U*, T*>
    constexpr optional(U& value) : _ptr(&value) // NOLINT
    {
    }

    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() const
    {
        CK_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    /// Pointer to the referee, or nullptr if empty.
    [[nodiscard]] constexpr T* as_ptr() const { return _ptr; }

    // comparison
public:
    /// Compares the referred-to values, not the addresses.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || *lhs._ptr == *rhs._ptr;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

    // members
private:
    T* _ptr = nullptr;
};
} // namespace ck
