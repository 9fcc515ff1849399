#pragma once

#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>
#include <chunked-core/impl/object_block.hh>
#include <chunked-core/impl/object_lifetime_util.hh>
#include <chunked-core/utility.hh>

#include <type_traits>


/// Dynamically allocated, contiguous vector of T elements with value semantics.
/// Similar to std::vector with signed sizes and asserted preconditions.
/// This is the dynamic-array primitive that chunked_vector composes for its chunk list and its chunks.
///
/// Member functions with the `_stable` suffix never reallocate the buffer or move live objects,
/// so existing references, pointers, and iterators stay valid.
/// They assert that sufficient capacity is already present.
///
/// === Exception & reference guarantees ===
///
/// Allocation failure is fatal (see <chunked-core/allocation.hh>).
/// Element construction failures leave size and live range unchanged.
/// Reallocation always uses move construction (no copy fallback), newest element first,
/// so constructing from an existing element (e.g. `v.push_back(v[0])`) is safe during growth.
///
/// Any reallocation invalidates pointers, references, and iterators.
template <class T>
struct ck::vector
{
    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        CK_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        CK_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        CK_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        CK_ASSERT(!empty(), "vector is empty");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        CK_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        CK_ASSERT(!empty(), "vector is empty");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr if nothing was ever allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Total number of elements that fit without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return _data.alloc_end - _data.obj_start; }

    /// How many elements can be appended without reallocation.
    [[nodiscard]] constexpr isize capacity_back() const { return _data.alloc_end - _data.obj_end; }

    [[nodiscard]] constexpr bool has_capacity_back_for(isize count) const { return capacity_back() >= count; }

    // factories
public:
    /// Empty vector with room for exactly `capacity` elements.
    /// Appending up to `capacity` elements never reallocates.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        vector v;
        if (capacity > 0)
            v._data = impl::object_block<T>::create_with_slots(capacity);
        return v;
    }

    // appends
public:
    /// Constructs a new element at the back, reallocating if necessary.
    /// If has_capacity_back_for(1), no invalidation of any kind occurs.
    /// Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(ck::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (!has_capacity_back_for(1)) [[unlikely]]
            return emplace_back_grow(ck::forward<Args>(args)...);

        auto const p = new (ck::placement_new, _data.obj_end) T(ck::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave the state valid
        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(ck::move(value)); }

    /// Constructs a new element at the back using existing capacity.
    /// Precondition: has_capacity_back_for(1).
    /// Never allocates; pointers, references, and iterators remain valid.
    template <class... Args>
    constexpr T& emplace_back_stable(Args&&... args)
    {
        static_assert(
            requires { T(ck::forward<Args>(args)...); }, "emplace_back_stable: T is not constructible from "
                                                         "the provided argument types");
        CK_ASSERT(has_capacity_back_for(1), "not enough capacity for emplace_back_stable");
        auto const p = new (ck::placement_new, _data.obj_end) T(ck::forward<Args>(args)...);
        _data.obj_end++;
        return *p;
    }

    constexpr T& push_back_stable(T const& value) { return emplace_back_stable(value); }
    constexpr T& push_back_stable(T&& value) { return emplace_back_stable(ck::move(value)); }

    /// Ensures that `count` more elements can be appended without reallocation.
    /// Reallocates to exactly size() + count if the current capacity is too small.
    void reserve_back(isize count)
    {
        CK_ASSERT(count >= 0, "count must be non-negative");
        if (has_capacity_back_for(count))
            return;

        auto grown = impl::object_block<T>::create_with_slots(size() + count);
        grown.obj_start = grown.alloc_start + size();
        grown.obj_end = grown.obj_start;
        relocate_into(grown);
    }

    // removals
public:
    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    /// NOTE: Prefer remove_back() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        CK_ASSERT(!empty(), "cannot pop from empty vector");
        auto value = ck::move(*(_data.obj_end - 1));
        (_data.obj_end - 1)->~T();
        _data.obj_end--;
        return value;
    }

    /// Removes the last element, destroying it in place.
    /// Precondition: !empty().
    constexpr void remove_back()
    {
        CK_ASSERT(!empty(), "cannot remove from empty vector");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Destroys all elements, size becomes 0.
    /// Keeps the allocation, so capacity() is unchanged.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._data.obj_start[i] == rhs._data.obj_start[i]))
                return false;
        return true;
    }

    // ctors
public:
    vector() = default;
    ~vector() = default;

    // move semantics are already fine via the object block
    vector(vector&&) = default;
    vector& operator=(vector&&) = default;

    // deep copy with capacity == size
    vector(vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (!rhs.empty())
        {
            _data = impl::object_block<T>::create_with_slots(rhs.size());
            impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
        }
    }
    vector& operator=(vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            auto copy = vector(rhs);
            _data = ck::move(copy._data);
        }
        return *this;
    }

    // growth
private:
    /// Exponential growth, rounded up so the block fills whole cache lines.
    [[nodiscard]] constexpr isize grown_capacity_for(isize min_capacity) const
    {
        auto const min_bytes = ck::max(capacity() << 1, min_capacity) * isize(sizeof(T));
        return ck::align_up(min_bytes, impl::object_block<T>::alloc_alignment) / isize(sizeof(T));
    }

    /// Moves all live elements in front of grown.obj_start and adopts grown as the new storage.
    /// Precondition: grown.obj_start == grown.alloc_start + size().
    void relocate_into(impl::object_block<T>& grown)
    {
        CK_ASSERT(grown.obj_start - grown.alloc_start == size(), "relocation target must leave room for all elements");
        impl::move_create_objects_to_reverse(grown.obj_start, _data.obj_start, _data.obj_end);
        _data = ck::move(grown); // destroys the moved-from old elements
    }

    template <class... Args>
    CK_COLD_FUNC T& emplace_back_grow(Args&&... args)
    {
        auto grown = impl::object_block<T>::create_with_slots(grown_capacity_for(size() + 1));

        // the new element goes in first: args may alias our current elements
        grown.obj_start = grown.alloc_start + size();
        grown.obj_end = grown.obj_start;
        auto const p = new (ck::placement_new, grown.obj_end) T(ck::forward<Args>(args)...);
        grown.obj_end++;

        relocate_into(grown);
        return *p;
    }

private:
    impl::object_block<T> _data;
};
