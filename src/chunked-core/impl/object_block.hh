#pragma once

#include <chunked-core/allocation.hh>
#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>
#include <chunked-core/impl/object_lifetime_util.hh>
#include <chunked-core/utility.hh>

#include <new>

namespace ck::impl
{
/// Owning handle for one heap block of T slots plus the window of live objects inside it.
///
/// Invariants:
/// - [alloc_start, alloc_end) is the owned slot range, obtained from system_allocate_bytes
/// - [obj_start, obj_end) is the live object range, always within the slot range
/// - all four pointers are nullptr for the empty (unallocated) block
///
/// Destruction destroys the live range (in reverse) and releases the slots.
/// Move-only: copying a block is a container decision, not a storage one.
template <class T>
struct object_block
{
    /// Alignment of every block.
    /// At least one destructive-interference unit, so distinct blocks never share a cache line.
    static constexpr isize alloc_alignment = isize(ck::max(alignof(T), std::hardware_destructive_interference_size));

    T* alloc_start = nullptr;
    T* obj_start = nullptr;
    T* obj_end = nullptr;
    T* alloc_end = nullptr;

    /// Empty block with room for exactly `capacity` objects and no live objects.
    [[nodiscard]] static object_block create_with_slots(isize capacity)
    {
        CK_ASSERT(capacity >= 0, "capacity must be non-negative");

        object_block b;
        b.alloc_start = reinterpret_cast<T*>(system_allocate_bytes(capacity * isize(sizeof(T)), alloc_alignment));
        b.obj_start = b.alloc_start;
        b.obj_end = b.alloc_start;
        b.alloc_end = b.alloc_start + capacity;
        return b;
    }

    [[nodiscard]] constexpr isize slot_count() const { return alloc_end - alloc_start; }
    [[nodiscard]] constexpr bool is_allocated() const { return alloc_start != nullptr; }

    object_block() = default;
    ~object_block() { release(); }

    object_block(object_block&& rhs) noexcept
      : alloc_start(ck::exchange(rhs.alloc_start, nullptr)),
        obj_start(ck::exchange(rhs.obj_start, nullptr)),
        obj_end(ck::exchange(rhs.obj_end, nullptr)),
        alloc_end(ck::exchange(rhs.alloc_end, nullptr))
    {
    }
    object_block& operator=(object_block&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release();
            alloc_start = ck::exchange(rhs.alloc_start, nullptr);
            obj_start = ck::exchange(rhs.obj_start, nullptr);
            obj_end = ck::exchange(rhs.obj_end, nullptr);
            alloc_end = ck::exchange(rhs.alloc_end, nullptr);
        }
        return *this;
    }

    object_block(object_block const&) = delete;
    object_block& operator=(object_block const&) = delete;

private:
    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        system_deallocate_bytes(reinterpret_cast<ck::byte*>(alloc_start), slot_count() * isize(sizeof(T)), alloc_alignment);
        alloc_start = nullptr;
        obj_start = nullptr;
        obj_end = nullptr;
        alloc_end = nullptr;
    }
};
} // namespace ck::impl
