#include "allocation.hh"

#include <chunked-core/assert.hh>
#include <chunked-core/macros.hh>
#include <chunked-core/utility.hh>

#include <cstdlib>

#ifdef CK_OS_WINDOWS
#include <malloc.h>
#endif

ck::byte* ck::impl::system_allocate_bytes(isize bytes, isize alignment)
{
    CK_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");
    CK_ASSERT(alignment > 0 && ck::is_power_of_two(alignment), "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

    ck::byte* p = nullptr;

#ifdef CK_OS_WINDOWS
    p = static_cast<ck::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign instead of std::aligned_alloc to avoid the bytes % alignment == 0 requirement
    // posix_memalign requires alignment >= sizeof(void*)
    void* raw_ptr = nullptr;
    isize const effective_alignment = alignment < isize(sizeof(void*)) ? isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, effective_alignment, bytes);
    p = result == 0 ? static_cast<ck::byte*>(raw_ptr) : nullptr;
#endif

    CK_ASSERT_ALWAYS(p != nullptr, "system allocation failed");
    return p;
}

void ck::impl::system_deallocate_bytes(ck::byte* p, isize bytes, isize alignment)
{
    // size and alignment are part of the contract for future pooling resources,
    // the system allocator does not need them
    CK_UNUSED(bytes);
    CK_UNUSED(alignment);

#ifdef CK_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}
