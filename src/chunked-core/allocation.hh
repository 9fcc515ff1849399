#pragma once

#include <chunked-core/fwd.hh>

// System byte allocation backing all ck containers.
//
// Containers own raw, aligned byte blocks and manage object lifetimes inside them themselves
// (see <chunked-core/impl/object_lifetime_util.hh>).
// Failure to allocate is fatal (CK_ASSERT_ALWAYS), so callers never see nullptr for bytes > 0.
//
// Contract:
// - bytes == 0 always returns nullptr and never touches the system allocator
// - alignment must be a positive power of two
// - deallocate_bytes must receive the exact pointer, byte count, and alignment used for allocation
//   (nullptr is a valid no-op)

namespace ck::impl
{
[[nodiscard]] ck::byte* system_allocate_bytes(isize bytes, isize alignment);

void system_deallocate_bytes(ck::byte* p, isize bytes, isize alignment);
} // namespace ck::impl
