#pragma once

#include <cstddef>
#include <cstdint>


namespace ck
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// All sizes and indices are signed i64, never size_t:
// * "size - 1" on an empty container stays -1 instead of wrapping to a huge value
// * no mixed signed/unsigned comparisons in index arithmetic
// * we only target 64-bit platforms, so the range is plenty
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Sizes
//

struct positive_size;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct vector;

template <class T>
struct chunked_vector;

} // namespace ck
