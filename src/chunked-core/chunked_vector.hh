#pragma once

#include <chunked-core/assert.hh>
#include <chunked-core/fwd.hh>
#include <chunked-core/impl/chunked_cursor.hh>
#include <chunked-core/optional.hh>
#include <chunked-core/positive_size.hh>
#include <chunked-core/utility.hh>
#include <chunked-core/vector.hh>

#include <type_traits>

/// Growable sequence of T that stores its elements in fixed-size chunks instead of one contiguous block.
///
/// Element i lives in chunk `i / chunk_size()` at offset `i % chunk_size()`.
/// Every chunk is allocated with room for exactly chunk_size() elements and is never reallocated,
/// so growing the container never moves existing elements:
///   - push_back is O(1) without reallocation spikes (a new chunk is appended when the last one is full)
///   - operator[] and get are O(1)
///   - full traversal is O(size())
///
/// Chunks are never released or shrunk. clear() destroys the elements but keeps every chunk,
/// so capacity() never decreases.
///
/// === Memory ===
///
/// Each chunk is a separate allocation aligned to max(alignof(T), std::hardware_destructive_interference_size),
/// typically 64 bytes, so no two chunks share a cache line.
/// Small chunks pay for this: a chunked_vector<char> with chunk size 1 spends a full 64-byte block
/// (plus allocator bookkeeping) per element. Pick chunk_size() so that a chunk spans several cache lines.
///
/// === Reference guarantees ===
///
/// References and pointers to an element stay valid until that element is removed (pop_back, remove_back, clear)
/// or the container is destroyed.
/// Iterators are invalidated by any append that adds a chunk.
///
/// === Threading ===
///
/// No internal synchronization.
/// Any number of concurrent readers OR a single writer, never both.
///
/// === Example ===
///
///   auto v = ck::chunked_vector<int>(1024);
///   v.push_back(1);
///   v.push_back(2);
///   for (auto& x : v)
///       x *= 2;
///   if (auto x = v.get(1); x.has_value())
///       use(x.value());
///
template <class T>
struct ck::chunked_vector
{
    static_assert(!std::is_reference_v<T>, "chunked_vector cannot store references");
    static_assert(!std::is_const_v<T>, "chunked_vector cannot store const elements");

    using chunk_t = ck::vector<T>;
    using iterator = impl::chunked_cursor<chunk_t>;
    using const_iterator = impl::chunked_cursor<chunk_t const>;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    /// Use get(i) if the index is not known to be valid.
    [[nodiscard]] T& operator[](isize i)
    {
        CK_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _chunks[i / _chunk_size][i % _chunk_size];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        CK_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _chunks[i / _chunk_size][i % _chunk_size];
    }

    /// Returns the element at index i, or nullopt if i is not in [0, size()).
    [[nodiscard]] ck::optional<T&> get(isize i)
    {
        if (i < 0 || i >= _size)
            return ck::nullopt;
        return _chunks[i / _chunk_size][i % _chunk_size];
    }
    [[nodiscard]] ck::optional<T const&> get(isize i) const
    {
        if (i < 0 || i >= _size)
            return ck::nullopt;
        return _chunks[i / _chunk_size][i % _chunk_size];
    }

    /// Precondition: !empty().
    [[nodiscard]] T& front()
    {
        CK_ASSERT(_size > 0, "chunked_vector is empty");
        return _chunks[0][0];
    }
    [[nodiscard]] T const& front() const
    {
        CK_ASSERT(_size > 0, "chunked_vector is empty");
        return _chunks[0][0];
    }

    /// Precondition: !empty().
    [[nodiscard]] T& back()
    {
        CK_ASSERT(_size > 0, "chunked_vector is empty");
        return _chunks[(_size - 1) / _chunk_size].back();
    }
    [[nodiscard]] T const& back() const
    {
        CK_ASSERT(_size > 0, "chunked_vector is empty");
        return _chunks[(_size - 1) / _chunk_size].back();
    }

    // iteration
public:
    /// Yields every element in index order, chunk boundaries are invisible.
    [[nodiscard]] iterator begin() { return iterator(_chunks.begin(), _chunks.end()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(_chunks.begin(), _chunks.end()); }
    [[nodiscard]] ck::sentinel end() const { return {}; }

    /// Calls fun(elem) or fun(idx, elem) for every element in index order.
    /// Iterates the chunks directly, which is usually faster than going through begin()/end().
    template <class F>
    void each(F&& fun)
    {
        isize idx = 0;
        for (auto& chunk : _chunks)
            for (auto& elem : chunk)
                ck::invoke_with_optional_idx(idx++, fun, elem);
    }
    template <class F>
    void each(F&& fun) const
    {
        isize idx = 0;
        for (auto const& chunk : _chunks)
            for (auto const& elem : chunk)
                ck::invoke_with_optional_idx(idx++, fun, elem);
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Fixed for the lifetime of the container.
    [[nodiscard]] isize chunk_size() const { return _chunk_size; }

    /// Number of elements that fit into the already allocated chunks.
    /// Always chunk_count() * chunk_size().
    [[nodiscard]] isize capacity() const { return _chunks.size() * _chunk_size; }

    [[nodiscard]] isize chunk_count() const { return _chunks.size(); }

    /// Read-only view of a single chunk.
    /// Precondition: 0 <= i < chunk_count().
    [[nodiscard]] chunk_t const& chunk(isize i) const { return _chunks[i]; }

    // appends
public:
    /// Constructs a new element at the back.
    /// Appends a new chunk if the last one is full; existing elements never move.
    template <class... Args>
    T& emplace_back(Args&&... args)
    {
        if (_size == capacity()) [[unlikely]]
            add_chunk();

        auto& elem = _chunks[_size / _chunk_size].emplace_back_stable(ck::forward<Args>(args)...);
        ++_size; // _after_ so exceptions in T(...) leave the state valid
        return elem;
    }

    T& push_back(T const& value) { return emplace_back(value); }
    T& push_back(T&& value) { return emplace_back(ck::move(value)); }

    // removals
public:
    /// Removes and returns the last element, or nullopt if empty.
    /// Capacity is unchanged.
    [[nodiscard("use remove_back() if you don't need the return value")]] ck::optional<T> pop_back()
    {
        if (_size == 0)
            return ck::nullopt;

        // if moving the element out throws, the chunk still holds it and _size must too
        T value = _chunks[(_size - 1) / _chunk_size].pop_back();
        --_size;
        return ck::optional<T>(ck::move(value));
    }

    /// Destroys the last element in place.
    /// Precondition: !empty().
    void remove_back()
    {
        CK_ASSERT(_size > 0, "cannot remove from empty chunked_vector");
        _chunks[(_size - 1) / _chunk_size].remove_back();
        --_size;
    }

    /// Destroys all elements, size becomes 0.
    /// All chunks stay allocated, so capacity() is unchanged.
    void clear()
    {
        for (auto& chunk : _chunks)
            chunk.clear();
        _size = 0;
    }

    // mutation
public:
    /// Exchanges the elements at indices a and b.
    /// Precondition: 0 <= a < size() and 0 <= b < size().
    /// swap(i, i) is a no-op.
    void swap(isize a, isize b)
    {
        CK_ASSERT(0 <= a && a < _size, "index a out of bounds");
        CK_ASSERT(0 <= b && b < _size, "index b out of bounds");
        if (a == b)
            return;

        ck::swap(_chunks[a / _chunk_size][a % _chunk_size], _chunks[b / _chunk_size][b % _chunk_size]);
    }

    // comparison
public:
    /// Element-wise comparison, chunk_size() and capacity() are ignored.
    [[nodiscard]] friend bool operator==(chunked_vector const& lhs, chunked_vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._size != rhs._size)
            return false;

        auto it_r = rhs.begin();
        for (auto const& l : lhs)
        {
            if (!(l == *it_r))
                return false;
            ++it_r;
        }
        return true;
    }

    // ctors
public:
    explicit chunked_vector(ck::positive_size chunk_size) : _chunk_size(chunk_size.value()) {}

    /// The moved-from container is empty, without chunks, and keeps its chunk size.
    chunked_vector(chunked_vector&& rhs) noexcept
      : _chunks(ck::move(rhs._chunks)), _size(ck::exchange(rhs._size, 0)), _chunk_size(rhs._chunk_size)
    {
    }
    chunked_vector& operator=(chunked_vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _chunks = ck::move(rhs._chunks);
            _size = ck::exchange(rhs._size, 0);
            _chunk_size = rhs._chunk_size;
        }
        return *this;
    }

    /// Deep copy with the same chunk size.
    /// Only the chunks needed for the elements are allocated.
    chunked_vector(chunked_vector const& rhs)
        requires std::is_copy_constructible_v<T>
      : _chunk_size(rhs._chunk_size)
    {
        for (auto const& chunk : rhs._chunks)
        {
            if (chunk.empty())
                break;
            _chunks.push_back(chunk_t::create_with_capacity(_chunk_size));
            auto& c = _chunks.back();
            for (auto const& elem : chunk)
                c.push_back_stable(elem);
            _size += chunk.size();
        }
    }
    chunked_vector& operator=(chunked_vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            *this = chunked_vector(rhs);
        return *this;
    }

    ~chunked_vector() = default;

private:
    CK_COLD_FUNC void add_chunk() { _chunks.push_back(chunk_t::create_with_capacity(_chunk_size)); }

    ck::vector<chunk_t> _chunks;
    isize _size = 0;
    isize _chunk_size;
};
