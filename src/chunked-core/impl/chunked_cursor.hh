#pragma once

#include <chunked-core/fwd.hh>
#include <chunked-core/utility.hh>

#include <iterator>
#include <type_traits>

namespace ck::impl
{
/// Forward cursor over the live elements of a sequence of chunks.
///
/// ChunkT is either `vector<T>` (mutable traversal, yields T&)
/// or `vector<T> const` (read-only traversal, yields T const&).
/// Both traversals of chunked_vector are this one template.
///
/// State: a cursor into the live range of the current chunk and a cursor into the chunk list.
/// Advancing steps within the chunk; once the chunk is exhausted, the cursor moves on to the next chunk
/// with live elements. The traversal ends when the chunk cursor reaches the end of the chunk list.
/// Chunk boundaries are never visible to the caller.
///
/// The end of a traversal is the stateless ck::sentinel.
template <class ChunkT>
struct chunked_cursor
{
    using elem_ptr_t = decltype(std::declval<ChunkT&>().begin());

    using iterator_category = std::forward_iterator_tag;
    using value_type = std::remove_cvref_t<decltype(*std::declval<elem_ptr_t>())>;
    using difference_type = isize;
    using reference = decltype(*std::declval<elem_ptr_t>());
    using pointer = elem_ptr_t;

    chunked_cursor() = default;
    chunked_cursor(ChunkT* chunk_it, ChunkT* chunk_end) : _chunk_it(chunk_it), _chunk_end(chunk_end)
    {
        if (_chunk_it != _chunk_end)
        {
            _elem_it = _chunk_it->begin();
            _elem_end = _chunk_it->end();
            skip_exhausted_chunks();
        }
    }

    [[nodiscard]] reference operator*() const { return *_elem_it; }
    [[nodiscard]] pointer operator->() const { return _elem_it; }

    chunked_cursor& operator++()
    {
        ++_elem_it;
        skip_exhausted_chunks();
        return *this;
    }
    chunked_cursor operator++(int)
    {
        auto copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]] bool operator==(chunked_cursor const& rhs) const
    {
        return _chunk_it == rhs._chunk_it && _elem_it == rhs._elem_it;
    }
    [[nodiscard]] bool operator==(ck::sentinel) const { return _chunk_it == _chunk_end; }

private:
    // establishes: either _elem_it points to a live element or _chunk_it == _chunk_end
    void skip_exhausted_chunks()
    {
        while (_elem_it == _elem_end)
        {
            ++_chunk_it;
            if (_chunk_it == _chunk_end)
            {
                _elem_it = nullptr;
                _elem_end = nullptr;
                return;
            }
            _elem_it = _chunk_it->begin();
            _elem_end = _chunk_it->end();
        }
    }

    ChunkT* _chunk_it = nullptr;
    ChunkT* _chunk_end = nullptr;
    elem_ptr_t _elem_it = nullptr;
    elem_ptr_t _elem_end = nullptr;
};
} // namespace ck::impl
