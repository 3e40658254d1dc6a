// File: src/support/arena.cpp
// License: GNU GPL v3. See LICENSE in the project root for details.
// Purpose: Implement the chunked bump-pointer arena backing JIT heap
//          allocations.
// Key invariants: The cursor never exceeds the current chunk and alignment
//                 requests must be non-zero powers of two.
// Ownership/Lifetime: Arena owns its chunks and invalidates all allocations on
//                     reset().
// Links: docs/codemap.md

/// @file
/// @brief Defines the `cortado::support::Arena` bump allocator implementation.
/// @details Chunks are allocated with value-initialisation so every slice the
///          arena hands out is zero-filled, which the JIT relies on for array
///          payloads.

#include "support/arena.hpp"

#include <limits>

namespace cortado::support
{
Arena::Arena(size_t chunkSize) : chunkSize_(chunkSize == 0 ? 1 : chunkSize) {}

/// @brief Allocate memory from the arena honoring the requested alignment.
///
/// @details Allocation proceeds in a handful of steps:
///          1. Validate that @p align is a non-zero power of two no larger than
///             what `new std::byte[]` guarantees for the chunk base.
///          2. Compute the aligned offset inside the current chunk while
///             guarding every arithmetic operation against overflow.
///          3. Append a fresh chunk when the request does not fit.
///          4. Advance the bump pointer and return the aligned slice.
///          Failure returns @c nullptr without mutating state.
void *Arena::allocate(size_t size, size_t align)
{
    if (align == 0 || (align & (align - 1)) != 0 || align > alignof(std::max_align_t))
        return nullptr;
    if (size > std::numeric_limits<size_t>::max() - align)
        return nullptr;

    const size_t mask = align - 1;
    size_t aligned = (offset_ + mask) & ~mask;
    if (chunks_.empty() || aligned > chunkCapacity_ || size > chunkCapacity_ - aligned)
    {
        grow(size);
        aligned = 0;
    }

    std::byte *base = chunks_.back().get();
    offset_ = aligned + size;
    allocated_ += size;
    return base + aligned;
}

void Arena::grow(size_t minSize)
{
    const size_t capacity = minSize > chunkSize_ ? minSize : chunkSize_;
    chunks_.push_back(std::make_unique<std::byte[]>(capacity));
    chunkCapacity_ = capacity;
    offset_ = 0;
}

void Arena::reset()
{
    chunks_.clear();
    chunkCapacity_ = 0;
    offset_ = 0;
    allocated_ = 0;
}

size_t Arena::bytesAllocated() const noexcept
{
    return allocated_;
}
} // namespace cortado::support
