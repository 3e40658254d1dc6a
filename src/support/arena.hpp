//===----------------------------------------------------------------------===//
//
// Part of the Cortado project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/arena.hpp
// Purpose: Declares a chunked bump allocator backing the JIT heap.
// Key invariants: Memory handed out is zero-filled and stays valid until
//                 reset() or destruction.
// Ownership/Lifetime: Arena owns all allocated memory.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace cortado::support
{
/// @brief Bump allocator that grows by appending fixed-size chunks.
///
/// Each call to allocate() advances the cursor inside the current chunk by
/// the requested size and alignment. When a request does not fit, a new chunk
/// large enough for it is appended. Individual allocations cannot be freed;
/// invoke reset() to release every chunk.
/// @invariant Allocations are not individually freed; use reset() to reuse.
/// @ownership Owns its chunks.
/// @note Not thread-safe; callers sharing an arena must serialize access.
class Arena
{
  public:
    /// @brief Create arena that grows in @p chunkSize byte steps.
    explicit Arena(size_t chunkSize = 64 * 1024);

    /// @brief Allocate @p size zeroed bytes with alignment @p align.
    /// @return Pointer to allocated memory or nullptr on failure.
    /// @notes Fails if @p align is zero, not a power of two, or larger than
    ///        the maximum fundamental alignment.
    void *allocate(size_t size, size_t align);

    /// @brief Release every chunk, invalidating all allocations.
    void reset();

    /// @brief Total bytes handed out since construction or the last reset().
    [[nodiscard]] size_t bytesAllocated() const noexcept;

  private:
    /// @brief Append a chunk able to hold at least @p minSize bytes.
    void grow(size_t minSize);

    size_t chunkSize_;
    std::vector<std::unique_ptr<std::byte[]>> chunks_;
    size_t chunkCapacity_ = 0; ///< Capacity of chunks_.back().
    size_t offset_ = 0;        ///< Cursor within chunks_.back().
    size_t allocated_ = 0;
};
} // namespace cortado::support
