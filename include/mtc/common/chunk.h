// =============================================================================
// mtc - Chunk Data Model
// =============================================================================
// ChunkRange is one byte range of the source file. Chunk pairs a range with
// its payload as it moves from reader to transformer to writer.
// =============================================================================

#ifndef MTC_COMMON_CHUNK_H
#define MTC_COMMON_CHUNK_H

#include <cstdint>
#include <span>
#include <utility>

#include "mtc/common/types.h"
#include "mtc/io/buffer_pool.h"

namespace mtc {

/// @brief A byte range [offset, offset + length) of the source file.
struct ChunkRange {
    FileOffset offset = 0;
    std::uint64_t length = 0;
    /// @brief True iff offset + length equals the file size.
    bool isLast = false;

    [[nodiscard]] FileOffset end() const noexcept { return offset + length; }

    [[nodiscard]] bool operator==(const ChunkRange& other) const = default;
};

/// @brief A chunk and its payload.
/// @note Move-only. A processed chunk is derived from an unprocessed one via
///       withProcessedPayload(), which keeps id and range and releases the
///       input payload back to its pool.
struct Chunk {
    ChunkId id = kInvalidChunkId;
    ChunkRange range;
    io::ManagedBuffer payload;
    bool processed = false;

    Chunk() = default;
    Chunk(ChunkId chunkId, ChunkRange chunkRange, io::ManagedBuffer data)
        : id(chunkId), range(chunkRange), payload(std::move(data)) {}

    Chunk(const Chunk&) = delete;
    Chunk& operator=(const Chunk&) = delete;
    Chunk(Chunk&&) noexcept = default;
    Chunk& operator=(Chunk&&) noexcept = default;

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return payload.span(); }

    /// @brief Consume this chunk, producing its processed successor.
    [[nodiscard]] Chunk withProcessedPayload(io::ManagedBuffer output) && {
        Chunk result(id, range, std::move(output));
        result.processed = true;
        payload.reset();
        return result;
    }
};

}  // namespace mtc

#endif  // MTC_COMMON_CHUNK_H
