// =============================================================================
// mtc - Chunk Reader
// =============================================================================
// Reads one planned byte range of a source into a pooled buffer.
// =============================================================================

#ifndef MTC_IO_CHUNK_READER_H
#define MTC_IO_CHUNK_READER_H

#include "mtc/common/chunk.h"
#include "mtc/common/error.h"
#include "mtc/io/buffer_pool.h"
#include "mtc/io/media_source.h"

namespace mtc::io {

/// @brief Source of chunk payloads.
/// @note Implementations must be safe to call from several threads at once.
class ChunkReader {
public:
    virtual ~ChunkReader() = default;

    /// @brief Read range of source into a buffer acquired from pool.
    /// @return Unprocessed chunk holding exactly range.length bytes, or
    ///         kReadFailure. A short read is accepted only when the file ends
    ///         inside the final range.
    [[nodiscard]] virtual Result<Chunk> readRange(const MediaSource& source, ChunkId id,
                                                  const ChunkRange& range,
                                                  BufferPool& pool) const = 0;
};

/// @brief Positional reads from the source file.
class FileChunkReader final : public ChunkReader {
public:
    [[nodiscard]] Result<Chunk> readRange(const MediaSource& source, ChunkId id,
                                          const ChunkRange& range,
                                          BufferPool& pool) const override;
};

}  // namespace mtc::io

#endif  // MTC_IO_CHUNK_READER_H
