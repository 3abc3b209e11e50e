// =============================================================================
// mtc - Chunk Reader Implementation
// =============================================================================

#include "mtc/io/chunk_reader.h"

#include <fmt/format.h>

#include <fstream>

namespace mtc::io {

Result<Chunk> FileChunkReader::readRange(const MediaSource& source, ChunkId id,
                                         const ChunkRange& range, BufferPool& pool) const {
    auto context = [&] {
        return ErrorContext{source.path().string()}.withChunk(id).withOffset(range.offset);
    };

    // One stream per call keeps concurrent reads independent.
    std::ifstream in(source.path(), std::ios::binary);
    if (!in) {
        return makeError<Chunk>(Error{ErrorCode::kReadFailure, "cannot open source", context()});
    }

    in.seekg(static_cast<std::streamoff>(range.offset));
    if (!in) {
        return makeError<Chunk>(Error{ErrorCode::kReadFailure, "seek failed", context()});
    }

    ManagedBuffer buffer = pool.acquire(static_cast<std::size_t>(range.length));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(range.length));
    const auto got = static_cast<std::uint64_t>(in.gcount());

    if (in.bad() || (got < range.length && !(in.eof() && range.isLast))) {
        return makeError<Chunk>(
            Error{ErrorCode::kReadFailure,
                  fmt::format("short read: expected {} bytes, got {}", range.length, got),
                  context()});
    }

    buffer.setSize(static_cast<std::size_t>(got));
    return Chunk(id, range, std::move(buffer));
}

}  // namespace mtc::io
