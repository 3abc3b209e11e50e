// =============================================================================
// mtc - Chunk Planner Implementation
// =============================================================================

#include "mtc/pipeline/chunk_planner.h"

#include <fmt/format.h>

#include <algorithm>

namespace mtc::pipeline {

ChunkRange ChunkPlan::Iterator::operator*() const noexcept {
    const std::uint64_t length = std::min(chunkSize_, fileSize_ - offset_);
    return ChunkRange{offset_, length, offset_ + length == fileSize_};
}

ChunkPlan::ChunkPlan(std::uint64_t fileSizeBytes, std::uint64_t chunkSizeBytes)
    : fileSize_(fileSizeBytes), chunkSize_(chunkSizeBytes) {
    if (chunkSize_ == 0) {
        throw ConfigurationError("chunk size must be greater than zero");
    }
}

Result<ChunkPlan> ChunkPlan::create(std::uint64_t fileSizeBytes, std::uint64_t chunkSizeBytes) {
    if (chunkSizeBytes == 0) {
        return makeError<ChunkPlan>(ErrorCode::kInvalidConfiguration,
                                    "chunk size must be greater than zero");
    }
    return ChunkPlan(fileSizeBytes, chunkSizeBytes);
}

std::uint64_t ChunkPlan::chunkCount() const noexcept {
    return fileSize_ / chunkSize_ + (fileSize_ % chunkSize_ != 0 ? 1 : 0);
}

Result<ChunkRange> ChunkPlan::rangeAt(ChunkId id) const {
    if (id >= chunkCount()) {
        return makeError<ChunkRange>(
            ErrorCode::kInvalidState,
            fmt::format("chunk {} out of range (plan has {} chunks)", id, chunkCount()));
    }
    const std::uint64_t offset = id * chunkSize_;
    const std::uint64_t length = std::min(chunkSize_, fileSize_ - offset);
    return ChunkRange{offset, length, offset + length == fileSize_};
}

VoidResult ChunkPlan::validate() const {
    std::uint64_t expectedOffset = 0;
    std::uint64_t count = 0;
    std::uint64_t lastFlags = 0;

    for (const ChunkRange range : *this) {
        if (range.offset != expectedOffset) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 fmt::format("gap or overlap at chunk {}: expected offset {}, got {}",
                                             count, expectedOffset, range.offset));
        }
        if (range.length == 0 || range.length > chunkSize_) {
            return makeVoidError(ErrorCode::kInvalidState,
                                 fmt::format("chunk {} has invalid length {}", count,
                                             range.length));
        }
        if (range.isLast) {
            ++lastFlags;
        }
        expectedOffset = range.end();
        ++count;
    }

    if (expectedOffset != fileSize_) {
        return makeVoidError(ErrorCode::kInvalidState,
                             fmt::format("plan covers {} of {} bytes", expectedOffset, fileSize_));
    }
    if (count != chunkCount()) {
        return makeVoidError(ErrorCode::kInvalidState,
                             fmt::format("plan yielded {} chunks, expected {}", count,
                                         chunkCount()));
    }
    if (lastFlags != (fileSize_ == 0 ? 0 : 1)) {
        return makeVoidError(ErrorCode::kInvalidState,
                             fmt::format("plan flags {} chunks as last", lastFlags));
    }
    return makeVoidSuccess();
}

}  // namespace mtc::pipeline
