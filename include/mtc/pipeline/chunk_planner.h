// =============================================================================
// mtc - Chunk Planner
// =============================================================================
// Divides a file of F bytes into consecutive ranges of C bytes. Ranges tile
// [0, F) exactly once; the final range may be shorter and is the only one
// flagged isLast. An empty file yields no ranges.
//
// The plan is lazy: ranges are computed while iterating, and iterating again
// yields the same sequence.
// =============================================================================

#ifndef MTC_PIPELINE_CHUNK_PLANNER_H
#define MTC_PIPELINE_CHUNK_PLANNER_H

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "mtc/common/chunk.h"
#include "mtc/common/error.h"
#include "mtc/common/types.h"

namespace mtc::pipeline {

/// @brief Lazy, restartable sequence of chunk ranges covering a file.
class ChunkPlan {
public:
    /// @brief Input iterator over the planned ranges.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChunkRange;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkRange*;
        using reference = ChunkRange;

        Iterator() = default;

        [[nodiscard]] ChunkRange operator*() const noexcept;

        Iterator& operator++() noexcept {
            offset_ = (fileSize_ - offset_ > chunkSize_) ? offset_ + chunkSize_ : fileSize_;
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator copy = *this;
            ++*this;
            return copy;
        }

        [[nodiscard]] bool operator==(const Iterator& other) const noexcept {
            return offset_ == other.offset_;
        }

    private:
        friend class ChunkPlan;

        Iterator(std::uint64_t offset, std::uint64_t fileSize, std::uint64_t chunkSize) noexcept
            : offset_(offset), fileSize_(fileSize), chunkSize_(chunkSize) {}

        std::uint64_t offset_ = 0;
        std::uint64_t fileSize_ = 0;
        std::uint64_t chunkSize_ = 0;
    };

    /// @brief Build a plan.
    /// @throws ConfigurationError if chunkSizeBytes is zero.
    ChunkPlan(std::uint64_t fileSizeBytes, std::uint64_t chunkSizeBytes);

    /// @brief Build a plan, reporting a zero chunk size as kInvalidConfiguration.
    [[nodiscard]] static Result<ChunkPlan> create(std::uint64_t fileSizeBytes,
                                                  std::uint64_t chunkSizeBytes);

    [[nodiscard]] Iterator begin() const noexcept { return {0, fileSize_, chunkSize_}; }
    [[nodiscard]] Iterator end() const noexcept { return {fileSize_, fileSize_, chunkSize_}; }

    /// @brief ceil(fileSize / chunkSize), computed without iterating.
    [[nodiscard]] std::uint64_t chunkCount() const noexcept;

    /// @brief Range of the chunk with the given id.
    [[nodiscard]] Result<ChunkRange> rangeAt(ChunkId id) const;

    [[nodiscard]] std::uint64_t fileSize() const noexcept { return fileSize_; }
    [[nodiscard]] std::uint64_t chunkSize() const noexcept { return chunkSize_; }
    [[nodiscard]] bool empty() const noexcept { return fileSize_ == 0; }

    /// @brief Walk the plan and verify the ranges tile [0, fileSize).
    [[nodiscard]] VoidResult validate() const;

private:
    std::uint64_t fileSize_;
    std::uint64_t chunkSize_;
};

}  // namespace mtc::pipeline

#endif  // MTC_PIPELINE_CHUNK_PLANNER_H
