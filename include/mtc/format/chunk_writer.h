// =============================================================================
// mtc - Chunk Writer
// =============================================================================
// Commits processed chunks to the output in file order and finalizes it.
//
// Lifecycle: initialize() -> writeChunk()* -> finalize(), or abort() at any
// point. finalize() is called exactly once, and only after every chunk was
// committed successfully.
// =============================================================================

#ifndef MTC_FORMAT_CHUNK_WRITER_H
#define MTC_FORMAT_CHUNK_WRITER_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

#include "mtc/common/chunk.h"
#include "mtc/common/error.h"
#include "mtc/common/media_format.h"
#include "mtc/common/types.h"

namespace mtc::format {

/// @brief Output boundary of the pipeline.
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    /// @brief Prepare the output for a run.
    [[nodiscard]] virtual VoidResult initialize(const std::filesystem::path& outputPath,
                                                const TranscodeOptions& target,
                                                const MediaDescriptor& source) = 0;

    /// @brief Commit a processed chunk. Chunks arrive in ascending id order.
    [[nodiscard]] virtual VoidResult writeChunk(const Chunk& chunk) = 0;

    /// @brief Make the output durable and visible.
    [[nodiscard]] virtual VoidResult finalize() = 0;

    /// @brief Discard partial output. Safe to call in any state.
    virtual void abort() noexcept = 0;

    /// @brief Bytes committed so far.
    [[nodiscard]] virtual std::uint64_t bytesWritten() const noexcept = 0;

    /// @brief Checksum of the bytes committed so far.
    [[nodiscard]] virtual Checksum checksum() const noexcept = 0;
};

/// @brief Writes chunks to "<output>.part" and renames it onto the output
///        path on finalize.
/// @note Keeps an XXH64 checksum of everything committed. Rejects chunks that
///       are unprocessed or not the next id in sequence. May be initialized
///       again once finalized or aborted.
class FileChunkWriter final : public ChunkWriter {
public:
    FileChunkWriter();
    ~FileChunkWriter() override;

    FileChunkWriter(const FileChunkWriter&) = delete;
    FileChunkWriter& operator=(const FileChunkWriter&) = delete;

    [[nodiscard]] VoidResult initialize(const std::filesystem::path& outputPath,
                                        const TranscodeOptions& target,
                                        const MediaDescriptor& source) override;

    [[nodiscard]] VoidResult writeChunk(const Chunk& chunk) override;

    [[nodiscard]] VoidResult finalize() override;

    void abort() noexcept override;

    [[nodiscard]] std::uint64_t bytesWritten() const noexcept override;

    [[nodiscard]] Checksum checksum() const noexcept override;

    [[nodiscard]] std::uint64_t chunksWritten() const noexcept;

    [[nodiscard]] bool finalized() const noexcept { return state_ == State::kFinalized; }

    /// @brief Temporary path used while writing; empty before initialize().
    [[nodiscard]] std::filesystem::path tempPath() const;

private:
    enum class State : std::uint8_t { kIdle, kOpen, kFinalized, kAborted };

    struct HashStateDeleter {
        void operator()(void* state) const noexcept;
    };

    void cleanupTempFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path tempPath_;
    std::ofstream stream_;
    std::unique_ptr<void, HashStateDeleter> hashState_;
    ChunkId nextChunkId_ = 0;
    std::uint64_t bytesWritten_ = 0;
    std::atomic<State> state_{State::kIdle};
    mutable std::mutex mutex_;
};

}  // namespace mtc::format

#endif  // MTC_FORMAT_CHUNK_WRITER_H
