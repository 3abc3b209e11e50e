// =============================================================================
// mtc - File Chunk Writer Implementation
// =============================================================================
// Atomic output via temporary file + rename, with a running xxHash64 over the
// committed bytes.
// =============================================================================

#include "mtc/format/chunk_writer.h"

#include <fmt/format.h>
#include <xxhash.h>

#include "mtc/common/logger.h"

namespace mtc::format {

namespace {

XXH64_state_t* asState(void* state) noexcept {
    return static_cast<XXH64_state_t*>(state);
}

}  // namespace

void FileChunkWriter::HashStateDeleter::operator()(void* state) const noexcept {
    XXH64_freeState(asState(state));
}

FileChunkWriter::FileChunkWriter() : hashState_(XXH64_createState()) {
    if (!hashState_) {
        throw IOError("failed to create xxHash64 state");
    }
    XXH64_reset(asState(hashState_.get()), 0);
}

FileChunkWriter::~FileChunkWriter() {
    const State state = state_.load();
    if (state == State::kOpen) {
        abort();
    }
}

VoidResult FileChunkWriter::initialize(const std::filesystem::path& outputPath,
                                       const TranscodeOptions& target,
                                       const MediaDescriptor& source) {
    std::lock_guard lock(mutex_);

    if (state_ == State::kOpen) {
        return makeVoidError(ErrorCode::kInvalidState, "writer is already open");
    }

    outputPath_ = outputPath;
    tempPath_ = outputPath_;
    tempPath_ += ".part";

    std::error_code ec;
    const auto parent = outputPath_.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        return std::unexpected(Error{ErrorCode::kWriteFailure, "output directory does not exist",
                                     ErrorContext{parent.string()}});
    }

    stream_.open(tempPath_, std::ios::binary | std::ios::trunc);
    if (!stream_.is_open()) {
        return std::unexpected(Error{ErrorCode::kWriteFailure, "cannot create temporary file",
                                     ErrorContext{tempPath_.string()}});
    }

    XXH64_reset(asState(hashState_.get()), 0);
    nextChunkId_ = 0;
    bytesWritten_ = 0;
    state_ = State::kOpen;

    MTC_LOG_DEBUG("Writer opened {} ({} -> {})", tempPath_.string(), source.container,
                  target.container.empty() ? source.container : target.container);
    return makeVoidSuccess();
}

VoidResult FileChunkWriter::writeChunk(const Chunk& chunk) {
    std::lock_guard lock(mutex_);

    if (state_ != State::kOpen) {
        return makeVoidError(ErrorCode::kInvalidState, "writer is not open");
    }
    if (!chunk.processed) {
        return std::unexpected(Error{ErrorCode::kWriteFailure, "chunk was not processed",
                                     ErrorContext{}.withChunk(chunk.id)});
    }
    if (chunk.id != nextChunkId_) {
        return std::unexpected(
            Error{ErrorCode::kWriteFailure,
                  fmt::format("out-of-order chunk: expected {}, got {}", nextChunkId_, chunk.id),
                  ErrorContext{tempPath_.string()}.withChunk(chunk.id)});
    }

    const auto bytes = chunk.bytes();
    if (!bytes.empty()) {
        stream_.write(reinterpret_cast<const char*>(bytes.data()),
                      static_cast<std::streamsize>(bytes.size()));
        if (!stream_) {
            return std::unexpected(Error{ErrorCode::kWriteFailure, "write failed",
                                         ErrorContext{tempPath_.string()}
                                             .withChunk(chunk.id)
                                             .withOffset(bytesWritten_)});
        }
        XXH64_update(asState(hashState_.get()), bytes.data(), bytes.size());
    }

    bytesWritten_ += bytes.size();
    ++nextChunkId_;
    return makeVoidSuccess();
}

VoidResult FileChunkWriter::finalize() {
    std::lock_guard lock(mutex_);

    if (state_ != State::kOpen) {
        return makeVoidError(ErrorCode::kInvalidState, "writer is not open");
    }

    stream_.flush();
    if (!stream_.good()) {
        return std::unexpected(
            Error{ErrorCode::kWriteFailure, "flush failed", ErrorContext{tempPath_.string()}});
    }
    stream_.close();

    std::error_code ec;
    std::filesystem::rename(tempPath_, outputPath_, ec);
    if (ec) {
        return std::unexpected(
            Error{ErrorCode::kWriteFailure,
                  fmt::format("cannot rename temporary file: {}", ec.message()),
                  ErrorContext{outputPath_.string()}});
    }

    state_ = State::kFinalized;
    MTC_LOG_DEBUG("Output finalized: {}, {} chunks, {} bytes", outputPath_.string(), nextChunkId_,
                  bytesWritten_);
    return makeVoidSuccess();
}

void FileChunkWriter::abort() noexcept {
    std::lock_guard lock(mutex_);

    const State state = state_.load();
    if (state == State::kAborted || state == State::kFinalized) {
        return;
    }
    state_ = State::kAborted;

    if (stream_.is_open()) {
        stream_.close();
    }
    cleanupTempFile();
    MTC_LOG_DEBUG("Writer aborted: {}", tempPath_.string());
}

void FileChunkWriter::cleanupTempFile() noexcept {
    if (tempPath_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(tempPath_, ec);
}

std::uint64_t FileChunkWriter::bytesWritten() const noexcept {
    std::lock_guard lock(mutex_);
    return bytesWritten_;
}

Checksum FileChunkWriter::checksum() const noexcept {
    std::lock_guard lock(mutex_);
    return XXH64_digest(asState(hashState_.get()));
}

std::uint64_t FileChunkWriter::chunksWritten() const noexcept {
    std::lock_guard lock(mutex_);
    return nextChunkId_;
}

std::filesystem::path FileChunkWriter::tempPath() const {
    std::lock_guard lock(mutex_);
    return tempPath_;
}

}  // namespace mtc::format
