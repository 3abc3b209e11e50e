// =============================================================================
// mtc - Transcode Pipeline
// =============================================================================
// Chunked parallel transcoding built on tbb::parallel_pipeline:
// - Admission stage: hands out planned chunk ranges (serial, in order)
// - Worker stage: reads and transforms one chunk (parallel)
// - Commit stage: writes processed chunks to the output (serial, in order)
//
// At most maxParallelism chunks are in flight. The commit stage sees chunks
// in plan order no matter the order in which workers finish, so the output
// is byte-identical to a sequential run.
//
// The first read, transform or write failure ends the run: admission stops,
// in-flight chunks drain without further work, every buffer returns to the
// pool and the writer is aborted. Cancellation behaves the same way but
// reports kCancelled.
//
// Usage:
// @code
// auto pipeline = TranscodePipeline::createDefault(config, "zstd");
// io::MediaSource source("input.mov");
// auto result = pipeline->run(source, "output.mp4", options, onProgress, token);
// @endcode
// =============================================================================

#ifndef MTC_PIPELINE_PIPELINE_H
#define MTC_PIPELINE_PIPELINE_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string_view>

#include "mtc/codec/chunk_transformer.h"
#include "mtc/common/error.h"
#include "mtc/common/media_format.h"
#include "mtc/common/types.h"
#include "mtc/format/chunk_writer.h"
#include "mtc/io/buffer_pool.h"
#include "mtc/io/chunk_reader.h"
#include "mtc/io/media_source.h"
#include "mtc/pipeline/pipeline_config.h"

namespace mtc::pipeline {

// =============================================================================
// Progress and Cancellation
// =============================================================================

/// @brief Progress of a run, reported after every committed chunk.
/// @note Snapshots of one run are non-decreasing in chunksCompleted.
struct ProgressSnapshot {
    double fractionComplete = 0.0;
    std::uint64_t chunksCompleted = 0;
    std::uint64_t totalChunks = 0;
    std::uint64_t bytesCompleted = 0;
    std::uint64_t totalBytes = 0;
    std::uint64_t elapsedMs = 0;

    /// @brief Linear extrapolation of the remaining time.
    [[nodiscard]] std::uint64_t estimatedRemainingMs() const noexcept {
        if (fractionComplete <= 0.0 || fractionComplete >= 1.0) {
            return 0;
        }
        return static_cast<std::uint64_t>(static_cast<double>(elapsedMs) *
                                          (1.0 - fractionComplete) / fractionComplete);
    }
};

/// @brief Receives progress snapshots from the commit stage. May be empty.
/// @note Exceptions thrown by the sink are logged and dropped.
using ProgressSink = std::function<void(const ProgressSnapshot&)>;

/// @brief Shared cancellation flag.
/// @note Copies share the flag. cancel() is a lock-free atomic store and may
///       be called from a signal handler.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// =============================================================================
// Result
// =============================================================================

/// @brief Outcome of a successful run.
struct TranscodeResult {
    std::uint64_t inputSizeBytes = 0;
    std::uint64_t outputSizeBytes = 0;
    std::uint64_t chunksProcessed = 0;
    std::uint64_t chunkSizeBytes = 0;
    std::uint64_t elapsedMs = 0;
    Checksum outputChecksum = 0;

    /// @brief Input megabytes per second of wall time.
    [[nodiscard]] double throughputMBps() const noexcept {
        if (elapsedMs == 0) {
            return 0.0;
        }
        return (static_cast<double>(inputSizeBytes) / (1024.0 * 1024.0)) /
               (static_cast<double>(elapsedMs) / 1000.0);
    }

    /// @brief Input size over output size; 1.0 when the output is empty.
    [[nodiscard]] double compressionRatio() const noexcept {
        if (outputSizeBytes == 0) {
            return 1.0;
        }
        return static_cast<double>(inputSizeBytes) / static_cast<double>(outputSizeBytes);
    }
};

// =============================================================================
// TranscodePipeline
// =============================================================================

/// @brief The collaborators a pipeline drives.
struct PipelineComponents {
    std::unique_ptr<io::MediaAnalyzer> analyzer;
    std::unique_ptr<io::ChunkReader> reader;
    std::unique_ptr<codec::ChunkTransformer> transformer;
    std::unique_ptr<format::ChunkWriter> writer;
};

class TranscodePipelineImpl;

/// @brief Orchestrates one transcode at a time.
class TranscodePipeline {
public:
    /// @throws ConfigurationError if a component is missing or config is invalid.
    TranscodePipeline(PipelineConfig config, PipelineComponents components);

    ~TranscodePipeline();

    TranscodePipeline(const TranscodePipeline&) = delete;
    TranscodePipeline& operator=(const TranscodePipeline&) = delete;
    TranscodePipeline(TranscodePipeline&&) noexcept;
    TranscodePipeline& operator=(TranscodePipeline&&) noexcept;

    /// @brief Pipeline with ProbeAnalyzer, FileChunkReader, FileChunkWriter
    ///        and the named transform engine.
    [[nodiscard]] static Result<TranscodePipeline> createDefault(PipelineConfig config,
                                                                 std::string_view engine);

    /// @brief Transcode source into outputPath.
    /// @return Run statistics, or the first failure. kCancelled if token (or
    ///         cancel()) stopped the run. No output is finalized on failure.
    [[nodiscard]] Result<TranscodeResult> run(io::MediaSource& source,
                                              const std::filesystem::path& outputPath,
                                              const TranscodeOptions& options,
                                              const ProgressSink& progress = {},
                                              const CancellationToken& token = {});

    /// @brief Request cancellation of the current run. Thread-safe.
    /// @note The request is cleared when a run ends. Issued while idle, it
    ///       cancels the next run.
    void cancel() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] const PipelineConfig& config() const noexcept;

    /// @brief Usage counters of the pipeline's buffer pool.
    [[nodiscard]] io::BufferPoolStats bufferPoolStats() const;

private:
    std::unique_ptr<TranscodePipelineImpl> impl_;
};

}  // namespace mtc::pipeline

#endif  // MTC_PIPELINE_PIPELINE_H
