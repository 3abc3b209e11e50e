// =============================================================================
// mtc - Transcode Pipeline Implementation
// =============================================================================

#include "mtc/pipeline/pipeline.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>

#include <fmt/format.h>
#include <tbb/parallel_pipeline.h>
#include <tbb/task_arena.h>

#include "mtc/common/logger.h"
#include "mtc/common/memory_budget.h"
#include "mtc/pipeline/chunk_planner.h"
#include "mtc/pipeline/chunk_size_policy.h"

namespace mtc::pipeline {

namespace {

using Clock = std::chrono::steady_clock;

std::uint64_t millisecondsSince(Clock::time_point start) {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}

/// @brief Unit of work travelling through the TBB filters.
/// @note chunk stays empty when the worker stage skipped or failed.
struct WorkItem {
    ChunkId id = kInvalidChunkId;
    ChunkRange range;
    std::optional<Chunk> chunk;
};

/// @brief Convert the exception in flight into an Error.
/// @note Only valid inside a catch handler. kInvalidChunkId adds no chunk context.
Error errorFromException(ErrorCode fallback, ChunkId id, std::string_view stage) {
    ErrorContext context;
    if (id != kInvalidChunkId) {
        context.withChunk(id);
    }
    try {
        throw;
    } catch (const MTCException& ex) {
        return Error{ex};
    } catch (const std::exception& ex) {
        return Error{fallback, fmt::format("{} threw: {}", stage, ex.what()), context};
    } catch (...) {
        return Error{fallback, fmt::format("{} threw a non-standard exception", stage), context};
    }
}

}  // namespace

// =============================================================================
// TranscodePipelineImpl
// =============================================================================

class TranscodePipelineImpl {
public:
    TranscodePipelineImpl(PipelineConfig config, PipelineComponents components)
        : config_(config),
          components_(std::move(components)),
          pool_(config_.maxParallelism * 2 + 2) {}

    Result<TranscodeResult> run(io::MediaSource& source, const std::filesystem::path& outputPath,
                                const TranscodeOptions& options, const ProgressSink& progress,
                                const CancellationToken& token) {
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            return makeError<TranscodeResult>(ErrorCode::kInvalidState,
                                              "pipeline is already running");
        }
        // A cancel() seen while running_ is set must reach this run, so the
        // request flag is cleared when the run ends rather than when it starts.
        struct RunningGuard {
            std::atomic<bool>& running;
            std::atomic<bool>& cancelled;
            ~RunningGuard() {
                cancelled.store(false);
                running.store(false);
            }
        } guard{running_, cancelled_};

        stopped_.store(false);
        firstError_.reset();

        const auto startTime = Clock::now();

        if (auto valid = validateRun(source, outputPath, options); !valid) {
            return std::unexpected(valid.error());
        }

        auto descriptor = source.ensureAnalyzed(*components_.analyzer);
        if (!descriptor) {
            return std::unexpected(descriptor.error());
        }

        format::ChunkWriter& writer = *components_.writer;
        if (auto init = writer.initialize(outputPath, options, *descriptor); !init) {
            writer.abort();
            return std::unexpected(init.error());
        }

        const std::uint64_t fileSize = source.sizeBytes();
        const std::uint64_t chunkSize = chooseChunkSize(fileSize, config_);
        auto plan = ChunkPlan::create(fileSize, chunkSize);
        if (!plan) {
            writer.abort();
            return std::unexpected(plan.error());
        }

        RunState state;
        state.totalChunks = plan->chunkCount();
        state.totalBytes = fileSize;
        state.startTime = startTime;

        MTC_LOG_INFO("Transcoding {} ({}) -> {} with engine '{}'", source.path().string(),
                     formatMemorySize(fileSize), outputPath.string(),
                     components_.transformer->name());
        MTC_LOG_DEBUG("Plan: {} chunks of {} bytes, parallelism {}, budget {}",
                      state.totalChunks, chunkSize, config_.maxParallelism,
                      formatMemorySize(config_.memoryBudgetBytes));

        if (state.totalChunks > 0) {
            try {
                executePlan(source, *plan, *descriptor, options, progress, token, state);
            } catch (...) {
                recordFailure(errorFromException(ErrorCode::kInternalError, kInvalidChunkId,
                                                 "pipeline"));
            }
        }

        if (firstError_) {
            writer.abort();
            MTC_LOG_ERROR("Transcode failed after {} of {} chunks: {}", state.chunksCompleted,
                          state.totalChunks, firstError_->message());
            return std::unexpected(*firstError_);
        }

        if (state.chunksCompleted < state.totalChunks) {
            writer.abort();
            MTC_LOG_WARNING("Transcode cancelled after {} of {} chunks", state.chunksCompleted,
                            state.totalChunks);
            return makeError<TranscodeResult>(
                ErrorCode::kCancelled,
                fmt::format("cancelled after {} of {} chunks", state.chunksCompleted,
                            state.totalChunks));
        }

        if (auto finalized = writer.finalize(); !finalized) {
            writer.abort();
            return std::unexpected(finalized.error());
        }

        if (state.totalChunks == 0) {
            ProgressSnapshot done;
            done.fractionComplete = 1.0;
            done.elapsedMs = millisecondsSince(startTime);
            notify(progress, done);
        }

        TranscodeResult result;
        result.inputSizeBytes = fileSize;
        result.outputSizeBytes = writer.bytesWritten();
        result.chunksProcessed = state.chunksCompleted;
        result.chunkSizeBytes = chunkSize;
        result.outputChecksum = writer.checksum();
        result.elapsedMs = millisecondsSince(startTime);

        MTC_LOG_INFO("Transcode complete: {} chunks, {} -> {}, {:.2f} MB/s",
                     result.chunksProcessed, formatMemorySize(result.inputSizeBytes),
                     formatMemorySize(result.outputSizeBytes), result.throughputMBps());
        return result;
    }

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

    [[nodiscard]] io::BufferPoolStats bufferPoolStats() const { return pool_.stats(); }

private:
    struct RunState {
        std::uint64_t totalChunks = 0;
        std::uint64_t totalBytes = 0;
        std::uint64_t chunksCompleted = 0;
        std::uint64_t bytesCompleted = 0;
        Clock::time_point startTime;
    };

    VoidResult validateRun(const io::MediaSource& source, const std::filesystem::path& outputPath,
                           const TranscodeOptions& options) const {
        if (auto valid = config_.validate(); !valid) {
            return valid;
        }
        if (auto valid = options.validate(); !valid) {
            return valid;
        }
        if (outputPath.empty()) {
            return makeVoidError(ErrorCode::kInvalidConfiguration, "output path is empty");
        }
        std::error_code ec;
        if (std::filesystem::equivalent(source.path(), outputPath, ec)) {
            return makeVoidError(ErrorCode::kInvalidConfiguration,
                                 "output path must differ from the source path");
        }
        return makeVoidSuccess();
    }

    [[nodiscard]] bool shouldStop(const CancellationToken& token) {
        if (stopped_.load(std::memory_order_acquire)) {
            return true;
        }
        if (token.isCancelled() || cancelled_.load(std::memory_order_acquire)) {
            stopped_.store(true, std::memory_order_release);
            return true;
        }
        return false;
    }

    /// @brief Deliver a snapshot. A throwing sink never affects the run.
    static void notify(const ProgressSink& progress, const ProgressSnapshot& snapshot) {
        if (!progress) {
            return;
        }
        try {
            progress(snapshot);
        } catch (const std::exception& ex) {
            MTC_LOG_WARNING("Progress sink threw: {}", ex.what());
        } catch (...) {
            MTC_LOG_WARNING("Progress sink threw a non-standard exception");
        }
    }

    /// @brief Keep the first failure; later ones are only logged.
    void recordFailure(Error error) {
        stopped_.store(true, std::memory_order_release);
        std::lock_guard lock(errorMutex_);
        if (!firstError_) {
            firstError_ = std::move(error);
        } else {
            MTC_LOG_WARNING("Suppressed secondary failure: {}", error.message());
        }
    }

    void executePlan(io::MediaSource& source, const ChunkPlan& plan,
                     const MediaDescriptor& descriptor, const TranscodeOptions& options,
                     const ProgressSink& progress, const CancellationToken& token,
                     RunState& state) {
        const io::ChunkReader& reader = *components_.reader;
        const codec::ChunkTransformer& transformer = *components_.transformer;
        format::ChunkWriter& writer = *components_.writer;

        auto next = plan.begin();
        const auto end = plan.end();
        ChunkId nextId = 0;

        auto admit = [&](tbb::flow_control& fc) -> WorkItem {
            if (next == end || shouldStop(token)) {
                fc.stop();
                return {};
            }
            WorkItem item;
            item.id = nextId++;
            item.range = *next;
            ++next;
            return item;
        };

        auto process = [&](WorkItem item) -> WorkItem {
            if (shouldStop(token)) {
                return item;
            }

            try {
                auto chunk = reader.readRange(source, item.id, item.range, pool_);
                if (!chunk) {
                    recordFailure(std::move(chunk.error()));
                    return item;
                }
                if (shouldStop(token)) {
                    return item;
                }

                auto output = transformer.transform(chunk->bytes(), descriptor, options, pool_);
                if (!output) {
                    const Error& cause = output.error();
                    recordFailure(Error{cause.code(), cause.message(),
                                        ErrorContext{}.withChunk(item.id).withOffset(
                                            item.range.offset)});
                    return item;
                }
                item.chunk = std::move(*chunk).withProcessedPayload(std::move(*output));
            } catch (...) {
                recordFailure(errorFromException(ErrorCode::kTransformFailure, item.id, "worker"));
                item.chunk.reset();
            }
            return item;
        };

        auto commit = [&](WorkItem item) {
            if (!item.chunk || shouldStop(token)) {
                return;
            }

            try {
                if (auto written = writer.writeChunk(*item.chunk); !written) {
                    recordFailure(std::move(written.error()));
                    return;
                }
            } catch (...) {
                recordFailure(errorFromException(ErrorCode::kWriteFailure, item.id, "writer"));
                return;
            }

            item.chunk.reset();
            ++state.chunksCompleted;
            state.bytesCompleted += item.range.length;
            MTC_LOG_TRACE("Committed chunk {} [{}, {})", item.id, item.range.offset,
                          item.range.end());

            if (progress) {
                ProgressSnapshot snapshot;
                snapshot.chunksCompleted = state.chunksCompleted;
                snapshot.totalChunks = state.totalChunks;
                snapshot.bytesCompleted = state.bytesCompleted;
                snapshot.totalBytes = state.totalBytes;
                snapshot.fractionComplete = static_cast<double>(state.chunksCompleted) /
                                            static_cast<double>(state.totalChunks);
                snapshot.elapsedMs = millisecondsSince(state.startTime);
                notify(progress, snapshot);
            }
        };

        const auto tokens = config_.maxParallelism;
        tbb::task_arena arena(static_cast<int>(tokens));
        arena.execute([&] {
            tbb::parallel_pipeline(
                tokens,
                tbb::make_filter<void, WorkItem>(tbb::filter_mode::serial_in_order, admit) &
                    tbb::make_filter<WorkItem, WorkItem>(tbb::filter_mode::parallel, process) &
                    tbb::make_filter<WorkItem, void>(tbb::filter_mode::serial_in_order, commit));
        });
    }

    PipelineConfig config_;
    PipelineComponents components_;
    io::BufferPool pool_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> stopped_{false};

    std::mutex errorMutex_;
    std::optional<Error> firstError_;
};

// =============================================================================
// TranscodePipeline
// =============================================================================

TranscodePipeline::TranscodePipeline(PipelineConfig config, PipelineComponents components) {
    if (auto valid = config.validate(); !valid) {
        throw ConfigurationError(valid.error().message());
    }
    if (!components.analyzer || !components.reader || !components.transformer ||
        !components.writer) {
        throw ConfigurationError("pipeline requires analyzer, reader, transformer and writer");
    }
    impl_ = std::make_unique<TranscodePipelineImpl>(config, std::move(components));
}

TranscodePipeline::~TranscodePipeline() = default;

TranscodePipeline::TranscodePipeline(TranscodePipeline&&) noexcept = default;

TranscodePipeline& TranscodePipeline::operator=(TranscodePipeline&&) noexcept = default;

Result<TranscodePipeline> TranscodePipeline::createDefault(PipelineConfig config,
                                                           std::string_view engine) {
    auto transformer = codec::createTransformer(engine);
    if (!transformer) {
        return std::unexpected(transformer.error());
    }

    PipelineComponents components;
    components.analyzer = std::make_unique<io::ProbeAnalyzer>();
    components.reader = std::make_unique<io::FileChunkReader>();
    components.transformer = std::move(*transformer);
    components.writer = std::make_unique<format::FileChunkWriter>();

    return tryExecute(
        [&] { return TranscodePipeline(config, std::move(components)); },
        ErrorCode::kInvalidConfiguration);
}

Result<TranscodeResult> TranscodePipeline::run(io::MediaSource& source,
                                               const std::filesystem::path& outputPath,
                                               const TranscodeOptions& options,
                                               const ProgressSink& progress,
                                               const CancellationToken& token) {
    return impl_->run(source, outputPath, options, progress, token);
}

void TranscodePipeline::cancel() noexcept {
    impl_->cancel();
}

bool TranscodePipeline::isRunning() const noexcept {
    return impl_->isRunning();
}

const PipelineConfig& TranscodePipeline::config() const noexcept {
    return impl_->config();
}

io::BufferPoolStats TranscodePipeline::bufferPoolStats() const {
    return impl_->bufferPoolStats();
}

}  // namespace mtc::pipeline
