// =============================================================================
// mtc - Transcode Command Implementation
// =============================================================================

#include "transcode_command.h"

#include <cstdio>
#include <iostream>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <unistd.h>

#include "mtc/common/logger.h"
#include "mtc/common/memory_budget.h"
#include "mtc/io/media_source.h"

namespace mtc::commands {

namespace {

/// @brief Interval between progress log lines when stderr is not a terminal.
constexpr std::uint64_t kProgressLogIntervalMs = 2000;

constexpr int kProgressBarWidth = 40;

[[nodiscard]] bool isStderrTty() noexcept {
    return isatty(fileno(stderr)) != 0;
}

}  // namespace

TranscodeCommand::TranscodeCommand(TranscodeCommandOptions options,
                                   pipeline::CancellationToken token)
    : options_(std::move(options)), token_(std::move(token)) {}

TranscodeCommand::~TranscodeCommand() = default;

TranscodeCommand::TranscodeCommand(TranscodeCommand&&) noexcept = default;

TranscodeCommand& TranscodeCommand::operator=(TranscodeCommand&&) noexcept = default;

int TranscodeCommand::execute() {
    try {
        validateOptions();
        runTranscode();

        if (!options_.quiet) {
            printSummary();
        }
        return toExitCode(ErrorCode::kSuccess);
    } catch (const CancelledError& e) {
        MTC_LOG_WARNING("Transcode cancelled: {}", e.message());
        return e.exitCode();
    } catch (const MTCException& e) {
        MTC_LOG_ERROR("Transcode failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        MTC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void TranscodeCommand::validateOptions() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(options_.inputPath, ec)) {
        throw IOError(ErrorCode::kSourceNotFound, "input file not found",
                      ErrorContext{options_.inputPath.string()});
    }

    if (!options_.forceOverwrite && std::filesystem::exists(options_.outputPath, ec)) {
        throw UsageError("output file already exists: " + options_.outputPath.string() +
                         " (use -f to overwrite)");
    }

    if (auto valid = options_.target.validate(); !valid) {
        throw ConfigurationError(valid.error().message());
    }

    MTC_LOG_DEBUG("Transcode options validated");
    MTC_LOG_DEBUG("  Input: {}", options_.inputPath.string());
    MTC_LOG_DEBUG("  Output: {}", options_.outputPath.string());
    MTC_LOG_DEBUG("  Engine: {}", options_.target.engine);
    MTC_LOG_DEBUG("  Quality: {}, passes: {}, preset: {}", options_.target.quality,
                  options_.target.encodingPasses, options_.target.encoderPreset);
}

pipeline::PipelineConfig TranscodeCommand::buildPipelineConfig() const {
    pipeline::PipelineConfig config;
    config.maxParallelism =
        options_.threads > 0 ? options_.threads : pipeline::recommendedParallelism();
    config.fixedChunkBytes = options_.chunkBytes;
    config.memoryBudgetBytes =
        options_.memoryBudgetBytes > 0 ? options_.memoryBudgetBytes : recommendedMemoryBudget();
    return config;
}

void TranscodeCommand::runTranscode() {
    const pipeline::PipelineConfig config = buildPipelineConfig();
    stats_.parallelism = config.maxParallelism;

    auto pipeline = unwrapOrThrow(
        pipeline::TranscodePipeline::createDefault(config, options_.target.engine));

    io::MediaSource source(options_.inputPath);

    pipeline::ProgressSink sink;
    if (options_.showProgress && !options_.quiet) {
        sink = [this](const pipeline::ProgressSnapshot& snapshot) { reportProgress(snapshot); };
    }

    auto result = pipeline.run(source, options_.outputPath, options_.target, sink, token_);

    if (progressLineOpen_) {
        fmt::print(stderr, "\n");
        progressLineOpen_ = false;
    }

    stats_.result = unwrapOrThrow(std::move(result));
    stats_.source = source.descriptor().value_or(MediaDescriptor{});
    stats_.target = resolveTarget(stats_.source, options_.target);
    stats_.peakRssBytes = getProcessMemoryUsage().peakRssBytes;
}

void TranscodeCommand::reportProgress(const pipeline::ProgressSnapshot& snapshot) {
    if (isStderrTty()) {
        const int filled = static_cast<int>(snapshot.fractionComplete * kProgressBarWidth);
        fmt::print(stderr, "\r[{:<{}}] {:5.1f}% {}/{} chunks, ETA {}s",
                   std::string(static_cast<std::size_t>(filled), '#'), kProgressBarWidth,
                   snapshot.fractionComplete * 100.0, snapshot.chunksCompleted,
                   snapshot.totalChunks, snapshot.estimatedRemainingMs() / 1000);
        std::fflush(stderr);
        progressLineOpen_ = true;
        return;
    }

    const bool finished = snapshot.chunksCompleted == snapshot.totalChunks;
    if (!finished && snapshot.elapsedMs < lastProgressLogMs_ + kProgressLogIntervalMs) {
        return;
    }
    lastProgressLogMs_ = snapshot.elapsedMs;
    MTC_LOG_INFO("Progress: {:.1f}% ({}/{} chunks, {})", snapshot.fractionComplete * 100.0,
                 snapshot.chunksCompleted, snapshot.totalChunks,
                 formatMemorySize(snapshot.bytesCompleted));
}

void TranscodeCommand::printSummary() const {
    const auto& r = stats_.result;
    std::cout << "\n=== Transcode Summary ===\n";
    std::cout << fmt::format("  Source:       {}\n", stats_.source.toString());
    std::cout << fmt::format("  Target:       {}\n", stats_.target.toString());
    std::cout << fmt::format("  Engine:       {}\n", options_.target.engine);
    std::cout << fmt::format("  Input size:   {}\n", formatMemorySize(r.inputSizeBytes));
    std::cout << fmt::format("  Output size:  {}\n", formatMemorySize(r.outputSizeBytes));
    std::cout << fmt::format("  Ratio:        {:.2f}x\n", r.compressionRatio());
    std::cout << fmt::format("  Chunks:       {} x {}\n", r.chunksProcessed,
                             formatMemorySize(r.chunkSizeBytes));
    std::cout << fmt::format("  Workers:      {}\n", stats_.parallelism);
    std::cout << fmt::format("  Time:         {:.2f} s\n", static_cast<double>(r.elapsedMs) / 1000.0);
    std::cout << fmt::format("  Throughput:   {:.2f} MB/s\n", r.throughputMBps());
    std::cout << fmt::format("  Checksum:     {:016x}\n", r.outputChecksum);
    if (stats_.peakRssBytes > 0) {
        std::cout << fmt::format("  Peak memory:  {}\n", formatMemorySize(stats_.peakRssBytes));
    }
    std::cout.flush();
}

}  // namespace mtc::commands
