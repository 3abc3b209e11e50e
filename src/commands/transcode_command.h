// =============================================================================
// mtc - Transcode Command
// =============================================================================
// Command handler for `mtc transcode`: builds the target options, runs the
// pipeline with progress display and cancellation, and prints a summary.
// =============================================================================

#ifndef MTC_COMMANDS_TRANSCODE_COMMAND_H
#define MTC_COMMANDS_TRANSCODE_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "mtc/common/error.h"
#include "mtc/common/media_format.h"
#include "mtc/pipeline/pipeline.h"

namespace mtc::commands {

/// @brief Options for a transcode run.
struct TranscodeCommandOptions {
    std::filesystem::path inputPath;
    std::filesystem::path outputPath;

    /// @brief Target format, already merged from profile and explicit flags.
    TranscodeOptions target;

    /// @brief Worker count (0 = auto-detect).
    std::size_t threads = 0;

    /// @brief Fixed chunk size in bytes (0 = automatic).
    std::uint64_t chunkBytes = 0;

    /// @brief Memory budget in bytes (0 = derive from system memory).
    std::uint64_t memoryBudgetBytes = 0;

    bool forceOverwrite = false;
    bool showProgress = true;
    bool quiet = false;
};

/// @brief Summary of a finished transcode.
struct TranscodeCommandStats {
    pipeline::TranscodeResult result;
    MediaDescriptor source;
    MediaDescriptor target;
    std::size_t parallelism = 0;
    std::size_t peakRssBytes = 0;
};

/// @brief Command handler for transcoding.
class TranscodeCommand {
public:
    TranscodeCommand(TranscodeCommandOptions options, pipeline::CancellationToken token);

    ~TranscodeCommand();

    TranscodeCommand(const TranscodeCommand&) = delete;
    TranscodeCommand& operator=(const TranscodeCommand&) = delete;
    TranscodeCommand(TranscodeCommand&&) noexcept;
    TranscodeCommand& operator=(TranscodeCommand&&) noexcept;

    /// @brief Run the transcode.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const TranscodeCommandStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const TranscodeCommandOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    [[nodiscard]] pipeline::PipelineConfig buildPipelineConfig() const;

    void runTranscode();

    void reportProgress(const pipeline::ProgressSnapshot& snapshot);

    void printSummary() const;

    TranscodeCommandOptions options_;
    pipeline::CancellationToken token_;
    TranscodeCommandStats stats_;
    std::uint64_t lastProgressLogMs_ = 0;
    bool progressLineOpen_ = false;
};

}  // namespace mtc::commands

#endif  // MTC_COMMANDS_TRANSCODE_COMMAND_H
