// =============================================================================
// mtc - Chunked Parallel Media Transcoder
// =============================================================================
// Main entry point for the mtc command-line tool.
//
// - Subcommands: transcode, probe
// - Global options: threads, memory budget, logging, progress
// - SIGINT/SIGTERM cancel a running transcode
// =============================================================================

#include <CLI/CLI.hpp>

#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mtc/common/error.h"
#include "mtc/common/logger.h"
#include "mtc/common/media_format.h"
#include "mtc/common/memory_budget.h"
#include "mtc/pipeline/pipeline.h"

#include "commands/probe_command.h"
#include "commands/transcode_command.h"

namespace mtc::commands {
int runTranscode(CLI::App* app);
int runProbe(CLI::App* app);
}  // namespace mtc::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "mtc: chunked parallel media transcoder\n"
    "Splits a source file into chunks, transforms them on a TBB worker pool\n"
    "and reassembles the output in order.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::size_t threads = 0;  // 0 = auto-detect
    int verbosity = 0;
    std::string memoryBudget;  // empty = derive from system memory
    std::string logFile;
    std::string logLevel;
    bool quiet = false;
    bool noProgress = false;
};

GlobalOptions gOptions;

/// @brief Raised by the signal handlers; shared with the running pipeline.
mtc::pipeline::CancellationToken gCancelToken;

extern "C" void handleTerminationSignal(int /*signal*/) {
    gCancelToken.cancel();
}

void installSignalHandlers() {
    std::signal(SIGINT, handleTerminationSignal);
    std::signal(SIGTERM, handleTerminationSignal);
}

// =============================================================================
// Transcode Command Options
// =============================================================================

struct CliTranscodeOptions {
    std::string input;
    std::string output;
    std::string profile;
    std::string container;
    std::string videoCodec;
    std::string audioCodec;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    double fps = 0.0;
    std::uint64_t videoBitrate = 0;
    std::uint64_t audioBitrate = 0;
    std::uint32_t quality = mtc::kDefaultQuality;
    std::uint32_t passes = 1;
    std::string preset;
    std::string engine{mtc::kDefaultEngine};
    std::string chunkSize;
    bool noAspect = false;
    std::string extraParams;
    bool force = false;
};

CliTranscodeOptions gTranscodeOpts;

// =============================================================================
// Probe Command Options
// =============================================================================

struct CliProbeOptions {
    std::string input;
    std::string profile;
    std::string engine{mtc::kDefaultEngine};
    std::string chunkSize;
    bool json = false;
};

CliProbeOptions gProbeOpts;

// =============================================================================
// Option Helpers
// =============================================================================

/// @brief Parse a size option; empty means 0 (automatic).
[[nodiscard]] std::uint64_t parseSizeOption(const std::string& value, std::string_view name) {
    if (value.empty()) {
        return 0;
    }
    auto bytes = mtc::parseMemorySize(value);
    if (!bytes) {
        throw mtc::UsageError(fmt::format("invalid {} '{}' (expected e.g. 512M, 2G)", name, value));
    }
    return *bytes;
}

/// @brief Starting options: the named profile, or defaults.
[[nodiscard]] mtc::TranscodeOptions baseOptions(const std::string& profile) {
    if (profile.empty()) {
        return mtc::TranscodeOptions{};
    }
    auto preset = mtc::TranscodeOptions::fromPresetName(profile);
    if (!preset) {
        throw mtc::UsageError(fmt::format("unknown profile '{}' (available: {})", profile,
                                          mtc::presetNames()));
    }
    return *preset;
}

[[nodiscard]] bool given(CLI::App* app, const std::string& name) {
    return app->get_option(name)->count() > 0;
}

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupTranscodeCommand(CLI::App& app) {
    auto* transcode = app.add_subcommand("transcode", "Transcode a media file");
    transcode->alias("t");

    transcode->add_option("-i,--input", gTranscodeOpts.input, "Input media file")
        ->required()
        ->check(CLI::ExistingFile);

    transcode->add_option("-o,--output", gTranscodeOpts.output, "Output file")->required();

    transcode->add_option("--profile", gTranscodeOpts.profile,
                          "Target profile: hd, 4k, web (explicit options override it)")
        ->check(CLI::IsMember({"hd", "1080p", "4k", "uhd", "2160p", "web", "720p"},
                              CLI::ignore_case));

    transcode->add_option("--container", gTranscodeOpts.container, "Target container");
    transcode->add_option("--video-codec", gTranscodeOpts.videoCodec, "Target video codec");
    transcode->add_option("--audio-codec", gTranscodeOpts.audioCodec, "Target audio codec");

    transcode->add_option("--width", gTranscodeOpts.width, "Target width (even)");
    transcode->add_option("--height", gTranscodeOpts.height, "Target height (even)");
    transcode->add_flag("--no-aspect", gTranscodeOpts.noAspect,
                        "Do not derive a missing dimension from the source aspect ratio");

    transcode->add_option("--fps", gTranscodeOpts.fps, "Target frame rate")
        ->check(CLI::NonNegativeNumber);

    transcode->add_option("--video-bitrate", gTranscodeOpts.videoBitrate,
                          "Target video bitrate in bits/s");
    transcode->add_option("--audio-bitrate", gTranscodeOpts.audioBitrate,
                          "Target audio bitrate in bits/s");

    transcode->add_option("--quality", gTranscodeOpts.quality,
                          "Quality 1-100 (0 = bitrate driven)")
        ->check(CLI::Range(0, 100));

    transcode->add_option("--passes", gTranscodeOpts.passes, "Encoding passes (1 or 2)")
        ->check(CLI::IsMember({1, 2}));

    transcode->add_option("--preset", gTranscodeOpts.preset,
                          "Encoder preset: ultrafast ... veryslow");

    transcode->add_option("--engine", gTranscodeOpts.engine, "Transform engine")
        ->check(CLI::IsMember({"identity", "invert", "zstd"}));

    transcode->add_option("--params", gTranscodeOpts.extraParams,
                          "Additional engine parameters");

    transcode->add_option("--chunk-size", gTranscodeOpts.chunkSize,
                          "Fixed chunk size, e.g. 4M (default: automatic)");

    transcode->add_flag("-f,--force", gTranscodeOpts.force, "Overwrite existing output file");
}

void setupProbeCommand(CLI::App& app) {
    auto* probe = app.add_subcommand("probe", "Analyze a media file and show the chunk plan");
    probe->alias("p");

    probe->add_option("-i,--input", gProbeOpts.input, "Input media file")
        ->required()
        ->check(CLI::ExistingFile);

    probe->add_option("--profile", gProbeOpts.profile, "Target profile for the size estimate")
        ->check(CLI::IsMember({"hd", "1080p", "4k", "uhd", "2160p", "web", "720p"},
                              CLI::ignore_case));

    probe->add_option("--engine", gProbeOpts.engine, "Transform engine")
        ->check(CLI::IsMember({"identity", "invert", "zstd"}));

    probe->add_option("--chunk-size", gProbeOpts.chunkSize,
                      "Fixed chunk size, e.g. 4M (default: automatic)");

    probe->add_flag("--json", gProbeOpts.json, "Output as JSON");
}

[[nodiscard]] mtc::log::Level selectLogLevel() {
    if (!gOptions.logLevel.empty()) {
        return mtc::log::levelFromString(gOptions.logLevel);
    }
    if (gOptions.quiet) {
        return mtc::log::Level::kError;
    }
    if (gOptions.verbosity >= 2) {
        return mtc::log::Level::kTrace;
    }
    if (gOptions.verbosity >= 1) {
        return mtc::log::Level::kDebug;
    }
    return mtc::log::Level::kInfo;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "Read options from an INI/TOML file");

    app.add_option("-j,--threads", gOptions.threads, "Number of workers (0 = auto-detect)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);

    app.add_option("--memory-budget", gOptions.memoryBudget,
                   "Memory budget, e.g. 512M or 2G (default: half of available memory)");

    app.add_option("--log-file", gOptions.logFile, "Also write log output to this file");

    app.add_option("--log-level", gOptions.logLevel,
                   "Log level: trace, debug, info, warning, error, critical")
        ->check(CLI::IsMember({"trace", "debug", "info", "warning", "warn", "error",
                               "critical"},
                              CLI::ignore_case));

    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_flag("--no-progress", gOptions.noProgress, "Disable progress display");

    setupTranscodeCommand(app);
    setupProbeCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        mtc::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = selectLogLevel();
        mtc::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("transcode")) {
            installSignalHandlers();
            exitCode = mtc::commands::runTranscode(app.get_subcommand("transcode"));
        } else if (app.got_subcommand("probe")) {
            exitCode = mtc::commands::runProbe(app.get_subcommand("probe"));
        }
    } catch (const mtc::MTCException& ex) {
        MTC_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        MTC_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = mtc::toExitCode(mtc::ErrorCode::kInternalError);
    }

    mtc::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace mtc::commands {

int runTranscode(CLI::App* app) {
    TranscodeCommandOptions opts;
    opts.inputPath = gTranscodeOpts.input;
    opts.outputPath = gTranscodeOpts.output;
    opts.threads = gOptions.threads;
    opts.memoryBudgetBytes = parseSizeOption(gOptions.memoryBudget, "memory budget");
    opts.chunkBytes = parseSizeOption(gTranscodeOpts.chunkSize, "chunk size");
    opts.forceOverwrite = gTranscodeOpts.force;
    opts.showProgress = !gOptions.noProgress;
    opts.quiet = gOptions.quiet;

    TranscodeOptions& target = opts.target;
    target = baseOptions(gTranscodeOpts.profile);
    if (given(app, "--container")) {
        target.container = gTranscodeOpts.container;
    }
    if (given(app, "--video-codec")) {
        target.videoCodec = gTranscodeOpts.videoCodec;
    }
    if (given(app, "--audio-codec")) {
        target.audioCodec = gTranscodeOpts.audioCodec;
    }
    if (given(app, "--width")) {
        target.width = gTranscodeOpts.width;
    }
    if (given(app, "--height")) {
        target.height = gTranscodeOpts.height;
    }
    if (given(app, "--fps")) {
        target.frameRate = gTranscodeOpts.fps;
    }
    if (given(app, "--video-bitrate")) {
        target.videoBitrate = gTranscodeOpts.videoBitrate;
    }
    if (given(app, "--audio-bitrate")) {
        target.audioBitrate = gTranscodeOpts.audioBitrate;
    }
    if (given(app, "--quality")) {
        target.quality = gTranscodeOpts.quality;
    }
    if (given(app, "--passes")) {
        target.encodingPasses = gTranscodeOpts.passes;
    }
    if (given(app, "--preset")) {
        target.encoderPreset = gTranscodeOpts.preset;
    }
    if (given(app, "--params")) {
        target.additionalParameters = gTranscodeOpts.extraParams;
    }
    if (gTranscodeOpts.noAspect) {
        target.maintainAspectRatio = false;
    }
    target.engine = gTranscodeOpts.engine;

    TranscodeCommand cmd(std::move(opts), gCancelToken);
    return cmd.execute();
}

int runProbe([[maybe_unused]] CLI::App* app) {
    ProbeOptions opts;
    opts.inputPath = gProbeOpts.input;
    opts.threads = gOptions.threads;
    opts.memoryBudgetBytes = parseSizeOption(gOptions.memoryBudget, "memory budget");
    opts.chunkBytes = parseSizeOption(gProbeOpts.chunkSize, "chunk size");
    opts.jsonOutput = gProbeOpts.json;
    opts.target = baseOptions(gProbeOpts.profile);
    opts.target.engine = gProbeOpts.engine;

    ProbeCommand cmd(std::move(opts));
    return cmd.execute();
}

}  // namespace mtc::commands
