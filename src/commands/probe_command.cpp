// =============================================================================
// mtc - Probe Command Implementation
// =============================================================================

#include "probe_command.h"

#include <iostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "mtc/common/error.h"
#include "mtc/common/logger.h"
#include "mtc/common/memory_budget.h"
#include "mtc/io/media_source.h"
#include "mtc/pipeline/chunk_planner.h"
#include "mtc/pipeline/chunk_size_policy.h"
#include "mtc/pipeline/pipeline_config.h"

namespace mtc::commands {

namespace {

/// @brief Escape a string for inclusion in a JSON document.
std::string jsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

void printDescriptorJson(std::string_view key, const MediaDescriptor& d, bool trailingComma) {
    std::cout << "  \"" << key << "\": {\n";
    std::cout << "    \"container\": \"" << jsonEscape(d.container) << "\",\n";
    std::cout << "    \"video_codec\": \"" << jsonEscape(d.videoCodec) << "\",\n";
    std::cout << "    \"audio_codec\": \"" << jsonEscape(d.audioCodec) << "\",\n";
    std::cout << "    \"width\": " << d.width << ",\n";
    std::cout << "    \"height\": " << d.height << ",\n";
    std::cout << fmt::format("    \"frame_rate\": {:.3f},\n", d.frameRate);
    std::cout << "    \"bitrate\": " << d.bitrate << "\n";
    std::cout << "  }" << (trailingComma ? "," : "") << "\n";
}

}  // namespace

ProbeCommand::ProbeCommand(ProbeOptions options) : options_(std::move(options)) {}

int ProbeCommand::execute() {
    try {
        const Report report = buildReport();
        if (options_.jsonOutput) {
            printJsonReport(report);
        } else {
            printTextReport(report);
        }
        return toExitCode(ErrorCode::kSuccess);
    } catch (const MTCException& e) {
        MTC_LOG_ERROR("Probe failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        MTC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

ProbeCommand::Report ProbeCommand::buildReport() const {
    if (auto valid = options_.target.validate(); !valid) {
        throw ConfigurationError(valid.error().message());
    }

    io::MediaSource source(options_.inputPath);
    io::ProbeAnalyzer analyzer;

    pipeline::PipelineConfig config;
    config.maxParallelism =
        options_.threads > 0 ? options_.threads : pipeline::recommendedParallelism();
    config.fixedChunkBytes = options_.chunkBytes;
    config.memoryBudgetBytes =
        options_.memoryBudgetBytes > 0 ? options_.memoryBudgetBytes : recommendedMemoryBudget();
    unwrapOrThrow(config.validate());

    Report report;
    report.fileSize = source.sizeBytes();
    report.source = unwrapOrThrow(source.ensureAnalyzed(analyzer));
    report.target = resolveTarget(report.source, options_.target);
    report.parallelism = config.maxParallelism;
    report.chunkSize = pipeline::chooseChunkSize(report.fileSize, config);
    report.chunkCount =
        unwrapOrThrow(pipeline::ChunkPlan::create(report.fileSize, report.chunkSize)).chunkCount();
    report.estimatedRatio = estimateCompressionRatio(report.source, options_.target);
    if (report.estimatedRatio > 0.0) {
        report.estimatedOutputBytes = static_cast<std::uint64_t>(
            static_cast<double>(report.fileSize) / report.estimatedRatio);
    }

    MTC_LOG_DEBUG("Probed {}: {}", options_.inputPath.string(), report.source.toString());
    return report;
}

void ProbeCommand::printTextReport(const Report& report) const {
    std::cout << "File: " << options_.inputPath.string() << "\n";
    std::cout << "================================================\n\n";

    std::cout << "Source:\n";
    std::cout << "  Size:         " << formatMemorySize(report.fileSize) << "\n";
    std::cout << "  Format:       " << report.source.toString() << "\n";
    std::cout << "  Resolution:   " << report.source.resolution() << "\n";
    if (report.source.durationSeconds > 0.0) {
        std::cout << fmt::format("  Duration:     {:.2f} s\n", report.source.durationSeconds);
    }
    std::cout << "\n";

    std::cout << "Target:\n";
    std::cout << "  Format:       " << report.target.toString() << "\n";
    std::cout << "  Resolution:   " << report.target.resolution() << "\n";
    std::cout << "  Engine:       " << options_.target.engine << "\n";
    std::cout << "\n";

    std::cout << "Plan:\n";
    std::cout << "  Workers:      " << report.parallelism << "\n";
    std::cout << "  Chunk size:   " << formatMemorySize(report.chunkSize) << "\n";
    std::cout << "  Chunks:       " << report.chunkCount << "\n";
    std::cout << fmt::format("  Est. ratio:   {:.2f}x\n", report.estimatedRatio);
    std::cout << "  Est. output:  " << formatMemorySize(report.estimatedOutputBytes) << "\n";
}

void ProbeCommand::printJsonReport(const Report& report) const {
    std::cout << "{\n";
    std::cout << "  \"file\": \"" << jsonEscape(options_.inputPath.string()) << "\",\n";
    std::cout << "  \"file_size\": " << report.fileSize << ",\n";
    printDescriptorJson("source", report.source, true);
    printDescriptorJson("target", report.target, true);
    std::cout << "  \"engine\": \"" << jsonEscape(options_.target.engine) << "\",\n";
    std::cout << "  \"plan\": {\n";
    std::cout << "    \"workers\": " << report.parallelism << ",\n";
    std::cout << "    \"chunk_size\": " << report.chunkSize << ",\n";
    std::cout << "    \"chunk_count\": " << report.chunkCount << "\n";
    std::cout << "  },\n";
    std::cout << fmt::format("  \"estimated_ratio\": {:.4f},\n", report.estimatedRatio);
    std::cout << "  \"estimated_output_size\": " << report.estimatedOutputBytes << "\n";
    std::cout << "}\n";
}

}  // namespace mtc::commands
