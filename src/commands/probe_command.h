// =============================================================================
// mtc - Probe Command
// =============================================================================
// Command handler for `mtc probe`: analyzes a source file and shows how it
// would be split and transcoded, without writing any output.
// =============================================================================

#ifndef MTC_COMMANDS_PROBE_COMMAND_H
#define MTC_COMMANDS_PROBE_COMMAND_H

#include <cstdint>
#include <filesystem>

#include "mtc/common/media_format.h"

namespace mtc::commands {

/// @brief Options for the probe command.
struct ProbeOptions {
    std::filesystem::path inputPath;

    /// @brief Target used for the size estimate.
    TranscodeOptions target;

    std::size_t threads = 0;
    std::uint64_t chunkBytes = 0;
    std::uint64_t memoryBudgetBytes = 0;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Command handler for probing.
class ProbeCommand {
public:
    explicit ProbeCommand(ProbeOptions options);

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    struct Report {
        std::uint64_t fileSize = 0;
        MediaDescriptor source;
        MediaDescriptor target;
        std::uint64_t chunkSize = 0;
        std::uint64_t chunkCount = 0;
        std::size_t parallelism = 0;
        double estimatedRatio = 1.0;
        std::uint64_t estimatedOutputBytes = 0;
    };

    [[nodiscard]] Report buildReport() const;

    void printTextReport(const Report& report) const;

    void printJsonReport(const Report& report) const;

    ProbeOptions options_;
};

}  // namespace mtc::commands

#endif  // MTC_COMMANDS_PROBE_COMMAND_H
