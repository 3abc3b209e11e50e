// =============================================================================
// mtc - Media Source and Analysis
// =============================================================================
// MediaSource identifies an input file and caches its analysis.
// MediaAnalyzer is the analysis boundary; ProbeAnalyzer is the built-in
// implementation that recognises common containers from their magic bytes,
// falling back to the file extension.
// =============================================================================

#ifndef MTC_IO_MEDIA_SOURCE_H
#define MTC_IO_MEDIA_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "mtc/common/error.h"
#include "mtc/common/media_format.h"

namespace mtc::io {

// =============================================================================
// MediaAnalyzer
// =============================================================================

/// @brief Produces a MediaDescriptor for a file.
class MediaAnalyzer {
public:
    virtual ~MediaAnalyzer() = default;

    /// @brief Analyze the file at path.
    /// @return Descriptor, or kAnalysisFailure / kSourceNotFound.
    [[nodiscard]] virtual Result<MediaDescriptor> analyze(
        const std::filesystem::path& path) const = 0;
};

/// @brief Header sniffing analyzer with extension fallback.
class ProbeAnalyzer final : public MediaAnalyzer {
public:
    [[nodiscard]] Result<MediaDescriptor> analyze(
        const std::filesystem::path& path) const override;
};

/// @brief Container name recognised from the leading bytes of a file.
/// @return Container name, or std::nullopt if no signature matches.
[[nodiscard]] std::optional<std::string> detectContainer(const std::uint8_t* header,
                                                         std::size_t size,
                                                         const std::filesystem::path& path);

/// @brief Descriptor defaults for a container name.
[[nodiscard]] MediaDescriptor defaultDescriptorFor(std::string_view container);

// =============================================================================
// MediaSource
// =============================================================================

/// @brief An input file plus its lazily computed descriptor.
/// @note ensureAnalyzed() runs the analyzer at most once, even when called
///       from several threads.
class MediaSource {
public:
    /// @throws IOError (kSourceNotFound) if path is not an existing regular file.
    explicit MediaSource(std::filesystem::path path);

    /// @brief Construct with a known descriptor, skipping analysis.
    MediaSource(std::filesystem::path path, MediaDescriptor descriptor);

    MediaSource(const MediaSource&) = delete;
    MediaSource& operator=(const MediaSource&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief File size captured at construction.
    [[nodiscard]] std::uint64_t sizeBytes() const noexcept { return sizeBytes_; }

    /// @brief Run analysis if it has not succeeded yet and return the descriptor.
    [[nodiscard]] Result<MediaDescriptor> ensureAnalyzed(const MediaAnalyzer& analyzer);

    /// @brief The descriptor, if analysis has completed.
    [[nodiscard]] std::optional<MediaDescriptor> descriptor() const;

    [[nodiscard]] bool analyzed() const;

private:
    std::filesystem::path path_;
    std::uint64_t sizeBytes_ = 0;
    std::optional<MediaDescriptor> descriptor_;
    mutable std::mutex mutex_;
};

}  // namespace mtc::io

#endif  // MTC_IO_MEDIA_SOURCE_H
