// =============================================================================
// mtc - Media Source and Analysis Implementation
// =============================================================================

#include "mtc/io/media_source.h"

#include "mtc/common/logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <fstream>
#include <string_view>

namespace mtc::io {

namespace {

/// @brief Enough to see the MPEG-TS sync byte of the second packet.
constexpr std::size_t kProbeBytes = 189;
constexpr std::size_t kTsPacketSize = 188;

bool matchesAt(const std::uint8_t* data, std::size_t size, std::size_t offset,
               std::string_view magic) noexcept {
    return size >= offset + magic.size() &&
           std::memcmp(data + offset, magic.data(), magic.size()) == 0;
}

std::string lowerExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string containerFromExtension(const std::filesystem::path& path) {
    const std::string ext = lowerExtension(path);
    if (ext == ".mp4" || ext == ".m4v" || ext == ".m4a") {
        return "MP4";
    }
    if (ext == ".mov") {
        return "QuickTime";
    }
    if (ext == ".mkv") {
        return "Matroska";
    }
    if (ext == ".webm") {
        return "WebM";
    }
    if (ext == ".avi") {
        return "AVI";
    }
    if (ext == ".ts" || ext == ".m2ts") {
        return "MPEG-TS";
    }
    if (ext == ".ogg" || ext == ".ogv") {
        return "Ogg";
    }
    if (ext == ".flac") {
        return "FLAC";
    }
    if (ext == ".mp3") {
        return "MP3";
    }
    if (ext == ".wav") {
        return "WAV";
    }
    return "Unknown";
}

}  // namespace

// =============================================================================
// Container detection
// =============================================================================

std::optional<std::string> detectContainer(const std::uint8_t* header, std::size_t size,
                                           const std::filesystem::path& path) {
    if (matchesAt(header, size, 4, "ftyp")) {
        return matchesAt(header, size, 8, "qt  ") ? "QuickTime" : "MP4";
    }
    if (matchesAt(header, size, 0, "\x1A\x45\xDF\xA3")) {
        return lowerExtension(path) == ".webm" ? "WebM" : "Matroska";
    }
    if (matchesAt(header, size, 0, "RIFF")) {
        if (matchesAt(header, size, 8, "AVI ")) {
            return "AVI";
        }
        if (matchesAt(header, size, 8, "WAVE")) {
            return "WAV";
        }
    }
    if (matchesAt(header, size, 0, "OggS")) {
        return "Ogg";
    }
    if (matchesAt(header, size, 0, "fLaC")) {
        return "FLAC";
    }
    if (matchesAt(header, size, 0, "ID3")) {
        return "MP3";
    }
    if (size > kTsPacketSize && header[0] == 0x47 && header[kTsPacketSize] == 0x47) {
        return "MPEG-TS";
    }
    if (size >= 2 && header[0] == 0xFF && (header[1] & 0xE0) == 0xE0) {
        return "MP3";
    }
    return std::nullopt;
}

MediaDescriptor defaultDescriptorFor(std::string_view container) {
    MediaDescriptor descriptor;
    descriptor.container = std::string(container);

    if (container == "MP4") {
        descriptor.videoCodec = "H.264";
        descriptor.audioCodec = "AAC";
        descriptor.width = 1920;
        descriptor.height = 1080;
        descriptor.frameRate = 30.0;
    } else if (container == "QuickTime") {
        descriptor.videoCodec = "ProRes";
        descriptor.audioCodec = "PCM";
        descriptor.width = 3840;
        descriptor.height = 2160;
        descriptor.frameRate = 24.0;
    } else {
        descriptor.videoCodec = "Unknown";
        descriptor.audioCodec = "Unknown";
    }
    return descriptor;
}

// =============================================================================
// ProbeAnalyzer
// =============================================================================

Result<MediaDescriptor> ProbeAnalyzer::analyze(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return makeError<MediaDescriptor>(
            Error{ErrorCode::kSourceNotFound, "media file not found", ErrorContext{path.string()}});
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return makeError<MediaDescriptor>(
            Error{ErrorCode::kAnalysisFailure, "cannot open media file for analysis",
                  ErrorContext{path.string()}});
    }

    std::array<std::uint8_t, kProbeBytes> header{};
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (in.bad()) {
        return makeError<MediaDescriptor>(
            Error{ErrorCode::kAnalysisFailure, "failed to read media header",
                  ErrorContext{path.string()}});
    }
    const auto headerSize = static_cast<std::size_t>(in.gcount());

    std::string container;
    if (auto detected = detectContainer(header.data(), headerSize, path)) {
        container = std::move(*detected);
    } else {
        container = containerFromExtension(path);
        MTC_LOG_DEBUG("No container signature in {}, using extension: {}", path.string(),
                      container);
    }

    MediaDescriptor descriptor = defaultDescriptorFor(container);
    MTC_LOG_DEBUG("Analyzed {}: {}", path.string(), descriptor.toString());
    return descriptor;
}

// =============================================================================
// MediaSource
// =============================================================================

MediaSource::MediaSource(std::filesystem::path path) : path_(std::move(path)) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        throw IOError(ErrorCode::kSourceNotFound, "media file not found",
                      ErrorContext{path_.string()});
    }
    sizeBytes_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw IOError("cannot determine size of " + path_.string(), ec);
    }
}

MediaSource::MediaSource(std::filesystem::path path, MediaDescriptor descriptor)
    : MediaSource(std::move(path)) {
    descriptor_ = std::move(descriptor);
}

Result<MediaDescriptor> MediaSource::ensureAnalyzed(const MediaAnalyzer& analyzer) {
    std::lock_guard lock(mutex_);
    if (descriptor_) {
        return *descriptor_;
    }

    auto result = analyzer.analyze(path_);
    if (!result) {
        return std::unexpected(result.error());
    }
    descriptor_ = *result;
    return *descriptor_;
}

std::optional<MediaDescriptor> MediaSource::descriptor() const {
    std::lock_guard lock(mutex_);
    return descriptor_;
}

bool MediaSource::analyzed() const {
    std::lock_guard lock(mutex_);
    return descriptor_.has_value();
}

}  // namespace mtc::io
