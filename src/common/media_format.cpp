// =============================================================================
// mtc - Media Format Model Implementation
// =============================================================================

#include "mtc/common/media_format.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <string>

namespace mtc {

namespace {

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

double codecEfficiency(std::string_view codec) noexcept {
    if (codec == "H.264") {
        return 1.2;
    }
    if (codec == "H.265") {
        return 1.5;
    }
    if (codec == "VP9") {
        return 1.4;
    }
    if (codec == "AV1") {
        return 1.8;
    }
    return 1.0;
}

std::uint32_t roundToEven(double value) noexcept {
    auto rounded = static_cast<std::uint32_t>(std::lround(value / 2.0) * 2);
    return std::max<std::uint32_t>(rounded, 2);
}

}  // namespace

// =============================================================================
// MediaDescriptor
// =============================================================================

std::string MediaDescriptor::resolution() const {
    return fmt::format("{}x{}", width, height);
}

std::string MediaDescriptor::toString() const {
    return fmt::format("{} | Video: {} ({}@{:.2f}fps) | Audio: {}", container, videoCodec,
                       resolution(), frameRate, audioCodec);
}

// =============================================================================
// TranscodeOptions
// =============================================================================

TranscodeOptions TranscodeOptions::hdPreset() {
    TranscodeOptions options;
    options.container = "MP4";
    options.videoCodec = "H.264";
    options.audioCodec = "AAC";
    options.width = 1920;
    options.height = 1080;
    options.frameRate = 30.0;
    options.videoBitrate = 5'000'000;
    options.audioBitrate = 192'000;
    options.quality = 0;
    options.encoderPreset = "medium";
    return options;
}

TranscodeOptions TranscodeOptions::uhd4kPreset() {
    TranscodeOptions options;
    options.container = "MP4";
    options.videoCodec = "H.265";
    options.audioCodec = "AAC";
    options.width = 3840;
    options.height = 2160;
    options.frameRate = 30.0;
    options.videoBitrate = 15'000'000;
    options.audioBitrate = 320'000;
    options.quality = 0;
    options.encoderPreset = "slow";
    return options;
}

TranscodeOptions TranscodeOptions::webPreset() {
    TranscodeOptions options;
    options.container = "MP4";
    options.videoCodec = "H.264";
    options.audioCodec = "AAC";
    options.width = 1280;
    options.height = 720;
    options.frameRate = 30.0;
    options.videoBitrate = 2'500'000;
    options.audioBitrate = 128'000;
    options.quality = 0;
    options.encoderPreset = "fast";
    return options;
}

std::optional<TranscodeOptions> TranscodeOptions::fromPresetName(std::string_view name) {
    const std::string lower = toLower(name);
    if (lower == "hd" || lower == "1080p") {
        return hdPreset();
    }
    if (lower == "4k" || lower == "uhd" || lower == "2160p") {
        return uhd4kPreset();
    }
    if (lower == "web" || lower == "720p") {
        return webPreset();
    }
    return std::nullopt;
}

VoidResult TranscodeOptions::validate() const {
    if (quality > 100) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             fmt::format("quality must be in [0, 100], got {}", quality));
    }
    if (encodingPasses != 1 && encodingPasses != 2) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             fmt::format("encoding passes must be 1 or 2, got {}", encodingPasses));
    }
    if (frameRate < 0.0 || !std::isfinite(frameRate)) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             fmt::format("invalid frame rate: {}", frameRate));
    }
    if ((width % 2) != 0 || (height % 2) != 0) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             fmt::format("dimensions must be even, got {}x{}", width, height));
    }
    if (!encoderPreset.empty() && !encoderPresetIndex(encoderPreset)) {
        return makeVoidError(ErrorCode::kInvalidConfiguration,
                             fmt::format("unknown encoder preset '{}'", encoderPreset));
    }
    if (engine.empty()) {
        return makeVoidError(ErrorCode::kInvalidConfiguration, "transform engine must be named");
    }
    return makeVoidSuccess();
}

std::optional<std::size_t> encoderPresetIndex(std::string_view preset) noexcept {
    for (std::size_t i = 0; i < std::size(kEncoderPresets); ++i) {
        if (kEncoderPresets[i] == preset) {
            return i;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Target resolution
// =============================================================================

MediaDescriptor resolveTarget(const MediaDescriptor& source, const TranscodeOptions& target) {
    MediaDescriptor resolved = source;

    if (!target.container.empty()) {
        resolved.container = target.container;
    }
    if (!target.videoCodec.empty()) {
        resolved.videoCodec = target.videoCodec;
    }
    if (!target.audioCodec.empty()) {
        resolved.audioCodec = target.audioCodec;
    }
    if (target.frameRate > 0.0) {
        resolved.frameRate = target.frameRate;
    }
    if (target.videoBitrate > 0) {
        resolved.bitrate = target.videoBitrate + target.audioBitrate;
    }

    const bool haveSourceAspect = source.width > 0 && source.height > 0;
    if (target.width > 0 && target.height > 0) {
        resolved.width = target.width;
        resolved.height = target.height;
    } else if (target.width > 0) {
        resolved.width = target.width;
        if (target.maintainAspectRatio && haveSourceAspect) {
            resolved.height = roundToEven(static_cast<double>(target.width) * source.height /
                                          source.width);
        }
    } else if (target.height > 0) {
        resolved.height = target.height;
        if (target.maintainAspectRatio && haveSourceAspect) {
            resolved.width = roundToEven(static_cast<double>(target.height) * source.width /
                                         source.height);
        }
    }

    return resolved;
}

double estimateCompressionRatio(const MediaDescriptor& source,
                                const TranscodeOptions& target) noexcept {
    double ratio = 1.0;

    if (!target.videoCodec.empty() && source.videoCodec != target.videoCodec) {
        ratio = codecEfficiency(target.videoCodec);
    }

    if (target.width > 0 && target.height > 0 && source.width > 0 && source.height > 0) {
        const double sourcePixels = static_cast<double>(source.width) * source.height;
        const double targetPixels = static_cast<double>(target.width) * target.height;
        if (targetPixels < sourcePixels) {
            ratio *= sourcePixels / targetPixels;
        }
    }

    if (target.videoBitrate > 0 && source.bitrate > 0) {
        ratio = static_cast<double>(source.bitrate) / static_cast<double>(target.videoBitrate);
    }

    return ratio;
}

}  // namespace mtc
