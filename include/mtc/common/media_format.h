// =============================================================================
// mtc - Media Format Model
// =============================================================================
// MediaDescriptor describes what analysis found in a source file.
// TranscodeOptions describes the requested target; zero or empty fields mean
// "keep the source value". Named presets cover the common HD, 4K and web
// targets.
// =============================================================================

#ifndef MTC_COMMON_MEDIA_FORMAT_H
#define MTC_COMMON_MEDIA_FORMAT_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mtc/common/error.h"

namespace mtc {

// =============================================================================
// MediaDescriptor
// =============================================================================

/// @brief Container and stream parameters of a media file.
struct MediaDescriptor {
    std::string container;
    std::string videoCodec;
    std::string audioCodec;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    double frameRate = 0.0;
    std::uint32_t bitDepth = 8;
    double durationSeconds = 0.0;
    /// @brief Overall bitrate in bits per second.
    std::uint64_t bitrate = 0;

    /// @brief "WxH", e.g. "1920x1080".
    [[nodiscard]] std::string resolution() const;

    /// @brief "MP4 | Video: H.264 (1920x1080@30.00fps) | Audio: AAC".
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] bool operator==(const MediaDescriptor& other) const = default;
};

// =============================================================================
// TranscodeOptions
// =============================================================================

inline constexpr std::uint32_t kDefaultQuality = 80;
inline constexpr std::string_view kDefaultEncoderPreset = "medium";
inline constexpr std::string_view kDefaultEngine = "identity";

/// @brief Requested output format and encoder settings.
struct TranscodeOptions {
    std::string container;
    std::string videoCodec;
    std::string audioCodec;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    double frameRate = 0.0;
    /// @brief Target video bitrate in bits per second; 0 keeps the source rate.
    std::uint64_t videoBitrate = 0;
    std::uint64_t audioBitrate = 0;
    /// @brief 1-100, or 0 to let the bitrate drive the encoder.
    std::uint32_t quality = kDefaultQuality;
    bool maintainAspectRatio = true;
    /// @brief 1 or 2.
    std::uint32_t encodingPasses = 1;
    std::string encoderPreset{kDefaultEncoderPreset};
    /// @brief Name of the chunk transform engine.
    std::string engine{kDefaultEngine};
    std::string additionalParameters;

    /// @brief 1080p H.264 at 5 Mbps.
    [[nodiscard]] static TranscodeOptions hdPreset();

    /// @brief 2160p H.265 at 15 Mbps, slow preset.
    [[nodiscard]] static TranscodeOptions uhd4kPreset();

    /// @brief 720p H.264 at 2.5 Mbps, fast preset.
    [[nodiscard]] static TranscodeOptions webPreset();

    /// @brief Look up a preset by name ("hd", "4k", "web"; case-insensitive).
    [[nodiscard]] static std::optional<TranscodeOptions> fromPresetName(std::string_view name);

    [[nodiscard]] VoidResult validate() const;
};

/// @brief Names accepted by TranscodeOptions::fromPresetName.
[[nodiscard]] constexpr std::string_view presetNames() noexcept {
    return "hd, 4k, web";
}

/// @brief Encoder speed presets from fastest to slowest.
inline constexpr std::string_view kEncoderPresets[] = {
    "ultrafast", "superfast", "veryfast", "faster", "fast",
    "medium",    "slow",      "slower",   "veryslow"};

/// @brief Index of an encoder preset in kEncoderPresets, if known.
[[nodiscard]] std::optional<std::size_t> encoderPresetIndex(std::string_view preset) noexcept;

// =============================================================================
// Target resolution
// =============================================================================

/// @brief Merge target options onto a source descriptor.
/// @note Unset target fields inherit the source value. When only one
///       dimension is given and maintainAspectRatio is set, the other is
///       derived from the source aspect ratio and rounded to an even value.
[[nodiscard]] MediaDescriptor resolveTarget(const MediaDescriptor& source,
                                            const TranscodeOptions& target);

/// @brief Heuristic ratio of input size to output size for a transcode.
/// @note Codec efficiency when the video codec changes, scaled by the pixel
///       ratio when downscaling. A known source bitrate and a target video
///       bitrate override both.
[[nodiscard]] double estimateCompressionRatio(const MediaDescriptor& source,
                                              const TranscodeOptions& target) noexcept;

}  // namespace mtc

#endif  // MTC_COMMON_MEDIA_FORMAT_H
