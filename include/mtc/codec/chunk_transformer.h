// =============================================================================
// mtc - Chunk Transformers
// =============================================================================
// The per-chunk transformation boundary and its built-in engines:
// - identity: copies the chunk unchanged
// - invert:   replaces every byte b with 255 - b
// - zstd:     encodes each chunk as an independent Zstandard frame, so the
//             concatenated output is a valid multi-frame stream
//
// Transformers are stateless; transform() may run on many threads at once
// and never retains its input.
// =============================================================================

#ifndef MTC_CODEC_CHUNK_TRANSFORMER_H
#define MTC_CODEC_CHUNK_TRANSFORMER_H

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "mtc/common/error.h"
#include "mtc/common/media_format.h"
#include "mtc/io/buffer_pool.h"

namespace mtc::codec {

/// @brief Maps one chunk's bytes to its transcoded bytes.
class ChunkTransformer {
public:
    virtual ~ChunkTransformer() = default;

    /// @brief Transform input into a buffer acquired from pool.
    /// @return Output of any length, or kTransformFailure.
    [[nodiscard]] virtual Result<io::ManagedBuffer> transform(
        std::span<const std::uint8_t> input, const MediaDescriptor& source,
        const TranscodeOptions& target, io::BufferPool& pool) const = 0;

    /// @brief Engine name as accepted by createTransformer().
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

class IdentityTransformer final : public ChunkTransformer {
public:
    [[nodiscard]] Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                                      const MediaDescriptor& source,
                                                      const TranscodeOptions& target,
                                                      io::BufferPool& pool) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "identity"; }
};

/// @brief Byte inversion; applying it twice restores the input.
class InvertTransformer final : public ChunkTransformer {
public:
    [[nodiscard]] Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                                      const MediaDescriptor& source,
                                                      const TranscodeOptions& target,
                                                      io::BufferPool& pool) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "invert"; }
};

/// @brief One Zstandard frame per chunk.
/// @note Level comes from quality (1-100 -> 1-19) or, when quality is 0,
///       from the encoder preset. Two encoding passes enable long distance
///       matching.
class ZstdTransformer final : public ChunkTransformer {
public:
    [[nodiscard]] Result<io::ManagedBuffer> transform(std::span<const std::uint8_t> input,
                                                      const MediaDescriptor& source,
                                                      const TranscodeOptions& target,
                                                      io::BufferPool& pool) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "zstd"; }

    /// @brief Compression level used for the given options.
    [[nodiscard]] static int compressionLevel(const TranscodeOptions& target) noexcept;
};

/// @brief Names of the built-in engines.
[[nodiscard]] std::vector<std::string_view> availableTransformers();

/// @brief Create a built-in engine by name.
/// @return The engine, or kUnsupportedCodec for unknown names.
[[nodiscard]] Result<std::unique_ptr<ChunkTransformer>> createTransformer(std::string_view name);

}  // namespace mtc::codec

#endif  // MTC_CODEC_CHUNK_TRANSFORMER_H
