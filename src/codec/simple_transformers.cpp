// =============================================================================
// mtc - Identity and Invert Transformers
// =============================================================================

#include "mtc/codec/chunk_transformer.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstring>

namespace mtc::codec {

Result<io::ManagedBuffer> IdentityTransformer::transform(std::span<const std::uint8_t> input,
                                                         const MediaDescriptor& /*source*/,
                                                         const TranscodeOptions& /*target*/,
                                                         io::BufferPool& pool) const {
    io::ManagedBuffer output = pool.acquire(input.size());
    if (!input.empty()) {
        std::memcpy(output.data(), input.data(), input.size());
    }
    output.setSize(input.size());
    return output;
}

Result<io::ManagedBuffer> InvertTransformer::transform(std::span<const std::uint8_t> input,
                                                       const MediaDescriptor& /*source*/,
                                                       const TranscodeOptions& /*target*/,
                                                       io::BufferPool& pool) const {
    io::ManagedBuffer output = pool.acquire(input.size());
    std::transform(input.begin(), input.end(), output.data(),
                   [](std::uint8_t b) { return static_cast<std::uint8_t>(255 - b); });
    output.setSize(input.size());
    return output;
}

std::vector<std::string_view> availableTransformers() {
    return {"identity", "invert", "zstd"};
}

Result<std::unique_ptr<ChunkTransformer>> createTransformer(std::string_view name) {
    if (name == "identity") {
        return std::make_unique<IdentityTransformer>();
    }
    if (name == "invert") {
        return std::make_unique<InvertTransformer>();
    }
    if (name == "zstd") {
        return std::make_unique<ZstdTransformer>();
    }
    return makeError<std::unique_ptr<ChunkTransformer>>(
        ErrorCode::kUnsupportedCodec,
        fmt::format("unknown transform engine '{}' (available: identity, invert, zstd)", name));
}

}  // namespace mtc::codec
