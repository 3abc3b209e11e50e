// =============================================================================
// mtc - Zstandard Chunk Transformer
// =============================================================================

#include "mtc/codec/chunk_transformer.h"

#include <fmt/format.h>
#include <zstd.h>

#include <algorithm>
#include <iterator>
#include <memory>

namespace mtc::codec {

namespace {

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
};

using CCtxPtr = std::unique_ptr<ZSTD_CCtx, CCtxDeleter>;

constexpr int kMinLevel = 1;
constexpr int kMaxLevel = 19;

}  // namespace

int ZstdTransformer::compressionLevel(const TranscodeOptions& target) noexcept {
    if (target.quality > 0) {
        const int quality = static_cast<int>(std::min<std::uint32_t>(target.quality, 100));
        return kMinLevel + (quality - 1) * (kMaxLevel - kMinLevel) / 99;
    }
    if (auto index = encoderPresetIndex(target.encoderPreset)) {
        const int lastIndex = static_cast<int>(std::size(kEncoderPresets)) - 1;
        return kMinLevel + static_cast<int>(*index) * (kMaxLevel - kMinLevel) / lastIndex;
    }
    return ZSTD_CLEVEL_DEFAULT;
}

Result<io::ManagedBuffer> ZstdTransformer::transform(std::span<const std::uint8_t> input,
                                                     const MediaDescriptor& /*source*/,
                                                     const TranscodeOptions& target,
                                                     io::BufferPool& pool) const {
    CCtxPtr ctx(ZSTD_createCCtx());
    if (!ctx) {
        return makeError<io::ManagedBuffer>(ErrorCode::kTransformFailure,
                                            "failed to create zstd context");
    }

    auto setParameter = [&](ZSTD_cParameter param, int value) -> VoidResult {
        const std::size_t rc = ZSTD_CCtx_setParameter(ctx.get(), param, value);
        if (ZSTD_isError(rc)) {
            return makeVoidError(ErrorCode::kTransformFailure,
                                 fmt::format("zstd parameter rejected: {}", ZSTD_getErrorName(rc)));
        }
        return makeVoidSuccess();
    };

    if (auto rc = setParameter(ZSTD_c_compressionLevel, compressionLevel(target)); !rc) {
        return std::unexpected(rc.error());
    }
    if (auto rc = setParameter(ZSTD_c_checksumFlag, 1); !rc) {
        return std::unexpected(rc.error());
    }
    if (target.encodingPasses > 1) {
        if (auto rc = setParameter(ZSTD_c_enableLongDistanceMatching, 1); !rc) {
            return std::unexpected(rc.error());
        }
    }

    io::ManagedBuffer output = pool.acquire(ZSTD_compressBound(input.size()));
    const std::size_t written =
        ZSTD_compress2(ctx.get(), output.data(), output.capacity(), input.data(), input.size());
    if (ZSTD_isError(written)) {
        return makeError<io::ManagedBuffer>(
            ErrorCode::kTransformFailure,
            fmt::format("zstd compression failed: {}", ZSTD_getErrorName(written)));
    }

    output.setSize(written);
    return output;
}

}  // namespace mtc::codec
