// =============================================================================
// mtc - Chunk Size Policy Implementation
// =============================================================================

#include "mtc/pipeline/chunk_size_policy.h"

#include <algorithm>

namespace mtc::pipeline {

std::uint64_t chooseChunkSize(std::uint64_t fileSizeBytes, const PipelineConfig& config) noexcept {
    if (config.fixedChunkBytes > 0) {
        return config.fixedChunkBytes;
    }

    const std::uint64_t workers = std::max<std::uint64_t>(1, config.maxParallelism);
    const auto available = static_cast<std::uint64_t>(
        static_cast<double>(config.memoryBudgetBytes) * kChunkMemoryFraction);

    const std::uint64_t baseSize = fileSizeBytes / workers / kChunksPerWorker;
    const std::uint64_t memoryCap = available / workers;

    return std::clamp(std::min(baseSize, memoryCap), kMinChunkBytes, kMaxChunkBytes);
}

}  // namespace mtc::pipeline
