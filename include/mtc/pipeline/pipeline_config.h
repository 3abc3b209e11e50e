// =============================================================================
// mtc - Pipeline Configuration
// =============================================================================

#ifndef MTC_PIPELINE_PIPELINE_CONFIG_H
#define MTC_PIPELINE_PIPELINE_CONFIG_H

#include <cstddef>
#include <cstdint>

#include "mtc/common/error.h"
#include "mtc/common/types.h"

namespace mtc::pipeline {

/// @brief Hardware concurrency, at least 1 and at most kMaxAutoParallelism.
[[nodiscard]] std::size_t recommendedParallelism() noexcept;

/// @brief Tunables for a transcode run.
struct PipelineConfig {
    /// @brief Upper bound on chunks being read or transformed at once.
    std::size_t maxParallelism = recommendedParallelism();

    /// @brief Fixed chunk size in bytes; 0 derives it from file size and budget.
    std::uint64_t fixedChunkBytes = 0;

    /// @brief Memory the chunk buffers may draw on.
    std::uint64_t memoryBudgetBytes = kDefaultMemoryBudgetBytes;

    [[nodiscard]] VoidResult validate() const;
};

}  // namespace mtc::pipeline

#endif  // MTC_PIPELINE_PIPELINE_CONFIG_H
