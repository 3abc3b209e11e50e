// =============================================================================
// mtc - Chunk Size Policy
// =============================================================================
// Chooses the chunk length for a run.
//
// A fixed size in the configuration wins. Otherwise the size aims for
// kChunksPerWorker chunks per worker, capped so that one chunk per worker
// fits in kChunkMemoryFraction of the memory budget, and clamped to
// [kMinChunkBytes, kMaxChunkBytes].
//
// The cap counts one buffer per worker. A worker holds its input and output
// buffers together while transforming, so peak chunk memory can reach about
// twice maxParallelism * chunk size. A transform whose output is as large as
// its input can therefore exceed the budget.
// =============================================================================

#ifndef MTC_PIPELINE_CHUNK_SIZE_POLICY_H
#define MTC_PIPELINE_CHUNK_SIZE_POLICY_H

#include <cstdint>

#include "mtc/pipeline/pipeline_config.h"

namespace mtc::pipeline {

/// @brief Chunk length in bytes for a file of fileSizeBytes.
/// @note Parallelism 0 is treated as 1. Never returns 0.
[[nodiscard]] std::uint64_t chooseChunkSize(std::uint64_t fileSizeBytes,
                                            const PipelineConfig& config) noexcept;

}  // namespace mtc::pipeline

#endif  // MTC_PIPELINE_CHUNK_SIZE_POLICY_H
