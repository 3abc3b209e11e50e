// =============================================================================
// mtc - Common Type Definitions
// =============================================================================
// Identifier aliases and size constants shared across the transcoder.
// =============================================================================

#ifndef MTC_COMMON_TYPES_H
#define MTC_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <limits>

namespace mtc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based chunk identifier; equals the chunk's position in the plan.
using ChunkId = std::uint64_t;

/// @brief Byte offset within the source file.
using FileOffset = std::uint64_t;

/// @brief Checksum values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

inline constexpr ChunkId kInvalidChunkId = std::numeric_limits<ChunkId>::max();

inline constexpr std::uint64_t kKiB = 1024;
inline constexpr std::uint64_t kMiB = 1024 * kKiB;
inline constexpr std::uint64_t kGiB = 1024 * kMiB;

/// @brief Lower bound for automatically chosen chunk sizes.
inline constexpr std::uint64_t kMinChunkBytes = 1 * kMiB;

/// @brief Upper bound for automatically chosen chunk sizes.
inline constexpr std::uint64_t kMaxChunkBytes = 64 * kMiB;

/// @brief Share of the memory budget that chunk buffers may occupy.
inline constexpr double kChunkMemoryFraction = 0.7;

/// @brief Target number of chunks per worker for load balancing.
inline constexpr std::uint64_t kChunksPerWorker = 2;

/// @brief Memory budget used when none is configured.
inline constexpr std::uint64_t kDefaultMemoryBudgetBytes = 1 * kGiB;

/// @brief Upper bound for the automatic worker count.
inline constexpr std::size_t kMaxAutoParallelism = 32;

}  // namespace mtc

#endif  // MTC_COMMON_TYPES_H
