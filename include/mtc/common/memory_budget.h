// =============================================================================
// mtc - Memory Budget Utilities
// =============================================================================
// System memory queries and size parsing/formatting used to derive the
// memory budget that bounds chunk buffers.
// =============================================================================

#ifndef MTC_COMMON_MEMORY_BUDGET_H
#define MTC_COMMON_MEMORY_BUDGET_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mtc {

/// @brief Snapshot of the process memory footprint.
struct MemoryUsage {
    std::size_t rssBytes = 0;
    std::size_t peakRssBytes = 0;
    std::size_t virtualBytes = 0;
};

/// @brief Available system memory in bytes, or 0 if unknown.
[[nodiscard]] std::size_t getSystemAvailableMemory() noexcept;

/// @brief Total system memory in bytes, or 0 if unknown.
[[nodiscard]] std::size_t getSystemTotalMemory() noexcept;

[[nodiscard]] MemoryUsage getProcessMemoryUsage() noexcept;

/// @brief Format a byte count as "1.50 MB" style text.
[[nodiscard]] std::string formatMemorySize(std::uint64_t bytes);

/// @brief Parse a size such as "512M", "2G", "64KiB" or "1048576".
/// @return Size in bytes; a bare number is taken as bytes.
///         std::nullopt for malformed input.
[[nodiscard]] std::optional<std::uint64_t> parseMemorySize(std::string_view str);

/// @brief Memory budget derived from available system memory.
/// @param fraction Share of available memory to claim, clamped to [0.1, 0.9].
/// @return Budget in bytes; kDefaultMemoryBudgetBytes when memory is unknown.
[[nodiscard]] std::uint64_t recommendedMemoryBudget(double fraction = 0.5) noexcept;

}  // namespace mtc

#endif  // MTC_COMMON_MEMORY_BUDGET_H
