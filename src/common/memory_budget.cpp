// =============================================================================
// mtc - Memory Budget Utilities Implementation
// =============================================================================

#include "mtc/common/memory_budget.h"

#include "mtc/common/types.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>

#ifdef __linux__
#include <sys/sysinfo.h>
#include <unistd.h>
#endif

namespace mtc {

// =============================================================================
// System Memory Functions
// =============================================================================

std::size_t getSystemAvailableMemory() noexcept {
#ifdef __linux__
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo) {
        return 0;
    }

    std::string line;
    std::size_t memFree = 0;
    while (std::getline(meminfo, line)) {
        std::size_t kb = 0;
        if (std::sscanf(line.c_str(), "MemAvailable: %zu kB", &kb) == 1) {
            return kb * 1024;
        }
        if (std::sscanf(line.c_str(), "MemFree: %zu kB", &kb) == 1) {
            memFree = kb;
        }
    }
    // Kernels before 3.14 lack MemAvailable.
    return memFree * 1024;
#else
    return 0;
#endif
}

std::size_t getSystemTotalMemory() noexcept {
#ifdef __linux__
    struct sysinfo info;
    if (sysinfo(&info) == 0) {
        return static_cast<std::size_t>(info.totalram) * info.mem_unit;
    }
#endif
    return 0;
}

MemoryUsage getProcessMemoryUsage() noexcept {
    MemoryUsage usage;

#ifdef __linux__
    std::ifstream statm("/proc/self/statm");
    if (statm) {
        std::size_t size = 0;
        std::size_t resident = 0;
        statm >> size >> resident;
        long pageSize = sysconf(_SC_PAGESIZE);
        if (statm && pageSize > 0) {
            usage.virtualBytes = size * static_cast<std::size_t>(pageSize);
            usage.rssBytes = resident * static_cast<std::size_t>(pageSize);
        }
    }

    std::ifstream status("/proc/self/status");
    std::string line;
    while (status && std::getline(status, line)) {
        std::size_t kb = 0;
        if (std::sscanf(line.c_str(), "VmHWM: %zu kB", &kb) == 1) {
            usage.peakRssBytes = kb * 1024;
            break;
        }
    }
#endif

    return usage;
}

// =============================================================================
// Utility Functions
// =============================================================================

std::string formatMemorySize(std::uint64_t bytes) {
    const auto value = static_cast<double>(bytes);

    if (bytes >= 1024 * kGiB) {
        return fmt::format("{:.2f} TB", value / static_cast<double>(1024 * kGiB));
    }
    if (bytes >= kGiB) {
        return fmt::format("{:.2f} GB", value / static_cast<double>(kGiB));
    }
    if (bytes >= kMiB) {
        return fmt::format("{:.2f} MB", value / static_cast<double>(kMiB));
    }
    if (bytes >= kKiB) {
        return fmt::format("{:.2f} KB", value / static_cast<double>(kKiB));
    }
    return fmt::format("{} B", bytes);
}

std::optional<std::uint64_t> parseMemorySize(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    if (str.empty()) {
        return std::nullopt;
    }

    std::size_t numEnd = 0;
    while (numEnd < str.size() &&
           (std::isdigit(static_cast<unsigned char>(str[numEnd])) || str[numEnd] == '.')) {
        ++numEnd;
    }
    if (numEnd == 0) {
        return std::nullopt;
    }

    double value = 0;
    auto numStr = str.substr(0, numEnd);
    auto [ptr, ec] = std::from_chars(numStr.data(), numStr.data() + numStr.size(), value);
    if (ec != std::errc{} || ptr != numStr.data() + numStr.size()) {
        return std::nullopt;
    }

    auto suffix = str.substr(numEnd);
    while (!suffix.empty() && std::isspace(static_cast<unsigned char>(suffix.front()))) {
        suffix.remove_prefix(1);
    }

    std::uint64_t multiplier = 1;
    if (!suffix.empty()) {
        switch (std::toupper(static_cast<unsigned char>(suffix.front()))) {
            case 'T':
                multiplier = 1024 * kGiB;
                break;
            case 'G':
                multiplier = kGiB;
                break;
            case 'M':
                multiplier = kMiB;
                break;
            case 'K':
                multiplier = kKiB;
                break;
            case 'B':
                multiplier = 1;
                break;
            default:
                return std::nullopt;
        }
        // Accept "M", "MB", "MiB" but nothing beyond.
        auto rest = suffix.substr(1);
        const bool unitTail = rest == "B" || rest == "b" || rest == "iB" || rest == "ib";
        if (!rest.empty() && (multiplier == 1 || !unitTail)) {
            return std::nullopt;
        }
    }

    return static_cast<std::uint64_t>(std::llround(value * static_cast<double>(multiplier)));
}

std::uint64_t recommendedMemoryBudget(double fraction) noexcept {
    std::size_t available = getSystemAvailableMemory();
    if (available == 0) {
        available = getSystemTotalMemory();
    }
    if (available == 0) {
        return kDefaultMemoryBudgetBytes;
    }

    fraction = std::clamp(fraction, 0.1, 0.9);
    auto budget = static_cast<std::uint64_t>(static_cast<double>(available) * fraction);
    return std::max<std::uint64_t>(budget, 64 * kMiB);
}

}  // namespace mtc
