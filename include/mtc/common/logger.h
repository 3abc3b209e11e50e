// =============================================================================
// mtc - Logger Module
// =============================================================================
// Asynchronous logging on top of the Quill library.
//
// A single process-wide logger is created by init(). Until then the MTC_LOG_*
// macros are no-ops, so library code and unit tests may log unconditionally.
//
// Usage:
//   mtc::log::init("mtc.log", mtc::log::Level::kInfo);
//   MTC_LOG_INFO("planned {} chunks", count);
// =============================================================================

#ifndef MTC_COMMON_LOGGER_H
#define MTC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace mtc::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "mtc";
};

/// @brief Initialize the global logger.
/// @note Subsequent calls are ignored until shutdown() has run.
void init(const Config& config);

/// @brief Convenience overload for console plus optional file logging.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until all pending messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive). Unknown names map to kInfo.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace mtc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define MTC_LOG_IMPL(MACRO, fmt, ...)                                  \
    do {                                                               \
        if (quill::Logger* mtcLogger_ = ::mtc::log::logger()) {        \
            MACRO(mtcLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                              \
    } while (false)

#define MTC_LOG_TRACE(fmt, ...) MTC_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define MTC_LOG_DEBUG(fmt, ...) MTC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define MTC_LOG_INFO(fmt, ...) MTC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define MTC_LOG_WARNING(fmt, ...) MTC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define MTC_LOG_ERROR(fmt, ...) MTC_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define MTC_LOG_CRITICAL(fmt, ...) MTC_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // MTC_COMMON_LOGGER_H
