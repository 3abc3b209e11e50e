// =============================================================================
// mtc - Error Handling Framework
// =============================================================================
// Error codes, the exception hierarchy and the Result<T> type shared by every
// layer of the transcoder.
//
// Pipeline stages and collaborators report failures through Result<T>
// (std::expected). Constructors and the command line layer throw
// MTCException subclasses. Both carry an ErrorCode that doubles as the
// process exit code:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error
// - 3: Source file not found
// - 4..7: Analysis, read, transform and write failures
// - 8: Cancelled
// =============================================================================

#ifndef MTC_COMMON_ERROR_H
#define MTC_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace mtc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,

    /// @brief Invalid command-line arguments or option values.
    kUsageError = 1,

    /// @brief Generic file system failure outside a chunk operation.
    kIOError = 2,

    /// @brief Source path does not exist or is not a regular file.
    kSourceNotFound = 3,

    /// @brief Media analysis could not produce a descriptor.
    kAnalysisFailure = 4,

    /// @brief A chunk range could not be read in full.
    kReadFailure = 5,

    /// @brief The transformer rejected or failed on a chunk.
    kTransformFailure = 6,

    /// @brief Committing a chunk or finalizing the output failed.
    kWriteFailure = 7,

    /// @brief The run was cancelled before completion.
    kCancelled = 8,

    /// @brief Configuration or target options are invalid.
    kInvalidConfiguration = 9,

    /// @brief Operation called in the wrong lifecycle state.
    kInvalidState = 10,

    /// @brief Unknown transform engine or target codec.
    kUnsupportedCodec = 11,

    /// @brief Unexpected failure that matches no other category.
    kInternalError = 12
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to a short human-readable category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kSourceNotFound:
            return "source not found";
        case ErrorCode::kAnalysisFailure:
            return "analysis failure";
        case ErrorCode::kReadFailure:
            return "read failure";
        case ErrorCode::kTransformFailure:
            return "transform failure";
        case ErrorCode::kWriteFailure:
            return "write failure";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kInvalidConfiguration:
            return "invalid configuration";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where an error occurred: file, chunk and byte offset.
struct ErrorContext {
    std::string filePath;
    std::optional<std::uint64_t> chunkId;
    std::optional<std::uint64_t> byteOffset;
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withChunk(std::uint64_t id) {
        chunkId = id;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Render as "file: x, chunk: n, offset: m".
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all transcoder errors.
class MTCException : public std::exception {
public:
    MTCException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    MTCException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~MTCException() override = default;

    MTCException(const MTCException&) = default;
    MTCException(MTCException&&) noexcept = default;
    MTCException& operator=(const MTCException&) = default;
    MTCException& operator=(MTCException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The error message without context decoration.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Invalid command-line usage (exit code 1).
class UsageError : public MTCException {
public:
    explicit UsageError(std::string message)
        : MTCException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : MTCException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief File system failures. The code defaults to kIOError but may be any
///        of the I/O-flavoured codes (kSourceNotFound, kReadFailure, ...).
class IOError : public MTCException {
public:
    explicit IOError(std::string message)
        : MTCException(ErrorCode::kIOError, std::move(message)) {}

    IOError(ErrorCode code, std::string message, ErrorContext context)
        : MTCException(code, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : MTCException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : MTCException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                       std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Invalid pipeline configuration or target options.
class ConfigurationError : public MTCException {
public:
    explicit ConfigurationError(std::string message)
        : MTCException(ErrorCode::kInvalidConfiguration, std::move(message)) {}
};

/// @brief A chunk transform failed or the requested engine is unknown.
class TransformError : public MTCException {
public:
    explicit TransformError(std::string message)
        : MTCException(ErrorCode::kTransformFailure, std::move(message)) {}

    TransformError(ErrorCode code, std::string message)
        : MTCException(code, std::move(message)) {}

    TransformError(std::string message, ErrorContext context)
        : MTCException(ErrorCode::kTransformFailure, std::move(message), std::move(context)) {}
};

/// @brief The run was cancelled.
class CancelledError : public MTCException {
public:
    explicit CancelledError(std::string message = "operation cancelled")
        : MTCException(ErrorCode::kCancelled, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error value carried by Result.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, const ErrorContext& context);

    /// @brief Capture code, message and any context of an exception.
    explicit Error(const MTCException& ex);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Convert to the exception type matching the error code.
    [[nodiscard]] MTCException toException() const;

    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value or throw the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Run func and convert thrown exceptions into a Result.
/// @param fallback Code used for exceptions outside the MTCException hierarchy.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func, ErrorCode fallback = ErrorCode::kInternalError)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const MTCException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{fallback, ex.what()});
    }
}

}  // namespace mtc

#endif  // MTC_COMMON_ERROR_H
