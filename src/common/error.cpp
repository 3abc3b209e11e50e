// =============================================================================
// mtc - Error Handling Framework Implementation
// =============================================================================

#include "mtc/common/error.h"

#include <fmt/format.h>

#include <sstream>

namespace mtc {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!filePath.empty()) {
        oss << "file: " << filePath;
        hasContent = true;
    }

    if (chunkId.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "chunk: " << *chunkId;
        hasContent = true;
    }

    if (byteOffset.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "offset: " << *byteOffset;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// MTCException Implementation
// =============================================================================

void MTCException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

namespace {

std::string withContext(std::string message, const ErrorContext& context) {
    std::string contextStr = context.format();
    if (contextStr.empty()) {
        return message;
    }
    return fmt::format("{} ({})", message, contextStr);
}

}  // namespace

Error::Error(ErrorCode code, std::string message, const ErrorContext& context)
    : code_(code), message_(withContext(std::move(message), context)) {}

Error::Error(const MTCException& ex)
    : code_(ex.code()),
      message_(ex.hasContext() ? withContext(ex.message(), *ex.context()) : ex.message()) {}

MTCException Error::toException() const {
    return MTCException(code_, message_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kSourceNotFound:
        case ErrorCode::kReadFailure:
        case ErrorCode::kWriteFailure:
            throw IOError(code_, message_, ErrorContext{});
        case ErrorCode::kInvalidConfiguration:
            throw ConfigurationError(message_);
        case ErrorCode::kTransformFailure:
        case ErrorCode::kUnsupportedCodec:
            throw TransformError(code_, message_);
        case ErrorCode::kCancelled:
            throw CancelledError(message_);
        default:
            break;
    }
    throw MTCException(code_, message_);
}

}  // namespace mtc
