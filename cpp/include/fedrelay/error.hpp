#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace fedrelay {

/**
 * Structured error reporting for the aggregation engine.
 * Every failure carries a code, the function it came from, and an optional
 * recovery suggestion for the caller.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_PARAMETER = 1,

    // Numeric / shape errors
    SHAPE_MISMATCH = 200,
    NO_UPDATES = 201,
    WIRE_FORMAT = 202,
    RANDOM_SOURCE_FAILED = 203,

    // Storage errors
    STORAGE_READ_FAILURE = 300,
    STORAGE_WRITE_FAILURE = 301,
    HISTORY_LOG_FAILURE = 302,

    // Control flow
    CANCELLED = 400,
    RETRY_EXHAUSTED = 401,

    // Internal errors
    INTERNAL_ERROR = 500
};

// Stable short name of a code, e.g. "StorageWriteFailure".
const char* error_code_name(ErrorCode code) noexcept;

class FedRelayException : public std::runtime_error {
public:
    explicit FedRelayException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "FedRelay error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidParameterError : public FedRelayException {
public:
    explicit InvalidParameterError(const std::string& message,
                                   const std::string& context = "",
                                   const std::string& suggestion = "")
        : FedRelayException(ErrorCode::INVALID_PARAMETER, message, context, suggestion) {}
};

class ShapeMismatchError : public FedRelayException {
public:
    explicit ShapeMismatchError(const std::string& message,
                                const std::string& context = "")
        : FedRelayException(ErrorCode::SHAPE_MISMATCH, message, context,
                            "All vectors in one merge must have the same length") {}
};

class NoUpdatesError : public FedRelayException {
public:
    explicit NoUpdatesError(const std::string& context = "")
        : FedRelayException(ErrorCode::NO_UPDATES, "Merge invoked with zero updates", context) {}
};

class WireFormatError : public FedRelayException {
public:
    explicit WireFormatError(const std::string& message,
                             const std::string& context = "")
        : FedRelayException(ErrorCode::WIRE_FORMAT, message, context,
                            "Payload must be little-endian float32 values, 4 bytes each") {}
};

class StorageReadError : public FedRelayException {
public:
    explicit StorageReadError(const std::string& message,
                              const std::string& context = "")
        : FedRelayException(ErrorCode::STORAGE_READ_FAILURE, message, context) {}
};

/**
 * Raised once every persist attempt has failed. Carries enough detail for the
 * caller to retry the submission externally.
 */
class StorageWriteError : public FedRelayException {
public:
    StorageWriteError(const std::string& model_id, int64_t round, int attempts,
                      const std::string& last_error)
        : FedRelayException(ErrorCode::STORAGE_WRITE_FAILURE,
                            "Failed to save global model after " + std::to_string(attempts) +
                                " attempt(s): " + last_error,
                            "model=" + model_id + " round=" + std::to_string(round),
                            "Prior global state is unchanged; resubmit the update")
        , model_id_(model_id)
        , round_(round)
        , attempts_(attempts) {}

    const std::string& model_id() const noexcept { return model_id_; }
    int64_t round() const noexcept { return round_; }
    int attempts() const noexcept { return attempts_; }

private:
    std::string model_id_;
    int64_t round_;
    int attempts_;
};

class HistoryLogError : public FedRelayException {
public:
    explicit HistoryLogError(const std::string& message,
                             const std::string& context = "")
        : FedRelayException(ErrorCode::HISTORY_LOG_FAILURE, message, context) {}
};

class CancelledError : public FedRelayException {
public:
    explicit CancelledError(const std::string& message,
                            const std::string& context = "")
        : FedRelayException(ErrorCode::CANCELLED, message, context) {}
};

class RetryExhaustedError : public FedRelayException {
public:
    RetryExhaustedError(int attempts, const std::string& last_error)
        : FedRelayException(ErrorCode::RETRY_EXHAUSTED,
                            "Gave up after " + std::to_string(attempts) + " attempt(s)",
                            last_error)
        , attempts_(attempts)
        , last_error_(last_error) {}

    int attempts() const noexcept { return attempts_; }
    const std::string& last_error() const noexcept { return last_error_; }

private:
    int attempts_;
    std::string last_error_;
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidParameterError(message, context);
        }
    }
};

// Macros for common error checking
#define FEDRELAY_CHECK_ARGUMENT(condition, message) \
    fedrelay::ErrorHandler::check_argument(condition, message, __func__)

#define FEDRELAY_THROW(code, message) \
    throw fedrelay::FedRelayException(code, message, __func__)

} // namespace fedrelay
