#include "fedrelay/error.hpp"

namespace fedrelay {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_PARAMETER: return "InvalidParameter";
        case ErrorCode::SHAPE_MISMATCH: return "ShapeMismatch";
        case ErrorCode::NO_UPDATES: return "NoUpdates";
        case ErrorCode::WIRE_FORMAT: return "WireFormat";
        case ErrorCode::RANDOM_SOURCE_FAILED: return "RandomSourceFailed";
        case ErrorCode::STORAGE_READ_FAILURE: return "StorageReadFailure";
        case ErrorCode::STORAGE_WRITE_FAILURE: return "StorageWriteFailure";
        case ErrorCode::HISTORY_LOG_FAILURE: return "HistoryLogFailure";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::RETRY_EXHAUSTED: return "RetryExhausted";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
    }
    return "Unknown";
}

} // namespace fedrelay
