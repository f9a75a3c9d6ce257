// src/storage_error/error_utils.cpp
#include "../../include/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace mapstore {
namespace error_utils {

// ErrorCode values lie outside magic_enum's reflection range, so they are
// spelled out here.
std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";

        case ErrorCode::INVALID_KEY_FORMAT: return "INVALID_KEY_FORMAT";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::KEY_NOT_FOUND: return "KEY_NOT_FOUND";
        case ErrorCode::DUPLICATE_KEY: return "DUPLICATE_KEY";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";
        case ErrorCode::UNSUPPORTED_FIELD: return "UNSUPPORTED_FIELD";

        case ErrorCode::TRANSACTION_CLOSED: return "TRANSACTION_CLOSED";
        case ErrorCode::ILLEGAL_STATE: return "ILLEGAL_STATE";
        case ErrorCode::TRANSACTION_CONFLICT: return "TRANSACTION_CONFLICT";

        case ErrorCode::MODEL_DUPLICATE: return "MODEL_DUPLICATE";
        case ErrorCode::TENANT_MISMATCH: return "TENANT_MISMATCH";
        case ErrorCode::CASCADE_FAILED: return "CASCADE_FAILED";

        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";

        default: return "UNKNOWN_ERROR_CODE_DETAIL";
    }
}

std::string_view severityToString(ErrorSeverity severity) {
    auto name = magic_enum::enum_name(severity);
    return name.empty() ? std::string_view("UNKNOWN_SEVERITY") : name;
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::FILE_NOT_FOUND:
        case ErrorCode::INVALID_DATA_FORMAT:
        case ErrorCode::TRANSACTION_CONFLICT:
        case ErrorCode::CASCADE_FAILED:
        case ErrorCode::INVALID_CONFIGURATION:
            return ErrorSeverity::ERROR;

        case ErrorCode::TRANSACTION_CLOSED:
        case ErrorCode::ILLEGAL_STATE:
        case ErrorCode::UNSUPPORTED_FIELD:
        case ErrorCode::INVALID_VALUE:
        case ErrorCode::INVALID_KEY_FORMAT:
            return ErrorSeverity::WARNING;

        case ErrorCode::KEY_NOT_FOUND:
        case ErrorCode::DUPLICATE_KEY:
        case ErrorCode::MODEL_DUPLICATE:
        case ErrorCode::TENANT_MISMATCH:
            return ErrorSeverity::INFO;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::TRANSACTION;
    } else if (code_value >= 7000 && code_value < 8000) {
        return ErrorCategory::DOMAIN_MODEL;
    } else if (code_value >= 8000 && code_value < 9000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

} // namespace error_utils
} // namespace mapstore
