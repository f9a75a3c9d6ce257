// include/storage_error/error_codes.h
#pragma once

namespace mapstore {

/**
 * @brief Error codes for entity storage, transaction and domain operations
 */
enum class ErrorCode : int {
    // I/O and File System Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    FILE_NOT_FOUND = 4006,

    // Data Validation Errors (5000-5999)
    INVALID_KEY_FORMAT = 5001,
    INVALID_VALUE = 5002,
    KEY_NOT_FOUND = 5003,
    DUPLICATE_KEY = 5004,
    CHECKSUM_MISMATCH = 5005,
    INVALID_DATA_FORMAT = 5006,
    UNSUPPORTED_FIELD = 5010,

    // Transaction Errors (6000-6999)
    TRANSACTION_CLOSED = 6001,
    ILLEGAL_STATE = 6002,
    TRANSACTION_CONFLICT = 6003,

    // Domain Model Errors (7000-7999)
    MODEL_DUPLICATE = 7001,
    TENANT_MISMATCH = 7002,
    CASCADE_FAILED = 7003,

    // Configuration Errors (8000-8999)
    INVALID_CONFIGURATION = 8001,

    // Generic Errors (10000+)
    INTERNAL_ERROR = 10004
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Operation succeeded but with issues
    ERROR,      // Operation failed but the store is consistent
    CRITICAL    // Stored data may be damaged
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    IO_FILESYSTEM,
    DATA_VALIDATION,
    TRANSACTION,
    DOMAIN_MODEL,
    CONFIGURATION,
    GENERIC
};

} // namespace mapstore
