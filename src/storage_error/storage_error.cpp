// src/storage_error/storage_error.cpp
#include "../../include/storage_error/storage_error.h"
#include "../../include/storage_error/error_utils.h"

#include <sstream>

namespace mapstore {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    this->underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withFilePath(const std::string& path) {
    this->file_path = path;
    return *this;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " | " << details;
    }
    if (file_path) {
        oss << " | file: " << *file_path;
    }
    if (!suggested_action.empty()) {
        oss << " | action: " << suggested_action;
    }
    return oss.str();
}

StorageError StorageError::duplicateKey(const std::string& key) {
    return StorageError(ErrorCode::DUPLICATE_KEY, "An entity with this key already exists")
        .withDetails("Key: " + key)
        .withContext("key", key);
}

StorageError StorageError::invalidKeyFormat(const std::string& raw, const std::string& expected) {
    return StorageError(ErrorCode::INVALID_KEY_FORMAT, "Key cannot be parsed")
        .withDetails("Input '" + raw + "' is not a valid " + expected)
        .withContext("key", raw);
}

StorageError StorageError::unsupportedField(const std::string& field, const std::string& reason) {
    return StorageError(ErrorCode::UNSUPPORTED_FIELD, "Criterion not supported by this store")
        .withDetails(reason)
        .withContext("field", field);
}

StorageError StorageError::transactionClosed(const std::string& operation) {
    return StorageError(ErrorCode::TRANSACTION_CLOSED, "Transaction is no longer active")
        .withDetails("Operation: " + operation)
        .withSuggestedAction("Start a new transaction");
}

StorageError StorageError::illegalState(const std::string& reason) {
    return StorageError(ErrorCode::ILLEGAL_STATE, "Illegal state")
        .withDetails(reason);
}

StorageError StorageError::ioError(ErrorCode code, const std::string& operation, const std::string& path) {
    return StorageError(code, "I/O operation failed")
        .withDetails("Operation: " + operation)
        .withFilePath(path)
        .withSuggestedAction("Check file permissions and disk space");
}

} // namespace mapstore
