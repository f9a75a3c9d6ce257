// include/storage_error/storage_error.h
#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <exception>
#include <unordered_map>

namespace mapstore {

/**
 * @brief Detailed error information with context.
 *
 * Thrown by stores, transactions and providers for synchronous typed
 * failures, and carried inside Result<T> where a step reports instead of
 * throwing.
 */
class StorageError : public std::exception {
public:
    ErrorCode code;
    ErrorSeverity severity; // Derived from code
    ErrorCategory category; // Derived from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<ErrorCode> underlying_error;
    std::unordered_map<std::string, std::string> context;

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withFilePath(const std::string& path);

    const char* what() const noexcept override { return message.c_str(); }

    // One line: severity, code, message, then details, file and suggested action when set.
    std::string toString() const;

    // Factory methods for the common failures
    static StorageError duplicateKey(const std::string& key);
    static StorageError invalidKeyFormat(const std::string& raw, const std::string& expected);
    static StorageError unsupportedField(const std::string& field, const std::string& reason);
    static StorageError transactionClosed(const std::string& operation);
    static StorageError illegalState(const std::string& reason);
    static StorageError ioError(ErrorCode code, const std::string& operation, const std::string& path);
};

} // namespace mapstore
