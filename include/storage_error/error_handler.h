// include/storage_error/error_handler.h
#pragma once

#include "storage_error.h"
#include "../debug_utils.h"

namespace mapstore {

/**
 * @brief Receives errors reported to an ErrorContext.
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const StorageError& error) = 0;
    virtual void handleCriticalError(const StorageError& error) = 0;
};

// Writes every reported error to the log.
class LoggingErrorHandler : public ErrorHandler {
public:
    void handleError(const StorageError& error) override {
        LOG_WARN("[ErrorContext] Reported: ", error.toString());
    }
    void handleCriticalError(const StorageError& error) override {
        LOG_ERROR("[ErrorContext] Reported critical: ", error.toString());
    }
};

} // namespace mapstore
