// src/storage_error/error_context.cpp
#include "../../include/storage_error/error_context.h"
#include "../../include/storage_error/error_handler.h"
#include <algorithm>

namespace mapstore {

ErrorContext::ErrorContext(std::shared_ptr<ErrorHandler> handler)
    : handler_(std::move(handler)) {
}

void ErrorContext::reportError(const StorageError& error) {
    std::shared_ptr<ErrorHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_counts_[error.code]++;
        recent_errors_.push_back(error);
        if (recent_errors_.size() > MAX_RECENT_ERRORS) {
            recent_errors_.erase(recent_errors_.begin());
        }
        handler = handler_;
    }

    // Handler runs outside the lock so it may query this context.
    if (handler) {
        if (error.severity == ErrorSeverity::CRITICAL) {
            handler->handleCriticalError(error);
        } else {
            handler->handleError(error);
        }
    }
}

void ErrorContext::reportError(ErrorCode code, const std::string& message) {
    reportError(StorageError(code, message));
}

size_t ErrorContext::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(code);
    return it != error_counts_.end() ? it->second : 0;
}

size_t ErrorContext::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& pair : error_counts_) {
        total += pair.second;
    }
    return total;
}

std::vector<StorageError> ErrorContext::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t actual_count = std::min(count, recent_errors_.size());
    if (actual_count == 0) {
        return {};
    }
    return std::vector<StorageError>(recent_errors_.end() - actual_count, recent_errors_.end());
}

} // namespace mapstore
