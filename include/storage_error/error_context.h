// include/storage_error/error_context.h
#pragma once

#include "storage_error.h"
#include <memory>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace mapstore {

class ErrorHandler;

/**
 * @brief Records errors that were reported rather than propagated (for
 * example event subscriber failures) so they remain observable.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::vector<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    mutable std::mutex mutex_;

    static constexpr size_t MAX_RECENT_ERRORS = 100;

public:
    ErrorContext(std::shared_ptr<ErrorHandler> handler = nullptr);

    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;
};

} // namespace mapstore
