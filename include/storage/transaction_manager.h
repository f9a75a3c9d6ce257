// include/storage/transaction_manager.h
#pragma once

#include "transaction_resource.h"
#include "../storage_error/storage_error.h"

#include <memory>
#include <optional>
#include <vector>

namespace mapstore {

/**
 * @brief Request-scoped group of transactions committed or rolled back
 * together, in enlistment order.
 *
 * Commit first prepares every transaction, so a batch that conflicts with
 * its store's current rows rolls everything back before anything is applied.
 * Commit is still not atomic across stores: when a later transaction fails
 * to commit despite preparing, earlier ones stay committed and the
 * remaining ones are rolled back.
 */
class TransactionManager {
public:
    TransactionManager() = default;
    ~TransactionManager();

    TransactionManager(const TransactionManager&) = delete;
    TransactionManager& operator=(const TransactionManager&) = delete;

    /**
     * @throws StorageError TRANSACTION_CLOSED once the manager completed,
     *         ILLEGAL_STATE if the transaction is not ACTIVE.
     */
    void enlist(std::shared_ptr<TransactionResource> txn);

    /**
     * @throws StorageError ILLEGAL_STATE when marked rollback-only (after
     *         rolling everything back) or already completed.
     */
    void commit();

    // Rethrows the first rollback failure after trying every transaction.
    void rollback();

    void setRollbackOnly();
    bool isRollbackOnly() const { return rollback_only_; }
    bool isActive() const { return active_; }
    size_t size() const { return transactions_.size(); }

private:
    // Rolls back every still-ACTIVE transaction; returns the first failure.
    std::optional<StorageError> rollbackActive();

    std::vector<std::shared_ptr<TransactionResource>> transactions_;
    bool rollback_only_ = false;
    bool active_ = true;
};

} // namespace mapstore
