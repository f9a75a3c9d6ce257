// include/storage/entity_handle.h
#pragma once

#include "transaction_state.h"
#include "../storage_error/storage_error.h"

#include <memory>
#include <utility>

namespace mapstore {

/**
 * @brief Mutable, change-tracked view of one entity inside one transaction.
 *
 * The handle keeps the entity as it was first seen by the transaction and
 * the current, possibly mutated, value. modify() marks it dirty; at commit
 * the transaction compares the two and stages an update only when they
 * actually differ. A transaction hands out at most one handle per key.
 */
template<typename V>
class EntityHandle {
public:
    EntityHandle(V original, std::shared_ptr<TransactionState> txn, bool created_in_txn)
        : original_(original),
          current_(std::move(original)),
          txn_(std::move(txn)),
          created_in_txn_(created_in_txn) {}

    EntityHandle(const EntityHandle&) = delete;
    EntityHandle& operator=(const EntityHandle&) = delete;

    const V& get() const { return current_; }
    const V& original() const { return original_; }

    /**
     * @brief Applies `mutation` to the tracked value.
     * @throws StorageError TRANSACTION_CLOSED once the transaction ended,
     *         ILLEGAL_STATE once the entity was deleted in the transaction
     *         or when the mutation changes the entity key.
     */
    template<typename F>
    void modify(F&& mutation) {
        if (!txn_->canModify()) {
            throw StorageError::transactionClosed("modify entity");
        }
        if (detached_) {
            throw StorageError::illegalState("Entity was deleted in this transaction");
        }
        V candidate = current_;
        std::forward<F>(mutation)(candidate);
        if (!(candidate.getId() == current_.getId())) {
            throw StorageError::illegalState("Entity key is immutable");
        }
        current_ = std::move(candidate);
        if (!dirty_) {
            txn_->markModified();
        }
        dirty_ = true;
    }

    bool isDirty() const { return dirty_ && !(current_ == original_); }
    bool isDetached() const { return detached_; }
    bool isCreatedInTransaction() const { return created_in_txn_; }
    TxnId getTransactionId() const { return txn_->getId(); }

    // Called by the owning transaction.
    void detach() { detached_ = true; }

    void reattach(V value, bool created_in_txn) {
        original_ = value;
        current_ = std::move(value);
        created_in_txn_ = created_in_txn;
        detached_ = false;
        dirty_ = false;
    }

private:
    V original_;
    V current_;
    std::shared_ptr<TransactionState> txn_;
    bool created_in_txn_;
    bool dirty_ = false;
    bool detached_ = false;
};

} // namespace mapstore
