// src/storage/transaction_manager.cpp
#include "../../include/storage/transaction_manager.h"
#include "../../include/storage_error/storage_error.h"
#include "../../include/debug_utils.h"

#include <optional>

namespace mapstore {

namespace {

    void logRollbackFailure(const std::optional<StorageError>& failure, const char* where) {
        if (failure) {
            LOG_WARN("[", where, "] Rollback completed with failures; first: ", failure->toString());
        }
    }

} // anonymous namespace

TransactionManager::~TransactionManager() {
    if (active_) {
        bool pending = false;
        for (const auto& txn : transactions_) {
            pending = pending || txn->isActive();
        }
        if (pending) {
            LOG_WARN("[TransactionManager Dtor] Destroyed with ", transactions_.size(),
                     " enlisted transaction(s) still open. Rolling back.");
        }
        logRollbackFailure(rollbackActive(), "TransactionManager Dtor");
    }
}

void TransactionManager::enlist(std::shared_ptr<TransactionResource> txn) {
    if (!active_) {
        throw StorageError::transactionClosed("enlist");
    }
    if (!txn || !txn->isActive()) {
        throw StorageError::illegalState("Only ACTIVE transactions can be enlisted");
    }
    transactions_.push_back(std::move(txn));
}

void TransactionManager::setRollbackOnly() {
    if (!rollback_only_) {
        LOG_TRACE("[TransactionManager] Marked rollback-only.");
    }
    rollback_only_ = true;
}

void TransactionManager::commit() {
    if (!active_) {
        throw StorageError::illegalState("Transaction manager already completed");
    }
    if (rollback_only_) {
        logRollbackFailure(rollbackActive(), "TransactionManager Commit");
        active_ = false;
        throw StorageError::illegalState("Transaction manager is marked rollback-only")
            .withSuggestedAction("Inspect the error that marked the request rollback-only");
    }

    active_ = false;
    for (const auto& txn : transactions_) {
        if (!txn->isActive()) {
            continue;
        }
        try {
            txn->prepare();
        } catch (const StorageError& e) {
            LOG_ERROR("[TransactionManager Commit] TxnID ", txn->getId(), " cannot commit: ", e.toString(),
                      ". Rolling back all ", transactions_.size(), " transaction(s).");
            logRollbackFailure(rollbackActive(), "TransactionManager Commit");
            throw;
        }
    }
    for (size_t i = 0; i < transactions_.size(); ++i) {
        if (!transactions_[i]->isActive()) {
            continue;
        }
        try {
            transactions_[i]->commit();
        } catch (const StorageError& e) {
            LOG_ERROR("[TransactionManager Commit] TxnID ", transactions_[i]->getId(), " failed: ", e.toString(),
                      ". Rolling back ", transactions_.size() - i - 1, " remaining transaction(s).");
            logRollbackFailure(rollbackActive(), "TransactionManager Commit");
            throw;
        }
    }
}

void TransactionManager::rollback() {
    if (!active_) {
        throw StorageError::illegalState("Transaction manager already completed");
    }
    active_ = false;
    if (std::optional<StorageError> failure = rollbackActive()) {
        throw *failure;
    }
}

std::optional<StorageError> TransactionManager::rollbackActive() {
    std::optional<StorageError> first_failure;
    for (const auto& txn : transactions_) {
        if (!txn->isActive()) {
            continue;
        }
        try {
            txn->rollback();
        } catch (const StorageError& e) {
            LOG_ERROR("[TransactionManager Rollback] TxnID ", txn->getId(), " failed: ", e.toString());
            if (!first_failure) {
                first_failure = e;
            }
        }
    }
    active_ = false;
    return first_failure;
}

} // namespace mapstore
