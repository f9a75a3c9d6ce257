// include/storage/transaction_state.h
#pragma once

#include "../types.h"

#include <atomic>
#include <mutex>
#include <string_view>

namespace mapstore {

enum class TransactionPhase {
    ACTIVE,
    COMMITTED,
    ROLLED_BACK
};

std::string_view transactionPhaseToString(TransactionPhase phase);

/**
 * @brief Lifecycle state shared between a transaction and the handles it
 * hands out, so a handle can tell when its transaction has ended.
 */
class TransactionState {
public:
    explicit TransactionState(TxnId id) : id_(id) {}

    TxnId getId() const { return id_; }

    TransactionPhase getPhase() const {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        return phase_;
    }

    void setPhase(TransactionPhase new_phase) {
        std::lock_guard<std::mutex> lock(phase_mutex_);
        phase_ = new_phase;
    }

    bool canModify() const { return getPhase() == TransactionPhase::ACTIVE; }

    // Set by handles on their first modify(); never cleared while the transaction lives.
    void markModified() { modified_.store(true, std::memory_order_relaxed); }
    bool hasModifications() const { return modified_.load(std::memory_order_relaxed); }

    static TxnId nextId() {
        static std::atomic<TxnId> next_txn_id{1};
        return next_txn_id.fetch_add(1, std::memory_order_relaxed);
    }

private:
    TxnId id_;
    TransactionPhase phase_ = TransactionPhase::ACTIVE;
    mutable std::mutex phase_mutex_;
    std::atomic<bool> modified_{false};
};

} // namespace mapstore
