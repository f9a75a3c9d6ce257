// include/storage/transaction.h
#pragma once

#include "entity_store.h"
#include "entity_handle.h"
#include "transaction_resource.h"
#include "../debug_utils.h"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mapstore {

/**
 * @brief Request-scoped read/write buffer over an EntityStore.
 *
 * Creates, deletes and handle mutations stay local until commit(), which
 * applies them to the store as one WriteBatch. Reads see the transaction's
 * own writes. A transaction is used by a single request thread and must not
 * outlive its store; sequences it returns must not outlive the transaction.
 *
 * Lifecycle: ACTIVE -> COMMITTED | ROLLED_BACK. Destroying an ACTIVE
 * transaction rolls it back.
 */
template<typename K, typename V>
class Transaction : public TransactionResource {
public:
    using Handle = EntityHandle<V>;
    using HandlePtr = std::shared_ptr<Handle>;

    explicit Transaction(EntityStore<K, V>& store)
        : store_(store), state_(std::make_shared<TransactionState>(TransactionState::nextId())) {
        LOG_TRACE("[Transaction] TxnID ", state_->getId(), " started.");
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ~Transaction() override {
        if (state_->getPhase() == TransactionPhase::ACTIVE) {
            LOG_WARN("[Transaction Dtor] TxnID ", state_->getId(), " destroyed while ACTIVE with ",
                     pendingChangeCount(), " pending change(s). Rolling back.");
            discard(TransactionPhase::ROLLED_BACK);
        }
    }

    TxnId getId() const override { return state_->getId(); }
    TransactionPhase getPhase() const override { return state_->getPhase(); }

    /**
     * @brief Returns the transaction's handle for `key`, or nullptr when the
     * entity does not exist or was deleted in this transaction. Repeated
     * reads of one key return the same handle.
     */
    HandlePtr read(const K& key) {
        ensureActive("read");
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            return it->second->isDetached() ? nullptr : it->second;
        }
        if (tombstones_.count(key) > 0) {
            return nullptr;
        }
        std::optional<V> stored = store_.read(key);
        if (!stored) {
            return nullptr;
        }
        return track(std::move(*stored), false);
    }

    /**
     * @brief Criteria read over the store merged with this transaction's
     * pending creates, deletes and modifications.
     *
     * Each walk sees the transaction as it is when the walk begins, and
     * beginning a walk after commit or rollback throws TRANSACTION_CLOSED.
     */
    LazySequence<HandlePtr> read(const QueryParameters<V>& params) {
        ensureActive("read");
        using Cursor = typename LazySequence<HandlePtr>::Cursor;
        return LazySequence<HandlePtr>([this, params]() -> Cursor {
            ensureActive("read");
            if (!hasLocalChanges()) {
                auto rows = std::make_shared<LazySequence<V>>(store_.read(params));
                auto it = std::make_shared<typename LazySequence<V>::iterator>(rows->begin());
                return [this, rows, it]() -> std::optional<HandlePtr> {
                    while (*it != rows->end()) {
                        HandlePtr handle = handleFor(**it);
                        ++*it;
                        if (handle) {
                            return handle;
                        }
                    }
                    return std::nullopt;
                };
            }
            auto rows = std::make_shared<std::vector<V>>(mergedRows(params));
            auto pos = std::make_shared<size_t>(0);
            return [this, rows, pos]() -> std::optional<HandlePtr> {
                while (*pos < rows->size()) {
                    if (HandlePtr handle = handleFor((*rows)[(*pos)++])) {
                        return handle;
                    }
                }
                return std::nullopt;
            };
        });
    }

    size_t count(const QueryParameters<V>& params) {
        ensureActive("count");
        if (!hasLocalChanges()) {
            return store_.count(params);
        }
        return mergedRows(params).size();
    }

    /**
     * @brief Buffers a new entity and returns its handle.
     * @throws StorageError DUPLICATE_KEY when the key is visible to this
     *         transaction or present in the store.
     */
    HandlePtr create(const V& entity) {
        ensureActive("create");
        const K& key = entity.getId();

        auto it = handles_.find(key);
        if (it != handles_.end() && !it->second->isDetached()) {
            throw StorageError::duplicateKey(store_.keyConvertor().toString(key));
        }
        bool deleted_here = tombstones_.count(key) > 0 || (it != handles_.end() && it->second->isDetached());
        if (!deleted_here) {
            if (store_.read(key)) {
                throw StorageError::duplicateKey(store_.keyConvertor().toString(key));
            }
            created_.insert(key);
            return track(entity, true);
        }

        // Recreating a key deleted earlier in this transaction.
        tombstones_.erase(key);
        bool in_store = store_.read(key).has_value();
        if (in_store) {
            replaced_.insert(key);
        } else {
            created_.insert(key);
        }
        if (it != handles_.end()) {
            it->second->reattach(entity, !in_store);
            return it->second;
        }
        return track(entity, !in_store);
    }

    /**
     * @brief Buffers a delete of `key`; the key need not have been read.
     * @return whether the entity was visible to this transaction.
     */
    bool remove(const K& key) {
        ensureActive("remove");
        bool visible = false;
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            visible = !it->second->isDetached();
            it->second->detach();
        } else if (tombstones_.count(key) == 0) {
            visible = store_.read(key).has_value();
        }
        replaced_.erase(key);
        if (created_.erase(key) == 0) {
            tombstones_.insert(key);
        }
        LOG_TRACE("[Transaction] TxnID ", state_->getId(), " buffered delete of '",
                  format_key_for_print(store_.keyConvertor().toString(key)), "'.");
        return visible;
    }

    /**
     * @brief Checks the buffered effects against the store's current rows
     * without applying them.
     * @throws StorageError ILLEGAL_STATE when not ACTIVE, otherwise what
     *         commit() would throw for the same rows.
     */
    void prepare() override {
        ensureCommittable();
        store_.checkBatch(pendingBatch());
    }

    /**
     * @brief Applies all buffered effects atomically.
     * @throws StorageError ILLEGAL_STATE when not ACTIVE; any store failure
     *         is rethrown after the transaction moved to ROLLED_BACK.
     */
    void commit() override {
        ensureCommittable();
        WriteBatch<K, V> batch = pendingBatch();
        try {
            store_.applyBatch(batch);
        } catch (const StorageError& e) {
            LOG_WARN("[Transaction Commit] TxnID ", state_->getId(), " failed: ", e.toString(),
                     ". Transaction rolled back.");
            discard(TransactionPhase::ROLLED_BACK);
            throw;
        }
        LOG_TRACE("[Transaction Commit] TxnID ", state_->getId(), " committed ", batch.size(), " change(s).");
        discard(TransactionPhase::COMMITTED);
    }

    void rollback() override {
        if (state_->getPhase() != TransactionPhase::ACTIVE) {
            throw StorageError::illegalState("Cannot roll back a transaction in phase " +
                                             std::string(transactionPhaseToString(state_->getPhase())));
        }
        LOG_TRACE("[Transaction Rollback] TxnID ", state_->getId(), " discarding ", pendingChangeCount(),
                  " pending change(s).");
        discard(TransactionPhase::ROLLED_BACK);
    }

    CriteriaBuilder<V> createCriteriaBuilder() const { return store_.createCriteriaBuilder(); }
    const KeyConvertor<K>& keyConvertor() const { return store_.keyConvertor(); }

    size_t pendingChangeCount() const {
        size_t dirty = 0;
        for (const auto& [key, handle] : handles_) {
            if (!handle->isDetached() && created_.count(key) == 0 &&
                (replaced_.count(key) > 0 || handle->isDirty())) {
                ++dirty;
            }
        }
        return created_.size() + tombstones_.size() + dirty;
    }

private:
    void ensureActive(const std::string& operation) const {
        if (state_->getPhase() != TransactionPhase::ACTIVE) {
            throw StorageError::transactionClosed(operation);
        }
    }

    void ensureCommittable() const {
        if (state_->getPhase() != TransactionPhase::ACTIVE) {
            throw StorageError::illegalState("Cannot commit a transaction in phase " +
                                             std::string(transactionPhaseToString(state_->getPhase())));
        }
    }

    // Conservative: a handle modified and then reverted still counts.
    bool hasLocalChanges() const {
        return !created_.empty() || !replaced_.empty() || !tombstones_.empty() || state_->hasModifications();
    }

    WriteBatch<K, V> pendingBatch() const {
        WriteBatch<K, V> batch;
        for (const auto& [key, handle] : handles_) {
            if (handle->isDetached()) {
                continue;
            }
            if (created_.count(key) > 0) {
                batch.creates.push_back(handle->get());
            } else if (replaced_.count(key) > 0 || handle->isDirty()) {
                batch.updates.push_back(handle->get());
            }
        }
        batch.deletes.assign(tombstones_.begin(), tombstones_.end());
        return batch;
    }

    HandlePtr track(V entity, bool created_in_txn) {
        K key = entity.getId();
        auto handle = std::make_shared<Handle>(std::move(entity), state_, created_in_txn);
        handles_[key] = handle;
        return handle;
    }

    // Memoized handle for a row the store (or the merged view) produced;
    // nullptr when the key was deleted in this transaction.
    HandlePtr handleFor(const V& entity) {
        const K& key = entity.getId();
        auto it = handles_.find(key);
        if (it != handles_.end()) {
            return it->second->isDetached() ? nullptr : it->second;
        }
        if (tombstones_.count(key) > 0) {
            return nullptr;
        }
        return track(entity, false);
    }

    std::vector<V> mergedRows(const QueryParameters<V>& params) const {
        const CriteriaBuilder<V>& criteria = params.criteria();
        std::vector<V> rows;
        std::unordered_set<K> seen;

        for (const V& stored : store_.read(params.withoutPagination())) {
            const K& key = stored.getId();
            seen.insert(key);
            if (tombstones_.count(key) > 0) {
                continue;
            }
            auto it = handles_.find(key);
            if (it == handles_.end()) {
                rows.push_back(stored);
            } else if (!it->second->isDetached() && criteria.matches(it->second->get())) {
                rows.push_back(it->second->get());
            }
        }
        // Local creations and local modifications that now match.
        for (const auto& [key, handle] : handles_) {
            if (seen.count(key) == 0 && !handle->isDetached() && criteria.matches(handle->get())) {
                rows.push_back(handle->get());
            }
        }

        const KeyConvertor<K>& convertor = store_.keyConvertor();
        return orderAndSlice(std::move(rows), params,
                             [&convertor](const V& e) { return convertor.toString(e.getId()); });
    }

    // Handles stay in their terminal-state transaction and refuse mutation.
    void discard(TransactionPhase terminal) {
        state_->setPhase(terminal);
        created_.clear();
        replaced_.clear();
        tombstones_.clear();
    }

    EntityStore<K, V>& store_;
    std::shared_ptr<TransactionState> state_;
    std::unordered_map<K, HandlePtr> handles_;
    std::unordered_set<K> created_;    // Keys absent from the store at create time
    std::unordered_set<K> replaced_;   // Store keys deleted then recreated here
    std::unordered_set<K> tombstones_; // Store keys to delete
};

} // namespace mapstore
