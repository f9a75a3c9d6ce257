// include/storage/entity_store.h
#pragma once

#include "criteria.h"
#include "lazy_sequence.h"
#include "../key_convertor.h"

#include <optional>
#include <vector>

namespace mapstore {

/**
 * @brief Effects of one committed transaction, applied all-or-nothing.
 */
template<typename K, typename V>
struct WriteBatch {
    std::vector<V> creates;   // Keys must be absent
    std::vector<V> updates;   // Keys must be present
    std::vector<K> deletes;   // Idempotent

    bool empty() const { return creates.empty() && updates.empty() && deletes.empty(); }
    size_t size() const { return creates.size() + updates.size() + deletes.size(); }
};

/**
 * @brief Backend plug-in contract.
 *
 * Any engine that can create, read, delete and count entities of type V
 * keyed by K, resolve criteria built from createCriteriaBuilder() and apply
 * a WriteBatch atomically can back a Transaction. Implementations must be
 * safe for concurrent use from request threads.
 *
 * V must be copyable, equality comparable and expose `const K& getId() const`.
 * Sequences returned by read() must not outlive the store.
 */
template<typename K, typename V>
class EntityStore {
public:
    using Key = K;
    using Entity = V;

    virtual ~EntityStore() = default;

    /**
     * @throws StorageError DUPLICATE_KEY if the key is already present.
     */
    virtual void create(const V& entity) = 0;

    virtual std::optional<V> read(const K& key) const = 0;

    /**
     * @brief Criteria-filtered read. Ordered when the parameters carry an
     * ordering or pagination; otherwise in backend order, stable for one walk.
     */
    virtual LazySequence<V> read(const QueryParameters<V>& params) const = 0;

    // Returns whether a row was actually removed.
    virtual bool remove(const K& key) = 0;

    // Equals the number of items read(params) yields.
    virtual size_t count(const QueryParameters<V>& params) const = 0;

    /**
     * @brief Applies every create, update and delete of the batch, or none.
     * @throws StorageError DUPLICATE_KEY when a create collides,
     *         TRANSACTION_CONFLICT when an updated row no longer exists.
     */
    virtual void applyBatch(const WriteBatch<K, V>& batch) = 0;

    /**
     * @brief Verifies the preconditions applyBatch checks without applying anything.
     * @throws StorageError as applyBatch would against the current rows.
     */
    virtual void checkBatch(const WriteBatch<K, V>& batch) const = 0;

    virtual CriteriaBuilder<V> createCriteriaBuilder() const = 0;

    virtual const KeyConvertor<K>& keyConvertor() const = 0;
};

// Number of rows a read over `total` matches yields once pagination applies.
template<typename V>
size_t paginatedCount(size_t total, const QueryParameters<V>& params) {
    size_t first = std::min(params.offset().value_or(0), total);
    size_t remaining = total - first;
    return params.limit() ? std::min(remaining, *params.limit()) : remaining;
}

} // namespace mapstore
