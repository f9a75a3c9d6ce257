// include/storage/in_memory_entity_store.h
#pragma once

#include "entity_store.h"
#include "../debug_utils.h"

#include <algorithm>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace mapstore {

/**
 * @brief Sharded in-memory backend.
 *
 * Rows are spread over shards by key hash, each shard guarded by its own
 * shared_mutex. A batch commit locks only the shards its keys hash to, in
 * ascending shard order, so commits over disjoint shards run in parallel
 * and overlapping commits cannot deadlock.
 */
template<typename K, typename V>
class InMemoryEntityStore : public EntityStore<K, V> {
public:
    static constexpr size_t DEFAULT_SHARD_COUNT = 16;

    InMemoryEntityStore(std::shared_ptr<const KeyConvertor<K>> convertor,
                        std::shared_ptr<const FieldDescriptors<V>> fields,
                        size_t shard_count = DEFAULT_SHARD_COUNT)
        : convertor_(std::move(convertor)), fields_(std::move(fields)) {
        if (shard_count == 0) {
            throw StorageError(ErrorCode::INVALID_CONFIGURATION, "Shard count must be positive");
        }
        shards_.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    InMemoryEntityStore(const InMemoryEntityStore&) = delete;
    InMemoryEntityStore& operator=(const InMemoryEntityStore&) = delete;

    void create(const V& entity) override {
        Shard& shard = shardFor(entity.getId());
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (shard.rows.count(entity.getId()) > 0) {
            throw StorageError::duplicateKey(convertor_->toString(entity.getId()));
        }
        shard.rows.emplace(entity.getId(), entity);
        LOG_TRACE("[InMemoryEntityStore Create] Key '", format_key_for_print(convertor_->toString(entity.getId())), "'");
    }

    std::optional<V> read(const K& key) const override {
        const Shard& shard = shardFor(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.rows.find(key);
        if (it == shard.rows.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    LazySequence<V> read(const QueryParameters<V>& params) const override {
        if (params.isOrdered() || params.isPaginated()) {
            return LazySequence<V>::deferred([this, params]() {
                return orderAndSlice(collectMatching(params.criteria()), params,
                                     [this](const V& e) { return convertor_->toString(e.getId()); });
            });
        }

        // Unordered: walk shard by shard, snapshotting each shard as it is reached.
        return LazySequence<V>([this, params]() -> typename LazySequence<V>::Cursor {
            auto next_shard = std::make_shared<size_t>(0);
            auto buffer = std::make_shared<std::vector<V>>();
            auto pos = std::make_shared<size_t>(0);
            return [this, params, next_shard, buffer, pos]() -> std::optional<V> {
                while (*pos >= buffer->size()) {
                    if (*next_shard >= shards_.size()) {
                        return std::nullopt;
                    }
                    buffer->clear();
                    *pos = 0;
                    const Shard& shard = *shards_[(*next_shard)++];
                    std::shared_lock<std::shared_mutex> lock(shard.mutex);
                    for (const auto& [key, entity] : shard.rows) {
                        if (params.criteria().matches(entity)) {
                            buffer->push_back(entity);
                        }
                    }
                }
                return (*buffer)[(*pos)++];
            };
        });
    }

    bool remove(const K& key) override {
        Shard& shard = shardFor(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        bool removed = shard.rows.erase(key) > 0;
        LOG_TRACE("[InMemoryEntityStore Remove] Key '", format_key_for_print(convertor_->toString(key)),
                  "' removed: ", removed);
        return removed;
    }

    size_t count(const QueryParameters<V>& params) const override {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            for (const auto& [key, entity] : shard->rows) {
                if (params.criteria().matches(entity)) {
                    ++total;
                }
            }
        }
        return paginatedCount(total, params);
    }

    void applyBatch(const WriteBatch<K, V>& batch) override {
        if (batch.empty()) {
            return;
        }
        std::vector<std::unique_lock<std::shared_mutex>> locks = lockShardsFor(batch);
        checkBatchLocked(batch);
        for (const V& entity : batch.creates) {
            shardFor(entity.getId()).rows.emplace(entity.getId(), entity);
        }
        for (const V& entity : batch.updates) {
            shardFor(entity.getId()).rows.insert_or_assign(entity.getId(), entity);
        }
        for (const K& key : batch.deletes) {
            shardFor(key).rows.erase(key);
        }
        LOG_TRACE("[InMemoryEntityStore ApplyBatch] Applied ", batch.creates.size(), " create(s), ",
                  batch.updates.size(), " update(s), ", batch.deletes.size(), " delete(s) over ",
                  locks.size(), " shard(s)");
    }

    void checkBatch(const WriteBatch<K, V>& batch) const override {
        std::vector<std::shared_lock<std::shared_mutex>> locks;
        for (size_t index : shardIndicesFor(batch)) {
            locks.emplace_back(shards_[index]->mutex);
        }
        checkBatchLocked(batch);
    }

    std::vector<V> snapshot() const {
        std::vector<V> rows;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            for (const auto& [key, entity] : shard->rows) {
                rows.push_back(entity);
            }
        }
        return rows;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            total += shard->rows.size();
        }
        return total;
    }

    size_t shardCount() const { return shards_.size(); }

    CriteriaBuilder<V> createCriteriaBuilder() const override { return CriteriaBuilder<V>(fields_); }

    const KeyConvertor<K>& keyConvertor() const override { return *convertor_; }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<K, V> rows;
    };

    size_t shardIndex(const K& key) const { return std::hash<K>()(key) % shards_.size(); }
    Shard& shardFor(const K& key) { return *shards_[shardIndex(key)]; }
    const Shard& shardFor(const K& key) const { return *shards_[shardIndex(key)]; }

    std::vector<size_t> shardIndicesFor(const WriteBatch<K, V>& batch) const {
        std::vector<size_t> indices;
        indices.reserve(batch.size());
        for (const V& entity : batch.creates) indices.push_back(shardIndex(entity.getId()));
        for (const V& entity : batch.updates) indices.push_back(shardIndex(entity.getId()));
        for (const K& key : batch.deletes) indices.push_back(shardIndex(key));
        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
        return indices;
    }

    std::vector<std::unique_lock<std::shared_mutex>> lockShardsFor(const WriteBatch<K, V>& batch) {
        std::vector<std::unique_lock<std::shared_mutex>> locks;
        for (size_t index : shardIndicesFor(batch)) {
            locks.emplace_back(shards_[index]->mutex);
        }
        return locks;
    }

    // Caller holds the locks of every shard the batch touches.
    void checkBatchLocked(const WriteBatch<K, V>& batch) const {
        for (const V& entity : batch.creates) {
            if (shardFor(entity.getId()).rows.count(entity.getId()) > 0) {
                throw StorageError::duplicateKey(convertor_->toString(entity.getId()));
            }
        }
        for (const V& entity : batch.updates) {
            if (shardFor(entity.getId()).rows.count(entity.getId()) == 0) {
                std::string key = convertor_->toString(entity.getId());
                throw StorageError(ErrorCode::TRANSACTION_CONFLICT,
                                   "Updated entity was removed by a concurrent commit")
                    .withDetails("Key: " + key)
                    .withContext("key", key);
            }
        }
    }

    std::vector<V> collectMatching(const CriteriaBuilder<V>& criteria) const {
        std::vector<V> rows;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard->mutex);
            for (const auto& [key, entity] : shard->rows) {
                if (criteria.matches(entity)) {
                    rows.push_back(entity);
                }
            }
        }
        return rows;
    }

    std::shared_ptr<const KeyConvertor<K>> convertor_;
    std::shared_ptr<const FieldDescriptors<V>> fields_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace mapstore
