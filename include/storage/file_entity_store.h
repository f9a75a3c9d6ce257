// include/storage/file_entity_store.h
#pragma once

#include "in_memory_entity_store.h"
#include "../serialization_utils.h"
#include "../debug_utils.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <unordered_map>

namespace mapstore {

/**
 * @brief File-backed backend: an in-memory view plus a JSON snapshot file.
 *
 * Every mutation rewrites the snapshot atomically before it becomes visible
 * in memory, so a failed write leaves both the file and the view unchanged.
 * Writers are serialized by one mutex; readers go straight to the in-memory
 * view. The entity payload is covered by a CRC-32 that is verified on load.
 *
 * V must additionally provide `nlohmann::json toJson() const` and
 * `static V fromJson(K id, const nlohmann::json&)`.
 */
template<typename K, typename V>
class FileEntityStore : public EntityStore<K, V> {
public:
    static constexpr int FORMAT_VERSION = 1;

    FileEntityStore(std::filesystem::path file_path,
                    std::shared_ptr<const KeyConvertor<K>> convertor,
                    std::shared_ptr<const FieldDescriptors<V>> fields,
                    size_t shard_count = InMemoryEntityStore<K, V>::DEFAULT_SHARD_COUNT)
        : file_path_(std::move(file_path)),
          convertor_(convertor),
          memory_(std::move(convertor), std::move(fields), shard_count) {
        load();
    }

    void create(const V& entity) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (memory_.read(entity.getId())) {
            throw StorageError::duplicateKey(convertor_->toString(entity.getId()));
        }
        std::vector<V> rows = memory_.snapshot();
        rows.push_back(entity);
        persist(rows);
        memory_.create(entity);
    }

    std::optional<V> read(const K& key) const override { return memory_.read(key); }

    LazySequence<V> read(const QueryParameters<V>& params) const override { return memory_.read(params); }

    bool remove(const K& key) override {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!memory_.read(key)) {
            return false;
        }
        std::vector<V> rows = memory_.snapshot();
        rows.erase(std::remove_if(rows.begin(), rows.end(),
                                  [&key](const V& e) { return e.getId() == key; }),
                   rows.end());
        persist(rows);
        return memory_.remove(key);
    }

    size_t count(const QueryParameters<V>& params) const override { return memory_.count(params); }

    void applyBatch(const WriteBatch<K, V>& batch) override {
        if (batch.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(write_mutex_);
        // Only writers holding write_mutex_ mutate memory_, so the check stays valid.
        memory_.checkBatch(batch);

        std::unordered_map<K, V> rows;
        for (V& entity : memory_.snapshot()) {
            K id = entity.getId();
            rows.emplace(std::move(id), std::move(entity));
        }
        for (const V& entity : batch.creates) rows.emplace(entity.getId(), entity);
        for (const V& entity : batch.updates) rows.insert_or_assign(entity.getId(), entity);
        for (const K& key : batch.deletes) rows.erase(key);

        std::vector<V> resulting;
        resulting.reserve(rows.size());
        for (auto& [key, entity] : rows) {
            resulting.push_back(std::move(entity));
        }
        persist(resulting);
        memory_.applyBatch(batch);
    }

    void checkBatch(const WriteBatch<K, V>& batch) const override { memory_.checkBatch(batch); }

    CriteriaBuilder<V> createCriteriaBuilder() const override { return memory_.createCriteriaBuilder(); }

    const KeyConvertor<K>& keyConvertor() const override { return *convertor_; }

    const std::filesystem::path& filePath() const { return file_path_; }

private:
    void load() {
        if (!std::filesystem::exists(file_path_)) {
            LOG_INFO("[FileEntityStore] No snapshot at '", file_path_.string(), "', starting empty.");
            return;
        }

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(ReadFileToString(file_path_));
        } catch (const nlohmann::json::parse_error& e) {
            throw StorageError(ErrorCode::INVALID_DATA_FORMAT, "Snapshot file is not valid JSON")
                .withDetails(e.what())
                .withFilePath(file_path_.string());
        }

        try {
            int version = doc.at("format_version").get<int>();
            if (version != FORMAT_VERSION) {
                throw StorageError(ErrorCode::INVALID_DATA_FORMAT, "Unsupported snapshot format version")
                    .withDetails("Found version " + std::to_string(version))
                    .withFilePath(file_path_.string());
            }
            const nlohmann::json& entities = doc.at("entities");
            uint32_t expected = doc.at("checksum").get<uint32_t>();
            uint32_t actual = calculate_payload_checksum(entities.dump());
            if (expected != actual) {
                throw StorageError(ErrorCode::CHECKSUM_MISMATCH, "Snapshot checksum mismatch")
                    .withDetails("Expected " + std::to_string(expected) + ", computed " + std::to_string(actual))
                    .withFilePath(file_path_.string())
                    .withSuggestedAction("Restore the snapshot from a backup");
            }
            for (const nlohmann::json& record : entities) {
                K id = convertor_->fromString(record.at("id").get<std::string>());
                try {
                    memory_.create(V::fromJson(id, record.at("data")));
                } catch (const StorageError& e) {
                    if (e.code != ErrorCode::DUPLICATE_KEY) {
                        throw;
                    }
                    throw StorageError(ErrorCode::INVALID_DATA_FORMAT, "Snapshot lists the same key twice")
                        .withDetails(record.at("id").get<std::string>())
                        .withFilePath(file_path_.string())
                        .withUnderlyingError(e.code);
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw StorageError(ErrorCode::INVALID_DATA_FORMAT, "Snapshot file has an unexpected layout")
                .withDetails(e.what())
                .withFilePath(file_path_.string());
        }
        LOG_INFO("[FileEntityStore] Loaded ", memory_.size(), " entities from '", file_path_.string(), "'.");
    }

    void persist(const std::vector<V>& rows) const {
        nlohmann::json entities = nlohmann::json::array();
        for (const V& entity : rows) {
            entities.push_back({{"id", convertor_->toString(entity.getId())}, {"data", entity.toJson()}});
        }
        nlohmann::json doc;
        doc["format_version"] = FORMAT_VERSION;
        doc["checksum"] = calculate_payload_checksum(entities.dump());
        doc["entities"] = std::move(entities);
        WriteFileAtomically(file_path_, doc.dump(2));
    }

    std::filesystem::path file_path_;
    std::shared_ptr<const KeyConvertor<K>> convertor_;
    InMemoryEntityStore<K, V> memory_;
    std::mutex write_mutex_;
};

} // namespace mapstore
