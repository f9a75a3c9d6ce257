// include/config.h
#pragma once

#include "storage/file_entity_store.h"
#include "storage/in_memory_entity_store.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace mapstore {

enum class StoreBackend {
    IN_MEMORY,
    FILE
};

struct StoreConfig {
    StoreBackend backend = StoreBackend::IN_MEMORY;
    size_t shard_count = 16;
    std::string data_dir = "./mapstore_data";
    std::string file_prefix; // FILE snapshots are "<data_dir>/<file_prefix><store name>.json"

    /**
     * @brief Reads the recognised keys of a JSON object; absent keys keep
     * their defaults.
     * @throws StorageError INVALID_CONFIGURATION for wrong types, an unknown
     *         backend name or a zero shard count.
     */
    static StoreConfig fromJson(const nlohmann::json& j);
    static StoreConfig loadFromFile(const std::filesystem::path& path);

    void validate() const;
    nlohmann::json toJson() const;

    std::filesystem::path filePathFor(const std::string& store_name) const;
};

struct ClientProviderConfig {
    std::string default_protocol = "openid-connect";

    static ClientProviderConfig fromJson(const nlohmann::json& j);
    static ClientProviderConfig loadFromFile(const std::filesystem::path& path);
};

// Builds the backend StoreConfig selects. `store_name` names the FILE snapshot.
template<typename K, typename V>
std::unique_ptr<EntityStore<K, V>> makeStore(const StoreConfig& config,
                                            const std::string& store_name,
                                            std::shared_ptr<const KeyConvertor<K>> convertor,
                                            std::shared_ptr<const FieldDescriptors<V>> fields) {
    config.validate();
    switch (config.backend) {
        case StoreBackend::IN_MEMORY:
            return std::make_unique<InMemoryEntityStore<K, V>>(std::move(convertor), std::move(fields),
                                                               config.shard_count);
        case StoreBackend::FILE: {
            std::filesystem::path file = config.filePathFor(store_name);
            std::error_code ec;
            if (!file.parent_path().empty()) {
                std::filesystem::create_directories(file.parent_path(), ec);
            }
            if (ec) {
                throw StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "create data directory",
                                            file.parent_path().string())
                    .withContext("reason", ec.message());
            }
            return std::make_unique<FileEntityStore<K, V>>(std::move(file), std::move(convertor),
                                                           std::move(fields), config.shard_count);
        }
    }
    throw StorageError(ErrorCode::INVALID_CONFIGURATION, "Unknown store backend");
}

} // namespace mapstore
