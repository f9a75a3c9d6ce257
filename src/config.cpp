// src/config.cpp
#include "../include/config.h"
#include "../include/serialization_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace mapstore {

namespace {

    nlohmann::json parseConfigFile(const std::filesystem::path& path) {
        try {
            return nlohmann::json::parse(ReadFileToString(path));
        } catch (const nlohmann::json::parse_error& e) {
            throw StorageError(ErrorCode::INVALID_CONFIGURATION, "Configuration file is not valid JSON")
                .withDetails(e.what())
                .withFilePath(path.string());
        }
    }

    StorageError configError(const std::string& key, const std::string& problem) {
        return StorageError(ErrorCode::INVALID_CONFIGURATION, "Invalid configuration value")
            .withDetails("'" + key + "': " + problem)
            .withContext("key", key);
    }

    void requireObject(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw StorageError(ErrorCode::INVALID_CONFIGURATION, "Configuration must be a JSON object");
        }
    }

} // anonymous namespace

StoreConfig StoreConfig::fromJson(const nlohmann::json& j) {
    requireObject(j);
    StoreConfig config;

    if (j.contains("backend")) {
        if (!j["backend"].is_string()) {
            throw configError("backend", "expected a string");
        }
        std::string name = j["backend"].get<std::string>();
        auto backend = magic_enum::enum_cast<StoreBackend>(name);
        if (!backend) {
            throw configError("backend", "unknown backend '" + name + "'");
        }
        config.backend = *backend;
    }
    if (j.contains("shard_count")) {
        if (!j["shard_count"].is_number_unsigned()) {
            throw configError("shard_count", "expected a positive integer");
        }
        config.shard_count = j["shard_count"].get<size_t>();
    }
    if (j.contains("data_dir")) {
        if (!j["data_dir"].is_string()) {
            throw configError("data_dir", "expected a string");
        }
        config.data_dir = j["data_dir"].get<std::string>();
    }
    if (j.contains("file_prefix")) {
        if (!j["file_prefix"].is_string()) {
            throw configError("file_prefix", "expected a string");
        }
        config.file_prefix = j["file_prefix"].get<std::string>();
    }

    config.validate();
    return config;
}

StoreConfig StoreConfig::loadFromFile(const std::filesystem::path& path) {
    return fromJson(parseConfigFile(path));
}

void StoreConfig::validate() const {
    if (shard_count == 0) {
        throw configError("shard_count", "must be greater than zero");
    }
    if (backend == StoreBackend::FILE && data_dir.empty()) {
        throw configError("data_dir", "required by the FILE backend");
    }
}

nlohmann::json StoreConfig::toJson() const {
    nlohmann::json j;
    j["backend"] = std::string(magic_enum::enum_name(backend));
    j["shard_count"] = shard_count;
    j["data_dir"] = data_dir;
    j["file_prefix"] = file_prefix;
    return j;
}

std::filesystem::path StoreConfig::filePathFor(const std::string& store_name) const {
    return std::filesystem::path(data_dir) / (file_prefix + store_name + ".json");
}

ClientProviderConfig ClientProviderConfig::fromJson(const nlohmann::json& j) {
    requireObject(j);
    ClientProviderConfig config;
    if (j.contains("default_protocol")) {
        if (!j["default_protocol"].is_string() || j["default_protocol"].get<std::string>().empty()) {
            throw configError("default_protocol", "expected a non-empty string");
        }
        config.default_protocol = j["default_protocol"].get<std::string>();
    }
    return config;
}

ClientProviderConfig ClientProviderConfig::loadFromFile(const std::filesystem::path& path) {
    return fromJson(parseConfigFile(path));
}

} // namespace mapstore
