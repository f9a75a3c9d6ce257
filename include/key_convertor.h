// include/key_convertor.h
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "storage_error/storage_error.h"

namespace mapstore {

/**
 * @brief Canonical string encoding and generation of store keys.
 *
 * Every store is generic over a key type K; the convertor is what makes K
 * usable from string identifiers handed in by callers.
 */
template<typename K>
class KeyConvertor {
public:
    virtual ~KeyConvertor() = default;

    virtual std::string toString(const K& key) const = 0;

    /**
     * @brief Parses a key.
     * @throws StorageError INVALID_KEY_FORMAT when raw is not a valid key.
     */
    K fromString(const std::string& raw) const;

    // Tolerant variant: malformed input yields nullopt.
    std::optional<K> fromStringSafe(const std::string& raw) const { return parse(raw); }

    virtual K newUniqueKey() const = 0;

    // Human readable name of the key format, used in error messages.
    virtual std::string formatName() const = 0;

protected:
    virtual std::optional<K> parse(const std::string& raw) const = 0;
};

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const { return bytes < other.bytes; }
};

// Cryptographically random bytes from OpenSSL.
std::vector<unsigned char> generateRandomBytes(int size);

Uuid randomUuid();
std::string uuidToString(const Uuid& uuid);
std::optional<Uuid> parseUuid(const std::string& raw);

// std::string keys; new keys are random UUID strings.
class StringKeyConvertor : public KeyConvertor<std::string> {
public:
    std::string toString(const std::string& key) const override { return key; }
    std::string newUniqueKey() const override;
    std::string formatName() const override { return "non-empty string key"; }

protected:
    std::optional<std::string> parse(const std::string& raw) const override;
};

class UuidKeyConvertor : public KeyConvertor<Uuid> {
public:
    std::string toString(const Uuid& key) const override { return uuidToString(key); }
    Uuid newUniqueKey() const override { return randomUuid(); }
    std::string formatName() const override { return "UUID"; }

protected:
    std::optional<Uuid> parse(const std::string& raw) const override { return parseUuid(raw); }
};

// Decimal uint64_t keys from a monotonic counter with a random starting offset.
class UInt64KeyConvertor : public KeyConvertor<uint64_t> {
public:
    UInt64KeyConvertor();
    explicit UInt64KeyConvertor(uint64_t first_key);

    std::string toString(const uint64_t& key) const override { return std::to_string(key); }
    uint64_t newUniqueKey() const override { return next_key_.fetch_add(1); }
    std::string formatName() const override { return "unsigned 64-bit decimal key"; }

protected:
    std::optional<uint64_t> parse(const std::string& raw) const override;

private:
    mutable std::atomic<uint64_t> next_key_;
};

} // namespace mapstore

namespace std {
template<>
struct hash<mapstore::Uuid> {
    size_t operator()(const mapstore::Uuid& uuid) const noexcept {
        uint64_t hi = 0, lo = 0;
        std::memcpy(&hi, uuid.bytes.data(), sizeof(hi));
        std::memcpy(&lo, uuid.bytes.data() + sizeof(hi), sizeof(lo));
        return std::hash<uint64_t>()(hi ^ (lo * 0x9E3779B97F4A7C15ULL));
    }
};
} // namespace std

namespace mapstore {

template<typename K>
K KeyConvertor<K>::fromString(const std::string& raw) const {
    std::optional<K> key = parse(raw);
    if (!key) {
        throw StorageError::invalidKeyFormat(raw, formatName());
    }
    return *key;
}

} // namespace mapstore
