// src/key_convertor.cpp
#include "../include/key_convertor.h"
#include "../include/storage_error/storage_error.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <charconv>
#include <cctype>

namespace mapstore {

namespace {

    constexpr char HEX_DIGITS[] = "0123456789abcdef";

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool isDashPosition(size_t i) {
        return i == 8 || i == 13 || i == 18 || i == 23;
    }

} // end anonymous namespace

std::vector<unsigned char> generateRandomBytes(int size) {
    std::vector<unsigned char> bytes(static_cast<size_t>(size));
    if (size > 0 && RAND_bytes(bytes.data(), size) != 1) {
        unsigned long err_code = ERR_get_error();
        char buffer[256];
        ERR_error_string_n(err_code, buffer, sizeof(buffer));
        throw StorageError(ErrorCode::INTERNAL_ERROR, "RAND_bytes failed")
            .withDetails(buffer);
    }
    return bytes;
}

Uuid randomUuid() {
    std::vector<unsigned char> random = generateRandomBytes(16);
    Uuid uuid;
    std::copy(random.begin(), random.end(), uuid.bytes.begin());
    uuid.bytes[6] = static_cast<uint8_t>((uuid.bytes[6] & 0x0F) | 0x40); // version 4
    uuid.bytes[8] = static_cast<uint8_t>((uuid.bytes[8] & 0x3F) | 0x80); // RFC 4122 variant
    return uuid;
}

std::string uuidToString(const Uuid& uuid) {
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid.bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(HEX_DIGITS[uuid.bytes[i] >> 4]);
        out.push_back(HEX_DIGITS[uuid.bytes[i] & 0x0F]);
    }
    return out;
}

std::optional<Uuid> parseUuid(const std::string& raw) {
    if (raw.size() != 36) {
        return std::nullopt;
    }
    Uuid uuid;
    size_t byte_index = 0;
    for (size_t i = 0; i < raw.size();) {
        if (isDashPosition(i)) {
            if (raw[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hexValue(raw[i]);
        int lo = hexValue(raw[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        uuid.bytes[byte_index++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return uuid;
}

std::string StringKeyConvertor::newUniqueKey() const {
    return uuidToString(randomUuid());
}

std::optional<std::string> StringKeyConvertor::parse(const std::string& raw) const {
    if (raw.empty()) {
        return std::nullopt;
    }
    return raw;
}

UInt64KeyConvertor::UInt64KeyConvertor() : next_key_(0) {
    std::vector<unsigned char> seed = generateRandomBytes(4);
    uint64_t offset = 0;
    for (unsigned char b : seed) {
        offset = (offset << 8) | b;
    }
    // Keeps keys from separate process runs apart when the store is persistent.
    next_key_.store((offset << 16) + 1);
}

UInt64KeyConvertor::UInt64KeyConvertor(uint64_t first_key) : next_key_(first_key) {}

std::optional<uint64_t> UInt64KeyConvertor::parse(const std::string& raw) const {
    if (raw.empty() || !std::isdigit(static_cast<unsigned char>(raw.front()))) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(raw.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace mapstore
