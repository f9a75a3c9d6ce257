// src/test/key_convertor.test.cpp
#include "gtest/gtest.h"
#include "../../include/key_convertor.h"

#include <set>
#include <thread>
#include <vector>

using namespace mapstore;

TEST(KeyConvertorTest, StringKeysRoundTripAndRejectEmpty) {
    StringKeyConvertor convertor;
    EXPECT_EQ(convertor.fromString("app1"), "app1");
    EXPECT_EQ(convertor.toString(convertor.fromString("My Client")), "My Client");

    EXPECT_FALSE(convertor.fromStringSafe("").has_value());
    try {
        convertor.fromString("");
        FAIL() << "Expected INVALID_KEY_FORMAT";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_KEY_FORMAT);
    }
}

TEST(KeyConvertorTest, StringKeysAreGeneratedAsUuids) {
    StringKeyConvertor convertor;
    std::string key = convertor.newUniqueKey();
    EXPECT_EQ(key.size(), 36u);
    EXPECT_TRUE(parseUuid(key).has_value());
    EXPECT_NE(key, convertor.newUniqueKey());
}

TEST(KeyConvertorTest, UuidCanonicalForm) {
    UuidKeyConvertor convertor;
    Uuid key = convertor.fromString("123E4567-E89B-12D3-A456-426614174000");
    EXPECT_EQ(convertor.toString(key), "123e4567-e89b-12d3-a456-426614174000");
    EXPECT_EQ(convertor.fromString(convertor.toString(key)), key);
}

TEST(KeyConvertorTest, UuidRejectsMalformedInput) {
    UuidKeyConvertor convertor;
    EXPECT_FALSE(convertor.fromStringSafe("not-a-uuid").has_value());
    EXPECT_FALSE(convertor.fromStringSafe("123e4567e89b12d3a456426614174000").has_value());
    EXPECT_FALSE(convertor.fromStringSafe("123e4567-e89b-12d3-a456-42661417400g").has_value());
    EXPECT_THROW(convertor.fromString("123e4567_e89b_12d3_a456_426614174000"), StorageError);
}

TEST(KeyConvertorTest, GeneratedUuidsAreVersion4) {
    UuidKeyConvertor convertor;
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        Uuid key = convertor.newUniqueKey();
        EXPECT_EQ(key.bytes[6] >> 4, 4);
        EXPECT_EQ(key.bytes[8] & 0xC0, 0x80);
        seen.insert(convertor.toString(key));
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(KeyConvertorTest, UInt64DecimalKeys) {
    UInt64KeyConvertor convertor(100);
    EXPECT_EQ(convertor.fromString("42"), 42u);
    EXPECT_EQ(convertor.toString(18446744073709551615ULL), "18446744073709551615");
    EXPECT_FALSE(convertor.fromStringSafe("-1").has_value());
    EXPECT_FALSE(convertor.fromStringSafe("+1").has_value());
    EXPECT_FALSE(convertor.fromStringSafe("12a").has_value());
    EXPECT_FALSE(convertor.fromStringSafe("18446744073709551616").has_value());

    EXPECT_EQ(convertor.newUniqueKey(), 100u);
    EXPECT_EQ(convertor.newUniqueKey(), 101u);
}

TEST(KeyConvertorTest, UInt64KeysAreUniqueAcrossThreads) {
    UInt64KeyConvertor convertor;
    const int num_threads = 4;
    const int keys_per_thread = 1000;
    std::vector<std::vector<uint64_t>> generated(num_threads);

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < keys_per_thread; ++i) {
                generated[t].push_back(convertor.newUniqueKey());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<uint64_t> all;
    for (const auto& keys : generated) {
        all.insert(keys.begin(), keys.end());
    }
    EXPECT_EQ(all.size(), static_cast<size_t>(num_threads * keys_per_thread));
}

TEST(KeyConvertorTest, InvalidKeyFormatCarriesExpectedFormat) {
    UuidKeyConvertor convertor;
    try {
        convertor.fromString("xyz");
        FAIL() << "Expected INVALID_KEY_FORMAT";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code, ErrorCode::INVALID_KEY_FORMAT);
        EXPECT_EQ(e.category, ErrorCategory::DATA_VALIDATION);
        EXPECT_NE(e.details.find("UUID"), std::string::npos);
        EXPECT_EQ(e.context.at("key"), "xyz");
    }
}

TEST(StorageErrorTest, ToStringCarriesDetailsFileAndAction) {
    StorageError error = StorageError::ioError(ErrorCode::IO_WRITE_ERROR, "rename snapshot", "/data/clients.json");
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_EQ(error.category, ErrorCategory::IO_FILESYSTEM);

    std::string line = error.toString();
    EXPECT_NE(line.find("IO_WRITE_ERROR"), std::string::npos);
    EXPECT_NE(line.find("Operation: rename snapshot"), std::string::npos);
    EXPECT_NE(line.find("file: /data/clients.json"), std::string::npos);
    EXPECT_NE(line.find("action: Check file permissions"), std::string::npos);
}

TEST(StorageErrorTest, SeverityFollowsCode) {
    EXPECT_EQ(StorageError(ErrorCode::CHECKSUM_MISMATCH).severity, ErrorSeverity::CRITICAL);
    EXPECT_EQ(StorageError(ErrorCode::DUPLICATE_KEY).severity, ErrorSeverity::INFO);
    EXPECT_EQ(StorageError(ErrorCode::TRANSACTION_CLOSED).category, ErrorCategory::TRANSACTION);
    EXPECT_EQ(StorageError(ErrorCode::INTERNAL_ERROR).category, ErrorCategory::GENERIC);
    EXPECT_EQ(StorageError(ErrorCode::CASCADE_FAILED).message, "CASCADE_FAILED");
}
