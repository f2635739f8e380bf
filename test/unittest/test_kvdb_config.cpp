/**
 * @file test_kvdb_config.cpp
 * @brief Unit tests for KVDB engine configuration
 * @date 2026-10-16
 */

#include <gtest/gtest.h>
#include "CKvDbConfig.hpp"

using namespace lap::kvdb;
using namespace lap::core;

class KvDbConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
    }

    void TearDown() override {
    }
};

TEST_F(KvDbConfigTest, Defaults) {
    KvDbConfig config;

    EXPECT_EQ(config.journalMode, "WAL");
    EXPECT_EQ(config.synchronous, "NORMAL");
    EXPECT_EQ(config.cacheSize, -10000);
    EXPECT_EQ(config.busyTimeoutMs, 0);
    EXPECT_TRUE(ValidateKvDbConfig(config).HasValue());
}

TEST_F(KvDbConfigTest, Parse_NullGivesDefaults) {
    auto result = ParseKvDbConfig(nlohmann::json());
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().journalMode, "WAL");
    EXPECT_EQ(result.Value().busyTimeoutMs, 0);
}

TEST_F(KvDbConfigTest, Parse_PartialObjectKeepsDefaults) {
    nlohmann::json moduleConfig = {
        {"synchronous", "FULL"},
        {"busyTimeoutMs", 250}
    };

    auto result = ParseKvDbConfig(moduleConfig);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().journalMode, "WAL");
    EXPECT_EQ(result.Value().synchronous, "FULL");
    EXPECT_EQ(result.Value().cacheSize, -10000);
    EXPECT_EQ(result.Value().busyTimeoutMs, 250);
}

TEST_F(KvDbConfigTest, Parse_FullObject) {
    nlohmann::json moduleConfig = {
        {"journalMode", "DELETE"},
        {"synchronous", "OFF"},
        {"cacheSize", 512},
        {"busyTimeoutMs", 1000}
    };

    auto result = ParseKvDbConfig(moduleConfig);
    ASSERT_TRUE(result.HasValue());
    EXPECT_EQ(result.Value().journalMode, "DELETE");
    EXPECT_EQ(result.Value().synchronous, "OFF");
    EXPECT_EQ(result.Value().cacheSize, 512);
    EXPECT_EQ(result.Value().busyTimeoutMs, 1000);
}

TEST_F(KvDbConfigTest, Parse_NotAnObject) {
    auto result = ParseKvDbConfig(nlohmann::json::array({1, 2, 3}));
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<ErrorDomain::CodeType>(KvDbErrc::kInvalidArgument));
}

TEST_F(KvDbConfigTest, Parse_WrongValueType) {
    nlohmann::json moduleConfig = {
        {"cacheSize", "large"}
    };

    auto result = ParseKvDbConfig(moduleConfig);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<ErrorDomain::CodeType>(KvDbErrc::kInvalidArgument));
}

TEST_F(KvDbConfigTest, Parse_UnknownJournalMode) {
    nlohmann::json moduleConfig = {
        {"journalMode", "JOURNAL"}
    };

    auto result = ParseKvDbConfig(moduleConfig);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<ErrorDomain::CodeType>(KvDbErrc::kInvalidArgument));
}

TEST_F(KvDbConfigTest, Validate_RejectsUnknownSynchronous) {
    KvDbConfig config;
    config.synchronous = "SOMETIMES";

    auto result = ValidateKvDbConfig(config);
    ASSERT_FALSE(result.HasValue());
    EXPECT_EQ(result.Error().Value(), static_cast<ErrorDomain::CodeType>(KvDbErrc::kInvalidArgument));
}

TEST_F(KvDbConfigTest, Validate_RejectsNegativeBusyTimeout) {
    KvDbConfig config;
    config.busyTimeoutMs = -1;

    EXPECT_FALSE(ValidateKvDbConfig(config).HasValue());
}

TEST_F(KvDbConfigTest, Validate_AcceptsAllJournalModes) {
    for (const char* mode : {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"}) {
        KvDbConfig config;
        config.journalMode = mode;
        EXPECT_TRUE(ValidateKvDbConfig(config).HasValue()) << mode;
    }
}
