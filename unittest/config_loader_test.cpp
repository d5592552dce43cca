// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <reliability/core/config/loader.hpp>
#include <reliability/core/config/app_config.hpp>

using namespace Reliability;

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "ReliabilityCore");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.evaluation.interval_seconds, 60u);
    EXPECT_DOUBLE_EQ(config.evaluation.budget_critical_threshold, 0.5);

    // Verify breakers
    ASSERT_EQ(config.breakers.size(), 2u);
    EXPECT_EQ(config.breakers[0].name, "database");
    EXPECT_EQ(config.breakers[0].failure_threshold, 3u);
    EXPECT_EQ(config.breakers[0].recovery_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.breakers[1].name, "external_notifications");

    // Verify SLOs
    ASSERT_EQ(config.slos.size(), 4u);
    EXPECT_EQ(config.slos[1].kind, SliKind::LATENCY);
    EXPECT_DOUBLE_EQ(config.slos[0].target, 99.9);
    EXPECT_EQ(config.slos[3].key, "freshness");
    EXPECT_EQ(config.slos[3].window_days, 7u);
}

TEST(ConfigLoader, DefaultsWhenSectionsOmitted) {
    auto config = ConfigLoader::loadFromString(
        "app_name: minimal\n"
        "version: \"2\"\n");

    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.recorder.retention_days, 0u);
    EXPECT_EQ(config.evaluation.interval_seconds, 60u);
    EXPECT_TRUE(config.breakers.empty());
    ASSERT_EQ(config.slos.size(), 4u);
    EXPECT_EQ(config.slos[0].key, "availability");
}

TEST(ConfigLoader, SloWindowDefaultsToThirtyDays) {
    auto config = ConfigLoader::loadFromString(
        "app_name: a\n"
        "version: b\n"
        "slos:\n"
        "  - key: checkout\n"
        "    sli: availability\n"
        "    target: 99.5\n");

    ASSERT_EQ(config.slos.size(), 1u);
    EXPECT_EQ(config.slos[0].name, "checkout");
    EXPECT_EQ(config.slos[0].kind, SliKind::AVAILABILITY);
    EXPECT_EQ(config.slos[0].window_days, 30u);
}

TEST(ConfigLoader, FractionalRecoveryTimeout) {
    auto config = ConfigLoader::loadFromString(
        "app_name: a\n"
        "version: b\n"
        "breakers:\n"
        "  - name: cache\n"
        "    failure_threshold: 2\n"
        "    recovery_timeout_seconds: 1.5\n");

    ASSERT_EQ(config.breakers.size(), 1u);
    EXPECT_EQ(config.breakers[0].recovery_timeout, std::chrono::milliseconds(1500));
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMalformedYaml) {
    EXPECT_THROW(ConfigLoader::loadFromString("app_name: [unterminated\n"), std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnUnknownSli) {
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "slos:\n  - key: x\n    sli: throughput_sli\n    target: 99\n"),
        std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnDuplicateBreaker) {
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n"
        "  - {name: db, failure_threshold: 3, recovery_timeout_seconds: 30}\n"
        "  - {name: db, failure_threshold: 4, recovery_timeout_seconds: 10}\n"),
        std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnNonPositiveBreakerSettings) {
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 0, recovery_timeout_seconds: 30}\n"),
        std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 3, recovery_timeout_seconds: 0}\n"),
        std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnOutOfRangeBreakerSettings) {
    // Would wrap to 0 as uint32_t
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 4294967296, recovery_timeout_seconds: 30}\n"),
        std::runtime_error);
    // Would truncate to 0 ms
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 3, recovery_timeout_seconds: 0.0005}\n"),
        std::runtime_error);
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 3, recovery_timeout_seconds: 1e30}\n"),
        std::runtime_error);

    auto config = ConfigLoader::loadFromString(
        "app_name: a\nversion: b\n"
        "breakers:\n  - {name: db, failure_threshold: 4294967295, recovery_timeout_seconds: 0.001}\n");
    ASSERT_EQ(config.breakers.size(), 1u);
    EXPECT_EQ(config.breakers[0].failure_threshold, 4294967295u);
    EXPECT_EQ(config.breakers[0].recovery_timeout, std::chrono::milliseconds(1));
}

TEST(ConfigLoader, ThrowsOnEmptySloList) {
    EXPECT_THROW(ConfigLoader::loadFromString("app_name: a\nversion: b\nslos: []\n"),
                 std::runtime_error);
}

TEST(ConfigLoader, ThrowsOnUnknownLogLevel) {
    EXPECT_THROW(ConfigLoader::loadFromString(
        "app_name: a\nversion: b\nlogging:\n  level: verbose\n"),
        std::runtime_error);
}
