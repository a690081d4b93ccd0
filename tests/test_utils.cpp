// tests/test_utils.cpp
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/utils/Utils.hpp"

// Silences the warnings applyConfigValue writes for rejected values.
class CerrSilencer {
public:
    CerrSilencer() : old_(std::cerr.rdbuf(captured_.rdbuf())) {}
    ~CerrSilencer() { std::cerr.rdbuf(old_); }
    std::string text() const { return captured_.str(); }

private:
    std::ostringstream captured_;
    std::streambuf* old_;
};

// --- Tests for parseArguments ---

TEST(UtilsTest, ParseArgumentsValidSingle) {
    std::vector<std::string> args = {"key=value"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "value");
}

TEST(UtilsTest, ParseArgumentsValidMultiple) {
    std::vector<std::string> args = {"key1=value1", "key2=value2"};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at("key1"), "value1");
    EXPECT_EQ(result->at("key2"), "value2");
}

TEST(UtilsTest, ParseArgumentsEmptyInput) {
    std::vector<std::string> args = {};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(UtilsTest, ParseArgumentsInvalidNoEquals) {
    CerrSilencer silence;
    std::vector<std::string> args = {"keyvalue"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsInvalidEmptyKey) {
    CerrSilencer silence;
    std::vector<std::string> args = {"=value"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

TEST(UtilsTest, ParseArgumentsEmptyValue) {
    std::vector<std::string> args = {"key="};
    auto result = Utils::parseArguments(args);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 1);
    EXPECT_EQ(result->at("key"), "");
}

TEST(UtilsTest, ParseArgumentsMixedValidInvalid) {
    // Any malformed argument fails the whole parse
    CerrSilencer silence;
    std::vector<std::string> args = {"key1=value1", "invalid", "key2=value2"};
    auto result = Utils::parseArguments(args);
    EXPECT_FALSE(result.has_value());
}

// --- Tests for the scalar helpers ---

TEST(UtilsTest, StringToIntRejectsTrailingGarbage) {
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_FALSE(Utils::stringToInt("42abc").has_value());
    EXPECT_FALSE(Utils::stringToInt("").has_value());
    EXPECT_FALSE(Utils::stringToInt("99999999999").has_value());
}

TEST(UtilsTest, StringToBoolAcceptsWordsAndDigits) {
    EXPECT_EQ(Utils::stringToBool("true"), true);
    EXPECT_EQ(Utils::stringToBool("1"), true);
    EXPECT_EQ(Utils::stringToBool("false"), false);
    EXPECT_EQ(Utils::stringToBool("0"), false);
    EXPECT_FALSE(Utils::stringToBool("yes").has_value());
}

TEST(UtilsTest, SplitTrimsAndDropsEmptyParts) {
    auto parts = Utils::split(" postgres , ,redis,", ',');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "postgres");
    EXPECT_EQ(parts[1], "redis");
}

TEST(UtilsTest, TrimOfBlankStringIsEmpty) {
    EXPECT_EQ(Utils::trim(" \t\r\n"), "");
    EXPECT_EQ(Utils::trim("  value "), "value");
}

TEST(UtilsTest, FormatTimestampIsUtcWithMillis) {
    std::chrono::system_clock::time_point epoch{};
    EXPECT_EQ(Utils::formatTimestamp(epoch), "1970-01-01T00:00:00.000Z");

    auto later = epoch + std::chrono::hours(24) + std::chrono::milliseconds(1234);
    EXPECT_EQ(Utils::formatTimestamp(later), "1970-01-02T00:00:01.234Z");
}

// --- Tests for applyConfigValue ---

TEST(UtilsTest, ApplyConfigValueSetsKnownKeys) {
    AppConfig config;
    EXPECT_TRUE(Utils::applyConfigValue(config, "use_redis", "false"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "redis_port", "6380"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "default_token_limit", "5000000000"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "breaker_failure_threshold", "3"));
    EXPECT_TRUE(Utils::applyConfigValue(config, "log_level", "DEBUG"));

    EXPECT_FALSE(config.use_redis);
    EXPECT_EQ(config.redis_port, 6380);
    EXPECT_EQ(config.default_token_limit, 5000000000LL);
    EXPECT_EQ(config.breaker_failure_threshold, 3);
    EXPECT_EQ(config.log_level, LogUtils::LogLevel::DEBUG);
}

TEST(UtilsTest, ApplyConfigValueRejectsBadValues) {
    CerrSilencer silence;
    AppConfig config;
    EXPECT_FALSE(Utils::applyConfigValue(config, "redis_port", "70000"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "breaker_failure_threshold", "0"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "dlq_max_attempts", "abc"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "default_token_limit", "-1"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "log_level", "LOUD"));

    AppConfig defaults;
    EXPECT_EQ(config.redis_port, defaults.redis_port);
    EXPECT_EQ(config.breaker_failure_threshold, defaults.breaker_failure_threshold);
    EXPECT_EQ(config.dlq_max_attempts, defaults.dlq_max_attempts);
    EXPECT_EQ(config.default_token_limit, defaults.default_token_limit);
    EXPECT_EQ(config.log_level, defaults.log_level);
}

TEST(UtilsTest, ApplyConfigValueUnknownKeyWarns) {
    CerrSilencer silence;
    AppConfig config;
    EXPECT_FALSE(Utils::applyConfigValue(config, "frontend_port", "9000"));
    EXPECT_NE(silence.text().find("Unknown configuration key"), std::string::npos);
}

TEST(UtilsTest, ApplyConfigValueParsesCriticalDependencies) {
    AppConfig config;
    EXPECT_TRUE(Utils::applyConfigValue(config, "critical_dependencies", "postgres, redis"));
    EXPECT_EQ(config.critical_dependencies, (std::set<std::string>{"postgres", "redis"}));
}

TEST(UtilsTest, ApplyConfigValueParsesGovernanceRule) {
    AppConfig config;
    EXPECT_TRUE(Utils::applyConfigValue(config, "governance.planner", "4,6,true"));

    ASSERT_EQ(config.governance_rules.count("planner"), 1u);
    const GovernanceRule& rule = config.governance_rules.at("planner");
    EXPECT_EQ(rule.role, "planner");
    EXPECT_EQ(rule.max_updates_per_day, 4);
    EXPECT_EQ(rule.cooldown, std::chrono::hours(6));
    EXPECT_TRUE(rule.requires_human_approval);
}

TEST(UtilsTest, ApplyConfigValueRejectsMalformedGovernanceRule) {
    CerrSilencer silence;
    AppConfig config;
    EXPECT_FALSE(Utils::applyConfigValue(config, "governance.developer", "5,2"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "governance.developer", "-1,2,false"));
    EXPECT_FALSE(Utils::applyConfigValue(config, "governance.", "5,2,false"));
    EXPECT_EQ(config.governance_rules.at("developer").max_updates_per_day, 5);
}

// --- Tests for loadConfiguration ---

TEST(UtilsTest, LoadConfigurationDefaults) {
    CerrSilencer silence;
    std::map<std::string, std::string> args = {};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.governance_rules.size(), 5u);
    EXPECT_TRUE(config.governance_rules.at("security").requires_human_approval);
    EXPECT_EQ(config.governance_rules.at("security").max_updates_per_day, 1);
    EXPECT_EQ(config.governance_rules.at("developer").cooldown, std::chrono::hours(2));
}

TEST(UtilsTest, LoadConfigurationArgumentsOverride) {
    CerrSilencer silence;
    std::map<std::string, std::string> args = {
        {"idempotency_ttl_seconds", "120"},
        {"worker_threads", " 8 "},
        {"governance.tester", "10,0,false"}
    };
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_EQ(config.idempotency_ttl_seconds, 120);
    EXPECT_EQ(config.worker_threads, 8);
    EXPECT_EQ(config.governance_rules.at("tester").max_updates_per_day, 10);
    EXPECT_EQ(config.governance_rules.at("tester").cooldown, std::chrono::hours(0));
}

TEST(UtilsTest, LoadConfigurationIgnoresInvalidArgument) {
    CerrSilencer silence;
    std::map<std::string, std::string> args = {{"redis_port", "abc"}};
    AppConfig config = Utils::loadConfiguration(args);
    EXPECT_GT(config.redis_port, 0);
    EXPECT_LE(config.redis_port, 65535);
}
