/**
 * @file test_conf.cpp
 * @brief Unit tests for config parsing and validation
 */

#include <gtest/gtest.h>
#include "conf.hpp"

class ConfigTest : public ::testing::Test {
protected:
    conf::possync_config defaults;

    void SetUp() override {
        conf::populate_default_config(defaults);
        defaults.device.id = "9f0e1c2a-5b7d-4e3f-8a1b-2c3d4e5f6a7b";
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    EXPECT_EQ(conf::validate_config(defaults), 0);
    EXPECT_EQ(defaults.sync.max_retry_attempts, 3u);
    EXPECT_EQ(defaults.sync.initial_retry_delay_ms, 5000u);
    EXPECT_DOUBLE_EQ(defaults.sync.retry_backoff_multiplier, 2.0);
    EXPECT_EQ(defaults.txstate.auto_save_interval_sec, 30u);
}

TEST_F(ConfigTest, JsonRoundTripPreservesValues) {
    defaults.sync.max_retry_delay_ms = 60000;
    defaults.recovery.high_priority_total = 250000;

    jsoncons::ojson d;
    conf::populate_config_json(d, defaults);

    conf::possync_config parsed;
    ASSERT_EQ(conf::parse_config_json(parsed, d), 0);
    EXPECT_EQ(parsed.device.id, defaults.device.id);
    EXPECT_EQ(parsed.server.base_url, defaults.server.base_url);
    EXPECT_EQ(parsed.server.timeout_ms, defaults.server.timeout_ms);
    EXPECT_EQ(parsed.sync.interval_ms, defaults.sync.interval_ms);
    EXPECT_EQ(parsed.sync.max_retry_delay_ms, 60000u);
    EXPECT_EQ(parsed.recovery.high_priority_total, 250000);
    EXPECT_EQ(parsed.log.loggers, defaults.log.loggers);
    EXPECT_EQ(parsed.log.log_level_type, conf::LOG_SEVERITY::INFO);
}

TEST_F(ConfigTest, MissingRequiredFieldFails) {
    jsoncons::ojson d;
    conf::populate_config_json(d, defaults);
    d.at("server").erase("timeout_ms");

    conf::possync_config parsed;
    EXPECT_EQ(conf::parse_config_json(parsed, d), -1);
}

TEST_F(ConfigTest, RetryDelayCeilingIsOptional) {
    jsoncons::ojson d;
    conf::populate_config_json(d, defaults);
    d.at("sync").erase("max_retry_delay_ms");

    conf::possync_config parsed;
    ASSERT_EQ(conf::parse_config_json(parsed, d), 0);
    EXPECT_EQ(parsed.sync.max_retry_delay_ms, 0u);
}

TEST_F(ConfigTest, OldConfigVersionRejected) {
    jsoncons::ojson d;
    conf::populate_config_json(d, defaults);
    d.insert_or_assign("version", "0.0.1");

    conf::possync_config parsed;
    EXPECT_EQ(conf::parse_config_json(parsed, d), -1);
}

TEST_F(ConfigTest, InvalidValuesRejected) {
    conf::possync_config cfg = defaults;
    cfg.sync.retry_backoff_multiplier = 0.5;
    EXPECT_EQ(conf::validate_config(cfg), -1);

    cfg = defaults;
    cfg.server.base_url = "ftp://pos.example.com";
    EXPECT_EQ(conf::validate_config(cfg), -1);

    cfg = defaults;
    cfg.log.log_level = "verbose";
    EXPECT_EQ(conf::validate_config(cfg), -1);

    cfg = defaults;
    cfg.device.id.clear();
    EXPECT_EQ(conf::validate_config(cfg), -1);
}
