/**
 * @file test_retry_executor.cpp
 * @brief Unit tests for bounded exponential backoff
 */

#include <gtest/gtest.h>
#include "syncer/retry_executor.hpp"
#include "remote/api_client.hpp"

using remote::api_result;

class RetryExecutorTest : public ::testing::Test {
protected:
    std::vector<uint64_t> delays;

    syncer::retry_executor make_executor(const uint32_t max_attempts, const uint64_t initial_delay_ms,
                                         const double multiplier, const uint64_t max_delay_ms = 0) {
        syncer::retry_config config;
        config.max_attempts = max_attempts;
        config.initial_delay_ms = initial_delay_ms;
        config.backoff_multiplier = multiplier;
        config.max_delay_ms = max_delay_ms;
        return syncer::retry_executor(config, [this](const uint64_t ms) { delays.push_back(ms); });
    }
};

TEST_F(RetryExecutorTest, FirstAttemptSuccessDoesNotSleep) {
    syncer::retry_executor retry = make_executor(3, 100, 2.0);
    int calls = 0;

    const api_result result = retry.execute<api_result>([&]() { calls++; return api_result{true, "", 200}; }, "op");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays.empty());
    EXPECT_EQ(retry.get_attempts("op"), 0u);
}

TEST_F(RetryExecutorTest, DelaysGrowByMultiplier) {
    syncer::retry_executor retry = make_executor(3, 100, 2.0);
    int calls = 0;

    const api_result result = retry.execute<api_result>([&]() {
        calls++;
        return api_result{calls == 3, calls == 3 ? "" : "timeout", 0};
    }, "op");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays, (std::vector<uint64_t>{100, 200}));
    EXPECT_EQ(retry.get_attempts("op"), 0u);
}

TEST_F(RetryExecutorTest, ExhaustedAttemptsReturnLastFailure) {
    syncer::retry_executor retry = make_executor(3, 100, 2.0);
    int calls = 0;

    const api_result result = retry.execute<api_result>([&]() {
        calls++;
        return api_result{false, "failure " + std::to_string(calls), 503};
    }, "op");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "failure 3");
    EXPECT_EQ(calls, 3);
    // No sleep after the final attempt.
    EXPECT_EQ(delays, (std::vector<uint64_t>{100, 200}));
    EXPECT_EQ(retry.get_attempts("op"), 3u);
}

TEST_F(RetryExecutorTest, ExceptionsCountAsFailedAttempts) {
    syncer::retry_executor retry = make_executor(2, 10, 2.0);
    int calls = 0;

    const api_result result = retry.execute<api_result>([&]() -> api_result {
        calls++;
        throw std::runtime_error("Connection refused");
    }, "op");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Connection refused");
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(delays, (std::vector<uint64_t>{10}));
}

TEST_F(RetryExecutorTest, DelayCeiling) {
    syncer::retry_executor retry = make_executor(5, 100, 3.0, 500);

    retry.execute<api_result>([&]() { return api_result{false, "down", 0}; }, "op");

    EXPECT_EQ(delays, (std::vector<uint64_t>{100, 300, 500, 500}));
}

TEST_F(RetryExecutorTest, StateIsTrackedPerKey) {
    syncer::retry_executor retry = make_executor(2, 1, 1.0);

    retry.execute<api_result>([&]() { return api_result{false, "down", 0}; }, "upload");
    retry.execute<api_result>([&]() { return api_result{true, "", 200}; }, "download");

    EXPECT_EQ(retry.get_attempts("upload"), 2u);
    EXPECT_EQ(retry.get_attempts("download"), 0u);

    retry.clear_all();
    EXPECT_EQ(retry.get_attempts("upload"), 0u);
}

TEST_F(RetryExecutorTest, ZeroMaxAttemptsStillRunsOnce) {
    syncer::retry_executor retry = make_executor(0, 100, 2.0);
    int calls = 0;

    retry.execute<api_result>([&]() { calls++; return api_result{false, "down", 0}; }, "op");

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(delays.empty());
}
