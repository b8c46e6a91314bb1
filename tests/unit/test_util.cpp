/**
 * @file test_util.cpp
 * @brief Unit tests for utility helpers (urls, versions, identifiers, timers)
 */

#include <gtest/gtest.h>
#include "util/util.hpp"
#include "util/version.hpp"
#include "util/timer.hpp"
#include "crypto.hpp"

// ============================================================================
// Url Tests
// ============================================================================

TEST(HttpUrlTest, HostOnlyDefaultsToPort80) {
    util::http_url url;
    ASSERT_EQ(util::parse_http_url("http://pos.example.com", url), 0);
    EXPECT_EQ(url.host, "pos.example.com");
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.target_prefix, "");
}

TEST(HttpUrlTest, PortAndPathPrefix) {
    util::http_url url;
    ASSERT_EQ(util::parse_http_url("http://10.0.0.5:5000/pos/", url), 0);
    EXPECT_EQ(url.host, "10.0.0.5");
    EXPECT_EQ(url.port, 5000);
    // Trailing slash is dropped so api paths can be appended.
    EXPECT_EQ(url.target_prefix, "/pos");
}

TEST(HttpUrlTest, RejectsUnsupportedOrMalformedUrls) {
    util::http_url url;
    EXPECT_EQ(util::parse_http_url("https://pos.example.com", url), -1);
    EXPECT_EQ(util::parse_http_url("pos.example.com:5000", url), -1);
    EXPECT_EQ(util::parse_http_url("http://:5000", url), -1);
    EXPECT_EQ(util::parse_http_url("http://pos.example.com:99999", url), -1);
    EXPECT_EQ(util::parse_http_url("http://pos.example.com:abc", url), -1);
}

TEST(HttpUrlTest, QueryValuesArePercentEncoded) {
    EXPECT_EQ(util::url_encode("device-01_A.b~"), "device-01_A.b~");
    EXPECT_EQ(util::url_encode("a b&c"), "a%20b%26c");
    EXPECT_EQ(util::url_encode("/"), "%2F");
}

// ============================================================================
// Version Tests
// ============================================================================

TEST(VersionTest, Compare) {
    EXPECT_EQ(version::version_compare("1.2.0", "1.2.0"), 0);
    EXPECT_EQ(version::version_compare("1.2.0", "1.10.0"), -1);
    EXPECT_EQ(version::version_compare("2.0.0", "1.9.9"), 1);
    EXPECT_EQ(version::version_compare("1.2", "1.2.0"), 0);
}

TEST(VersionTest, MalformedVersion) {
    EXPECT_EQ(version::version_compare("1.x.0", "1.0.0"), -2);
    EXPECT_EQ(version::version_compare("1.0.0", "1.-1.0"), -2);
}

TEST(VersionTest, CurrentVersionSatisfiesMinimumConfigVersion) {
    EXPECT_GE(version::version_compare(version::POSSYNC_VERSION, version::MIN_CONFIG_VERSION), 0);
}

// ============================================================================
// Identifier Tests
// ============================================================================

TEST(UuidTest, VersionFourFormat) {
    ASSERT_EQ(crypto::init(), 0);

    const std::string uuid = crypto::generate_uuid();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}

TEST(UuidTest, Unique) {
    ASSERT_EQ(crypto::init(), 0);

    std::set<std::string> ids;
    for (int i = 0; i < 100; i++)
        ids.insert(crypto::generate_uuid());
    EXPECT_EQ(ids.size(), 100u);
}

// ============================================================================
// Timer Tests
// ============================================================================

TEST(ThreadTimerServiceTest, FiresUntilStopped) {
    util::thread_timer_service timers;
    std::atomic<int> ticks = 0;

    const uint64_t id = timers.start(20, [&]() { ticks++; });
    EXPECT_NE(id, 0u);

    for (int i = 0; i < 100 && ticks < 2; i++)
        util::sleep(10);
    EXPECT_GE(ticks.load(), 2);

    timers.stop(id);
    const int after_stop = ticks;
    util::sleep(100);
    EXPECT_EQ(ticks.load(), after_stop);
}

TEST(ThreadTimerServiceTest, StopFromOwnCallback) {
    util::thread_timer_service timers;
    std::atomic<int> ticks = 0;
    std::atomic<uint64_t> id = 0;

    id = timers.start(10, [&]() {
        ticks++;
        timers.stop(id);
    });

    for (int i = 0; i < 50 && ticks == 0; i++)
        util::sleep(10);
    util::sleep(100);
    EXPECT_EQ(ticks.load(), 1);
}

TEST(ThreadTimerServiceTest, StoppingUnknownTimerIsNoop) {
    util::thread_timer_service timers;
    timers.stop(12345);
    SUCCEED();
}
