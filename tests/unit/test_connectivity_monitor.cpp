/**
 * @file test_connectivity_monitor.cpp
 * @brief Unit tests for tcp reachability checks and bounded name resolution
 */

#include <gtest/gtest.h>
#include "conn/tcp_connectivity_monitor.hpp"
#include "util/util.hpp"
#include "test_common.hpp"

using namespace possync_test;
using tcp = boost::asio::ip::tcp;

class TcpConnectivityMonitorTest : public ::testing::Test {
protected:
    manual_timer_service timers;
    conn::tcp_connectivity_monitor monitor{timers};
    boost::asio::io_context ioc;

    static std::string url_for(const uint16_t port) {
        return "http://127.0.0.1:" + std::to_string(port);
    }
};

// ============================================================================
// Reachability
// ============================================================================

TEST_F(TcpConnectivityMonitorTest, ListeningServerIsReachable) {
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const uint16_t port = acceptor.local_endpoint().port();

    EXPECT_TRUE(monitor.is_server_reachable(url_for(port), 1000));
}

TEST_F(TcpConnectivityMonitorTest, ClosedPortIsUnreachable) {
    uint16_t port = 0;
    {
        tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    EXPECT_FALSE(monitor.is_server_reachable(url_for(port), 1000));
}

TEST_F(TcpConnectivityMonitorTest, InvalidUrlIsUnreachable) {
    EXPECT_FALSE(monitor.is_server_reachable("ftp://127.0.0.1:21", 100));
    EXPECT_FALSE(monitor.is_server_reachable("http://:8080", 100));
}

TEST_F(TcpConnectivityMonitorTest, MonitoringChecksAndNotifiesChange) {
    tcp::acceptor acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    ASSERT_EQ(monitor.init(url_for(acceptor.local_endpoint().port()), 1000, 1000), 0);

    std::vector<bool> changes;
    monitor.add_listener([&](const bool connected) { changes.push_back(connected); });

    ASSERT_EQ(monitor.start_monitoring(), 0);
    EXPECT_EQ(monitor.start_monitoring(), -1);
    EXPECT_TRUE(monitor.is_connected());
    EXPECT_EQ(changes, (std::vector<bool>{true}));
    EXPECT_EQ(timers.active_count(), 1u);

    monitor.stop_monitoring();
    EXPECT_EQ(timers.active_count(), 0u);
}

// ============================================================================
// Name resolution
// ============================================================================

TEST(ResolveTest, NumericHostResolvesWithinDeadline) {
    std::vector<tcp::endpoint> endpoints;
    boost::system::error_code ec;

    ASSERT_EQ(util::resolve_tcp_endpoints(endpoints, "127.0.0.1", 8080, 1000, ec), 0) << ec.message();
    ASSERT_FALSE(endpoints.empty());
    EXPECT_EQ(endpoints.front().port(), 8080);
    EXPECT_TRUE(endpoints.front().address().is_loopback());
}

TEST(ResolveTest, ZeroDeadlineTimesOut) {
    std::vector<tcp::endpoint> endpoints;
    boost::system::error_code ec;

    // A zero deadline expires before any lookup can report back.
    const auto started = std::chrono::steady_clock::now();
    const int res = util::resolve_tcp_endpoints(endpoints, "possync-unresolvable.invalid", 80, 0, ec);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(res, -1);
    EXPECT_TRUE(ec);
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
    EXPECT_TRUE(endpoints.empty());
}
