#include "tcp_connectivity_monitor.hpp"
#include "../util/util.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace conn
{
    tcp_connectivity_monitor::tcp_connectivity_monitor(util::timer_service &timers)
        : timers(timers)
    {
    }

    /**
     * @param server_url Sync server base url whose host:port is probed.
     * @param check_interval_ms Probe interval while monitoring.
     * @param timeout_ms Connect timeout of a single probe.
     * @returns 0 on success. -1 if the url is invalid.
     */
    int tcp_connectivity_monitor::init(std::string_view server_url, const uint64_t check_interval_ms, const uint32_t timeout_ms)
    {
        util::http_url url;
        if (util::parse_http_url(server_url, url) == -1)
        {
            LOG_ERROR << "Invalid connectivity probe url " << server_url;
            return -1;
        }

        this->server_url = server_url;
        this->check_interval_ms = check_interval_ms;
        this->timeout_ms = timeout_ms;
        return 0;
    }

    bool tcp_connectivity_monitor::is_connected()
    {
        return connected.load();
    }

    /**
     * Attempts a tcp connection to the host:port of the given url.
     * @returns true if the connection succeeded within the timeout. false otherwise.
     */
    bool tcp_connectivity_monitor::is_server_reachable(std::string_view url, const uint32_t timeout_ms)
    {
        util::http_url target;
        if (util::parse_http_url(url, target) == -1)
        {
            LOG_DEBUG << "Reachability probe skipped. Invalid url " << url;
            return false;
        }

        beast::error_code ec;
        std::vector<tcp::endpoint> endpoints;
        if (util::resolve_tcp_endpoints(endpoints, target.host, target.port, timeout_ms, ec) == -1)
        {
            LOG_DEBUG << "Server " << target.host << " could not be resolved. " << ec.message();
            return false;
        }

        net::io_context ioc;
        beast::tcp_stream stream(ioc);

        stream.expires_after(std::chrono::milliseconds(timeout_ms));
        stream.async_connect(
            endpoints,
            [&](beast::error_code cec, tcp::endpoint) {
                ec = cec;
            });

        ioc.run();

        if (ec)
        {
            LOG_DEBUG << "Server " << target.host << ":" << target.port << " unreachable. " << ec.message();
            return false;
        }

        beast::error_code shutdown_ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        return true;
    }

    void tcp_connectivity_monitor::add_listener(connectivity_listener listener)
    {
        std::scoped_lock lock(monitor_mutex);
        listeners.push_back(std::move(listener));
    }

    /**
     * Probes once immediately and then keeps probing on the configured interval.
     * @returns 0 on success. -1 if monitoring has already started.
     */
    int tcp_connectivity_monitor::start_monitoring()
    {
        {
            std::scoped_lock lock(monitor_mutex);
            if (timer_id != 0)
            {
                LOG_WARNING << "Connectivity monitoring already started.";
                return -1;
            }
            timer_id = timers.start(check_interval_ms, [this]() { check_connectivity(); });
        }

        check_connectivity();
        LOG_INFO << "Connectivity monitoring started. Server " << (connected ? "reachable." : "unreachable.");
        return 0;
    }

    void tcp_connectivity_monitor::stop_monitoring()
    {
        uint64_t id = 0;
        {
            std::scoped_lock lock(monitor_mutex);
            id = timer_id;
            timer_id = 0;
        }

        if (id != 0)
        {
            timers.stop(id);
            LOG_INFO << "Connectivity monitoring stopped.";
        }
    }

    tcp_connectivity_monitor::~tcp_connectivity_monitor()
    {
        stop_monitoring();
    }

    void tcp_connectivity_monitor::check_connectivity()
    {
        const bool reachable = is_server_reachable(server_url, timeout_ms);
        if (connected.exchange(reachable) == reachable)
            return;

        LOG_INFO << "Connectivity changed. Server " << (reachable ? "reachable." : "unreachable.");

        std::vector<connectivity_listener> to_notify;
        {
            std::scoped_lock lock(monitor_mutex);
            to_notify = listeners;
        }

        for (const connectivity_listener &listener : to_notify)
            listener(reachable);
    }

} // namespace conn
