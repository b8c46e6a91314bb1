#ifndef _POSSYNC_CONN_TCP_CONNECTIVITY_MONITOR_
#define _POSSYNC_CONN_TCP_CONNECTIVITY_MONITOR_

#include "../pchheader.hpp"
#include "../util/timer.hpp"
#include "connectivity_monitor.hpp"

namespace conn
{
    /**
     * Considers the device connected when a tcp connection to the sync server host:port can be established.
     */
    class tcp_connectivity_monitor : public connectivity_monitor
    {
    private:
        util::timer_service &timers;
        std::string server_url;
        uint64_t check_interval_ms = 0;
        uint32_t timeout_ms = 0;

        std::atomic<bool> connected = false;
        uint64_t timer_id = 0;
        std::mutex monitor_mutex; // Guards timer_id and listeners.
        std::vector<connectivity_listener> listeners;

        void check_connectivity();

    public:
        tcp_connectivity_monitor(util::timer_service &timers);

        int init(std::string_view server_url, const uint64_t check_interval_ms, const uint32_t timeout_ms);

        bool is_connected();

        bool is_server_reachable(std::string_view url, const uint32_t timeout_ms);

        void add_listener(connectivity_listener listener);

        int start_monitoring();

        void stop_monitoring();

        ~tcp_connectivity_monitor();
    };

} // namespace conn

#endif
