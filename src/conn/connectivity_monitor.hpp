#ifndef _POSSYNC_CONN_CONNECTIVITY_MONITOR_
#define _POSSYNC_CONN_CONNECTIVITY_MONITOR_

#include "../pchheader.hpp"

namespace conn
{
    // Invoked with the new connectivity state whenever it changes.
    typedef std::function<void(const bool is_connected)> connectivity_listener;

    /**
     * Reports network reachability of the sync server and notifies listeners when it changes.
     */
    class connectivity_monitor
    {
    public:
        virtual bool is_connected() = 0;

        virtual bool is_server_reachable(std::string_view url, const uint32_t timeout_ms) = 0;

        virtual void add_listener(connectivity_listener listener) = 0;

        virtual int start_monitoring() = 0;

        virtual void stop_monitoring() = 0;

        virtual ~connectivity_monitor() {}
    };

} // namespace conn

#endif
