#ifndef _POSSYNC_STATUS_
#define _POSSYNC_STATUS_

#include "pchheader.hpp"

namespace status
{
    struct sync_progress_event
    {
        std::string stage;
        size_t total_items = 0;
        size_t processed_items = 0;
        uint32_t percentage = 0;
        bool completed = false;
    };

    struct connectivity_change_event
    {
        bool is_connected = false;
        uint64_t changed_at = 0;
    };

    struct sync_completed_event
    {
        bool success = false;
        size_t items_synced = 0;
        std::string error_message;
        uint64_t completed_at = 0;
    };

    // Represents any kind of change that has happened in the daemon.
    typedef std::variant<sync_progress_event, connectivity_change_event, sync_completed_event> change_event;

    extern moodycamel::ConcurrentQueue<change_event> event_queue;

    void sync_progressed(const sync_progress_event &ev);
    void connectivity_changed(const bool is_connected);
    void sync_completed(const bool success, const size_t items_synced, std::string_view error_message, const uint64_t completed_at);
    bool get_connected();
    uint64_t get_last_sync_time();

} // namespace status

#endif
