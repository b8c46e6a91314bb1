#include "status.hpp"
#include "util/util.hpp"

namespace status
{
    moodycamel::ConcurrentQueue<change_event> event_queue;

    std::atomic<bool> connected = false;
    std::atomic<uint64_t> last_sync_time = 0; // Completion time of the last successful full sync.

    void sync_progressed(const sync_progress_event &ev)
    {
        event_queue.try_enqueue(ev);
    }

    void connectivity_changed(const bool is_connected)
    {
        if (is_connected != connected.load())
        {
            connected = is_connected;
            event_queue.try_enqueue(connectivity_change_event{is_connected, util::get_epoch_milliseconds()});
        }
    }

    void sync_completed(const bool success, const size_t items_synced, std::string_view error_message, const uint64_t completed_at)
    {
        if (success)
            last_sync_time = completed_at;
        event_queue.try_enqueue(sync_completed_event{success, items_synced, std::string(error_message), completed_at});
    }

    bool get_connected()
    {
        return connected.load();
    }

    uint64_t get_last_sync_time()
    {
        return last_sync_time.load();
    }

} // namespace status
