#ifndef _POSSYNC_TXSTATE_TRANSACTION_STATE_STORE_
#define _POSSYNC_TXSTATE_TRANSACTION_STATE_STORE_

#include "../pchheader.hpp"
#include "../db/local_store.hpp"
#include "../util/timer.hpp"
#include "transaction_snapshot.hpp"

namespace txstate
{
    /**
     * Durable checkpoints of in-flight transactions, one live snapshot per session.
     * Live snapshots are cached in memory in front of the local store. The local store is authoritative and
     * the cache starts cold after a restart.
     */
    class transaction_state_store
    {
    private:
        db::local_store &store;
        util::timer_service &timers;

        std::mutex cache_mutex; // Also serializes writes so the cache and the store see the same order.
        std::unordered_map<std::string, transaction_snapshot> cache;

        std::mutex auto_save_mutex;
        std::unordered_map<std::string, uint64_t> auto_save_timers; // Session id -> timer id.

        int persist(const std::string &session_id, const transaction_snapshot &snapshot, const bool auto_saved);

        int write_snapshot(const std::string &session_id, const transaction_snapshot &snapshot, const bool auto_saved);

        int close_session(const std::string &session_id, const db::SNAPSHOT_STATE state);

        void on_auto_save_timer(const std::string &session_id);

    public:
        transaction_state_store(db::local_store &store, util::timer_service &timers);

        int auto_save(const std::string &session_id, const transaction_snapshot &snapshot);

        int save(const std::string &session_id, const transaction_snapshot &snapshot);

        int restore(const std::string &session_id, transaction_snapshot &snapshot);

        int list_unsaved(const std::optional<std::string> &user_id, const std::optional<std::string> &device_id,
                         std::vector<transaction_snapshot> &snapshots);

        int mark_completed(const std::string &session_id);

        int mark_cancelled(const std::string &session_id);

        int start_auto_save(const std::string &session_id, const uint32_t interval_seconds);

        void stop_auto_save(const std::string &session_id);

        bool is_auto_saving(const std::string &session_id);

        int purge_older_than(const uint32_t days, size_t &purged_count);

        void stop_all();

        ~transaction_state_store();
    };

} // namespace txstate

#endif
