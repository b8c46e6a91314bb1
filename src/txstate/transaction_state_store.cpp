#include "transaction_state_store.hpp"
#include "../util/util.hpp"

namespace txstate
{
    transaction_state_store::transaction_state_store(db::local_store &store, util::timer_service &timers)
        : store(store), timers(timers)
    {
    }

    /**
     * Persists a timer driven checkpoint of the session's transaction.
     * @returns 0 on success. -1 on failure.
     */
    int transaction_state_store::auto_save(const std::string &session_id, const transaction_snapshot &snapshot)
    {
        return persist(session_id, snapshot, true);
    }

    /**
     * Persists a user requested checkpoint of the session's transaction.
     * @returns 0 on success. -1 on failure.
     */
    int transaction_state_store::save(const std::string &session_id, const transaction_snapshot &snapshot)
    {
        return persist(session_id, snapshot, false);
    }

    int transaction_state_store::persist(const std::string &session_id, const transaction_snapshot &snapshot, const bool auto_saved)
    {
        std::scoped_lock lock(cache_mutex);
        return write_snapshot(session_id, snapshot, auto_saved);
    }

    /**
     * Writes the snapshot to the local store and refreshes the cache. Caller must hold the cache lock.
     * The snapshot supersedes any previous snapshot of the session.
     */
    int transaction_state_store::write_snapshot(const std::string &session_id, const transaction_snapshot &snapshot, const bool auto_saved)
    {
        if (session_id.empty())
        {
            LOG_ERROR << "Cannot save transaction snapshot without a session id.";
            return -1;
        }

        if (!snapshot.session_id.empty() && snapshot.session_id != session_id)
        {
            LOG_ERROR << "Transaction snapshot of session " << snapshot.session_id << " cannot be saved under session " << session_id;
            return -1;
        }

        const uint64_t now = util::get_epoch_milliseconds();
        transaction_snapshot s = snapshot;
        s.session_id = session_id;
        s.auto_saved = auto_saved;
        s.last_saved_at = now;
        if (s.created_at == 0)
            s.created_at = now;

        db::snapshot_row row;
        row.session_id = session_id;
        row.user_id = s.user_id;
        row.device_id = s.device_id;
        row.state = s.completed ? db::SNAPSHOT_STATE::COMPLETED : db::SNAPSHOT_STATE::ACTIVE;
        row.created_at = s.created_at;
        row.last_modified = now;
        to_json(row.data, s);

        if (store.put_snapshot(row) == -1)
        {
            LOG_ERROR << "Failed to save transaction snapshot of session " << session_id;
            return -1;
        }

        if (s.completed)
            cache.erase(session_id);
        else
            cache[session_id] = std::move(s);

        LOG_DEBUG << (auto_saved ? "Auto-saved" : "Saved") << " transaction snapshot of session " << session_id;
        return 0;
    }

    /**
     * Gets the last saved snapshot of the session.
     * @returns 1 if found. 0 if the session has no snapshot (or its payload was purged). -1 on error.
     */
    int transaction_state_store::restore(const std::string &session_id, transaction_snapshot &snapshot)
    {
        std::scoped_lock lock(cache_mutex);

        const auto itr = cache.find(session_id);
        if (itr != cache.end())
        {
            snapshot = itr->second;
            return 1;
        }

        db::snapshot_row row;
        const int res = store.get_snapshot(session_id, row);
        if (res < 1)
            return res;

        if (row.data.empty())
            return 0;

        if (from_json(snapshot, row.data) == -1)
        {
            LOG_WARNING << "Corrupt transaction snapshot for session " << session_id;
            return -1;
        }

        if (row.state == db::SNAPSHOT_STATE::ACTIVE && !snapshot.completed)
            cache.emplace(session_id, snapshot);

        return 1;
    }

    /**
     * Gets all snapshots that were never completed or cancelled, most recently saved first.
     * Snapshots that cannot be deserialized are skipped.
     */
    int transaction_state_store::list_unsaved(const std::optional<std::string> &user_id, const std::optional<std::string> &device_id,
                                              std::vector<transaction_snapshot> &snapshots)
    {
        std::vector<db::snapshot_row> rows;
        if (store.get_active_snapshots(user_id, device_id, rows) == -1)
            return -1;

        for (const db::snapshot_row &row : rows)
        {
            transaction_snapshot snapshot;
            if (from_json(snapshot, row.data) == -1)
            {
                LOG_WARNING << "Skipping corrupt transaction snapshot of session " << row.session_id;
                continue;
            }

            if (!snapshot.completed)
                snapshots.push_back(std::move(snapshot));
        }

        return 0;
    }

    /**
     * Flags the session's transaction as completed and stops its auto-save. Completed snapshots are never
     * offered for recovery.
     * @returns 0 on success. -1 if there is no snapshot for the session or on error.
     */
    int transaction_state_store::mark_completed(const std::string &session_id)
    {
        if (close_session(session_id, db::SNAPSHOT_STATE::COMPLETED) == -1)
            return -1;

        LOG_INFO << "Marked transaction of session " << session_id << " as completed.";
        return 0;
    }

    /**
     * Flags the session's transaction as cancelled and stops its auto-save.
     * @returns 0 on success. -1 if there is no snapshot for the session or on error.
     */
    int transaction_state_store::mark_cancelled(const std::string &session_id)
    {
        if (close_session(session_id, db::SNAPSHOT_STATE::CANCELLED) == -1)
            return -1;

        LOG_INFO << "Marked transaction of session " << session_id << " as cancelled.";
        return 0;
    }

    int transaction_state_store::close_session(const std::string &session_id, const db::SNAPSHOT_STATE state)
    {
        stop_auto_save(session_id);

        std::scoped_lock lock(cache_mutex);
        cache.erase(session_id);

        db::snapshot_row row;
        const int res = store.get_snapshot(session_id, row);
        if (res == -1)
            return -1;

        if (res == 0)
        {
            LOG_WARNING << "No transaction snapshot found for session " << session_id;
            return -1;
        }

        const uint64_t now = util::get_epoch_milliseconds();

        transaction_snapshot snapshot;
        if (!row.data.empty() && from_json(snapshot, row.data) == 0)
        {
            if (state == db::SNAPSHOT_STATE::COMPLETED)
                snapshot.completed = true;
            snapshot.last_saved_at = now;
            to_json(row.data, snapshot);
        }

        row.state = state;
        row.last_modified = now;
        if (store.put_snapshot(row) == -1)
        {
            LOG_ERROR << "Failed to close transaction snapshot of session " << session_id;
            return -1;
        }

        return 0;
    }

    /**
     * Starts auto-saving the cached snapshot of the session on the given interval. A running auto-save of the
     * session is replaced.
     * @returns 0 on success. -1 if the interval is invalid.
     */
    int transaction_state_store::start_auto_save(const std::string &session_id, const uint32_t interval_seconds)
    {
        if (interval_seconds == 0)
        {
            LOG_ERROR << "Invalid auto-save interval for session " << session_id;
            return -1;
        }

        const uint64_t timer_id = timers.start(interval_seconds * 1000ULL, [this, session_id]() { on_auto_save_timer(session_id); });

        uint64_t previous_timer_id = 0;
        {
            std::scoped_lock lock(auto_save_mutex);
            const auto itr = auto_save_timers.find(session_id);
            if (itr != auto_save_timers.end())
                previous_timer_id = itr->second;
            auto_save_timers[session_id] = timer_id;
        }

        if (previous_timer_id != 0)
            timers.stop(previous_timer_id);

        LOG_INFO << "Started auto-save for session " << session_id << " with " << interval_seconds << "s interval.";
        return 0;
    }

    void transaction_state_store::stop_auto_save(const std::string &session_id)
    {
        uint64_t timer_id = 0;
        {
            std::scoped_lock lock(auto_save_mutex);
            const auto itr = auto_save_timers.find(session_id);
            if (itr == auto_save_timers.end())
                return;

            timer_id = itr->second;
            auto_save_timers.erase(itr);
        }

        timers.stop(timer_id);
        LOG_DEBUG << "Stopped auto-save for session " << session_id;
    }

    bool transaction_state_store::is_auto_saving(const std::string &session_id)
    {
        std::scoped_lock lock(auto_save_mutex);
        return auto_save_timers.count(session_id) == 1;
    }

    /**
     * Drops the payload of completed and cancelled snapshots last modified more than the given days ago.
     * Active snapshots are never purged.
     */
    int transaction_state_store::purge_older_than(const uint32_t days, size_t &purged_count)
    {
        const uint64_t now = util::get_epoch_milliseconds();
        const uint64_t retention = days * util::MS_PER_DAY;
        const uint64_t cutoff = now > retention ? now - retention : 0;

        if (store.purge_snapshots_before(cutoff, purged_count) == -1)
            return -1;

        LOG_INFO << "Cleared transaction state data of " << purged_count << " old sessions.";
        return 0;
    }

    /**
     * Stops all auto-save timers.
     */
    void transaction_state_store::stop_all()
    {
        std::unordered_map<std::string, uint64_t> to_stop;
        {
            std::scoped_lock lock(auto_save_mutex);
            to_stop.swap(auto_save_timers);
        }

        for (const auto &[session_id, timer_id] : to_stop)
            timers.stop(timer_id);
    }

    transaction_state_store::~transaction_state_store()
    {
        stop_all();
    }

    void transaction_state_store::on_auto_save_timer(const std::string &session_id)
    {
        std::scoped_lock lock(cache_mutex);

        const auto itr = cache.find(session_id);
        if (itr == cache.end())
        {
            LOG_DEBUG << "Nothing to auto-save for session " << session_id;
            return;
        }

        // Copy since writing replaces the cache entry.
        const transaction_snapshot snapshot = itr->second;
        if (write_snapshot(session_id, snapshot, true) == -1)
            LOG_WARNING << "Auto-save failed for session " << session_id;
    }

} // namespace txstate
