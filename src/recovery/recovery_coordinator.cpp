#include "recovery_coordinator.hpp"
#include "../crypto.hpp"
#include "../util/util.hpp"
#include "../util/version.hpp"

namespace recovery
{
    constexpr const char *SALE_WORK_TITLE = "Unsaved Sale Transaction";

    // Formats an amount in cents as a decimal string (eg. 1234 -> "12.34").
    const std::string format_amount(const int64_t cents)
    {
        std::ostringstream os;
        const uint64_t abs_cents = cents < 0 ? -cents : cents;
        os << (cents < 0 ? "-" : "") << abs_cents / 100 << "." << std::setw(2) << std::setfill('0') << abs_cents % 100;
        return os.str();
    }

    const std::string session_of(const recoverable_work_item &item)
    {
        if (const sale_transaction_work *work = std::get_if<sale_transaction_work>(&item.payload))
            return work->snapshot.session_id;
        return std::string();
    }

    recovery_coordinator::recovery_coordinator(db::local_store &store, txstate::transaction_state_store &txstore, const priority_thresholds &thresholds)
        : store(store), txstore(txstore), thresholds(thresholds)
    {
    }

    /**
     * Looks for sessions of the user/device that never ended and never shut down cleanly, and reclassifies them
     * as crashed. The session of this process is not considered.
     * @returns true if a crashed session was found. false otherwise or on error.
     */
    bool recovery_coordinator::detect_crash(const std::string &user_id, const std::string &device_id)
    {
        std::vector<db::app_session_record> sessions;
        if (store.get_open_app_sessions(user_id, device_id, sessions) == -1)
        {
            LOG_ERROR << "Error detecting crash for user " << user_id << " on device " << device_id;
            return false;
        }

        std::string own_session_id;
        {
            std::scoped_lock lock(session_mutex);
            own_session_id = current_session_id;
        }

        const uint64_t now = util::get_epoch_milliseconds();
        size_t crashed_count = 0;
        for (const db::app_session_record &session : sessions)
        {
            if (session.session_id == own_session_id)
                continue;

            if (store.end_app_session(session.session_id, now, false, std::string(CRASH_REASON)) == -1)
                LOG_ERROR << "Failed to mark session " << session.session_id << " as crashed.";

            crashed_count++;
        }

        if (crashed_count > 0)
            LOG_WARNING << "Crash detected for user " << user_id << " on device " << device_id << ": " << crashed_count << " unclean sessions.";

        return crashed_count > 0;
    }

    /**
     * Lists the unsaved transactions of the user/device as recoverable work, highest priority first and most
     * recently saved first within a priority.
     * @returns 0 on success. -1 on error.
     */
    int recovery_coordinator::list_recoverable_work(const std::string &user_id, const std::string &device_id, std::vector<recoverable_work_item> &items)
    {
        std::vector<txstate::transaction_snapshot> snapshots;
        if (txstore.list_unsaved(user_id, device_id, snapshots) == -1)
        {
            LOG_ERROR << "Error listing recoverable work for user " << user_id << " on device " << device_id;
            return -1;
        }

        const uint64_t now = util::get_epoch_milliseconds();
        for (txstate::transaction_snapshot &snapshot : snapshots)
        {
            recoverable_work_item item;
            item.id = snapshot.session_id + "@" + std::to_string(snapshot.last_saved_at);
            item.title = SALE_WORK_TITLE;
            item.description = "Sale with " + std::to_string(snapshot.line_items.size()) + " items, total: " + format_amount(snapshot.grand_total);
            item.priority = determine_priority(snapshot);
            item.user_id = snapshot.user_id;
            item.device_id = snapshot.device_id;
            item.last_modified = snapshot.last_saved_at;
            item.discovered_at = now;
            item.payload = sale_transaction_work{std::move(snapshot)};
            items.push_back(std::move(item));
        }

        std::stable_sort(items.begin(), items.end(), [](const recoverable_work_item &a, const recoverable_work_item &b) {
            if (a.priority != b.priority)
                return a.priority > b.priority;
            return a.last_modified > b.last_modified;
        });

        LOG_INFO << "Found " << items.size() << " recoverable work items for user " << user_id << " on device " << device_id;
        return 0;
    }

    /**
     * Restores a recoverable work item. Restoring an item that was already restored does nothing.
     */
    restoration_result recovery_coordinator::restore(recoverable_work_item &item)
    {
        restoration_result result;

        int recorded = item.restored ? 1 : is_restoration_recorded(item.id);
        if (recorded == 1)
        {
            item.restored = true;
            result.success = true;
            result.message = "Work item already restored";
            result.warnings.push_back("Work item " + item.id + " was already restored. Nothing was changed.");
            return result;
        }
        else if (recorded == -1)
        {
            result.message = "Failed to read restoration records";
            return result;
        }

        LOG_INFO << "Restoring work item " << item.id;

        if (const sale_transaction_work *work = std::get_if<sale_transaction_work>(&item.payload))
        {
            result = restore_sale_transaction(*work);
        }
        else
        {
            const unrecognized_work &unknown = std::get<unrecognized_work>(item.payload);
            result.success = false;
            result.message = "Unknown work type: " + unknown.kind;
        }

        if (!result.success)
        {
            LOG_WARNING << "Failed to restore work item " << item.id << ": " << result.message;
            return result;
        }

        item.restored = true;
        item.restored_at = util::get_epoch_milliseconds();

        if (mark_work_restored(item.id, session_of(item)) == -1)
            result.warnings.push_back("Restoration of work item " + item.id + " could not be recorded.");

        LOG_INFO << "Restored work item " << item.id;
        return result;
    }

    restoration_result recovery_coordinator::restore_sale_transaction(const sale_transaction_work &work)
    {
        restoration_result result;
        const txstate::transaction_snapshot &snapshot = work.snapshot;

        if (snapshot.session_id.empty())
        {
            result.message = "No sale session id found for restoration";
            return result;
        }

        if (txstore.save(snapshot.session_id, snapshot) == -1)
        {
            result.message = "Failed to save restored transaction state";
            return result;
        }

        result.success = true;
        result.message = "Sale transaction restored successfully";
        result.restored_session_id = snapshot.session_id;
        result.actions_performed.push_back("Restored transaction state");
        result.actions_performed.push_back("Restored " + std::to_string(snapshot.line_items.size()) + " sale items");
        result.actions_performed.push_back("Restored customer: " + snapshot.customer_ref.value_or("None"));
        return result;
    }

    /**
     * Detects a crash and automatically restores the high and critical priority work it left behind. Lower
     * priority work is returned for an explicit user decision.
     */
    crash_recovery_result recovery_coordinator::perform_automatic_recovery(const std::string &user_id, const std::string &device_id)
    {
        const uint64_t start_time = util::get_epoch_milliseconds();
        crash_recovery_result result;

        LOG_INFO << "Performing automatic crash recovery for user " << user_id << " on device " << device_id;

        result.crash_detected = detect_crash(user_id, device_id);
        if (!result.crash_detected)
        {
            result.actions.push_back("No crash detected, no recovery needed");
            result.duration_ms = util::get_epoch_milliseconds() - start_time;
            return result;
        }

        std::vector<recoverable_work_item> work;
        if (list_recoverable_work(user_id, device_id, work) == -1)
            result.errors.push_back("Error listing recoverable work");

        result.recoverable_count = work.size();
        if (work.empty())
        {
            result.actions.push_back("Crash detected but no recoverable work found");
            result.duration_ms = util::get_epoch_milliseconds() - start_time;
            return result;
        }

        for (recoverable_work_item &item : work)
        {
            if (item.priority < WORK_PRIORITY::HIGH)
                continue;

            const restoration_result restoration = restore(item);
            if (restoration.success)
            {
                result.succeeded++;
                result.actions.push_back("Auto-restored: " + item.title);
            }
            else
            {
                result.failed++;
                result.errors.push_back("Failed to auto-restore " + item.title + ": " + restoration.message);
            }
        }

        result.available_work = std::move(work);
        result.duration_ms = util::get_epoch_milliseconds() - start_time;

        LOG_INFO << "Automatic crash recovery completed: " << result.succeeded << " successful, " << result.failed << " failed.";
        return result;
    }

    /**
     * Records the user's decision not to restore a work item. The underlying transaction is cancelled so it is
     * never offered again.
     * @returns 0 on success. -1 on failure.
     */
    int recovery_coordinator::discard_work(recoverable_work_item &item)
    {
        const std::string session_id = session_of(item);
        if (!session_id.empty() && txstore.mark_cancelled(session_id) == -1)
        {
            LOG_ERROR << "Error discarding work item " << item.id;
            return -1;
        }

        db::recovery_log_record record;
        record.work_item_id = item.id;
        record.session_id = session_id;
        record.action = db::RECOVERY_ACTION::DISCARDED;
        record.recorded_at = util::get_epoch_milliseconds();
        if (store.insert_recovery_log(record) == -1)
            return -1;

        LOG_INFO << "Discarded recoverable work item " << item.id;
        return 0;
    }

    /**
     * Durably records that a work item was restored.
     * @returns 0 on success. -1 on failure.
     */
    int recovery_coordinator::mark_work_restored(const std::string &work_item_id, const std::string &session_id)
    {
        db::recovery_log_record record;
        record.work_item_id = work_item_id;
        record.session_id = session_id;
        record.action = db::RECOVERY_ACTION::RESTORED;
        record.recorded_at = util::get_epoch_milliseconds();
        if (store.insert_recovery_log(record) == -1)
        {
            LOG_ERROR << "Error marking work item " << work_item_id << " as restored.";
            return -1;
        }

        LOG_DEBUG << "Marked work item " << work_item_id << " as restored.";
        return 0;
    }

    /**
     * @returns 1 if a restoration of the work item was recorded. 0 if not. -1 on error.
     */
    int recovery_coordinator::is_restoration_recorded(const std::string &work_item_id)
    {
        std::vector<db::recovery_log_record> records;
        if (store.get_recovery_log(work_item_id, records) == -1)
            return -1;

        for (const db::recovery_log_record &record : records)
        {
            if (record.action == db::RECOVERY_ACTION::RESTORED)
                return 1;
        }
        return 0;
    }

    /**
     * Records the start of this process. The session stays open until a clean shutdown is recorded, so a process
     * that dies leaves it open for the next startup to detect.
     * @param session_id Populated with the id of the new session.
     * @returns 0 on success. -1 on failure.
     */
    int recovery_coordinator::record_startup(const std::string &user_id, const std::string &device_id, std::string &session_id)
    {
        db::app_session_record session;
        session.session_id = crypto::generate_uuid();
        session.user_id = user_id;
        session.device_id = device_id;
        session.started_at = util::get_epoch_milliseconds();
        session.app_version = version::POSSYNC_VERSION;
        session.platform = version::PLATFORM;

        if (store.insert_app_session(session) == -1)
        {
            LOG_ERROR << "Error recording application startup for user " << user_id << " on device " << device_id;
            return -1;
        }

        {
            std::scoped_lock lock(session_mutex);
            current_session_id = session.session_id;
        }

        session_id = session.session_id;
        LOG_DEBUG << "Recorded application startup. Session " << session_id;
        return 0;
    }

    /**
     * @returns true if the session was marked as cleanly shut down. false otherwise.
     */
    bool recovery_coordinator::record_clean_shutdown(const std::string &session_id)
    {
        const int res = store.end_app_session(session_id, util::get_epoch_milliseconds(), true, std::nullopt);
        if (res == -1)
        {
            LOG_ERROR << "Error recording clean shutdown for session " << session_id;
            return false;
        }
        else if (res == 0)
        {
            LOG_WARNING << "Application session " << session_id << " not found for clean shutdown.";
            return false;
        }

        LOG_DEBUG << "Recorded clean shutdown for session " << session_id;
        return true;
    }

    /**
     * Removes ended session records and transaction snapshot payloads older than the retention period.
     * @param cleaned_count Total number of records cleaned up.
     * @returns 0 on success. -1 on failure.
     */
    int recovery_coordinator::cleanup_old_data(const uint32_t older_than_days, size_t &cleaned_count)
    {
        const uint64_t now = util::get_epoch_milliseconds();
        const uint64_t retention = older_than_days * util::MS_PER_DAY;
        const uint64_t cutoff = now > retention ? now - retention : 0;

        size_t sessions_count = 0, snapshots_count = 0;
        if (store.delete_app_sessions_before(cutoff, sessions_count) == -1 ||
            txstore.purge_older_than(older_than_days, snapshots_count) == -1)
        {
            LOG_ERROR << "Error cleaning up old recovery data.";
            return -1;
        }

        cleaned_count = sessions_count + snapshots_count;
        LOG_INFO << "Cleaned up " << cleaned_count << " old crash recovery data items.";
        return 0;
    }

    /**
     * Gets crash and recovery figures for sessions started and decisions recorded within the given period.
     * @returns 0 on success. -1 on failure.
     */
    int recovery_coordinator::get_statistics(const uint64_t from, const uint64_t to, recovery_statistics &stats)
    {
        std::vector<db::app_session_record> crashed;
        std::vector<db::recovery_log_record> records;
        if (store.get_crashed_app_sessions(from, to, crashed) == -1 ||
            store.get_recovery_log_between(from, to, records) == -1)
        {
            LOG_ERROR << "Error getting crash recovery statistics.";
            return -1;
        }

        stats.period_start = from;
        stats.period_end = to;
        stats.total_crashes = crashed.size();
        stats.last_crash_at.reset();
        for (const db::app_session_record &session : crashed)
        {
            if (!stats.last_crash_at || session.started_at > *stats.last_crash_at)
                stats.last_crash_at = session.started_at;
        }

        stats.restored_count = 0;
        stats.discarded_count = 0;
        for (const db::recovery_log_record &record : records)
        {
            if (record.action == db::RECOVERY_ACTION::RESTORED)
                stats.restored_count++;
            else
                stats.discarded_count++;
        }

        return 0;
    }

    /**
     * Empty carts are low priority. A sale whose payment was tendered but never completed is critical.
     * Large sales are high priority. Everything else is normal.
     */
    WORK_PRIORITY recovery_coordinator::determine_priority(const txstate::transaction_snapshot &snapshot) const
    {
        if (snapshot.line_items.empty())
            return WORK_PRIORITY::LOW;

        if (snapshot.amount_tendered && *snapshot.amount_tendered > 0 && !snapshot.completed)
            return WORK_PRIORITY::CRITICAL;

        if (snapshot.grand_total > thresholds.high_priority_total ||
            snapshot.line_items.size() > thresholds.high_priority_item_count)
            return WORK_PRIORITY::HIGH;

        return WORK_PRIORITY::NORMAL;
    }

} // namespace recovery
