#ifndef _POSSYNC_RECOVERY_RECOVERY_COORDINATOR_
#define _POSSYNC_RECOVERY_RECOVERY_COORDINATOR_

#include "../pchheader.hpp"
#include "../db/local_store.hpp"
#include "../txstate/transaction_state_store.hpp"
#include "recoverable_work.hpp"

namespace recovery
{
    constexpr const char *CRASH_REASON = "Application crash detected on next startup";

    /**
     * Detects sessions that ended without a clean shutdown and restores the work they left behind.
     */
    class recovery_coordinator
    {
    private:
        db::local_store &store;
        txstate::transaction_state_store &txstore;
        const priority_thresholds thresholds;

        std::mutex session_mutex;
        std::string current_session_id; // Session of this process. Never treated as crashed.

        WORK_PRIORITY determine_priority(const txstate::transaction_snapshot &snapshot) const;

        restoration_result restore_sale_transaction(const sale_transaction_work &work);

        int is_restoration_recorded(const std::string &work_item_id);

    public:
        recovery_coordinator(db::local_store &store, txstate::transaction_state_store &txstore, const priority_thresholds &thresholds);

        bool detect_crash(const std::string &user_id, const std::string &device_id);

        int list_recoverable_work(const std::string &user_id, const std::string &device_id, std::vector<recoverable_work_item> &items);

        restoration_result restore(recoverable_work_item &item);

        crash_recovery_result perform_automatic_recovery(const std::string &user_id, const std::string &device_id);

        int discard_work(recoverable_work_item &item);

        int mark_work_restored(const std::string &work_item_id, const std::string &session_id);

        int record_startup(const std::string &user_id, const std::string &device_id, std::string &session_id);

        bool record_clean_shutdown(const std::string &session_id);

        int cleanup_old_data(const uint32_t older_than_days, size_t &cleaned_count);

        int get_statistics(const uint64_t from, const uint64_t to, recovery_statistics &stats);
    };

} // namespace recovery

#endif
