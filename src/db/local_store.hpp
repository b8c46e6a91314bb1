#ifndef _POSSYNC_DB_LOCAL_STORE_
#define _POSSYNC_DB_LOCAL_STORE_

#include "../pchheader.hpp"
#include "db_common.hpp"

namespace db
{
    /**
     * Persistent local data store used by the sync and recovery subsystems.
     * Functions return 0 on success and -1 on error. Lookups return 1 when found, 0 when not found and -1 on error.
     */
    class local_store
    {
    public:
        /**
         * Runs the given work as one atomic unit. The work is committed if it returns 0 and rolled back otherwise.
         * Calls to the store made by the work from the same thread join the unit.
         * @returns 0 when committed. -1 when rolled back or on error.
         */
        virtual int run_in_transaction(const std::function<int()> &work) = 0;

        // Sales.
        virtual int insert_sale(const sale_record &sale) = 0;
        virtual int get_sale(const std::string &sale_id, sale_record &sale) = 0;
        virtual int get_unsynced_sales(std::vector<sale_record> &sales) = 0;
        virtual int update_sale_sync_status(const std::vector<std::string> &sale_ids, const SYNC_STATUS status, const uint64_t server_synced_at) = 0;

        // Products.
        virtual int get_product(const std::string &product_id, product_record &product) = 0;
        virtual int insert_product(const product_record &product) = 0;
        virtual int update_product(const product_record &product) = 0;

        // Stock.
        virtual int get_stock(const std::string &stock_id, stock_record &stock) = 0;
        virtual int get_stock_by_product(const std::string &product_id, stock_record &stock) = 0;
        virtual int insert_stock(const stock_record &stock) = 0;
        virtual int update_stock(const stock_record &stock) = 0;

        // Sync cursors.
        virtual int get_sync_cursor(std::string_view entity_kind, uint64_t &last_synced_at) = 0;
        virtual int advance_sync_cursor(std::string_view entity_kind, const uint64_t last_synced_at) = 0;

        // Application sessions.
        virtual int insert_app_session(const app_session_record &session) = 0;
        virtual int get_app_session(const std::string &session_id, app_session_record &session) = 0;
        virtual int get_open_app_sessions(const std::string &user_id, const std::string &device_id, std::vector<app_session_record> &sessions) = 0;
        virtual int end_app_session(const std::string &session_id, const uint64_t ended_at, const bool clean_shutdown, const std::optional<std::string> &crash_reason) = 0;
        virtual int get_crashed_app_sessions(const uint64_t from, const uint64_t to, std::vector<app_session_record> &sessions) = 0;
        virtual int delete_app_sessions_before(const uint64_t cutoff, size_t &deleted_count) = 0;

        // Transaction snapshots.
        virtual int put_snapshot(const snapshot_row &row) = 0;
        virtual int get_snapshot(const std::string &session_id, snapshot_row &row) = 0;
        virtual int get_active_snapshots(const std::optional<std::string> &user_id, const std::optional<std::string> &device_id, std::vector<snapshot_row> &rows) = 0;
        virtual int set_snapshot_state(const std::string &session_id, const SNAPSHOT_STATE state, const uint64_t modified_at) = 0;
        virtual int purge_snapshots_before(const uint64_t cutoff, size_t &purged_count) = 0;

        // Recovery log.
        virtual int insert_recovery_log(const recovery_log_record &record) = 0;
        virtual int get_recovery_log(const std::string &work_item_id, std::vector<recovery_log_record> &records) = 0;
        virtual int get_recovery_log_between(const uint64_t from, const uint64_t to, std::vector<recovery_log_record> &records) = 0;

        virtual ~local_store() {}
    };

} // namespace db

#endif
