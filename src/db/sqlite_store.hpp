#ifndef _POSSYNC_DB_SQLITE_STORE_
#define _POSSYNC_DB_SQLITE_STORE_

#include "../pchheader.hpp"
#include "local_store.hpp"

namespace db
{
    /**
     * Local store backed by a single sqlite connection. The connection is guarded by a recursive mutex so
     * a transaction started by one thread holds off store access from all other threads until it ends.
     */
    class sqlite_store : public local_store
    {
    private:
        sqlite3 *db = NULL;
        std::recursive_mutex db_mutex;
        uint32_t transaction_depth = 0;

        int load_sale_items(sale_record &sale);

    public:
        int init(std::string_view db_path);

        void deinit();

        int run_in_transaction(const std::function<int()> &work);

        int insert_sale(const sale_record &sale);
        int get_sale(const std::string &sale_id, sale_record &sale);
        int get_unsynced_sales(std::vector<sale_record> &sales);
        int update_sale_sync_status(const std::vector<std::string> &sale_ids, const SYNC_STATUS status, const uint64_t server_synced_at);

        int get_product(const std::string &product_id, product_record &product);
        int insert_product(const product_record &product);
        int update_product(const product_record &product);

        int get_stock(const std::string &stock_id, stock_record &stock);
        int get_stock_by_product(const std::string &product_id, stock_record &stock);
        int insert_stock(const stock_record &stock);
        int update_stock(const stock_record &stock);

        int get_sync_cursor(std::string_view entity_kind, uint64_t &last_synced_at);
        int advance_sync_cursor(std::string_view entity_kind, const uint64_t last_synced_at);

        int insert_app_session(const app_session_record &session);
        int get_app_session(const std::string &session_id, app_session_record &session);
        int get_open_app_sessions(const std::string &user_id, const std::string &device_id, std::vector<app_session_record> &sessions);
        int end_app_session(const std::string &session_id, const uint64_t ended_at, const bool clean_shutdown, const std::optional<std::string> &crash_reason);
        int get_crashed_app_sessions(const uint64_t from, const uint64_t to, std::vector<app_session_record> &sessions);
        int delete_app_sessions_before(const uint64_t cutoff, size_t &deleted_count);

        int put_snapshot(const snapshot_row &row);
        int get_snapshot(const std::string &session_id, snapshot_row &row);
        int get_active_snapshots(const std::optional<std::string> &user_id, const std::optional<std::string> &device_id, std::vector<snapshot_row> &rows);
        int set_snapshot_state(const std::string &session_id, const SNAPSHOT_STATE state, const uint64_t modified_at);
        int purge_snapshots_before(const uint64_t cutoff, size_t &purged_count);

        int insert_recovery_log(const recovery_log_record &record);
        int get_recovery_log(const std::string &work_item_id, std::vector<recovery_log_record> &records);
        int get_recovery_log_between(const uint64_t from, const uint64_t to, std::vector<recovery_log_record> &records);

        ~sqlite_store();
    };

} // namespace db

#endif
