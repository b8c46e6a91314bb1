#include "sqlite.hpp"

namespace db::sqlite
{
    constexpr const char *COLUMN_DATA_TYPES[]{"INT", "TEXT", "BLOB", "REAL"};
    constexpr const char *CREATE_TABLE = "CREATE TABLE IF NOT EXISTS ";
    constexpr const char *CREATE_INDEX = "CREATE INDEX IF NOT EXISTS ";
    constexpr const char *CREATE_UNIQUE_INDEX = "CREATE UNIQUE INDEX IF NOT EXISTS ";
    constexpr const char *JOURNAL_MODE_WAL = "PRAGMA journal_mode=WAL";
    constexpr const char *BEGIN_TRANSACTION = "BEGIN TRANSACTION";
    constexpr const char *COMMIT_TRANSACTION = "COMMIT";
    constexpr const char *ROLLBACK_TRANSACTION = "ROLLBACK";
    constexpr const char *PRIMARY_KEY = "PRIMARY KEY";
    constexpr const char *NOT_NULL = "NOT NULL";
    constexpr const char *SELECT_TABLE = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";

    constexpr const char *SALES_TABLE = "sales";
    constexpr const char *SALE_ITEMS_TABLE = "sale_items";
    constexpr const char *PRODUCTS_TABLE = "products";
    constexpr const char *STOCK_TABLE = "stock";
    constexpr const char *SYNC_CURSORS_TABLE = "sync_cursors";
    constexpr const char *APP_SESSIONS_TABLE = "app_sessions";
    constexpr const char *SNAPSHOTS_TABLE = "transaction_snapshots";
    constexpr const char *RECOVERY_LOG_TABLE = "recovery_log";

    /**
     * Opens a connection to a given databse and give the db pointer.
     * @param db_name Database name to be connected (":memory:" for a private in-memory db).
     * @param db Pointer to the db pointer which is to be connected and pointed.
     * @returns returns 0 on success, or -1 on error.
    */
    int open_db(std::string_view db_name, sqlite3 **db)
    {
        int ret;
        if ((ret = sqlite3_open(db_name.data(), db)) != SQLITE_OK)
        {
            LOG_ERROR << "Can't open database: " << ret << ", " << sqlite3_errmsg(*db);
            sqlite3_close(*db);
            *db = NULL;
            return -1;
        }

        // Write-ahead journaling so a crash mid-write never corrupts committed sync state.
        if (exec_sql(*db, JOURNAL_MODE_WAL) == -1)
        {
            close_db(db);
            return -1;
        }

        return 0;
    }

    /**
     * Executes given sql query.
     * @param db Pointer to the db.
     * @param sql Sql query to be executed.
     * @param callback Callback funcion which is called for each result row.
     * @param callback_first_arg First data argumat to be parced to the callback (void pointer).
     * @returns returns 0 on success, or -1 on error.
    */
    int exec_sql(sqlite3 *db, std::string_view sql, int (*callback)(void *, int, char **, char **), void *callback_first_arg)
    {
        char *err_msg;
        if (sqlite3_exec(db, sql.data(), callback, (callback != NULL ? (void *)callback_first_arg : NULL), &err_msg) != SQLITE_OK)
        {
            LOG_ERROR << "SQL error occured: " << err_msg;
            sqlite3_free(err_msg);
            return -1;
        }
        return 0;
    }

    int begin_transaction(sqlite3 *db)
    {
        return exec_sql(db, BEGIN_TRANSACTION);
    }

    int commit_transaction(sqlite3 *db)
    {
        return exec_sql(db, COMMIT_TRANSACTION);
    }

    int rollback_transaction(sqlite3 *db)
    {
        return exec_sql(db, ROLLBACK_TRANSACTION);
    }

    /**
     * Create a table with given table info.
     * @param db Pointer to the db.
     * @param table_name Table name to be created.
     * @param column_info Column info of the table.
     * @returns returns 0 on success, or -1 on error.
    */
    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info)
    {
        std::string sql;
        sql.append(CREATE_TABLE).append(table_name).append(" (");

        for (auto itr = column_info.begin(); itr != column_info.end(); ++itr)
        {
            sql.append(itr->name);
            sql.append(" ");
            sql.append(COLUMN_DATA_TYPES[itr->column_type]);

            if (itr->is_key)
            {
                sql.append(" ");
                sql.append(PRIMARY_KEY);
            }

            if (!itr->is_null)
            {
                sql.append(" ");
                sql.append(NOT_NULL);
            }

            if (itr != column_info.end() - 1)
                sql.append(",");
        }
        sql.append(")");

        const int ret = exec_sql(db, sql);
        if (ret == -1)
            LOG_ERROR << "Error when creating sqlite table " << table_name;

        return ret;
    }

    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique)
    {
        std::string index_name = std::string("idx_").append(table_name).append("_").append(column_names);
        std::replace(index_name.begin(), index_name.end(), ',', '_');

        std::string sql;
        sql.append(is_unique ? CREATE_UNIQUE_INDEX : CREATE_INDEX)
            .append(index_name)
            .append(" ON ")
            .append(table_name)
            .append("(")
            .append(column_names)
            .append(")");

        const int ret = exec_sql(db, sql);
        if (ret == -1)
            LOG_ERROR << "Error when creating sqlite index '" << index_name << "' in table " << table_name;

        return ret;
    }

    /**
     * Checks whether table exist in the database.
     * @param db Pointer to the db.
     * @param table_name Table name to be checked.
     * @returns returns true is exist, otherwise false.
    */
    bool is_table_exists(sqlite3 *db, std::string_view table_name)
    {
        sqlite3_stmt *stmt = NULL;
        bool exists = false;

        if (sqlite3_prepare_v2(db, SELECT_TABLE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            sqlite3_bind_text(stmt, 1, table_name.data(), table_name.size(), SQLITE_STATIC) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW)
            exists = true;

        // Finalize and distroys the statement.
        sqlite3_finalize(stmt);
        return exists;
    }

    /**
     * Closes a connection to a given databse.
     * @param db Pointer to the db.
     * @returns returns 0 on success, or -1 on error.
    */
    int close_db(sqlite3 **db)
    {
        if (*db == NULL)
            return 0;

        if (sqlite3_close(*db) != SQLITE_OK)
        {
            LOG_ERROR << "Can't close database: " << sqlite3_errmsg(*db);
            return -1;
        }

        *db = NULL;
        return 0;
    }

    /**
     * Sets up the local pos database. Existing tables are left untouched so this is safe to call on every startup.
     * @param db Pointer to the db.
     * @returns returns 0 on success, or -1 on error.
    */
    int initialize_local_db(sqlite3 *db)
    {
        // Sales and their line items.
        {
            const std::vector<table_column_info> sale_columns{
                table_column_info("id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("invoice_number", COLUMN_DATA_TYPE::TEXT),
                table_column_info("total_amount", COLUMN_DATA_TYPE::INT),
                table_column_info("payment_method", COLUMN_DATA_TYPE::TEXT),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT),
                table_column_info("device_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("sync_status", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("server_synced_at", COLUMN_DATA_TYPE::INT)};

            const std::vector<table_column_info> item_columns{
                table_column_info("id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("sale_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("product_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("quantity", COLUMN_DATA_TYPE::INT),
                table_column_info("unit_price", COLUMN_DATA_TYPE::INT),
                table_column_info("batch_number", COLUMN_DATA_TYPE::TEXT)};

            if (create_table(db, SALES_TABLE, sale_columns) == -1 ||
                create_index(db, SALES_TABLE, "sync_status", false) == -1 ||
                create_table(db, SALE_ITEMS_TABLE, item_columns) == -1 ||
                create_index(db, SALE_ITEMS_TABLE, "sale_id", false) == -1)
                return -1;
        }

        // Products.
        {
            const std::vector<table_column_info> columns{
                table_column_info("id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("name", COLUMN_DATA_TYPE::TEXT),
                table_column_info("barcode", COLUMN_DATA_TYPE::TEXT),
                table_column_info("category", COLUMN_DATA_TYPE::TEXT),
                table_column_info("unit_price", COLUMN_DATA_TYPE::INT),
                table_column_info("is_active", COLUMN_DATA_TYPE::INT),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT),
                table_column_info("updated_at", COLUMN_DATA_TYPE::INT),
                table_column_info("device_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("batch_number", COLUMN_DATA_TYPE::TEXT),
                table_column_info("expiry_date", COLUMN_DATA_TYPE::INT),
                table_column_info("purchase_price", COLUMN_DATA_TYPE::INT),
                table_column_info("selling_price", COLUMN_DATA_TYPE::INT),
                table_column_info("sync_status", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("server_synced_at", COLUMN_DATA_TYPE::INT)};

            if (create_table(db, PRODUCTS_TABLE, columns) == -1 ||
                create_index(db, PRODUCTS_TABLE, "barcode", false) == -1)
                return -1;
        }

        // Stock.
        {
            const std::vector<table_column_info> columns{
                table_column_info("id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("product_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("quantity", COLUMN_DATA_TYPE::INT),
                table_column_info("last_updated_at", COLUMN_DATA_TYPE::INT),
                table_column_info("sync_status", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("server_synced_at", COLUMN_DATA_TYPE::INT)};

            if (create_table(db, STOCK_TABLE, columns) == -1 ||
                create_index(db, STOCK_TABLE, "product_id", false) == -1)
                return -1;
        }

        // Sync cursors.
        {
            const std::vector<table_column_info> columns{
                table_column_info("entity_kind", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("last_synced_at", COLUMN_DATA_TYPE::INT, false, false)};

            if (create_table(db, SYNC_CURSORS_TABLE, columns) == -1)
                return -1;
        }

        // Application sessions.
        {
            const std::vector<table_column_info> columns{
                table_column_info("session_id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("user_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("device_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("started_at", COLUMN_DATA_TYPE::INT),
                table_column_info("ended_at", COLUMN_DATA_TYPE::INT),
                table_column_info("clean_shutdown", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("crash_reason", COLUMN_DATA_TYPE::TEXT),
                table_column_info("app_version", COLUMN_DATA_TYPE::TEXT),
                table_column_info("platform", COLUMN_DATA_TYPE::TEXT)};

            if (create_table(db, APP_SESSIONS_TABLE, columns) == -1 ||
                create_index(db, APP_SESSIONS_TABLE, "user_id,device_id", false) == -1 ||
                create_index(db, APP_SESSIONS_TABLE, "started_at", false) == -1)
                return -1;
        }

        // Transaction snapshots.
        {
            const std::vector<table_column_info> columns{
                table_column_info("session_id", COLUMN_DATA_TYPE::TEXT, true),
                table_column_info("user_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("device_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("state", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("data", COLUMN_DATA_TYPE::BLOB),
                table_column_info("created_at", COLUMN_DATA_TYPE::INT),
                table_column_info("last_modified", COLUMN_DATA_TYPE::INT)};

            if (create_table(db, SNAPSHOTS_TABLE, columns) == -1 ||
                create_index(db, SNAPSHOTS_TABLE, "state", false) == -1)
                return -1;
        }

        // Recovery decisions.
        {
            const std::vector<table_column_info> columns{
                table_column_info("work_item_id", COLUMN_DATA_TYPE::TEXT, false, false),
                table_column_info("session_id", COLUMN_DATA_TYPE::TEXT),
                table_column_info("action", COLUMN_DATA_TYPE::INT, false, false),
                table_column_info("recorded_at", COLUMN_DATA_TYPE::INT)};

            if (create_table(db, RECOVERY_LOG_TABLE, columns) == -1 ||
                create_index(db, RECOVERY_LOG_TABLE, "work_item_id", false) == -1)
                return -1;
        }

        return 0;
    }

    /**
     * Binds an optional text value. Absent values are bound as NULL.
     * @returns SQLITE_OK on success or the sqlite error code.
     */
    int bind_optional_text(sqlite3_stmt *stmt, const int idx, const std::optional<std::string> &value)
    {
        if (!value)
            return sqlite3_bind_null(stmt, idx);
        return sqlite3_bind_text(stmt, idx, value->data(), value->size(), SQLITE_STATIC);
    }

    int bind_optional_int64(sqlite3_stmt *stmt, const int idx, const std::optional<int64_t> &value)
    {
        if (!value)
            return sqlite3_bind_null(stmt, idx);
        return sqlite3_bind_int64(stmt, idx, *value);
    }

    std::string get_text(sqlite3_stmt *stmt, const int idx)
    {
        const unsigned char *text = sqlite3_column_text(stmt, idx);
        if (text == NULL)
            return std::string();
        return std::string(reinterpret_cast<const char *>(text), sqlite3_column_bytes(stmt, idx));
    }

    std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, const int idx)
    {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL)
            return std::nullopt;
        return get_text(stmt, idx);
    }

    std::optional<int64_t> get_optional_int64(sqlite3_stmt *stmt, const int idx)
    {
        if (sqlite3_column_type(stmt, idx) == SQLITE_NULL)
            return std::nullopt;
        return sqlite3_column_int64(stmt, idx);
    }

} // namespace db::sqlite
