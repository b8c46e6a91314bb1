#include "sqlite_store.hpp"
#include "sqlite.hpp"

namespace db
{
    constexpr const char *SALE_COLUMNS = "id, invoice_number, total_amount, payment_method, created_at, device_id, sync_status, server_synced_at";
    constexpr const char *INSERT_SALE = "INSERT INTO sales(id, invoice_number, total_amount, payment_method, created_at, device_id,"
                                        " sync_status, server_synced_at) VALUES(?,?,?,?,?,?,?,?)";
    constexpr const char *INSERT_SALE_ITEM = "INSERT INTO sale_items(id, sale_id, product_id, quantity, unit_price, batch_number)"
                                             " VALUES(?,?,?,?,?,?)";
    constexpr const char *SELECT_SALE_ITEMS = "SELECT id, sale_id, product_id, quantity, unit_price, batch_number FROM sale_items"
                                              " WHERE sale_id=? ORDER BY rowid";
    constexpr const char *UPDATE_SALE_SYNCED = "UPDATE sales SET sync_status=?, server_synced_at=? WHERE id=?";
    constexpr const char *UPDATE_SALE_STATUS = "UPDATE sales SET sync_status=? WHERE id=?";

    constexpr const char *SELECT_PRODUCT = "SELECT id, name, barcode, category, unit_price, is_active, created_at, updated_at, device_id,"
                                           " batch_number, expiry_date, purchase_price, selling_price, sync_status, server_synced_at"
                                           " FROM products WHERE id=?";
    constexpr const char *INSERT_PRODUCT = "INSERT INTO products(id, name, barcode, category, unit_price, is_active, created_at, updated_at,"
                                           " device_id, batch_number, expiry_date, purchase_price, selling_price, sync_status, server_synced_at)"
                                           " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)";
    constexpr const char *UPDATE_PRODUCT = "UPDATE products SET name=?2, barcode=?3, category=?4, unit_price=?5, is_active=?6, created_at=?7,"
                                           " updated_at=?8, device_id=?9, batch_number=?10, expiry_date=?11, purchase_price=?12,"
                                           " selling_price=?13, sync_status=?14, server_synced_at=?15 WHERE id=?1";

    constexpr const char *SELECT_STOCK = "SELECT id, product_id, quantity, last_updated_at, sync_status, server_synced_at FROM stock WHERE id=?";
    constexpr const char *SELECT_STOCK_BY_PRODUCT = "SELECT id, product_id, quantity, last_updated_at, sync_status, server_synced_at FROM stock"
                                                    " WHERE product_id=? ORDER BY last_updated_at DESC LIMIT 1";
    constexpr const char *INSERT_STOCK = "INSERT INTO stock(id, product_id, quantity, last_updated_at, sync_status, server_synced_at)"
                                         " VALUES(?,?,?,?,?,?)";
    constexpr const char *UPDATE_STOCK = "UPDATE stock SET product_id=?2, quantity=?3, last_updated_at=?4, sync_status=?5,"
                                         " server_synced_at=?6 WHERE id=?1";

    constexpr const char *SELECT_CURSOR = "SELECT last_synced_at FROM sync_cursors WHERE entity_kind=?";
    // Cursor never moves backwards. An older stamp is silently ignored.
    constexpr const char *UPSERT_CURSOR = "INSERT INTO sync_cursors(entity_kind, last_synced_at) VALUES(?,?)"
                                          " ON CONFLICT(entity_kind) DO UPDATE SET last_synced_at=excluded.last_synced_at"
                                          " WHERE excluded.last_synced_at > sync_cursors.last_synced_at";

    constexpr const char *SESSION_COLUMNS = "session_id, user_id, device_id, started_at, ended_at, clean_shutdown, crash_reason, app_version, platform";
    constexpr const char *INSERT_SESSION = "INSERT INTO app_sessions(session_id, user_id, device_id, started_at, ended_at, clean_shutdown,"
                                           " crash_reason, app_version, platform) VALUES(?,?,?,?,?,?,?,?,?)";
    constexpr const char *END_SESSION = "UPDATE app_sessions SET ended_at=?, clean_shutdown=?, crash_reason=? WHERE session_id=?";
    constexpr const char *DELETE_SESSIONS_BEFORE = "DELETE FROM app_sessions WHERE started_at < ? AND ended_at IS NOT NULL";

    constexpr const char *SNAPSHOT_COLUMNS = "session_id, user_id, device_id, state, data, created_at, last_modified";
    constexpr const char *UPSERT_SNAPSHOT = "INSERT INTO transaction_snapshots(session_id, user_id, device_id, state, data, created_at, last_modified)"
                                            " VALUES(?,?,?,?,?,?,?) ON CONFLICT(session_id) DO UPDATE SET user_id=excluded.user_id,"
                                            " device_id=excluded.device_id, state=excluded.state, data=excluded.data,"
                                            " last_modified=excluded.last_modified";
    constexpr const char *UPDATE_SNAPSHOT_STATE = "UPDATE transaction_snapshots SET state=?, last_modified=? WHERE session_id=?";
    constexpr const char *PURGE_SNAPSHOTS_BEFORE = "UPDATE transaction_snapshots SET data=NULL WHERE state IN (1, 2) AND data IS NOT NULL"
                                                   " AND last_modified < ?";

    constexpr const char *RECOVERY_LOG_COLUMNS = "work_item_id, session_id, action, recorded_at";
    constexpr const char *INSERT_RECOVERY_LOG = "INSERT INTO recovery_log(work_item_id, session_id, action, recorded_at) VALUES(?,?,?,?)";

#define BIND_TEXT(idx, field) (sqlite3_bind_text(stmt, idx, field.data(), field.size(), SQLITE_STATIC) == SQLITE_OK)
#define BIND_INT64(idx, value) (sqlite3_bind_int64(stmt, idx, value) == SQLITE_OK)
#define BIND_OPT_TEXT(idx, field) (sqlite::bind_optional_text(stmt, idx, field) == SQLITE_OK)
#define BIND_OPT_INT64(idx, field) (sqlite::bind_optional_int64(stmt, idx, field) == SQLITE_OK)
#define BIND_DATA_BLOB(idx, field) (sqlite3_bind_blob(stmt, idx, field.data(), field.size(), SQLITE_STATIC) == SQLITE_OK)

    std::optional<int64_t> to_optional_int64(const std::optional<uint64_t> &value)
    {
        if (!value)
            return std::nullopt;
        return static_cast<int64_t>(*value);
    }

    std::optional<uint64_t> to_optional_uint64(const std::optional<int64_t> &value)
    {
        if (!value)
            return std::nullopt;
        return static_cast<uint64_t>(*value);
    }

    void populate_sale_from_sql_record(sale_record &sale, sqlite3_stmt *stmt)
    {
        sale.id = sqlite::get_text(stmt, 0);
        sale.invoice_number = sqlite::get_text(stmt, 1);
        sale.total_amount = sqlite3_column_int64(stmt, 2);
        sale.payment_method = sqlite::get_text(stmt, 3);
        sale.created_at = sqlite3_column_int64(stmt, 4);
        sale.device_id = sqlite::get_text(stmt, 5);
        sale.sync_status = static_cast<SYNC_STATUS>(sqlite3_column_int(stmt, 6));
        sale.server_synced_at = sqlite3_column_int64(stmt, 7);
    }

    void populate_product_from_sql_record(product_record &product, sqlite3_stmt *stmt)
    {
        product.id = sqlite::get_text(stmt, 0);
        product.name = sqlite::get_text(stmt, 1);
        product.barcode = sqlite::get_optional_text(stmt, 2);
        product.category = sqlite::get_optional_text(stmt, 3);
        product.unit_price = sqlite3_column_int64(stmt, 4);
        product.is_active = sqlite3_column_int(stmt, 5) == 1;
        product.created_at = sqlite3_column_int64(stmt, 6);
        product.updated_at = sqlite3_column_int64(stmt, 7);
        product.device_id = sqlite::get_text(stmt, 8);
        product.batch_number = sqlite::get_optional_text(stmt, 9);
        product.expiry_date = to_optional_uint64(sqlite::get_optional_int64(stmt, 10));
        product.purchase_price = sqlite::get_optional_int64(stmt, 11);
        product.selling_price = sqlite::get_optional_int64(stmt, 12);
        product.sync_status = static_cast<SYNC_STATUS>(sqlite3_column_int(stmt, 13));
        product.server_synced_at = sqlite3_column_int64(stmt, 14);
    }

    void populate_stock_from_sql_record(stock_record &stock, sqlite3_stmt *stmt)
    {
        stock.id = sqlite::get_text(stmt, 0);
        stock.product_id = sqlite::get_text(stmt, 1);
        stock.quantity = sqlite3_column_int(stmt, 2);
        stock.last_updated_at = sqlite3_column_int64(stmt, 3);
        stock.sync_status = static_cast<SYNC_STATUS>(sqlite3_column_int(stmt, 4));
        stock.server_synced_at = sqlite3_column_int64(stmt, 5);
    }

    void populate_session_from_sql_record(app_session_record &session, sqlite3_stmt *stmt)
    {
        session.session_id = sqlite::get_text(stmt, 0);
        session.user_id = sqlite::get_text(stmt, 1);
        session.device_id = sqlite::get_text(stmt, 2);
        session.started_at = sqlite3_column_int64(stmt, 3);
        session.ended_at = to_optional_uint64(sqlite::get_optional_int64(stmt, 4));
        session.clean_shutdown = sqlite3_column_int(stmt, 5) == 1;
        session.crash_reason = sqlite::get_optional_text(stmt, 6);
        session.app_version = sqlite::get_text(stmt, 7);
        session.platform = sqlite::get_text(stmt, 8);
    }

    void populate_snapshot_from_sql_record(snapshot_row &row, sqlite3_stmt *stmt)
    {
        row.session_id = sqlite::get_text(stmt, 0);
        row.user_id = sqlite::get_text(stmt, 1);
        row.device_id = sqlite::get_text(stmt, 2);
        row.state = static_cast<SNAPSHOT_STATE>(sqlite3_column_int(stmt, 3));

        const void *data = sqlite3_column_blob(stmt, 4);
        row.data = data == NULL ? std::string() : std::string(static_cast<const char *>(data), sqlite3_column_bytes(stmt, 4));

        row.created_at = sqlite3_column_int64(stmt, 5);
        row.last_modified = sqlite3_column_int64(stmt, 6);
    }

    void populate_recovery_log_from_sql_record(recovery_log_record &record, sqlite3_stmt *stmt)
    {
        record.work_item_id = sqlite::get_text(stmt, 0);
        record.session_id = sqlite::get_text(stmt, 1);
        record.action = static_cast<RECOVERY_ACTION>(sqlite3_column_int(stmt, 2));
        record.recorded_at = sqlite3_column_int64(stmt, 3);
    }

    /**
     * Opens (creating if needed) the local database and makes sure all tables exist.
     * @param db_path Database file path or ":memory:".
     * @returns 0 on success. -1 on failure.
     */
    int sqlite_store::init(std::string_view db_path)
    {
        std::scoped_lock lock(db_mutex);

        if (sqlite::open_db(db_path, &db) == -1)
            return -1;

        if (sqlite::initialize_local_db(db) == -1)
        {
            LOG_ERROR << "Error initializing local database at " << db_path;
            sqlite::close_db(&db);
            return -1;
        }

        return 0;
    }

    void sqlite_store::deinit()
    {
        std::scoped_lock lock(db_mutex);
        sqlite::close_db(&db);
    }

    sqlite_store::~sqlite_store()
    {
        deinit();
    }

    /**
     * Runs the given unit of work inside one sqlite transaction. Nested units join the outermost transaction
     * and the outermost caller commits or rolls back. If the work throws, the outermost transaction is rolled
     * back and the exception is rethrown.
     * @returns 0 if the work succeeded and was committed. -1 otherwise.
     */
    int sqlite_store::run_in_transaction(const std::function<int()> &work)
    {
        std::scoped_lock lock(db_mutex);

        const bool is_outermost = transaction_depth == 0;
        if (is_outermost && sqlite::begin_transaction(db) == -1)
            return -1;

        int res = -1;
        transaction_depth++;
        try
        {
            res = work();
        }
        catch (...)
        {
            transaction_depth--;
            if (is_outermost)
            {
                LOG_ERROR << "Exception in local store transaction. Rolling back.";
                sqlite::rollback_transaction(db);
            }
            throw;
        }
        transaction_depth--;

        if (!is_outermost)
            return res == 0 ? 0 : -1;

        if (res == 0 && sqlite::commit_transaction(db) == 0)
            return 0;

        LOG_WARNING << "Rolling back local store transaction.";
        sqlite::rollback_transaction(db);
        return -1;
    }

    //----- Sales

    int sqlite_store::insert_sale(const sale_record &sale)
    {
        return run_in_transaction([&]()
                                  {
                                      sqlite3_stmt *stmt = NULL;
                                      if (sqlite3_prepare_v2(db, INSERT_SALE, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
                                          !BIND_TEXT(1, sale.id) ||
                                          !BIND_TEXT(2, sale.invoice_number) ||
                                          !BIND_INT64(3, sale.total_amount) ||
                                          !BIND_TEXT(4, sale.payment_method) ||
                                          !BIND_INT64(5, sale.created_at) ||
                                          !BIND_TEXT(6, sale.device_id) ||
                                          !BIND_INT64(7, sale.sync_status) ||
                                          !BIND_INT64(8, sale.server_synced_at) ||
                                          sqlite3_step(stmt) != SQLITE_DONE)
                                      {
                                          LOG_ERROR << "Error inserting sale " << sale.id << ". " << sqlite3_errmsg(db);
                                          sqlite3_finalize(stmt);
                                          return -1;
                                      }
                                      sqlite3_finalize(stmt);

                                      for (const sale_item &item : sale.items)
                                      {
                                          if (sqlite3_prepare_v2(db, INSERT_SALE_ITEM, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
                                              !BIND_TEXT(1, item.id) ||
                                              !BIND_TEXT(2, sale.id) ||
                                              !BIND_TEXT(3, item.product_id) ||
                                              !BIND_INT64(4, item.quantity) ||
                                              !BIND_INT64(5, item.unit_price) ||
                                              !BIND_OPT_TEXT(6, item.batch_number) ||
                                              sqlite3_step(stmt) != SQLITE_DONE)
                                          {
                                              LOG_ERROR << "Error inserting sale item " << item.id << ". " << sqlite3_errmsg(db);
                                              sqlite3_finalize(stmt);
                                              return -1;
                                          }
                                          sqlite3_finalize(stmt);
                                      }

                                      return 0;
                                  });
    }

    int sqlite_store::load_sale_items(sale_record &sale)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_SALE_ITEMS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_TEXT(1, sale.id))
        {
            LOG_ERROR << "Error querying sale items of " << sale.id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        sale.items.clear();
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            sale_item item;
            item.id = sqlite::get_text(stmt, 0);
            item.sale_id = sqlite::get_text(stmt, 1);
            item.product_id = sqlite::get_text(stmt, 2);
            item.quantity = sqlite3_column_int(stmt, 3);
            item.unit_price = sqlite3_column_int64(stmt, 4);
            item.batch_number = sqlite::get_optional_text(stmt, 5);
            sale.items.push_back(std::move(item));
        }

        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading sale items of " << sale.id << ". " << sqlite3_errmsg(db);
            return -1;
        }
        return 0;
    }

    /**
     * Gets a sale together with its line items.
     * @returns 1 if found. 0 if not found. -1 on error.
     */
    int sqlite_store::get_sale(const std::string &sale_id, sale_record &sale)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SALE_COLUMNS).append(" FROM sales WHERE id=?");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, sale_id))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_sale_from_sql_record(sale, stmt);
                sqlite3_finalize(stmt);
                return load_sale_items(sale) == -1 ? -1 : 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying sale " << sale_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Gets all sales which were never synced or whose last sync failed, oldest first.
     */
    int sqlite_store::get_unsynced_sales(std::vector<sale_record> &sales)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SALE_COLUMNS).append(" FROM sales WHERE sync_status IN (0, 2) ORDER BY created_at ASC");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL)
        {
            LOG_ERROR << "Error when querying unsynced sales. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            sale_record sale;
            populate_sale_from_sql_record(sale, stmt);
            sales.push_back(std::move(sale));
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading unsynced sales. " << sqlite3_errmsg(db);
            return -1;
        }

        for (sale_record &sale : sales)
        {
            if (load_sale_items(sale) == -1)
                return -1;
        }

        return 0;
    }

    /**
     * Sets the sync status of the given sales. The server sync time is only recorded when marking them synced.
     */
    int sqlite_store::update_sale_sync_status(const std::vector<std::string> &sale_ids, const SYNC_STATUS status, const uint64_t server_synced_at)
    {
        return run_in_transaction([&]()
                                  {
                                      const bool is_synced = status == SYNC_STATUS::SYNCED;
                                      sqlite3_stmt *stmt = NULL;
                                      if (sqlite3_prepare_v2(db, is_synced ? UPDATE_SALE_SYNCED : UPDATE_SALE_STATUS, -1, &stmt, 0) != SQLITE_OK || stmt == NULL)
                                      {
                                          LOG_ERROR << "Error preparing sale status update. " << sqlite3_errmsg(db);
                                          sqlite3_finalize(stmt);
                                          return -1;
                                      }

                                      for (const std::string &sale_id : sale_ids)
                                      {
                                          const bool bound = is_synced
                                                                 ? (BIND_INT64(1, status) && BIND_INT64(2, server_synced_at) && BIND_TEXT(3, sale_id))
                                                                 : (BIND_INT64(1, status) && BIND_TEXT(2, sale_id));
                                          if (!bound || sqlite3_step(stmt) != SQLITE_DONE || sqlite3_reset(stmt) != SQLITE_OK)
                                          {
                                              LOG_ERROR << "Error updating sync status of sale " << sale_id << ". " << sqlite3_errmsg(db);
                                              sqlite3_finalize(stmt);
                                              return -1;
                                          }
                                      }

                                      sqlite3_finalize(stmt);
                                      return 0;
                                  });
    }

    //----- Products

    /**
     * @returns 1 if found. 0 if not found. -1 on error.
     */
    int sqlite_store::get_product(const std::string &product_id, product_record &product)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_PRODUCT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, product_id))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_product_from_sql_record(product, stmt);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying product " << product_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int bind_product(sqlite3_stmt *stmt, const product_record &product)
    {
        const bool bound = BIND_TEXT(1, product.id) &&
                           BIND_TEXT(2, product.name) &&
                           BIND_OPT_TEXT(3, product.barcode) &&
                           BIND_OPT_TEXT(4, product.category) &&
                           BIND_INT64(5, product.unit_price) &&
                           BIND_INT64(6, product.is_active ? 1 : 0) &&
                           BIND_INT64(7, product.created_at) &&
                           BIND_INT64(8, product.updated_at) &&
                           BIND_TEXT(9, product.device_id) &&
                           BIND_OPT_TEXT(10, product.batch_number) &&
                           BIND_OPT_INT64(11, to_optional_int64(product.expiry_date)) &&
                           BIND_OPT_INT64(12, product.purchase_price) &&
                           BIND_OPT_INT64(13, product.selling_price) &&
                           BIND_INT64(14, product.sync_status) &&
                           BIND_INT64(15, product.server_synced_at);
        return bound ? 0 : -1;
    }

    int sqlite_store::insert_product(const product_record &product)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_PRODUCT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            bind_product(stmt, product) == 0 &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting product " << product.id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int sqlite_store::update_product(const product_record &product)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_PRODUCT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            bind_product(stmt, product) == 0 &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error updating product " << product.id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    //----- Stock

    /**
     * @returns 1 if found. 0 if not found. -1 on error.
     */
    /**
     * Runs a single stock row query keyed by the given text value.
     * @returns 1 if a row was found. 0 if not found. -1 on error.
     */
    int query_single_stock(sqlite3 *db, const char *sql, const std::string &key, stock_record &stock)
    {
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, key))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_stock_from_sql_record(stock, stmt);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying stock " << key << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int sqlite_store::get_stock(const std::string &stock_id, stock_record &stock)
    {
        std::scoped_lock lock(db_mutex);
        return query_single_stock(db, SELECT_STOCK, stock_id, stock);
    }

    /**
     * Looks up the stock row of a product. If several rows exist the most recently updated one is returned.
     * @returns 1 if found. 0 if the product has no stock row. -1 on error.
     */
    int sqlite_store::get_stock_by_product(const std::string &product_id, stock_record &stock)
    {
        std::scoped_lock lock(db_mutex);
        return query_single_stock(db, SELECT_STOCK_BY_PRODUCT, product_id, stock);
    }

    int bind_stock(sqlite3_stmt *stmt, const stock_record &stock)
    {
        const bool bound = BIND_TEXT(1, stock.id) &&
                           BIND_TEXT(2, stock.product_id) &&
                           BIND_INT64(3, stock.quantity) &&
                           BIND_INT64(4, stock.last_updated_at) &&
                           BIND_INT64(5, stock.sync_status) &&
                           BIND_INT64(6, stock.server_synced_at);
        return bound ? 0 : -1;
    }

    int sqlite_store::insert_stock(const stock_record &stock)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_STOCK, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            bind_stock(stmt, stock) == 0 &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting stock " << stock.id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int sqlite_store::update_stock(const stock_record &stock)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_STOCK, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            bind_stock(stmt, stock) == 0 &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error updating stock " << stock.id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    //----- Sync cursors

    /**
     * @returns 1 if the cursor exists. 0 if the kind was never synced. -1 on error.
     */
    int sqlite_store::get_sync_cursor(std::string_view entity_kind, uint64_t &last_synced_at)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, SELECT_CURSOR, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, entity_kind))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                last_synced_at = sqlite3_column_int64(stmt, 0);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying sync cursor " << entity_kind << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int sqlite_store::advance_sync_cursor(std::string_view entity_kind, const uint64_t last_synced_at)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPSERT_CURSOR, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, entity_kind) &&
            BIND_INT64(2, last_synced_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error advancing sync cursor " << entity_kind << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    //----- Application sessions

    int sqlite_store::insert_app_session(const app_session_record &session)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_SESSION, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, session.session_id) &&
            BIND_TEXT(2, session.user_id) &&
            BIND_TEXT(3, session.device_id) &&
            BIND_INT64(4, session.started_at) &&
            BIND_OPT_INT64(5, to_optional_int64(session.ended_at)) &&
            BIND_INT64(6, session.clean_shutdown ? 1 : 0) &&
            BIND_OPT_TEXT(7, session.crash_reason) &&
            BIND_TEXT(8, session.app_version) &&
            BIND_TEXT(9, session.platform) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting application session " << session.session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * @returns 1 if found. 0 if not found. -1 on error.
     */
    int sqlite_store::get_app_session(const std::string &session_id, app_session_record &session)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SESSION_COLUMNS).append(" FROM app_sessions WHERE session_id=?");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, session_id))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_session_from_sql_record(session, stmt);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying application session " << session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Collects all rows of a session query whose parameters are already bound.
     */
    int collect_sessions(sqlite3 *db, sqlite3_stmt *stmt, std::vector<app_session_record> &sessions)
    {
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            app_session_record session;
            populate_session_from_sql_record(session, stmt);
            sessions.push_back(std::move(session));
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading application sessions. " << sqlite3_errmsg(db);
            return -1;
        }
        return 0;
    }

    /**
     * Gets the sessions of the user/device which have neither ended nor shut down cleanly.
     */
    int sqlite_store::get_open_app_sessions(const std::string &user_id, const std::string &device_id, std::vector<app_session_record> &sessions)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SESSION_COLUMNS).append(" FROM app_sessions WHERE user_id=? AND device_id=?"
                                                                                      " AND ended_at IS NULL AND clean_shutdown=0 ORDER BY started_at");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_TEXT(1, user_id) ||
            !BIND_TEXT(2, device_id))
        {
            LOG_ERROR << "Error when querying open application sessions. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        return collect_sessions(db, stmt, sessions);
    }

    /**
     * Marks a session as ended.
     * @returns 1 if the session was updated. 0 if no such session exists. -1 on error.
     */
    int sqlite_store::end_app_session(const std::string &session_id, const uint64_t ended_at, const bool clean_shutdown, const std::optional<std::string> &crash_reason)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, END_SESSION, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_INT64(1, ended_at) &&
            BIND_INT64(2, clean_shutdown ? 1 : 0) &&
            BIND_OPT_TEXT(3, crash_reason) &&
            BIND_TEXT(4, session_id) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return sqlite3_changes(db) > 0 ? 1 : 0;
        }

        LOG_ERROR << "Error ending application session " << session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Gets the sessions started within the given window which were classified as crashed.
     */
    int sqlite_store::get_crashed_app_sessions(const uint64_t from, const uint64_t to, std::vector<app_session_record> &sessions)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SESSION_COLUMNS).append(" FROM app_sessions WHERE crash_reason IS NOT NULL"
                                                                                      " AND started_at >= ? AND started_at <= ? ORDER BY started_at");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_INT64(1, from) ||
            !BIND_INT64(2, to))
        {
            LOG_ERROR << "Error when querying crashed application sessions. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        return collect_sessions(db, stmt, sessions);
    }

    /**
     * Deletes ended sessions started before the cutoff. Sessions that are still open are never deleted.
     */
    int sqlite_store::delete_app_sessions_before(const uint64_t cutoff, size_t &deleted_count)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, DELETE_SESSIONS_BEFORE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_INT64(1, cutoff) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            deleted_count = sqlite3_changes(db);
            return 0;
        }

        LOG_ERROR << "Error deleting old application sessions. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    //----- Transaction snapshots

    /**
     * Inserts the snapshot or supersedes the existing snapshot of the same session. Creation time of an
     * existing row is preserved.
     */
    int sqlite_store::put_snapshot(const snapshot_row &row)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPSERT_SNAPSHOT, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, row.session_id) &&
            BIND_TEXT(2, row.user_id) &&
            BIND_TEXT(3, row.device_id) &&
            BIND_INT64(4, row.state) &&
            BIND_DATA_BLOB(5, row.data) &&
            BIND_INT64(6, row.created_at) &&
            BIND_INT64(7, row.last_modified) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error saving transaction snapshot " << row.session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * @returns 1 if found. 0 if not found. -1 on error.
     */
    int sqlite_store::get_snapshot(const std::string &session_id, snapshot_row &row)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SNAPSHOT_COLUMNS).append(" FROM transaction_snapshots WHERE session_id=?");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, session_id))
        {
            const int result = sqlite3_step(stmt);
            if (result == SQLITE_ROW)
            {
                populate_snapshot_from_sql_record(row, stmt);
                sqlite3_finalize(stmt);
                return 1;
            }
            else if (result == SQLITE_DONE)
            {
                sqlite3_finalize(stmt);
                return 0;
            }
        }

        LOG_ERROR << "Error when querying transaction snapshot " << session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Gets all active snapshots which still carry a payload, most recently modified first.
     * @param user_id Only include snapshots of this user when specified.
     * @param device_id Only include snapshots of this device when specified.
     */
    int sqlite_store::get_active_snapshots(const std::optional<std::string> &user_id, const std::optional<std::string> &device_id, std::vector<snapshot_row> &rows)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(SNAPSHOT_COLUMNS).append(" FROM transaction_snapshots WHERE state=0 AND data IS NOT NULL"
                                                                                       " AND (?1 IS NULL OR user_id=?1) AND (?2 IS NULL OR device_id=?2)"
                                                                                       " ORDER BY last_modified DESC");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_OPT_TEXT(1, user_id) ||
            !BIND_OPT_TEXT(2, device_id))
        {
            LOG_ERROR << "Error when querying active transaction snapshots. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            snapshot_row row;
            populate_snapshot_from_sql_record(row, stmt);
            rows.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading active transaction snapshots. " << sqlite3_errmsg(db);
            return -1;
        }
        return 0;
    }

    /**
     * @returns 1 if the snapshot was updated. 0 if no snapshot exists for the session. -1 on error.
     */
    int sqlite_store::set_snapshot_state(const std::string &session_id, const SNAPSHOT_STATE state, const uint64_t modified_at)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, UPDATE_SNAPSHOT_STATE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_INT64(1, state) &&
            BIND_INT64(2, modified_at) &&
            BIND_TEXT(3, session_id) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return sqlite3_changes(db) > 0 ? 1 : 0;
        }

        LOG_ERROR << "Error updating state of transaction snapshot " << session_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    /**
     * Drops the payload of completed/cancelled snapshots last modified before the cutoff. The rows are kept.
     */
    int sqlite_store::purge_snapshots_before(const uint64_t cutoff, size_t &purged_count)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, PURGE_SNAPSHOTS_BEFORE, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_INT64(1, cutoff) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            purged_count = sqlite3_changes(db);
            return 0;
        }

        LOG_ERROR << "Error purging old transaction snapshots. " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    //----- Recovery log

    int sqlite_store::insert_recovery_log(const recovery_log_record &record)
    {
        std::scoped_lock lock(db_mutex);

        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, INSERT_RECOVERY_LOG, -1, &stmt, 0) == SQLITE_OK && stmt != NULL &&
            BIND_TEXT(1, record.work_item_id) &&
            BIND_TEXT(2, record.session_id) &&
            BIND_INT64(3, record.action) &&
            BIND_INT64(4, record.recorded_at) &&
            sqlite3_step(stmt) == SQLITE_DONE)
        {
            sqlite3_finalize(stmt);
            return 0;
        }

        LOG_ERROR << "Error inserting recovery log for " << record.work_item_id << ". " << sqlite3_errmsg(db);
        sqlite3_finalize(stmt);
        return -1;
    }

    int collect_recovery_logs(sqlite3 *db, sqlite3_stmt *stmt, std::vector<recovery_log_record> &records)
    {
        int result;
        while ((result = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            recovery_log_record record;
            populate_recovery_log_from_sql_record(record, stmt);
            records.push_back(std::move(record));
        }
        sqlite3_finalize(stmt);

        if (result != SQLITE_DONE)
        {
            LOG_ERROR << "Error reading recovery log. " << sqlite3_errmsg(db);
            return -1;
        }
        return 0;
    }

    int sqlite_store::get_recovery_log(const std::string &work_item_id, std::vector<recovery_log_record> &records)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(RECOVERY_LOG_COLUMNS).append(" FROM recovery_log WHERE work_item_id=? ORDER BY recorded_at");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_TEXT(1, work_item_id))
        {
            LOG_ERROR << "Error when querying recovery log of " << work_item_id << ". " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        return collect_recovery_logs(db, stmt, records);
    }

    int sqlite_store::get_recovery_log_between(const uint64_t from, const uint64_t to, std::vector<recovery_log_record> &records)
    {
        std::scoped_lock lock(db_mutex);

        const std::string sql = std::string("SELECT ").append(RECOVERY_LOG_COLUMNS).append(" FROM recovery_log WHERE recorded_at >= ? AND recorded_at <= ?"
                                                                                           " ORDER BY recorded_at");
        sqlite3_stmt *stmt = NULL;
        if (sqlite3_prepare_v2(db, sql.data(), -1, &stmt, 0) != SQLITE_OK || stmt == NULL ||
            !BIND_INT64(1, from) ||
            !BIND_INT64(2, to))
        {
            LOG_ERROR << "Error when querying recovery log. " << sqlite3_errmsg(db);
            sqlite3_finalize(stmt);
            return -1;
        }

        return collect_recovery_logs(db, stmt, records);
    }

} // namespace db
