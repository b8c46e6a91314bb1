#ifndef _POSSYNC_DB_SQLITE_
#define _POSSYNC_DB_SQLITE_

#include "../pchheader.hpp"

namespace db::sqlite
{
    /**
    * Define an enum and a string array for the column data types.
    * Any column data type that needs to be supportes should be added to both the 'COLUMN_DATA_TYPE' enum and the 'column_data_type' array in its respective order.
    */
    enum COLUMN_DATA_TYPE
    {
        INT,
        TEXT,
        BLOB,
        REAL
    };

    /**
     * Struct of table column information.
     * {
     *  string name   Name of the column.
     *  column_type   Data type of the column.
     *  is_key        Whether column is a key.
     *  is_null       Whether column is nullable.
     * }
    */
    struct table_column_info
    {
        std::string name;
        COLUMN_DATA_TYPE column_type;
        bool is_key;
        bool is_null;

        table_column_info(std::string_view name, const COLUMN_DATA_TYPE &column_type, const bool is_key = false, const bool is_null = true)
            : name(name), column_type(column_type), is_key(is_key), is_null(is_null)
        {
        }
    };

    int open_db(std::string_view db_name, sqlite3 **db);

    int exec_sql(sqlite3 *db, std::string_view sql, int (*callback)(void *, int, char **, char **) = NULL, void *callback_first_arg = NULL);

    int begin_transaction(sqlite3 *db);

    int commit_transaction(sqlite3 *db);

    int rollback_transaction(sqlite3 *db);

    int create_table(sqlite3 *db, std::string_view table_name, const std::vector<table_column_info> &column_info);

    int create_index(sqlite3 *db, std::string_view table_name, std::string_view column_names, const bool is_unique);

    bool is_table_exists(sqlite3 *db, std::string_view table_name);

    int close_db(sqlite3 **db);

    int initialize_local_db(sqlite3 *db);

    int bind_optional_text(sqlite3_stmt *stmt, const int idx, const std::optional<std::string> &value);

    int bind_optional_int64(sqlite3_stmt *stmt, const int idx, const std::optional<int64_t> &value);

    std::string get_text(sqlite3_stmt *stmt, const int idx);

    std::optional<std::string> get_optional_text(sqlite3_stmt *stmt, const int idx);

    std::optional<int64_t> get_optional_int64(sqlite3_stmt *stmt, const int idx);

} // namespace db::sqlite

#endif
