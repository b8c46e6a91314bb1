#ifndef _POSSYNC_DB_DB_COMMON_
#define _POSSYNC_DB_DB_COMMON_

#include "../pchheader.hpp"

namespace db
{
    // Sync state of a locally stored syncable record. Values are persisted.
    enum SYNC_STATUS
    {
        NOT_SYNCED = 0,
        SYNCED = 1,
        SYNC_FAILED = 2
    };

    // Entity kinds that carry a sync cursor.
    constexpr const char *CURSOR_SALES = "sales";
    constexpr const char *CURSOR_PRODUCTS = "products";
    constexpr const char *CURSOR_STOCK = "stock";
    constexpr const char *CURSOR_ALL = "all";

    struct sale_item
    {
        std::string id;
        std::string sale_id;
        std::string product_id;
        int32_t quantity = 0;
        int64_t unit_price = 0; // Cents.
        std::optional<std::string> batch_number;
    };

    struct sale_record
    {
        std::string id;
        std::string invoice_number;
        int64_t total_amount = 0; // Cents.
        std::string payment_method;
        uint64_t created_at = 0;
        std::string device_id;
        std::vector<sale_item> items;
        SYNC_STATUS sync_status = SYNC_STATUS::NOT_SYNCED;
        uint64_t server_synced_at = 0; // 0 when never synced.
    };

    struct product_record
    {
        std::string id;
        std::string name;
        std::optional<std::string> barcode;
        std::optional<std::string> category;
        int64_t unit_price = 0; // Cents.
        bool is_active = true;
        uint64_t created_at = 0;
        uint64_t updated_at = 0;
        std::string device_id;
        std::optional<std::string> batch_number;
        std::optional<uint64_t> expiry_date;
        std::optional<int64_t> purchase_price;
        std::optional<int64_t> selling_price;
        SYNC_STATUS sync_status = SYNC_STATUS::NOT_SYNCED;
        uint64_t server_synced_at = 0;

        bool operator==(const product_record &other) const
        {
            return id == other.id && name == other.name && barcode == other.barcode && category == other.category &&
                   unit_price == other.unit_price && is_active == other.is_active && created_at == other.created_at &&
                   updated_at == other.updated_at && device_id == other.device_id && batch_number == other.batch_number &&
                   expiry_date == other.expiry_date && purchase_price == other.purchase_price &&
                   selling_price == other.selling_price && sync_status == other.sync_status &&
                   server_synced_at == other.server_synced_at;
        }
    };

    struct stock_record
    {
        std::string id;
        std::string product_id;
        int32_t quantity = 0;
        uint64_t last_updated_at = 0;
        SYNC_STATUS sync_status = SYNC_STATUS::NOT_SYNCED;
        uint64_t server_synced_at = 0;

        bool operator==(const stock_record &other) const
        {
            return id == other.id && product_id == other.product_id && quantity == other.quantity &&
                   last_updated_at == other.last_updated_at && sync_status == other.sync_status &&
                   server_synced_at == other.server_synced_at;
        }
    };

    /**
     * One application process lifetime. A record with no end time and no clean shutdown
     * belongs to either the running process or a process that died.
     */
    struct app_session_record
    {
        std::string session_id;
        std::string user_id;
        std::string device_id;
        uint64_t started_at = 0;
        std::optional<uint64_t> ended_at;
        bool clean_shutdown = false;
        std::optional<std::string> crash_reason;
        std::string app_version;
        std::string platform;
    };

    enum SNAPSHOT_STATE
    {
        ACTIVE = 0,
        COMPLETED = 1,
        CANCELLED = 2
    };

    // Persisted transaction snapshot row. 'data' holds the serialized snapshot and is
    // empty once the payload has been purged.
    struct snapshot_row
    {
        std::string session_id;
        std::string user_id;
        std::string device_id;
        SNAPSHOT_STATE state = SNAPSHOT_STATE::ACTIVE;
        std::string data;
        uint64_t created_at = 0;
        uint64_t last_modified = 0;
    };

    enum RECOVERY_ACTION
    {
        RESTORED = 0,
        DISCARDED = 1
    };

    struct recovery_log_record
    {
        std::string work_item_id;
        std::string session_id;
        RECOVERY_ACTION action = RECOVERY_ACTION::RESTORED;
        uint64_t recorded_at = 0;
    };

} // namespace db

#endif
