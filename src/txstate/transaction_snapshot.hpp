#ifndef _POSSYNC_TXSTATE_TRANSACTION_SNAPSHOT_
#define _POSSYNC_TXSTATE_TRANSACTION_SNAPSHOT_

#include "../pchheader.hpp"

namespace txstate
{
    // All money amounts are in cents.

    struct snapshot_line_item
    {
        std::string product_id;
        std::string product_name;
        std::optional<std::string> barcode;
        int32_t quantity = 0;
        int64_t unit_price = 0;
        int64_t discount_amount = 0;
        int64_t tax_amount = 0;
        int64_t line_total = 0;
        std::optional<std::string> batch_number;
    };

    struct applied_discount
    {
        std::string name;
        int64_t amount = 0;
        double percentage = 0;
        std::string type;
        bool auto_applied = false;
    };

    /**
     * Checkpoint of one in-flight sale transaction.
     */
    struct transaction_snapshot
    {
        std::string session_id;
        std::string user_id;
        std::string device_id;
        std::string shop_id;
        std::optional<std::string> customer_ref;
        std::vector<snapshot_line_item> line_items;
        std::string payment_method;
        std::optional<int64_t> amount_tendered;
        std::optional<int64_t> change_due;
        int64_t subtotal = 0;
        int64_t discount_total = 0;
        int64_t tax_total = 0;
        int64_t grand_total = 0;
        std::vector<applied_discount> applied_discounts;
        uint64_t created_at = 0;
        uint64_t last_saved_at = 0;
        bool completed = false;
        bool auto_saved = false;
        std::optional<std::string> notes;
    };

    void to_json(std::string &out, const transaction_snapshot &snapshot);

    int from_json(transaction_snapshot &snapshot, std::string_view json);

} // namespace txstate

#endif
