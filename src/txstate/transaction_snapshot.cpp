#include "transaction_snapshot.hpp"

namespace txstate
{
    template <typename T>
    void insert_optional(jsoncons::ojson &d, const char *field, const std::optional<T> &value)
    {
        if (value)
            d.insert_or_assign(field, *value);
        else
            d.insert_or_assign(field, jsoncons::null_type());
    }

    template <typename T>
    void read_optional(std::optional<T> &out, const jsoncons::ojson &d, const char *field)
    {
        if (!d.contains(field) || d[field].is_null())
            out = std::nullopt;
        else
            out = d[field].as<T>();
    }

    /**
     * Serializes the snapshot into its persisted json form.
     */
    void to_json(std::string &out, const transaction_snapshot &snapshot)
    {
        jsoncons::ojson d;
        d.insert_or_assign("session_id", snapshot.session_id);
        d.insert_or_assign("user_id", snapshot.user_id);
        d.insert_or_assign("device_id", snapshot.device_id);
        d.insert_or_assign("shop_id", snapshot.shop_id);
        insert_optional(d, "customer_ref", snapshot.customer_ref);

        jsoncons::ojson items(jsoncons::json_array_arg);
        for (const snapshot_line_item &item : snapshot.line_items)
        {
            jsoncons::ojson i;
            i.insert_or_assign("product_id", item.product_id);
            i.insert_or_assign("product_name", item.product_name);
            insert_optional(i, "barcode", item.barcode);
            i.insert_or_assign("quantity", item.quantity);
            i.insert_or_assign("unit_price", item.unit_price);
            i.insert_or_assign("discount_amount", item.discount_amount);
            i.insert_or_assign("tax_amount", item.tax_amount);
            i.insert_or_assign("line_total", item.line_total);
            insert_optional(i, "batch_number", item.batch_number);
            items.push_back(std::move(i));
        }
        d.insert_or_assign("line_items", std::move(items));

        d.insert_or_assign("payment_method", snapshot.payment_method);
        insert_optional(d, "amount_tendered", snapshot.amount_tendered);
        insert_optional(d, "change_due", snapshot.change_due);
        d.insert_or_assign("subtotal", snapshot.subtotal);
        d.insert_or_assign("discount_total", snapshot.discount_total);
        d.insert_or_assign("tax_total", snapshot.tax_total);
        d.insert_or_assign("grand_total", snapshot.grand_total);

        jsoncons::ojson discounts(jsoncons::json_array_arg);
        for (const applied_discount &discount : snapshot.applied_discounts)
        {
            jsoncons::ojson a;
            a.insert_or_assign("name", discount.name);
            a.insert_or_assign("amount", discount.amount);
            a.insert_or_assign("percentage", discount.percentage);
            a.insert_or_assign("type", discount.type);
            a.insert_or_assign("auto_applied", discount.auto_applied);
            discounts.push_back(std::move(a));
        }
        d.insert_or_assign("applied_discounts", std::move(discounts));

        d.insert_or_assign("created_at", snapshot.created_at);
        d.insert_or_assign("last_saved_at", snapshot.last_saved_at);
        d.insert_or_assign("completed", snapshot.completed);
        d.insert_or_assign("auto_saved", snapshot.auto_saved);
        insert_optional(d, "notes", snapshot.notes);

        d.dump(out);
    }

    /**
     * Deserializes a persisted snapshot.
     * @returns 0 on success. -1 if the json is malformed or required fields are missing.
     */
    int from_json(transaction_snapshot &snapshot, std::string_view json)
    {
        try
        {
            const jsoncons::ojson d = jsoncons::ojson::parse(json, jsoncons::strict_json_parsing());

            snapshot.session_id = d["session_id"].as<std::string>();
            snapshot.user_id = d["user_id"].as<std::string>();
            snapshot.device_id = d["device_id"].as<std::string>();
            snapshot.shop_id = d["shop_id"].as<std::string>();
            read_optional(snapshot.customer_ref, d, "customer_ref");

            snapshot.line_items.clear();
            for (const auto &i : d["line_items"].array_range())
            {
                snapshot_line_item item;
                item.product_id = i["product_id"].as<std::string>();
                item.product_name = i["product_name"].as<std::string>();
                read_optional(item.barcode, i, "barcode");
                item.quantity = i["quantity"].as<int32_t>();
                item.unit_price = i["unit_price"].as<int64_t>();
                item.discount_amount = i["discount_amount"].as<int64_t>();
                item.tax_amount = i["tax_amount"].as<int64_t>();
                item.line_total = i["line_total"].as<int64_t>();
                read_optional(item.batch_number, i, "batch_number");
                snapshot.line_items.push_back(std::move(item));
            }

            snapshot.payment_method = d["payment_method"].as<std::string>();
            read_optional(snapshot.amount_tendered, d, "amount_tendered");
            read_optional(snapshot.change_due, d, "change_due");
            snapshot.subtotal = d["subtotal"].as<int64_t>();
            snapshot.discount_total = d["discount_total"].as<int64_t>();
            snapshot.tax_total = d["tax_total"].as<int64_t>();
            snapshot.grand_total = d["grand_total"].as<int64_t>();

            snapshot.applied_discounts.clear();
            if (d.contains("applied_discounts"))
            {
                for (const auto &a : d["applied_discounts"].array_range())
                {
                    applied_discount discount;
                    discount.name = a["name"].as<std::string>();
                    discount.amount = a["amount"].as<int64_t>();
                    discount.percentage = a["percentage"].as<double>();
                    discount.type = a["type"].as<std::string>();
                    discount.auto_applied = a["auto_applied"].as<bool>();
                    snapshot.applied_discounts.push_back(std::move(discount));
                }
            }

            snapshot.created_at = d["created_at"].as<uint64_t>();
            snapshot.last_saved_at = d["last_saved_at"].as<uint64_t>();
            snapshot.completed = d["completed"].as<bool>();
            snapshot.auto_saved = d["auto_saved"].as<bool>();
            read_optional(snapshot.notes, d, "notes");
        }
        catch (const std::exception &e)
        {
            LOG_DEBUG << "Transaction snapshot json parsing failed. " << e.what();
            return -1;
        }

        return 0;
    }

} // namespace txstate
