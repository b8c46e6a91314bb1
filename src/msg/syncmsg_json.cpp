#include "../pchheader.hpp"
#include "syncmsg_common.hpp"
#include "syncmsg_json.hpp"

namespace msg::syncmsg::json
{
    bool is_absent(const jsoncons::ojson &d, const char *field)
    {
        return !d.contains(field) || d[field].is_null();
    }

    int read_text(std::string &out, const jsoncons::ojson &d, const char *field)
    {
        if (!d.contains(field) || !d[field].is<std::string>())
        {
            LOG_DEBUG << "Sync message field '" << field << "' missing or invalid.";
            return -1;
        }
        out = d[field].as<std::string>();
        return 0;
    }

    int read_optional_text(std::optional<std::string> &out, const jsoncons::ojson &d, const char *field)
    {
        if (is_absent(d, field))
        {
            out = std::nullopt;
            return 0;
        }
        if (!d[field].is<std::string>())
        {
            LOG_DEBUG << "Sync message field '" << field << "' invalid.";
            return -1;
        }
        out = d[field].as<std::string>();
        return 0;
    }

    template <typename T>
    int read_number(T &out, const jsoncons::ojson &d, const char *field)
    {
        if (!d.contains(field) || !d[field].is<T>())
        {
            LOG_DEBUG << "Sync message field '" << field << "' missing or invalid.";
            return -1;
        }
        out = d[field].as<T>();
        return 0;
    }

    template <typename T>
    int read_optional_number(std::optional<T> &out, const jsoncons::ojson &d, const char *field)
    {
        if (is_absent(d, field))
        {
            out = std::nullopt;
            return 0;
        }
        if (!d[field].is<T>())
        {
            LOG_DEBUG << "Sync message field '" << field << "' invalid.";
            return -1;
        }
        out = d[field].as<T>();
        return 0;
    }

    template <typename T>
    void insert_optional(jsoncons::ojson &d, const char *field, const std::optional<T> &value)
    {
        if (value)
            d.insert_or_assign(field, *value);
        else
            d.insert_or_assign(field, jsoncons::null_type());
    }

    /**
     * Constructs the sales upload request body.
     * @param msg String to construct the json into.
     *            Message format:
     *            {
     *              "deviceId": "<device id>",
     *              "lastSyncTimestamp": <sales cursor in epoch millis>,
     *              "sales": [
     *                {
     *                  "id": "<sale id>", "invoiceNumber": "...", "totalAmount": <cents>,
     *                  "paymentMethod": "...", "createdAt": <epoch millis>, "deviceId": "...",
     *                  "items": [{"id", "saleId", "productId", "quantity", "unitPrice", "batchNumber"}, ...]
     *                }, ...
     *              ]
     *            }
     * @param batch The batch to serialize.
     */
    void create_upload_request(std::string &msg, const remote::upload_batch &batch)
    {
        jsoncons::ojson d;
        d.insert_or_assign(FLD_DEVICE_ID, batch.device_id);
        d.insert_or_assign(FLD_LAST_SYNC_TIMESTAMP, batch.since);

        jsoncons::ojson sales(jsoncons::json_array_arg);
        for (const db::sale_record &sale : batch.sales)
        {
            jsoncons::ojson s;
            s.insert_or_assign(FLD_ID, sale.id);
            s.insert_or_assign(FLD_INVOICE_NUMBER, sale.invoice_number);
            s.insert_or_assign(FLD_TOTAL_AMOUNT, sale.total_amount);
            s.insert_or_assign(FLD_PAYMENT_METHOD, sale.payment_method);
            s.insert_or_assign(FLD_CREATED_AT, sale.created_at);
            s.insert_or_assign(FLD_DEVICE_ID, sale.device_id);

            jsoncons::ojson items(jsoncons::json_array_arg);
            for (const db::sale_item &item : sale.items)
            {
                jsoncons::ojson i;
                i.insert_or_assign(FLD_ID, item.id);
                i.insert_or_assign(FLD_SALE_ID, sale.id);
                i.insert_or_assign(FLD_PRODUCT_ID, item.product_id);
                i.insert_or_assign(FLD_QUANTITY, item.quantity);
                i.insert_or_assign(FLD_UNIT_PRICE, item.unit_price);
                insert_optional(i, FLD_BATCH_NUMBER, item.batch_number);
                items.push_back(std::move(i));
            }
            s.insert_or_assign(FLD_ITEMS, std::move(items));

            sales.push_back(std::move(s));
        }
        d.insert_or_assign(FLD_SALES, std::move(sales));

        d.dump(msg);
    }

    /**
     * Parses the common response envelope {"success": <bool>, "message": "<text>", "data": ...}.
     * Success is only reported when both the http status and the envelope indicate success.
     * @returns 0 if the envelope was parsed. -1 if the body is malformed.
     */
    int parse_envelope(bool &success, std::string &message, jsoncons::ojson &d, const int status_code, std::string_view body)
    {
        const bool is_ok_status = status_code >= 200 && status_code < 300;
        const std::string status_message = "Server responded with status " + std::to_string(status_code);
        success = false;
        message.clear();

        try
        {
            d = jsoncons::ojson::parse(body, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            LOG_DEBUG << "Sync response json parsing failed. " << e.what();
            message = is_ok_status ? "Invalid response from server" : status_message;
            return -1;
        }

        if (!d.is_object() || !d.contains(FLD_SUCCESS) || !d[FLD_SUCCESS].is<bool>())
        {
            LOG_DEBUG << "Sync response 'success' missing or invalid.";
            message = is_ok_status ? "Invalid response from server" : status_message;
            return -1;
        }

        if (d.contains(FLD_MESSAGE) && d[FLD_MESSAGE].is<std::string>())
            message = d[FLD_MESSAGE].as<std::string>();

        success = is_ok_status && d[FLD_SUCCESS].as<bool>();
        if (!is_ok_status && message.empty())
            message = status_message;

        return 0;
    }

    /**
     * Parses the upload response.
     * @returns 0 if the response was well formed. -1 otherwise. The result is populated in both cases.
     */
    int parse_upload_response(remote::api_result &result, const int status_code, std::string_view body)
    {
        result.status_code = status_code;
        jsoncons::ojson d;
        return parse_envelope(result.success, result.message, d, status_code, body);
    }

    /**
     * Parses the download response.
     * @param body Response body.
     *             Accepted format:
     *             {
     *               "success": true,
     *               "message": "...",
     *               "data": {
     *                 "serverTimestamp": <epoch millis>,
     *                 "products": [<product>, ...],
     *                 "stock": [<stock>, ...],
     *                 "hasMoreData": <bool>
     *               }
     *             }
     * @returns 0 if the response was well formed. -1 otherwise. The result is populated in both cases.
     */
    int parse_download_response(remote::download_result &result, const int status_code, std::string_view body)
    {
        result.status_code = status_code;
        result.data.reset();

        jsoncons::ojson d;
        if (parse_envelope(result.success, result.message, d, status_code, body) == -1)
            return -1;

        if (!result.success)
            return 0;

        remote::download_data data;
        const bool data_valid = d.contains(FLD_DATA) && d[FLD_DATA].is_object() &&
                                read_number(data.server_timestamp, d[FLD_DATA], FLD_SERVER_TIMESTAMP) == 0 &&
                                (is_absent(d[FLD_DATA], FLD_PRODUCTS) || d[FLD_DATA][FLD_PRODUCTS].is_array()) &&
                                (is_absent(d[FLD_DATA], FLD_STOCK) || d[FLD_DATA][FLD_STOCK].is_array());
        if (!data_valid)
        {
            LOG_DEBUG << "Download response 'data' missing or invalid.";
            result.success = false;
            result.message = "Invalid download response from server";
            return -1;
        }

        const jsoncons::ojson &jdata = d[FLD_DATA];
        if (!is_absent(jdata, FLD_PRODUCTS))
        {
            for (const auto &p : jdata[FLD_PRODUCTS].array_range())
            {
                db::product_record product;
                if (extract_product(product, p) == -1)
                {
                    result.success = false;
                    result.message = "Invalid product in download response";
                    return -1;
                }
                data.products.push_back(std::move(product));
            }
        }

        if (!is_absent(jdata, FLD_STOCK))
        {
            for (const auto &s : jdata[FLD_STOCK].array_range())
            {
                db::stock_record stock;
                if (extract_stock(stock, s) == -1)
                {
                    result.success = false;
                    result.message = "Invalid stock in download response";
                    return -1;
                }
                data.stock.push_back(std::move(stock));
            }
        }

        data.has_more = jdata.contains(FLD_HAS_MORE_DATA) && jdata[FLD_HAS_MORE_DATA].is<bool>() && jdata[FLD_HAS_MORE_DATA].as<bool>();
        result.data = std::move(data);
        return 0;
    }

    /**
     * Extracts a product record from its json representation. Sync fields are left at their defaults.
     * @returns 0 on successful extraction. -1 on failure.
     */
    int extract_product(db::product_record &product, const jsoncons::ojson &d)
    {
        if (!d.is_object())
            return -1;

        if (read_text(product.id, d, FLD_ID) == -1 ||
            read_text(product.name, d, FLD_NAME) == -1 ||
            read_optional_text(product.barcode, d, FLD_BARCODE) == -1 ||
            read_optional_text(product.category, d, FLD_CATEGORY) == -1 ||
            read_number(product.unit_price, d, FLD_UNIT_PRICE) == -1 ||
            read_number(product.is_active, d, FLD_IS_ACTIVE) == -1 ||
            read_number(product.created_at, d, FLD_CREATED_AT) == -1 ||
            read_number(product.updated_at, d, FLD_UPDATED_AT) == -1 ||
            read_optional_text(product.batch_number, d, FLD_BATCH_NUMBER) == -1 ||
            read_optional_number(product.expiry_date, d, FLD_EXPIRY_DATE) == -1 ||
            read_optional_number(product.purchase_price, d, FLD_PURCHASE_PRICE) == -1 ||
            read_optional_number(product.selling_price, d, FLD_SELLING_PRICE) == -1)
            return -1;

        // Device id is informational only. Server originated products may not carry one.
        if (!is_absent(d, FLD_DEVICE_ID) && read_text(product.device_id, d, FLD_DEVICE_ID) == -1)
            return -1;

        return 0;
    }

    /**
     * Extracts a stock record from its json representation. Sync fields are left at their defaults.
     * @returns 0 on successful extraction. -1 on failure.
     */
    int extract_stock(db::stock_record &stock, const jsoncons::ojson &d)
    {
        if (!d.is_object())
            return -1;

        if (read_text(stock.id, d, FLD_ID) == -1 ||
            read_text(stock.product_id, d, FLD_PRODUCT_ID) == -1 ||
            read_number(stock.quantity, d, FLD_QUANTITY) == -1 ||
            read_number(stock.last_updated_at, d, FLD_LAST_UPDATED_AT) == -1)
            return -1;

        return 0;
    }

    void populate_product_json(jsoncons::ojson &d, const db::product_record &product)
    {
        d.insert_or_assign(FLD_ID, product.id);
        d.insert_or_assign(FLD_NAME, product.name);
        insert_optional(d, FLD_BARCODE, product.barcode);
        insert_optional(d, FLD_CATEGORY, product.category);
        d.insert_or_assign(FLD_UNIT_PRICE, product.unit_price);
        d.insert_or_assign(FLD_IS_ACTIVE, product.is_active);
        d.insert_or_assign(FLD_CREATED_AT, product.created_at);
        d.insert_or_assign(FLD_UPDATED_AT, product.updated_at);
        d.insert_or_assign(FLD_DEVICE_ID, product.device_id);
        insert_optional(d, FLD_BATCH_NUMBER, product.batch_number);
        insert_optional(d, FLD_EXPIRY_DATE, product.expiry_date);
        insert_optional(d, FLD_PURCHASE_PRICE, product.purchase_price);
        insert_optional(d, FLD_SELLING_PRICE, product.selling_price);
    }

    void populate_stock_json(jsoncons::ojson &d, const db::stock_record &stock)
    {
        d.insert_or_assign(FLD_ID, stock.id);
        d.insert_or_assign(FLD_PRODUCT_ID, stock.product_id);
        d.insert_or_assign(FLD_QUANTITY, stock.quantity);
        d.insert_or_assign(FLD_LAST_UPDATED_AT, stock.last_updated_at);
    }

} // namespace msg::syncmsg::json
