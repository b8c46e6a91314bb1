/**
 * @file test_syncmsg.cpp
 * @brief Unit tests for the sync api json codec
 */

#include <gtest/gtest.h>
#include "msg/syncmsg_json.hpp"
#include "test_common.hpp"

namespace jsonmsg = msg::syncmsg::json;
using namespace possync_test;

// ============================================================================
// Upload Tests
// ============================================================================

TEST(UploadRequestTest, CarriesDeviceCursorAndSales) {
    remote::upload_batch batch;
    batch.device_id = "device-1";
    batch.since = 1700000000000;
    batch.sales.push_back(make_sale("s-1", 1700000000500, 2599));

    std::string body;
    jsonmsg::create_upload_request(body, batch);

    const jsoncons::ojson d = jsoncons::ojson::parse(body);
    EXPECT_EQ(d["deviceId"].as<std::string>(), "device-1");
    EXPECT_EQ(d["lastSyncTimestamp"].as<uint64_t>(), 1700000000000u);
    ASSERT_EQ(d["sales"].size(), 1u);

    const jsoncons::ojson &sale = d["sales"][0];
    EXPECT_EQ(sale["id"].as<std::string>(), "s-1");
    EXPECT_EQ(sale["invoiceNumber"].as<std::string>(), "INV-s-1");
    EXPECT_EQ(sale["totalAmount"].as<int64_t>(), 2599);
    ASSERT_EQ(sale["items"].size(), 1u);
    EXPECT_EQ(sale["items"][0]["saleId"].as<std::string>(), "s-1");
    EXPECT_TRUE(sale["items"][0]["batchNumber"].is_null());
}

TEST(UploadResponseTest, SuccessNeedsStatusAndEnvelope) {
    remote::api_result result;

    EXPECT_EQ(jsonmsg::parse_upload_response(result, 200, R"({"success":true,"message":"ok"})"), 0);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "ok");

    EXPECT_EQ(jsonmsg::parse_upload_response(result, 200, R"({"success":false,"message":"Duplicate invoice"})"), 0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Duplicate invoice");

    EXPECT_EQ(jsonmsg::parse_upload_response(result, 500, R"({"success":true})"), 0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server responded with status 500");
    EXPECT_EQ(result.status_code, 500);
}

TEST(UploadResponseTest, MalformedBody) {
    remote::api_result result;

    EXPECT_EQ(jsonmsg::parse_upload_response(result, 200, "<html>"), -1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invalid response from server");

    EXPECT_EQ(jsonmsg::parse_upload_response(result, 502, "Bad gateway"), -1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Server responded with status 502");
}

// ============================================================================
// Download Tests
// ============================================================================

class DownloadResponseTest : public ::testing::Test {
protected:
    std::string make_body(const std::vector<db::product_record> &products, const std::vector<db::stock_record> &stock,
                          const uint64_t server_timestamp, const bool has_more) {
        jsoncons::ojson jproducts(jsoncons::json_array_arg);
        for (const db::product_record &p : products) {
            jsoncons::ojson jp;
            jsonmsg::populate_product_json(jp, p);
            jproducts.push_back(std::move(jp));
        }

        jsoncons::ojson jstock(jsoncons::json_array_arg);
        for (const db::stock_record &s : stock) {
            jsoncons::ojson js;
            jsonmsg::populate_stock_json(js, s);
            jstock.push_back(std::move(js));
        }

        jsoncons::ojson data;
        data.insert_or_assign("serverTimestamp", server_timestamp);
        data.insert_or_assign("products", std::move(jproducts));
        data.insert_or_assign("stock", std::move(jstock));
        data.insert_or_assign("hasMoreData", has_more);

        jsoncons::ojson d;
        d.insert_or_assign("success", true);
        d.insert_or_assign("data", std::move(data));

        std::string body;
        d.dump(body);
        return body;
    }
};

TEST_F(DownloadResponseTest, ProductsAndStock) {
    db::product_record product = make_product("p-1", "Rice 5kg", 1250);
    product.barcode = "4791234567890";
    product.expiry_date = 1800000000000;
    product.selling_price = 1300;

    const std::string body = make_body({product}, {make_stock("st-1", "p-1", 42)}, 1700000009999, true);

    remote::download_result result;
    ASSERT_EQ(jsonmsg::parse_download_response(result, 200, body), 0);
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.data.has_value());
    EXPECT_EQ(result.data->server_timestamp, 1700000009999u);
    EXPECT_TRUE(result.data->has_more);

    ASSERT_EQ(result.data->products.size(), 1u);
    EXPECT_EQ(result.data->products[0], product);
    EXPECT_FALSE(result.data->products[0].category.has_value());

    ASSERT_EQ(result.data->stock.size(), 1u);
    EXPECT_EQ(result.data->stock[0].product_id, "p-1");
    EXPECT_EQ(result.data->stock[0].quantity, 42);
}

TEST_F(DownloadResponseTest, ProductWithoutDeviceId) {
    const std::string body = R"({"success":true,"data":{"serverTimestamp":5,"products":[
        {"id":"p-9","name":"Tea","unitPrice":300,"isActive":true,"createdAt":1,"updatedAt":2}]}})";

    remote::download_result result;
    ASSERT_EQ(jsonmsg::parse_download_response(result, 200, body), 0);
    ASSERT_TRUE(result.data.has_value());
    ASSERT_EQ(result.data->products.size(), 1u);
    EXPECT_EQ(result.data->products[0].device_id, "");
    EXPECT_TRUE(result.data->stock.empty());
    EXPECT_FALSE(result.data->has_more);
}

TEST_F(DownloadResponseTest, MissingServerTimestamp) {
    remote::download_result result;
    EXPECT_EQ(jsonmsg::parse_download_response(result, 200, R"({"success":true,"data":{"products":[]}})"), -1);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Invalid download response from server");
    EXPECT_FALSE(result.data.has_value());
}

TEST_F(DownloadResponseTest, InvalidRecords) {
    remote::download_result result;

    EXPECT_EQ(jsonmsg::parse_download_response(result, 200,
        R"({"success":true,"data":{"serverTimestamp":5,"products":[{"id":"p-1","name":"Tea"}]}})"), -1);
    EXPECT_EQ(result.message, "Invalid product in download response");

    EXPECT_EQ(jsonmsg::parse_download_response(result, 200,
        R"({"success":true,"data":{"serverTimestamp":5,"stock":[{"id":"st-1","quantity":"ten"}]}})"), -1);
    EXPECT_EQ(result.message, "Invalid stock in download response");
    EXPECT_FALSE(result.success);
}

TEST_F(DownloadResponseTest, RejectedDownloadCarriesNoData) {
    remote::download_result result;
    EXPECT_EQ(jsonmsg::parse_download_response(result, 401, R"({"success":false,"message":"Unknown device"})"), 0);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown device");
    EXPECT_FALSE(result.data.has_value());
}
