#ifndef _POSSYNC_MSG_SYNCMSG_COMMON_
#define _POSSYNC_MSG_SYNCMSG_COMMON_

#include "../pchheader.hpp"

namespace msg::syncmsg
{
    // Message fields.
    constexpr const char *FLD_SUCCESS = "success";
    constexpr const char *FLD_MESSAGE = "message";
    constexpr const char *FLD_DATA = "data";
    constexpr const char *FLD_DEVICE_ID = "deviceId";
    constexpr const char *FLD_LAST_SYNC_TIMESTAMP = "lastSyncTimestamp";
    constexpr const char *FLD_SALES = "sales";
    constexpr const char *FLD_PRODUCTS = "products";
    constexpr const char *FLD_STOCK = "stock";
    constexpr const char *FLD_SERVER_TIMESTAMP = "serverTimestamp";
    constexpr const char *FLD_HAS_MORE_DATA = "hasMoreData";

    // Record fields.
    constexpr const char *FLD_ID = "id";
    constexpr const char *FLD_INVOICE_NUMBER = "invoiceNumber";
    constexpr const char *FLD_TOTAL_AMOUNT = "totalAmount";
    constexpr const char *FLD_PAYMENT_METHOD = "paymentMethod";
    constexpr const char *FLD_CREATED_AT = "createdAt";
    constexpr const char *FLD_UPDATED_AT = "updatedAt";
    constexpr const char *FLD_ITEMS = "items";
    constexpr const char *FLD_SALE_ID = "saleId";
    constexpr const char *FLD_PRODUCT_ID = "productId";
    constexpr const char *FLD_QUANTITY = "quantity";
    constexpr const char *FLD_UNIT_PRICE = "unitPrice";
    constexpr const char *FLD_BATCH_NUMBER = "batchNumber";
    constexpr const char *FLD_NAME = "name";
    constexpr const char *FLD_BARCODE = "barcode";
    constexpr const char *FLD_CATEGORY = "category";
    constexpr const char *FLD_IS_ACTIVE = "isActive";
    constexpr const char *FLD_EXPIRY_DATE = "expiryDate";
    constexpr const char *FLD_PURCHASE_PRICE = "purchasePrice";
    constexpr const char *FLD_SELLING_PRICE = "sellingPrice";
    constexpr const char *FLD_LAST_UPDATED_AT = "lastUpdatedAt";

    // Api endpoints.
    constexpr const char *PATH_UPLOAD = "/api/sync/upload";
    constexpr const char *PATH_DOWNLOAD = "/api/sync/download";
    constexpr const char *QUERY_DEVICE_ID = "deviceId";
    constexpr const char *QUERY_SINCE = "since";

} // namespace msg::syncmsg

#endif
