#ifndef _POSSYNC_REMOTE_API_CLIENT_
#define _POSSYNC_REMOTE_API_CLIENT_

#include "../pchheader.hpp"
#include "../db/db_common.hpp"

namespace remote
{
    /**
     * Batch of local sales uploaded in one request.
     * {
     *  device_id   Uploading device.
     *  since       Sales cursor of the device at the time of the upload.
     *  sales       Sales with their line items.
     * }
     */
    struct upload_batch
    {
        std::string device_id;
        uint64_t since = 0;
        std::vector<db::sale_record> sales;
    };

    struct download_data
    {
        std::vector<db::product_record> products;
        std::vector<db::stock_record> stock;
        uint64_t server_timestamp = 0; // Server clock at the time the delta was produced.
        bool has_more = false;         // Server holds more changes beyond this delta.
    };

    struct api_result
    {
        bool success = false;
        std::string message;
        int status_code = 0;
    };

    struct download_result
    {
        bool success = false;
        std::string message;
        int status_code = 0;
        std::optional<download_data> data;
    };

    /**
     * Remote sync api. Logical failures (rejections, non-2xx responses) are reported through the result.
     * Transport failures are thrown as exceptions.
     */
    class api_client
    {
    public:
        virtual api_result upload_changes(const upload_batch &batch) = 0;

        virtual download_result download_changes(std::string_view device_id, const uint64_t since) = 0;

        virtual ~api_client() {}
    };

} // namespace remote

#endif
