#ifndef _POSSYNC_REMOTE_HTTP_API_CLIENT_
#define _POSSYNC_REMOTE_HTTP_API_CLIENT_

#include "../pchheader.hpp"
#include "../util/util.hpp"
#include "api_client.hpp"

namespace remote
{
    /**
     * Sync api client talking json over plain http/1.1. Each call uses its own connection.
     */
    class http_api_client : public api_client
    {
    private:
        util::http_url server_url;
        uint32_t timeout_ms = 0;

        void send_request(const boost::beast::http::verb method, const std::string &target, const std::string &body,
                          int &status_code, std::string &response_body);

    public:
        int init(std::string_view base_url, const uint32_t timeout_ms);

        api_result upload_changes(const upload_batch &batch);

        download_result download_changes(std::string_view device_id, const uint64_t since);
    };

} // namespace remote

#endif
