#include "http_api_client.hpp"
#include "../msg/syncmsg_common.hpp"
#include "../msg/syncmsg_json.hpp"
#include "../util/util.hpp"
#include "../util/version.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace remote
{
    /**
     * @param base_url Server base url (http://host[:port][/prefix]).
     * @param timeout_ms Timeout applied to each network stage of a request.
     * @returns 0 on success. -1 if the url is invalid.
     */
    int http_api_client::init(std::string_view base_url, const uint32_t timeout_ms)
    {
        if (util::parse_http_url(base_url, server_url) == -1)
        {
            LOG_ERROR << "Invalid sync server url " << base_url;
            return -1;
        }

        this->timeout_ms = timeout_ms;
        return 0;
    }

    api_result http_api_client::upload_changes(const upload_batch &batch)
    {
        std::string body;
        msg::syncmsg::json::create_upload_request(body, batch);

        LOG_DEBUG << "Uploading " << batch.sales.size() << " sales to server.";

        int status_code = 0;
        std::string response_body;
        send_request(http::verb::post, server_url.target_prefix + msg::syncmsg::PATH_UPLOAD, body, status_code, response_body);

        api_result result;
        if (msg::syncmsg::json::parse_upload_response(result, status_code, response_body) == -1)
            LOG_WARNING << "Malformed upload response from server. Status " << status_code;
        return result;
    }

    download_result http_api_client::download_changes(std::string_view device_id, const uint64_t since)
    {
        const std::string target = server_url.target_prefix + msg::syncmsg::PATH_DOWNLOAD +
                                   "?" + msg::syncmsg::QUERY_DEVICE_ID + "=" + util::url_encode(device_id) +
                                   "&" + msg::syncmsg::QUERY_SINCE + "=" + std::to_string(since);

        LOG_DEBUG << "Downloading changes for device " << device_id << " since " << since;

        int status_code = 0;
        std::string response_body;
        send_request(http::verb::get, target, std::string(), status_code, response_body);

        download_result result;
        if (msg::syncmsg::json::parse_download_response(result, status_code, response_body) == -1)
            LOG_WARNING << "Malformed download response from server. Status " << status_code;
        return result;
    }

    /**
     * Performs one http request/response exchange. Network failures (resolve, connect, timeout, io) are thrown
     * as boost::system::system_error.
     */
    void http_api_client::send_request(const http::verb method, const std::string &target, const std::string &body,
                                       int &status_code, std::string &response_body)
    {
        const std::chrono::milliseconds timeout(timeout_ms);

        beast::error_code ec;
        std::vector<tcp::endpoint> endpoints;
        if (util::resolve_tcp_endpoints(endpoints, server_url.host, server_url.port, timeout_ms, ec) == -1)
            throw beast::system_error(ec);

        net::io_context ioc;
        beast::tcp_stream stream(ioc);

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, server_url.host);
        req.set(http::field::user_agent, std::string("possync/") + version::POSSYNC_VERSION);
        req.set(http::field::accept, "application/json");
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();

        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        // tcp_stream timeouts only apply to async operations. So the exchange is driven as an async chain
        // on a private io context.
        stream.expires_after(timeout);
        stream.async_connect(
            endpoints,
            [&](beast::error_code cec, tcp::endpoint) {
                if (cec)
                {
                    ec = cec;
                    return;
                }

                stream.expires_after(timeout);
                http::async_write(
                    stream, req,
                    [&](beast::error_code wec, size_t) {
                        if (wec)
                        {
                            ec = wec;
                            return;
                        }

                        stream.expires_after(timeout);
                        http::async_read(
                            stream, buffer, res,
                            [&](beast::error_code rdec, size_t) {
                                ec = rdec;
                            });
                    });
            });

        ioc.run();

        if (ec)
            throw beast::system_error(ec);

        status_code = res.result_int();
        response_body = std::move(res.body());

        beast::error_code shutdown_ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
    }

} // namespace remote
