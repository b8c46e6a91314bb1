#ifndef _POSSYNC_UTIL_UTIL_
#define _POSSYNC_UTIL_UTIL_

#include "../pchheader.hpp"

/**
 * Contains helper functions and data structures used by multiple other subsystems.
 */

#define MAX(a, b) ((a > b) ? a : b)
#define MIN(a, b) ((a < b) ? a : b)

namespace util
{
    constexpr uint64_t MS_PER_DAY = 24 * 60 * 60 * 1000ULL;

    /**
     * Components of an http base url such as "http://pos.example.com:8080/base".
     */
    struct http_url
    {
        std::string host;
        uint16_t port = 80;
        std::string target_prefix; // Path prefix without a trailing slash ("" when absent).
    };

    const std::string to_hex(const std::string_view bin);

    uint64_t get_epoch_milliseconds();

    void sleep(const uint64_t milliseconds);

    const std::string realpath(const std::string &path);

    void mask_signal();

    bool is_dir_exists(std::string_view path);

    bool is_file_exists(std::string_view path);

    int create_dir_tree_recursive(std::string_view path);

    void split_string(std::vector<std::string> &collection, std::string_view str, std::string_view delimeter);

    int stoull(const std::string &str, uint64_t &result);

    int read_from_fd(const int fd, std::string &buf, const off_t offset = 0);

    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len);

    int release_lock(const int fd, struct flock &lock);

    int parse_http_url(std::string_view url, http_url &result);

    const std::string url_encode(std::string_view str);

    int resolve_tcp_endpoints(std::vector<boost::asio::ip::tcp::endpoint> &endpoints, std::string_view host, const uint16_t port,
                              const uint32_t timeout_ms, boost::system::error_code &ec);

} // namespace util

#endif
