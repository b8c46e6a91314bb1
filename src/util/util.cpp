#include "../pchheader.hpp"
#include "util.hpp"

namespace util
{
    constexpr mode_t DIR_PERMS = 0755;
    constexpr const char *HTTP_SCHEME = "http://";

    const std::string to_hex(const std::string_view bin)
    {
        // Allocate the target string.
        std::string encoded_string;
        encoded_string.resize(bin.size() * 2);

        // Get encoded string.
        sodium_bin2hex(
            encoded_string.data(),
            encoded_string.length() + 1, // + 1 because sodium writes ending '\0' character as well.
            reinterpret_cast<const unsigned char *>(bin.data()),
            bin.size());
        return encoded_string;
    }

    /**
     * Returns current time in UNIX epoch milliseconds.
     */
    uint64_t get_epoch_milliseconds()
    {
        return std::chrono::duration_cast<std::chrono::duration<std::uint64_t, std::milli>>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    /**
     * Sleeps the current thread for specified no. of milliseconds.
     */
    void sleep(const uint64_t milliseconds)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
    }

    // Provide a safe std::string overload for realpath
    const std::string realpath(const std::string &path)
    {
        std::array<char, PATH_MAX> buffer;
        if (!::realpath(path.c_str(), buffer.data()))
            return {};

        buffer[PATH_MAX - 1] = '\0';
        return buffer.data();
    }

    // Applies signal mask to the calling thread.
    void mask_signal()
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    /**
     * Check whether given directory exists.
     * @param path Directory path.
     * @return Returns true if given directory exists otherwise false.
     */
    bool is_dir_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISDIR(st.st_mode));
    }

    /**
     * Check whether given file exists.
     * @param path File path.
     * @return Returns true if give file exists otherwise false.
     */
    bool is_file_exists(std::string_view path)
    {
        struct stat st;
        return (stat(path.data(), &st) == 0 && S_ISREG(st.st_mode));
    }

    /**
     * Recursively creates directories and sub-directories if not exist.
     * @param path Directory path.
     * @return Returns 0 operations succeeded otherwise -1.
     */
    int create_dir_tree_recursive(std::string_view path)
    {
        if (strcmp(path.data(), "/") == 0) // No need of checking if we are at root.
            return 0;

        struct stat st;
        if (stat(path.data(), &st) != 0 || !S_ISDIR(st.st_mode))
        {
            // Check and create parent dir tree first.
            char *path2 = strdup(path.data());
            char *parent_dir_path = dirname(path2);
            bool error_thrown = false;

            if (create_dir_tree_recursive(parent_dir_path) == -1)
                error_thrown = true;

            free(path2);

            if (!error_thrown && mkdir(path.data(), DIR_PERMS) == -1)
            {
                LOG_ERROR << errno << ": Error in recursive dir creation. " << path;
                error_thrown = true;
            }

            if (error_thrown)
                return -1;
        }

        return 0;
    }

    void split_string(std::vector<std::string> &collection, std::string_view str, std::string_view delimeter)
    {
        if (str.empty())
            return;

        size_t start = 0;
        size_t end = str.find(delimeter);

        while (end != std::string::npos)
        {
            // Do not add empty strings.
            if (start != end)
                collection.push_back(std::string(str.substr(start, end - start)));
            start = end + delimeter.length();
            end = str.find(delimeter, start);
        }

        // If there are any leftover from the source string add the remaining.
        if (start < str.size())
            collection.push_back(std::string(str.substr(start)));
    }

    /**
     * Converts given string to a uint_64. A wrapper function for std::stoull.
     * @param str String variable.
     * @param result Variable to store the answer from the conversion.
     * @return Returns 0 in a successful conversion and -1 on error.
     */
    int stoull(const std::string &str, uint64_t &result)
    {
        try
        {
            result = std::stoull(str);
        }
        catch (const std::exception &e)
        {
            return -1;
        }
        return 0;
    }

    /**
     * Reads the entire file from given file discriptor.
     * @param fd File descriptor to be read.
     * @param buf String buffer to be populated.
     * @param offset Begin offset of the file to read.
     * @return Returns number of bytes read in a successful read and -1 on error.
     */
    int read_from_fd(const int fd, std::string &buf, const off_t offset)
    {
        struct stat st;
        if (fstat(fd, &st) == -1)
        {
            LOG_ERROR << errno << ": Error in stat for reading entire file.";
            return -1;
        }

        buf.resize(st.st_size - offset);

        return pread(fd, buf.data(), buf.size(), offset);
    }

    /**
     * Create a record lock for the file descriptor. Lock is associated with the process (Not for forked child processes).
     * @param fd File descriptor to be locked.
     * @param lock File lock.
     * @param is_rwlock Whether the record lock is a write lock.
     * @param start Starting offset for the lock.
     * @param len Number of bytes to lock.
     * @return Returns 0 if lock is successfully acquired, -1 on error.
     */
    int set_lock(const int fd, struct flock &lock, const bool is_rwlock, const off_t start, const off_t len)
    {
        lock.l_type = is_rwlock ? F_WRLCK : F_RDLCK;
        lock.l_whence = SEEK_SET;
        lock.l_start = start,
        lock.l_len = len;
        return fcntl(fd, F_SETLK, &lock);
    }

    /**
     * Releases the lock on file descriptor.
     * @param fd File descriptor to be released.
     * @param lock File lock.
     * @return Returns 0 if lock is successfully released, -1 on error.
     */
    int release_lock(const int fd, struct flock &lock)
    {
        lock.l_type = F_UNLCK;
        return fcntl(fd, F_SETLKW, &lock);
    }

    /**
     * Splits a plain http base url into host, port and path prefix.
     * @param url Url in the form http://host[:port][/prefix].
     * @param result Url components to populate.
     * @return 0 on success. -1 if the url is not a valid http url.
     */
    int parse_http_url(std::string_view url, http_url &result)
    {
        const std::string_view scheme(HTTP_SCHEME);
        if (url.substr(0, scheme.size()) != scheme)
        {
            LOG_ERROR << "Only http:// server urls are supported. " << url;
            return -1;
        }

        std::string_view rest = url.substr(scheme.size());
        const size_t path_pos = rest.find('/');
        std::string_view authority = rest.substr(0, path_pos);
        std::string_view path = (path_pos == std::string_view::npos) ? std::string_view() : rest.substr(path_pos);

        // Trailing slashes are dropped so targets can be appended as "/api/...".
        while (!path.empty() && path.back() == '/')
            path.remove_suffix(1);

        const size_t colon_pos = authority.rfind(':');
        if (colon_pos != std::string_view::npos)
        {
            uint64_t port = 0;
            if (stoull(std::string(authority.substr(colon_pos + 1)), port) == -1 || port == 0 || port > 65535)
            {
                LOG_ERROR << "Invalid port in server url. " << url;
                return -1;
            }
            result.port = port;
            authority = authority.substr(0, colon_pos);
        }
        else
        {
            result.port = 80;
        }

        if (authority.empty())
        {
            LOG_ERROR << "Host missing in server url. " << url;
            return -1;
        }

        result.host = authority;
        result.target_prefix = path;
        return 0;
    }

    /**
     * Percent-encodes a string for use in an url query component.
     */
    const std::string url_encode(std::string_view str)
    {
        std::ostringstream os;
        os << std::hex << std::uppercase;
        for (const char c : str)
        {
            if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~')
                os << c;
            else
                os << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(c));
        }
        return os.str();
    }

    struct resolve_outcome
    {
        boost::system::error_code ec;
        std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    };

    /**
     * Resolves host:port to tcp endpoints within the given time. A blocking name lookup cannot be cancelled, so
     * it runs on a detached worker thread which is abandoned if the deadline passes.
     * @param endpoints Resolved endpoints to populate.
     * @param ec Populated with the resolver error, or timed_out if the deadline passed.
     * @return 0 on success. -1 on resolve failure or timeout.
     */
    int resolve_tcp_endpoints(std::vector<boost::asio::ip::tcp::endpoint> &endpoints, std::string_view host, const uint16_t port,
                              const uint32_t timeout_ms, boost::system::error_code &ec)
    {
        auto outcome = std::make_shared<std::promise<resolve_outcome>>();
        std::future<resolve_outcome> resolved = outcome->get_future();

        std::thread([outcome, host = std::string(host), port]() {
            boost::asio::io_context ioc;
            boost::asio::ip::tcp::resolver resolver(ioc);

            resolve_outcome result;
            const auto results = resolver.resolve(host, std::to_string(port), result.ec);
            if (!result.ec)
            {
                for (const auto &entry : results)
                    result.endpoints.push_back(entry.endpoint());
            }
            outcome->set_value(std::move(result));
        }).detach();

        if (resolved.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready)
        {
            ec = boost::asio::error::timed_out;
            return -1;
        }

        resolve_outcome result = resolved.get();
        ec = result.ec;
        if (ec)
            return -1;

        endpoints = std::move(result.endpoints);
        return 0;
    }

} // namespace util
