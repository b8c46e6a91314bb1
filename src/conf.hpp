#ifndef _POSSYNC_CONF_
#define _POSSYNC_CONF_

#include "pchheader.hpp"
#include "util/util.hpp"

/**
 * Manages the central config and context structs.
 * Contains functions to config operations such as create/load/validate.
 */
namespace conf
{
    // Log severity levels used in possync.
    enum LOG_SEVERITY
    {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct device_config
    {
        std::string id;      // Device uuid. Sent with every upload/download request.
        std::string shop_id; // Shop the device belongs to.
        std::string user_id; // Operator account whose sessions are tracked for crash recovery.
    };

    struct server_config
    {
        std::string base_url;    // Remote sync api base url (eg. http://pos.example.com:5000).
        uint32_t timeout_ms = 0; // Per request timeout for remote calls and reachability probes.
    };

    struct sync_config
    {
        uint64_t interval_ms = 0;                    // Periodic full sync interval.
        uint64_t connectivity_check_interval_ms = 0; // Server reachability probe interval.
        uint64_t initial_retry_delay_ms = 0;         // Delay before the first retry of a failed remote call.
        uint32_t max_retry_attempts = 0;             // Max attempts per remote call (including the first).
        double retry_backoff_multiplier = 0;         // Delay multiplier applied after each failed attempt.
        uint64_t max_retry_delay_ms = 0;             // Retry delay ceiling. 0 means uncapped.
    };

    struct txstate_config
    {
        uint32_t auto_save_interval_sec = 0; // Auto-save interval for open transactions.
    };

    struct recovery_config
    {
        uint32_t retention_days = 0;           // Session records and snapshot payloads older than this are cleaned up.
        int64_t high_priority_total = 0;       // Grand total (cents) above which recoverable work is high priority.
        uint32_t high_priority_item_count = 0; // Line item count above which recoverable work is high priority.
    };

    struct log_config
    {
        std::string log_level;                   // Log severity level (dbg, inf, wrn, err)
        LOG_SEVERITY log_level_type;             // Log severity level enum (debug, info, warn, error)
        std::unordered_set<std::string> loggers; // List of enabled loggers (console, file)
        size_t max_mbytes_per_file = 0;          // Max MB size of a single log file.
        size_t max_file_count = 0;               // Max no. of log files to keep.
    };

    // Holds all the config values.
    struct possync_config
    {
        std::string version;
        device_config device;
        server_config server;
        sync_config sync;
        txstate_config txstate;
        recovery_config recovery;
        log_config log;
    };

    // Holds contextual information about the currently used data directory.
    struct possync_ctx
    {
        std::string command; // The CLI command issued to launch possync
        std::string exe_dir; // possync executable dir.

        std::string data_dir;    // Data base directory full path.
        std::string config_dir;  // Config dir full path.
        std::string config_file; // Full path to the config file.
        std::string log_dir;     // Log dir full path.
        std::string db_file;     // Full path to the local sqlite database.

        int config_fd = -1;       // Config file file descriptor.
        struct flock config_lock; // Config file lock.
    };

    // Global context struct exposed to the application.
    extern possync_ctx ctx;

    // Global configuration struct exposed to the application.
    extern possync_config cfg;

    int init();

    void deinit();

    int create_data_dir();

    void set_dir_paths(std::string exepath, std::string basedir);

    void populate_default_config(possync_config &cfg);

    //------Internal-use functions for this namespace.

    int read_config(possync_config &cfg);

    int parse_config_json(possync_config &cfg, const jsoncons::ojson &d);

    void populate_config_json(jsoncons::ojson &d, const possync_config &cfg);

    int write_config(const possync_config &cfg);

    int validate_config(const possync_config &cfg);

    int validate_dir_paths();

    LOG_SEVERITY get_loglevel_type(std::string_view severity);

    const std::string extract_missing_field(std::string err_message);

    int set_config_lock();

    int release_config_lock();

    int write_json_file(const std::string &file_path, const jsoncons::ojson &d);

} // namespace conf

#endif
