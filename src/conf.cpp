#include "pchheader.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "util/util.hpp"
#include "util/version.hpp"

namespace conf
{

    // Global context struct exposed to the application.
    possync_ctx ctx;

    // Global configuration struct exposed to the application.
    possync_config cfg;

    constexpr int FILE_PERMS = 0644;

    bool init_success = false;

    /**
     * Loads and initializes the config for execution. Must be called once during application startup.
     * @return 0 for success. -1 for failure.
     */
    int init()
    {
        // The validations/loading needs to be in this order.
        // 1. Validate data directories
        // 2. Lock the config so another instance cannot run on the same directory
        // 3. Read and load the config into memory
        // 4. Validate the loaded config values

        if (validate_dir_paths() == -1)
            return -1;

        if (set_config_lock() == -1)
            return -1;

        if (read_config(cfg) == -1 ||
            validate_config(cfg) == -1)
        {
            release_config_lock();
            return -1;
        }

        init_success = true;
        return 0;
    }

    /**
     * Cleanup any resources.
     */
    void deinit()
    {
        if (init_success)
        {
            // Releases the config file lock at the termination.
            release_config_lock();
            init_success = false;
        }
    }

    /**
     * Creates a new data directory with the default config.
     * By the time this gets called, the 'ctx' struct must be populated.
     */
    int create_data_dir()
    {
        if (util::is_dir_exists(ctx.data_dir))
        {
            std::cerr << "Data dir already exists. Cannot create possync data dir at the same location.\n";
            return -1;
        }

        if (util::create_dir_tree_recursive(ctx.config_dir) == -1 ||
            util::create_dir_tree_recursive(ctx.log_dir) == -1)
        {
            std::cerr << "ERROR: unable to create directories.\n";
            return -1;
        }

        // We populate the in-memory struct with default settings and then save it to the file.
        possync_config cfg = {};
        populate_default_config(cfg);
        cfg.device.id = crypto::generate_uuid();

        if (write_config(cfg) != 0)
            return -1;

        std::cout << "possync data directory created at " << ctx.data_dir << std::endl;
        std::cout << "Device id: " << cfg.device.id << std::endl;

        return 0;
    }

    /**
     * Fills the given config struct with the default settings used for new data directories.
     */
    void populate_default_config(possync_config &cfg)
    {
        cfg.version = version::POSSYNC_VERSION;

        cfg.device.shop_id = "default";
        cfg.device.user_id = "operator";

        cfg.server.base_url = "http://localhost:5000";
        cfg.server.timeout_ms = 30000;

        cfg.sync.interval_ms = 5 * 60 * 1000;
        cfg.sync.connectivity_check_interval_ms = 60 * 1000;
        cfg.sync.initial_retry_delay_ms = 5000;
        cfg.sync.max_retry_attempts = 3;
        cfg.sync.retry_backoff_multiplier = 2.0;
        cfg.sync.max_retry_delay_ms = 0;

        cfg.txstate.auto_save_interval_sec = 30;

        cfg.recovery.retention_days = 30;
        cfg.recovery.high_priority_total = 100000;
        cfg.recovery.high_priority_item_count = 10;

        cfg.log.log_level = "inf";
        cfg.log.log_level_type = LOG_SEVERITY::INFO;
        cfg.log.max_mbytes_per_file = 10;
        cfg.log.max_file_count = 50;
        cfg.log.loggers.emplace("console");
        cfg.log.loggers.emplace("file");
    }

    /**
     * Updates the context with directory paths based on provided base directory.
     * This is called after parsing the command line args in order to populate the ctx.
     */
    void set_dir_paths(std::string exepath, std::string basedir)
    {
        if (exepath.empty())
        {
            std::cerr << "Executable path must be specified\n";
            exit(1);
        }

        if (basedir.empty())
        {
            std::cerr << "A data directory must be specified\n";
            exit(1);
        }

        // Resolving the path through realpath will remove any trailing slash if present.
        // The data dir may not exist yet when creating a new one.
        const std::string resolved = util::realpath(basedir);
        if (!resolved.empty())
            basedir = resolved;
        exepath = util::realpath(exepath);

        // Take the parent directory path.
        ctx.exe_dir = dirname(exepath.data());

        ctx.data_dir = basedir;
        ctx.config_dir = basedir + "/cfg";
        ctx.config_file = ctx.config_dir + "/possync.cfg";
        ctx.log_dir = basedir + "/log";
        ctx.db_file = basedir + "/possync.db";
    }

    /**
     * Reads the config file on disk and populates the in-memory 'cfg' struct.
     * @return 0 for successful loading of config. -1 for failure.
     */
    int read_config(possync_config &cfg)
    {
        // Read the config file into json document object.
        std::string buf;
        if (util::read_from_fd(ctx.config_fd, buf) == -1)
        {
            std::cerr << "Error reading from the config file. " << errno << '\n';
            return -1;
        }

        jsoncons::ojson d;
        try
        {
            d = jsoncons::ojson::parse(buf, jsoncons::strict_json_parsing());
        }
        catch (const std::exception &e)
        {
            std::cerr << "Invalid config file format. " << e.what() << '\n';
            return -1;
        }
        buf.clear();

        return parse_config_json(cfg, d);
    }

    /**
     * Populates the config struct from a parsed config json document.
     * @return 0 on success. -1 when a field is missing or invalid.
     */
    int parse_config_json(possync_config &cfg, const jsoncons::ojson &d)
    {
        try
        {
            // Check whether the version is specified.
            cfg.version = d["version"].as<std::string>();
            if (cfg.version.empty())
            {
                std::cerr << "Config version missing.\n";
                return -1;
            }

            // Check whether this config complies with the min version requirement.
            const int verresult = version::version_compare(cfg.version, std::string(version::MIN_CONFIG_VERSION));
            if (verresult == -1)
            {
                std::cerr << "Config version too old. Minimum "
                          << version::MIN_CONFIG_VERSION << " required. "
                          << cfg.version << " found.\n";
                return -1;
            }
            else if (verresult == -2)
            {
                std::cerr << "Malformed version string.\n";
                return -1;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "Required config field version missing at " << ctx.config_file << std::endl;
            return -1;
        }

        // device
        {
            try
            {
                const jsoncons::ojson &device = d["device"];
                cfg.device.id = device["id"].as<std::string>();
                cfg.device.shop_id = device["shop_id"].as<std::string>();
                cfg.device.user_id = device["user_id"].as<std::string>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required device config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // server
        {
            try
            {
                const jsoncons::ojson &server = d["server"];
                cfg.server.base_url = server["base_url"].as<std::string>();
                cfg.server.timeout_ms = server["timeout_ms"].as<uint32_t>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required server config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // sync
        {
            try
            {
                const jsoncons::ojson &sync = d["sync"];
                cfg.sync.interval_ms = sync["interval_ms"].as<uint64_t>();
                cfg.sync.connectivity_check_interval_ms = sync["connectivity_check_interval_ms"].as<uint64_t>();
                cfg.sync.initial_retry_delay_ms = sync["initial_retry_delay_ms"].as<uint64_t>();
                cfg.sync.max_retry_attempts = sync["max_retry_attempts"].as<uint32_t>();
                cfg.sync.retry_backoff_multiplier = sync["retry_backoff_multiplier"].as<double>();

                // Retry delay ceiling is optional. Absent means uncapped.
                cfg.sync.max_retry_delay_ms = sync.contains("max_retry_delay_ms") ? sync["max_retry_delay_ms"].as<uint64_t>() : 0;
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required sync config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // txstate
        {
            try
            {
                const jsoncons::ojson &txstate = d["txstate"];
                cfg.txstate.auto_save_interval_sec = txstate["auto_save_interval_sec"].as<uint32_t>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required txstate config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // recovery
        {
            try
            {
                const jsoncons::ojson &recovery = d["recovery"];
                cfg.recovery.retention_days = recovery["retention_days"].as<uint32_t>();
                cfg.recovery.high_priority_total = recovery["high_priority_total"].as<int64_t>();
                cfg.recovery.high_priority_item_count = recovery["high_priority_item_count"].as<uint32_t>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required recovery config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        // log
        {
            try
            {
                const jsoncons::ojson &log = d["log"];
                cfg.log.log_level = log["log_level"].as<std::string>();
                cfg.log.log_level_type = get_loglevel_type(cfg.log.log_level);
                cfg.log.max_mbytes_per_file = log["max_mbytes_per_file"].as<size_t>();
                cfg.log.max_file_count = log["max_file_count"].as<size_t>();
                cfg.log.loggers.clear();
                for (auto &v : log["loggers"].array_range())
                    cfg.log.loggers.emplace(v.as<std::string>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "Required log config field " << extract_missing_field(e.what()) << " missing at " << ctx.config_file << std::endl;
                return -1;
            }
        }

        return 0;
    }

    /**
     * Populates the given json doc with 'cfg' values.
     * ojson is used instead of json to preserve insertion order.
     */
    void populate_config_json(jsoncons::ojson &d, const possync_config &cfg)
    {
        d.insert_or_assign("version", cfg.version);

        // Device config.
        {
            jsoncons::ojson device;
            device.insert_or_assign("id", cfg.device.id);
            device.insert_or_assign("shop_id", cfg.device.shop_id);
            device.insert_or_assign("user_id", cfg.device.user_id);
            d.insert_or_assign("device", device);
        }

        // Server config.
        {
            jsoncons::ojson server;
            server.insert_or_assign("base_url", cfg.server.base_url);
            server.insert_or_assign("timeout_ms", cfg.server.timeout_ms);
            d.insert_or_assign("server", server);
        }

        // Sync config.
        {
            jsoncons::ojson sync;
            sync.insert_or_assign("interval_ms", cfg.sync.interval_ms);
            sync.insert_or_assign("connectivity_check_interval_ms", cfg.sync.connectivity_check_interval_ms);
            sync.insert_or_assign("initial_retry_delay_ms", cfg.sync.initial_retry_delay_ms);
            sync.insert_or_assign("max_retry_attempts", cfg.sync.max_retry_attempts);
            sync.insert_or_assign("retry_backoff_multiplier", cfg.sync.retry_backoff_multiplier);
            sync.insert_or_assign("max_retry_delay_ms", cfg.sync.max_retry_delay_ms);
            d.insert_or_assign("sync", sync);
        }

        // Transaction state config.
        {
            jsoncons::ojson txstate;
            txstate.insert_or_assign("auto_save_interval_sec", cfg.txstate.auto_save_interval_sec);
            d.insert_or_assign("txstate", txstate);
        }

        // Recovery config.
        {
            jsoncons::ojson recovery;
            recovery.insert_or_assign("retention_days", cfg.recovery.retention_days);
            recovery.insert_or_assign("high_priority_total", cfg.recovery.high_priority_total);
            recovery.insert_or_assign("high_priority_item_count", cfg.recovery.high_priority_item_count);
            d.insert_or_assign("recovery", recovery);
        }

        // Log configs.
        {
            jsoncons::ojson log_config;
            log_config.insert_or_assign("log_level", cfg.log.log_level);
            log_config.insert_or_assign("max_mbytes_per_file", cfg.log.max_mbytes_per_file);
            log_config.insert_or_assign("max_file_count", cfg.log.max_file_count);

            jsoncons::ojson loggers(jsoncons::json_array_arg);
            for (std::string_view logger : cfg.log.loggers)
            {
                loggers.push_back(logger);
            }
            log_config.insert_or_assign("loggers", loggers);
            d.insert_or_assign("log", log_config);
        }
    }

    /**
     * Saves the provided 'cfg' struct into the config file.
     * @return 0 for successful save. -1 for failure.
     */
    int write_config(const possync_config &cfg)
    {
        jsoncons::ojson d;
        populate_config_json(d, cfg);
        return write_json_file(ctx.config_file, d);
    }

    /**
     * Validates the 'cfg' struct for invalid values.
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_config(const possync_config &cfg)
    {
        bool fields_missing = false;

        fields_missing |= cfg.device.id.empty() && std::cerr << "Missing cfg field: device id\n";
        fields_missing |= cfg.device.user_id.empty() && std::cerr << "Missing cfg field: device user_id\n";
        fields_missing |= cfg.server.base_url.empty() && std::cerr << "Missing cfg field: server base_url\n";
        fields_missing |= cfg.server.timeout_ms == 0 && std::cerr << "Missing cfg field: server timeout_ms\n";
        fields_missing |= cfg.sync.interval_ms == 0 && std::cerr << "Missing cfg field: sync interval_ms\n";
        fields_missing |= cfg.sync.connectivity_check_interval_ms == 0 && std::cerr << "Missing cfg field: sync connectivity_check_interval_ms\n";
        fields_missing |= cfg.sync.max_retry_attempts == 0 && std::cerr << "Missing cfg field: sync max_retry_attempts\n";
        fields_missing |= cfg.txstate.auto_save_interval_sec == 0 && std::cerr << "Missing cfg field: txstate auto_save_interval_sec\n";
        fields_missing |= cfg.log.log_level.empty() && std::cerr << "Missing cfg field: log_level\n";
        fields_missing |= cfg.log.loggers.empty() && std::cerr << "Missing cfg field: loggers\n";

        if (fields_missing)
        {
            std::cerr << "Required configuration fields missing at " << ctx.config_file << std::endl;
            return -1;
        }

        if (cfg.sync.retry_backoff_multiplier < 1.0)
        {
            std::cerr << "Sync retry_backoff_multiplier cannot be less than 1.0\n";
            return -1;
        }

        if (cfg.recovery.high_priority_total < 0)
        {
            std::cerr << "Recovery high_priority_total cannot be negative\n";
            return -1;
        }

        util::http_url url;
        if (util::parse_http_url(cfg.server.base_url, url) == -1)
        {
            std::cerr << "Invalid server base_url configured. Expected http://host[:port][/path]\n";
            return -1;
        }

        // Log settings
        const std::unordered_set<std::string> valid_loglevels({"dbg", "inf", "wrn", "err"});
        if (valid_loglevels.count(cfg.log.log_level) != 1)
        {
            std::cerr << "Invalid log_level configured. Valid values: dbg|inf|wrn|err\n";
            return -1;
        }

        const std::unordered_set<std::string> valid_loggers({"console", "file"});
        for (const std::string &logger : cfg.log.loggers)
        {
            if (valid_loggers.count(logger) != 1)
            {
                std::cerr << "Invalid logger. Valid values: console|file\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Checks for the existence of the data sub directories.
     * @return 0 for successful validation. -1 for failure.
     */
    int validate_dir_paths()
    {
        const std::string paths[3] = {
            ctx.data_dir,
            ctx.config_file,
            ctx.log_dir};

        for (const std::string &path : paths)
        {
            if (!util::is_file_exists(path) && !util::is_dir_exists(path))
            {
                std::cerr << path << " does not exist. Run 'possync new <dir>' to create a data directory.\n";
                return -1;
            }
        }

        return 0;
    }

    /**
     * Convert string to Log Severity enum type.
     * @param severity log severity code.
     * @return log severity type.
     */
    LOG_SEVERITY get_loglevel_type(std::string_view severity)
    {
        if (severity == "dbg")
            return LOG_SEVERITY::DEBUG;
        else if (severity == "wrn")
            return LOG_SEVERITY::WARN;
        else if (severity == "inf")
            return LOG_SEVERITY::INFO;
        else
            return LOG_SEVERITY::ERROR;
    }

    /**
     * Extracts missing config field from the jsoncons exception message.
     * @param err_message Jsoncons error message.
     * @return Missing config field.
     */
    const std::string extract_missing_field(std::string err_message)
    {
        err_message.erase(0, err_message.find("'") + 1);
        return err_message.substr(0, err_message.find("'"));
    }

    /**
     * Locks the config file. If already locked means there's another possync instance running in the same directory.
     * If so, log error and return, Otherwise lock the config.
     * @return Returns 0 if lock is successfully aquired, -1 on error.
     */
    int set_config_lock()
    {
        ctx.config_fd = open(ctx.config_file.data(), O_RDWR, 444);
        if (ctx.config_fd == -1)
        {
            std::cerr << errno << ": Error opening the config file " << ctx.config_file << "\n";
            return -1;
        }

        if (util::set_lock(ctx.config_fd, ctx.config_lock, true, 0, 0) == -1)
        {
            if (errno == EACCES || errno == EAGAIN)
            {
                std::cerr << "Another possync instance is already running in directory " << ctx.data_dir << "\n";
            }
            // Close fd if lock aquiring failed.
            close(ctx.config_fd);
            ctx.config_fd = -1;
            return -1;
        }

        return 0;
    }

    /**
     * Releases the config file and closes the opened file descriptor.
     * @return Returns 0 if lock is successfully released, -1 on error.
     */
    int release_config_lock()
    {
        if (ctx.config_fd == -1)
            return 0;

        const int res = util::release_lock(ctx.config_fd, ctx.config_lock);
        // Close fd in termination.
        close(ctx.config_fd);
        ctx.config_fd = -1;
        return res;
    }

    /**
     * Writes the given json doc to a file.
     * @return 0 on success. -1 on failure.
     */
    int write_json_file(const std::string &file_path, const jsoncons::ojson &d)
    {
        std::string json;
        // Convert json object to a string.
        try
        {
            jsoncons::json_options options;
            options.object_array_line_splits(jsoncons::line_split_kind::multi_line);
            options.spaces_around_comma(jsoncons::spaces_option::no_spaces);
            std::ostringstream os;
            os << jsoncons::pretty_print(d, options);
            json = os.str();
            os.clear();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Converting json to string failed. " << file_path << std::endl;
            return -1;
        }

        // O_TRUNC flag is used to trucate existing content from the file.
        const int fd = open(file_path.data(), O_CREAT | O_RDWR | O_TRUNC, FILE_PERMS);
        if (fd == -1 || write(fd, json.data(), json.size()) == -1)
        {
            std::cerr << "Writing file failed. " << file_path << std::endl;
            if (fd != -1)
                close(fd);
            return -1;
        }
        close(fd);
        return 0;
    }

} // namespace conf
