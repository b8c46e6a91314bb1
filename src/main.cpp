/**
    Entry point for possync
**/

#include "pchheader.hpp"
#include "util/version.hpp"
#include "util/util.hpp"
#include "util/timer.hpp"
#include "conf.hpp"
#include "crypto.hpp"
#include "pslog.hpp"
#include "status.hpp"
#include "db/sqlite_store.hpp"
#include "remote/http_api_client.hpp"
#include "conn/tcp_connectivity_monitor.hpp"
#include "syncer/retry_executor.hpp"
#include "syncer/sync_orchestrator.hpp"
#include "txstate/transaction_state_store.hpp"
#include "recovery/recovery_coordinator.hpp"

std::atomic<bool> is_shutting_down = false;

/**
 * Parses CLI args and extracts possync command and parameters given.
 * possync command line accepts command and the data directory(optional)
 */
int parse_cmd(int argc, char **argv)
{
    if (argc > 1) //We get working dir as an arg anyway. So we need to check for >1 args.
    {
        conf::ctx.command = argv[1];

        // For run/new, data directory argument must be specified.
        if (conf::ctx.command == "run" || conf::ctx.command == "new")
        {
            if (argc != 3)
            {
                std::cerr << "Data directory not specified.\n";
            }
            else
            {
                conf::set_dir_paths(argv[0], argv[2]);
                return 0;
            }
        }
        else if (conf::ctx.command == "version")
        {
            if (argc == 2)
                return 0;
        }
    }

    std::cerr << "Arguments mismatch.\n";
    std::cout << "Usage:\n";
    std::cout << "possync version\n";
    std::cout << "possync <command> <data dir> (command = run | new)\n";
    std::cout << "Example: possync run ~/possync\n";

    return -1;
}

void sig_exit_handler(int signum)
{
    is_shutting_down = true;
}

void segfault_handler(int signum)
{
    std::cerr << boost::stacktrace::stacktrace() << "\n";
    exit(SIGABRT);
}

/**
 * Global exception handler for std exceptions.
 */
void std_terminate() noexcept
{
    std::exception_ptr exptr = std::current_exception();
    if (exptr != 0)
    {
        try
        {
            std::rethrow_exception(exptr);
        }
        catch (std::exception &ex)
        {
            LOG_ERROR << "std error: " << ex.what();
        }
        catch (...)
        {
            LOG_ERROR << "std error: Terminated due to unknown exception";
        }
    }
    else
    {
        LOG_ERROR << "std error: Terminated due to unknown reason";
    }

    LOG_ERROR << boost::stacktrace::stacktrace();

    exit(1);
}

/**
 * Logs the status events raised by the sync subsystem.
 */
void drain_status_events()
{
    status::change_event ev;
    while (status::event_queue.try_dequeue(ev))
    {
        if (ev.index() == 0)
        {
            const status::sync_progress_event &progress = std::get<status::sync_progress_event>(ev);
            LOG_DEBUG << progress.stage << ": " << progress.processed_items << "/" << progress.total_items << " (" << progress.percentage << "%)";
        }
        else if (ev.index() == 1)
        {
            const status::connectivity_change_event &change = std::get<status::connectivity_change_event>(ev);
            LOG_INFO << "Connectivity changed: " << (change.is_connected ? "online" : "offline");
        }
        else if (ev.index() == 2)
        {
            const status::sync_completed_event &completed = std::get<status::sync_completed_event>(ev);
            if (completed.success)
                LOG_INFO << "Sync completed. " << completed.items_synced << " items synced.";
            else
                LOG_WARNING << "Sync failed. " << completed.error_message;
        }
    }
}

/**
 * Runs the sync daemon until a termination signal is received.
 */
int run()
{
    db::sqlite_store store;
    if (store.init(conf::ctx.db_file) == -1)
        return -1;

    util::thread_timer_service timers;

    remote::http_api_client client;
    if (client.init(conf::cfg.server.base_url, conf::cfg.server.timeout_ms) == -1)
        return -1;

    conn::tcp_connectivity_monitor monitor(timers);
    if (monitor.init(conf::cfg.server.base_url, conf::cfg.sync.connectivity_check_interval_ms, conf::cfg.server.timeout_ms) == -1)
        return -1;

    syncer::retry_config retry_cfg;
    retry_cfg.max_attempts = conf::cfg.sync.max_retry_attempts;
    retry_cfg.initial_delay_ms = conf::cfg.sync.initial_retry_delay_ms;
    retry_cfg.backoff_multiplier = conf::cfg.sync.retry_backoff_multiplier;
    retry_cfg.max_delay_ms = conf::cfg.sync.max_retry_delay_ms;
    syncer::retry_executor retry(retry_cfg);

    syncer::sync_options options;
    options.device_id = conf::cfg.device.id;
    options.server_url = conf::cfg.server.base_url;
    options.sync_interval_ms = conf::cfg.sync.interval_ms;
    options.connectivity_check_interval_ms = conf::cfg.sync.connectivity_check_interval_ms;
    options.probe_timeout_ms = conf::cfg.server.timeout_ms;
    syncer::sync_orchestrator orchestrator(store, client, monitor, timers, retry, options);

    txstate::transaction_state_store txstore(store, timers);

    recovery::priority_thresholds thresholds;
    thresholds.high_priority_total = conf::cfg.recovery.high_priority_total;
    thresholds.high_priority_item_count = conf::cfg.recovery.high_priority_item_count;
    recovery::recovery_coordinator coordinator(store, txstore, thresholds);

    const std::string &user_id = conf::cfg.device.user_id;
    const std::string &device_id = conf::cfg.device.id;

    const recovery::crash_recovery_result recovery_result = coordinator.perform_automatic_recovery(user_id, device_id);
    for (const std::string &action : recovery_result.actions)
        LOG_INFO << action;
    for (const std::string &error : recovery_result.errors)
        LOG_ERROR << error;
    if (recovery_result.available_work.size() > recovery_result.succeeded)
        LOG_WARNING << (recovery_result.available_work.size() - recovery_result.succeeded) << " recoverable work items await a decision.";

    size_t cleaned_count = 0;
    if (coordinator.cleanup_old_data(conf::cfg.recovery.retention_days, cleaned_count) == -1)
        LOG_WARNING << "Old crash recovery data was not cleaned up.";

    std::string session_id;
    if (coordinator.record_startup(user_id, device_id, session_id) == -1)
        return -1;

    // Register the exit handler before the first sync cycle can start so a termination always reaches
    // the clean shutdown record.
    signal(SIGINT, &sig_exit_handler);
    signal(SIGTERM, &sig_exit_handler);

    if (orchestrator.start_background_sync() == -1)
    {
        coordinator.record_clean_shutdown(session_id);
        return -1;
    }

    while (!is_shutting_down)
    {
        drain_status_events();
        util::sleep(100);
    }

    LOG_WARNING << "Termination signal received. Shutting down.";

    orchestrator.stop_background_sync();
    monitor.stop_monitoring();
    txstore.stop_all();
    timers.stop_all();
    drain_status_events();
    coordinator.record_clean_shutdown(session_id);
    return 0;
}

int main(int argc, char **argv)
{
    // Register exception and segfault handlers.
    std::set_terminate(&std_terminate);
    signal(SIGSEGV, &segfault_handler);
    signal(SIGABRT, &segfault_handler);

    // Disable SIGPIPE to avoid crashing on broken pipe IO.
    {
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, NULL);
    }

    // Extract the CLI args
    // This call will populate conf::ctx
    if (parse_cmd(argc, argv) != 0)
        return -1;

    if (conf::ctx.command == "version")
    {
        std::cout << "possync " << version::POSSYNC_VERSION << std::endl;
        return 0;
    }

    // Device and session identifiers are generated with the crypto subsystem.
    if (crypto::init() != 0)
        return -1;

    if (conf::ctx.command == "new")
    {
        if (conf::create_data_dir() != 0)
            return -1;

        std::cout << "Created possync data dir at " << conf::ctx.data_dir << "\n";
        return 0;
    }

    if (conf::init() != 0)
        return -1;

    pslog::init();

    LOG_INFO << "possync " << version::POSSYNC_VERSION;
    LOG_INFO << "Device: " << conf::cfg.device.id << " (shop " << conf::cfg.device.shop_id << ")";
    LOG_INFO << "Sync server: " << conf::cfg.server.base_url;

    const int res = run();

    conf::deinit();

    if (res == -1)
    {
        LOG_ERROR << "possync exited with errors.";
        return -1;
    }

    LOG_INFO << "possync exited normally.";
    return 0;
}
