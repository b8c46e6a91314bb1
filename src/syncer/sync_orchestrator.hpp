#ifndef _POSSYNC_SYNCER_SYNC_ORCHESTRATOR_
#define _POSSYNC_SYNCER_SYNC_ORCHESTRATOR_

#include "../pchheader.hpp"
#include "../db/local_store.hpp"
#include "../remote/api_client.hpp"
#include "../conn/connectivity_monitor.hpp"
#include "../util/timer.hpp"
#include "../status.hpp"
#include "retry_executor.hpp"

namespace syncer
{
    // Retry state keys of the remote operations.
    constexpr const char *RETRY_KEY_SALES_UPLOAD = "sales_upload";
    constexpr const char *RETRY_KEY_PRODUCTS_DOWNLOAD = "products_download";
    constexpr const char *RETRY_KEY_STOCK_DOWNLOAD = "stock_download";

    // Progress stages.
    constexpr const char *STAGE_SALES = "Syncing sales";
    constexpr const char *STAGE_PRODUCTS = "Syncing products";
    constexpr const char *STAGE_STOCK = "Syncing stock";

    struct sync_outcome
    {
        bool success = false;
        size_t items_synced = 0;
        std::string error_message;
        uint64_t completed_at = 0;
    };

    struct sync_options
    {
        std::string device_id;
        std::string server_url;                      // Probed by the reachability timer.
        uint64_t sync_interval_ms = 0;               // Periodic full sync interval.
        uint64_t connectivity_check_interval_ms = 0; // Reachability probe interval.
        uint32_t probe_timeout_ms = 0;
    };

    typedef std::function<void(const status::sync_progress_event &ev)> progress_listener;

    /**
     * Runs sync cycles against the remote api. At most one cycle is active at any time. Cycles are started
     * explicitly or by the background timers and connectivity events.
     */
    class sync_orchestrator
    {
    private:
        db::local_store &store;
        remote::api_client &client;
        conn::connectivity_monitor &monitor;
        util::timer_service &timers;
        retry_executor &retry;
        const sync_options options;

        std::atomic<bool> is_syncing = false;

        std::mutex timers_mutex;
        uint64_t sync_timer_id = 0;
        uint64_t connectivity_timer_id = 0;
        bool is_monitor_subscribed = false;

        std::mutex listeners_mutex;
        std::vector<progress_listener> progress_listeners;
        std::vector<conn::connectivity_listener> connectivity_listeners;

        sync_outcome sync_all();

        void report_progress(std::string_view stage, const size_t total, const size_t processed, const bool completed);

        sync_outcome failed_outcome(std::string_view error_message);

    public:
        sync_orchestrator(db::local_store &store, remote::api_client &client, conn::connectivity_monitor &monitor,
                          util::timer_service &timers, retry_executor &retry, const sync_options &options);

        sync_outcome run_full_sync();

        sync_outcome sync_sales();

        sync_outcome sync_products();

        sync_outcome sync_stock();

        bool is_sync_in_progress();

        void add_progress_listener(progress_listener listener);

        void add_connectivity_listener(conn::connectivity_listener listener);

        int start_background_sync();

        void stop_background_sync();

        void on_sync_timer();

        void on_connectivity_timer();

        void on_connectivity_changed(const bool is_connected);

        ~sync_orchestrator();
    };

} // namespace syncer

#endif
