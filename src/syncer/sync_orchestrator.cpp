#include "sync_orchestrator.hpp"
#include "conflict_resolver.hpp"
#include "../util/util.hpp"

namespace syncer
{
    sync_orchestrator::sync_orchestrator(db::local_store &store, remote::api_client &client, conn::connectivity_monitor &monitor,
                                         util::timer_service &timers, retry_executor &retry, const sync_options &options)
        : store(store), client(client), monitor(monitor), timers(timers), retry(retry), options(options)
    {
    }

    /**
     * Runs one full sync cycle: sales upload, products download and stock download in that order.
     * Returns immediately with a failure if a cycle is already active or the server is not connected.
     */
    sync_outcome sync_orchestrator::run_full_sync()
    {
        bool expected = false;
        if (!is_syncing.compare_exchange_strong(expected, true))
        {
            LOG_DEBUG << "Sync request rejected. Sync already in progress.";
            return failed_outcome("Sync already in progress");
        }

        if (!monitor.is_connected())
        {
            is_syncing = false;
            LOG_DEBUG << "Sync request rejected. No network connectivity.";
            return failed_outcome("No network connectivity");
        }

        sync_outcome outcome;
        try
        {
            outcome = sync_all();
        }
        catch (const std::exception &e)
        {
            LOG_ERROR << "Sync cycle aborted. " << e.what();
            outcome = failed_outcome(e.what());
        }

        status::sync_completed(outcome.success, outcome.items_synced, outcome.error_message, outcome.completed_at);
        is_syncing = false;
        return outcome;
    }

    sync_outcome sync_orchestrator::sync_all()
    {
        LOG_INFO << "Full sync started.";

        const sync_outcome sales = sync_sales();
        const sync_outcome products = sync_products();
        const sync_outcome stock = sync_stock();

        sync_outcome outcome;
        outcome.success = sales.success && products.success && stock.success;
        outcome.items_synced = sales.items_synced + products.items_synced + stock.items_synced;

        std::vector<std::string> errors;
        if (!sales.success)
            errors.push_back("Sales: " + sales.error_message);
        if (!products.success)
            errors.push_back("Products: " + products.error_message);
        if (!stock.success)
            errors.push_back("Stock: " + stock.error_message);

        for (size_t i = 0; i < errors.size(); i++)
        {
            if (i > 0)
                outcome.error_message.append("; ");
            outcome.error_message.append(errors[i]);
        }

        outcome.completed_at = util::get_epoch_milliseconds();

        if (outcome.success)
        {
            retry.clear_all();
            if (store.advance_sync_cursor(db::CURSOR_ALL, outcome.completed_at) == -1)
                LOG_ERROR << "Failed to stamp full sync time.";

            LOG_INFO << "Full sync completed. " << outcome.items_synced << " items synced.";
        }
        else
        {
            LOG_WARNING << "Full sync completed with errors. " << outcome.error_message;
        }

        return outcome;
    }

    /**
     * Uploads all sales that were never synced or whose previous sync failed.
     */
    sync_outcome sync_orchestrator::sync_sales()
    {
        report_progress(STAGE_SALES, 0, 0, false);

        std::vector<db::sale_record> sales;
        if (store.get_unsynced_sales(sales) == -1)
            return failed_outcome("Failed to load unsynced sales");

        if (sales.empty())
        {
            LOG_DEBUG << "No unsynced sales found.";
            report_progress(STAGE_SALES, 0, 0, true);
            return sync_outcome{true, 0, "", util::get_epoch_milliseconds()};
        }

        const size_t total = sales.size();
        report_progress(STAGE_SALES, total, 0, false);

        remote::upload_batch batch;
        batch.device_id = options.device_id;
        if (store.get_sync_cursor(db::CURSOR_SALES, batch.since) == -1)
            return failed_outcome("Failed to read sales sync cursor");

        std::vector<std::string> sale_ids;
        for (const db::sale_record &sale : sales)
            sale_ids.push_back(sale.id);
        batch.sales = std::move(sales);

        const remote::api_result result = retry.execute<remote::api_result>(
            [&]() { return client.upload_changes(batch); },
            RETRY_KEY_SALES_UPLOAD);

        if (!result.success)
        {
            // Failed sales are picked up again by the next cycle.
            if (store.update_sale_sync_status(sale_ids, db::SYNC_STATUS::SYNC_FAILED, 0) == -1)
                LOG_ERROR << "Failed to flag " << total << " sales as sync failed.";

            LOG_WARNING << "Failed to sync sales. " << result.message;
            report_progress(STAGE_SALES, total, 0, true);
            return failed_outcome(result.message.empty() ? "Sales upload failed" : result.message);
        }

        const uint64_t synced_at = util::get_epoch_milliseconds();
        const int res = store.run_in_transaction([&]() {
            if (store.update_sale_sync_status(sale_ids, db::SYNC_STATUS::SYNCED, synced_at) == -1 ||
                store.advance_sync_cursor(db::CURSOR_SALES, synced_at) == -1)
                return -1;
            return 0;
        });

        if (res == -1)
        {
            LOG_ERROR << "Sales were uploaded but could not be marked as synced.";
            report_progress(STAGE_SALES, total, 0, true);
            return failed_outcome("Failed to mark uploaded sales as synced");
        }

        LOG_INFO << "Synced " << total << " sales.";
        report_progress(STAGE_SALES, total, total, true);
        return sync_outcome{true, total, "", synced_at};
    }

    /**
     * Downloads product changes since the products cursor and applies them with server-wins resolution.
     */
    sync_outcome sync_orchestrator::sync_products()
    {
        report_progress(STAGE_PRODUCTS, 0, 0, false);

        uint64_t since = 0;
        if (store.get_sync_cursor(db::CURSOR_PRODUCTS, since) == -1)
            return failed_outcome("Failed to read products sync cursor");

        const remote::download_result result = retry.execute<remote::download_result>(
            [&]() { return client.download_changes(options.device_id, since); },
            RETRY_KEY_PRODUCTS_DOWNLOAD);

        if (!result.success || !result.data)
        {
            LOG_WARNING << "Failed to download products. " << result.message;
            report_progress(STAGE_PRODUCTS, 0, 0, true);
            return failed_outcome(result.message.empty() ? "Products download failed" : result.message);
        }

        const remote::download_data &data = *result.data;
        if (data.has_more)
            LOG_INFO << "Server holds more changes. They will be downloaded in the next cycle.";

        const size_t total = data.products.size();
        if (total == 0)
        {
            report_progress(STAGE_PRODUCTS, 0, 0, true);
            return sync_outcome{true, 0, "", util::get_epoch_milliseconds()};
        }

        report_progress(STAGE_PRODUCTS, total, 0, false);

        // Listeners are notified only after the transaction ends so no caller code runs under the store lock.
        const int res = store.run_in_transaction([&]() {
            for (const db::product_record &product : data.products)
            {
                if (conflict_resolver::apply_product(store, product, data.server_timestamp) == -1)
                    return -1;
            }

            // Cursor follows the server clock so local clock skew never causes missed changes.
            return store.advance_sync_cursor(db::CURSOR_PRODUCTS, data.server_timestamp);
        });

        if (res == -1)
        {
            LOG_ERROR << "Failed to apply " << total << " downloaded products.";
            report_progress(STAGE_PRODUCTS, total, 0, true);
            return failed_outcome("Failed to apply downloaded products");
        }

        LOG_INFO << "Synced " << total << " products.";
        for (size_t processed = 1; processed < total; processed++)
            report_progress(STAGE_PRODUCTS, total, processed, false);
        report_progress(STAGE_PRODUCTS, total, total, true);
        return sync_outcome{true, total, "", util::get_epoch_milliseconds()};
    }

    /**
     * Downloads stock changes since the stock cursor and applies them with server-wins resolution.
     */
    sync_outcome sync_orchestrator::sync_stock()
    {
        report_progress(STAGE_STOCK, 0, 0, false);

        uint64_t since = 0;
        if (store.get_sync_cursor(db::CURSOR_STOCK, since) == -1)
            return failed_outcome("Failed to read stock sync cursor");

        const remote::download_result result = retry.execute<remote::download_result>(
            [&]() { return client.download_changes(options.device_id, since); },
            RETRY_KEY_STOCK_DOWNLOAD);

        if (!result.success || !result.data)
        {
            LOG_WARNING << "Failed to download stock. " << result.message;
            report_progress(STAGE_STOCK, 0, 0, true);
            return failed_outcome(result.message.empty() ? "Stock download failed" : result.message);
        }

        const remote::download_data &data = *result.data;
        if (data.has_more)
            LOG_INFO << "Server holds more changes. They will be downloaded in the next cycle.";

        const size_t total = data.stock.size();
        if (total == 0)
        {
            report_progress(STAGE_STOCK, 0, 0, true);
            return sync_outcome{true, 0, "", util::get_epoch_milliseconds()};
        }

        report_progress(STAGE_STOCK, total, 0, false);

        const int res = store.run_in_transaction([&]() {
            for (const db::stock_record &stock : data.stock)
            {
                if (conflict_resolver::apply_stock(store, stock, data.server_timestamp) == -1)
                    return -1;
            }
            return store.advance_sync_cursor(db::CURSOR_STOCK, data.server_timestamp);
        });

        if (res == -1)
        {
            LOG_ERROR << "Failed to apply " << total << " downloaded stock records.";
            report_progress(STAGE_STOCK, total, 0, true);
            return failed_outcome("Failed to apply downloaded stock");
        }

        LOG_INFO << "Synced " << total << " stock records.";
        for (size_t processed = 1; processed < total; processed++)
            report_progress(STAGE_STOCK, total, processed, false);
        report_progress(STAGE_STOCK, total, total, true);
        return sync_outcome{true, total, "", util::get_epoch_milliseconds()};
    }

    bool sync_orchestrator::is_sync_in_progress()
    {
        return is_syncing.load();
    }

    void sync_orchestrator::add_progress_listener(progress_listener listener)
    {
        std::scoped_lock lock(listeners_mutex);
        progress_listeners.push_back(std::move(listener));
    }

    void sync_orchestrator::add_connectivity_listener(conn::connectivity_listener listener)
    {
        std::scoped_lock lock(listeners_mutex);
        connectivity_listeners.push_back(std::move(listener));
    }

    /**
     * Starts the periodic sync and reachability timers and then connectivity monitoring. The first connectivity
     * probe may run a sync cycle on the calling thread, so monitoring is started without holding the timers lock.
     * @returns 0 on success. -1 if background sync is already running.
     */
    int sync_orchestrator::start_background_sync()
    {
        {
            std::scoped_lock lock(timers_mutex);
            if (sync_timer_id != 0)
            {
                LOG_WARNING << "Background sync already started.";
                return -1;
            }

            if (!is_monitor_subscribed)
            {
                monitor.add_listener([this](const bool is_connected) { on_connectivity_changed(is_connected); });
                is_monitor_subscribed = true;
            }

            sync_timer_id = timers.start(options.sync_interval_ms, [this]() { on_sync_timer(); });
            connectivity_timer_id = timers.start(options.connectivity_check_interval_ms, [this]() { on_connectivity_timer(); });
        }

        if (monitor.start_monitoring() == -1)
            LOG_WARNING << "Connectivity monitoring could not be started.";

        {
            // Background sync may have been stopped while monitoring was starting.
            std::scoped_lock lock(timers_mutex);
            if (sync_timer_id == 0)
            {
                monitor.stop_monitoring();
                LOG_INFO << "Background sync stopped during startup.";
                return 0;
            }
        }

        LOG_INFO << "Background sync started. Sync interval " << options.sync_interval_ms << "ms.";
        return 0;
    }

    /**
     * Stops the timers and connectivity monitoring. A cycle that is already running is allowed to finish.
     */
    void sync_orchestrator::stop_background_sync()
    {
        uint64_t sync_id = 0, connectivity_id = 0;
        {
            std::scoped_lock lock(timers_mutex);
            sync_id = sync_timer_id;
            connectivity_id = connectivity_timer_id;
            sync_timer_id = 0;
            connectivity_timer_id = 0;
        }

        if (sync_id == 0 && connectivity_id == 0)
            return;

        timers.stop(sync_id);
        timers.stop(connectivity_id);
        monitor.stop_monitoring();

        LOG_INFO << "Background sync stopped.";
    }

    void sync_orchestrator::on_sync_timer()
    {
        if (monitor.is_connected() && !is_syncing)
        {
            LOG_DEBUG << "Periodic sync triggered.";
            run_full_sync();
        }
    }

    void sync_orchestrator::on_connectivity_timer()
    {
        if (is_syncing)
            return;

        if (monitor.is_server_reachable(options.server_url, options.probe_timeout_ms) && !is_syncing)
        {
            LOG_DEBUG << "Server reachable. Triggering sync.";
            run_full_sync();
        }
    }

    /**
     * Forwards the connectivity change to listeners and starts a cycle when connectivity is restored.
     */
    void sync_orchestrator::on_connectivity_changed(const bool is_connected)
    {
        LOG_INFO << "Connectivity changed. Connected: " << (is_connected ? "true" : "false");
        status::connectivity_changed(is_connected);

        std::vector<conn::connectivity_listener> to_notify;
        {
            std::scoped_lock lock(listeners_mutex);
            to_notify = connectivity_listeners;
        }
        for (const conn::connectivity_listener &listener : to_notify)
            listener(is_connected);

        if (is_connected && !is_syncing)
        {
            LOG_INFO << "Connectivity restored. Triggering sync.";
            run_full_sync();
        }
    }

    sync_orchestrator::~sync_orchestrator()
    {
        stop_background_sync();
    }

    void sync_orchestrator::report_progress(std::string_view stage, const size_t total, const size_t processed, const bool completed)
    {
        status::sync_progress_event ev;
        ev.stage = stage;
        ev.total_items = total;
        ev.processed_items = processed;
        ev.percentage = total == 0 ? 0 : static_cast<uint32_t>(processed * 100 / total);
        ev.completed = completed;

        status::sync_progressed(ev);

        std::vector<progress_listener> to_notify;
        {
            std::scoped_lock lock(listeners_mutex);
            to_notify = progress_listeners;
        }
        for (const progress_listener &listener : to_notify)
            listener(ev);
    }

    sync_outcome sync_orchestrator::failed_outcome(std::string_view error_message)
    {
        return sync_outcome{false, 0, std::string(error_message), util::get_epoch_milliseconds()};
    }

} // namespace syncer
