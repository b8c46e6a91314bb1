/**
 * @file test_sync_orchestrator.cpp
 * @brief Unit tests for sync cycles, retries, cursors and background triggers
 */

#include <gtest/gtest.h>
#include <future>
#include <thread>
#include "syncer/sync_orchestrator.hpp"
#include "test_common.hpp"

using namespace possync_test;

class SyncOrchestratorTest : public ::testing::Test {
protected:
    counting_store store;
    fake_api_client client;
    fake_connectivity_monitor monitor;
    manual_timer_service timers;
    std::vector<uint64_t> delays;
    syncer::retry_executor retry{retry_settings(), [this](const uint64_t ms) { delays.push_back(ms); }};
    syncer::sync_orchestrator orchestrator{store, client, monitor, timers, retry, sync_settings()};

    static syncer::retry_config retry_settings() {
        syncer::retry_config config;
        config.max_attempts = 3;
        config.initial_delay_ms = 100;
        config.backoff_multiplier = 2.0;
        return config;
    }

    static syncer::sync_options sync_settings() {
        syncer::sync_options options;
        options.device_id = "device-1";
        options.server_url = "http://localhost:5000";
        options.sync_interval_ms = 1000;
        options.connectivity_check_interval_ms = 500;
        options.probe_timeout_ms = 100;
        return options;
    }

    void add_sales(const size_t count) {
        for (size_t i = 0; i < count; i++)
            ASSERT_EQ(store.insert_sale(make_sale("s-" + std::to_string(i), 1000 + i)), 0);
    }

    // True when another thread can reach the store within a short time, i.e. the store lock is not held.
    bool store_is_free_for_other_threads() {
        auto done = std::make_shared<std::promise<void>>();
        std::future<void> finished = done->get_future();
        std::thread([this, done]() {
            uint64_t cursor = 0;
            store.get_sync_cursor(db::CURSOR_ALL, cursor);
            done->set_value();
        }).detach();
        return finished.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
    }

    db::SYNC_STATUS sale_status(const std::string &id) {
        db::sale_record sale;
        EXPECT_EQ(store.get_sale(id, sale), 1);
        return sale.sync_status;
    }
};

// ============================================================================
// Full sync cycle
// ============================================================================

TEST_F(SyncOrchestratorTest, UploadSucceedsAfterRetries) {
    add_sales(3);
    client.upload_script = {upload_failure("timeout"), upload_failure("timeout")};

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.items_synced, 3u);
    EXPECT_EQ(client.upload_calls.load(), 3u);
    EXPECT_EQ(delays, (std::vector<uint64_t>{100, 200}));

    for (const std::string id : {"s-0", "s-1", "s-2"})
        EXPECT_EQ(sale_status(id), db::SYNC_STATUS::SYNCED);

    std::vector<db::sale_record> unsynced;
    ASSERT_EQ(store.get_unsynced_sales(unsynced), 0);
    EXPECT_TRUE(unsynced.empty());
    EXPECT_FALSE(orchestrator.is_sync_in_progress());
}

TEST_F(SyncOrchestratorTest, UploadCarriesDeviceAndAllUnsyncedSales) {
    add_sales(2);

    ASSERT_TRUE(orchestrator.run_full_sync().success);

    ASSERT_EQ(client.uploaded.size(), 1u);
    EXPECT_EQ(client.uploaded[0].device_id, "device-1");
    EXPECT_EQ(client.uploaded[0].since, 0u);
    ASSERT_EQ(client.uploaded[0].sales.size(), 2u);
    EXPECT_EQ(client.uploaded[0].sales[0].items.size(), 1u);
}

TEST_F(SyncOrchestratorTest, NoUnsyncedSalesSkipsUpload) {
    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.items_synced, 0u);
    EXPECT_EQ(client.upload_calls.load(), 0u);
    EXPECT_EQ(client.download_calls.load(), 2u);
}

TEST_F(SyncOrchestratorTest, FailedUploadFlagsSalesForNextCycle) {
    add_sales(2);
    client.default_upload = upload_failure("Server down");

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "Sales: Server down");
    EXPECT_EQ(client.upload_calls.load(), 3u);
    EXPECT_EQ(sale_status("s-0"), db::SYNC_STATUS::SYNC_FAILED);
    EXPECT_EQ(sale_status("s-1"), db::SYNC_STATUS::SYNC_FAILED);
    EXPECT_EQ(retry.get_attempts(syncer::RETRY_KEY_SALES_UPLOAD), 3u);

    // Failed sales are uploaded again once the server recovers.
    client.default_upload = remote::api_result{true, "", 200};
    ASSERT_TRUE(orchestrator.run_full_sync().success);
    EXPECT_EQ(sale_status("s-0"), db::SYNC_STATUS::SYNCED);
    EXPECT_EQ(retry.get_attempts(syncer::RETRY_KEY_SALES_UPLOAD), 0u);
}

TEST_F(SyncOrchestratorTest, ThrowingClientIsReportedAsFailure) {
    add_sales(1);
    client.throw_on_upload = true;

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "Sales: Connection refused");
    EXPECT_FALSE(orchestrator.is_sync_in_progress());
}

TEST_F(SyncOrchestratorTest, OfflineSyncIsRejected) {
    add_sales(1);
    monitor.connected = false;

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "No network connectivity");
    EXPECT_EQ(client.upload_calls.load(), 0u);
    EXPECT_EQ(client.download_calls.load(), 0u);
}

TEST_F(SyncOrchestratorTest, ConcurrentSyncIsRejected) {
    add_sales(1);

    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    client.on_upload = [&]() {
        entered.set_value();
        released.wait();
    };

    std::future<syncer::sync_outcome> first = std::async(std::launch::async, [&]() { return orchestrator.run_full_sync(); });
    entered.get_future().wait();

    EXPECT_TRUE(orchestrator.is_sync_in_progress());
    const syncer::sync_outcome second = orchestrator.run_full_sync();
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error_message, "Sync already in progress");
    EXPECT_EQ(client.upload_calls.load(), 1u);

    release.set_value();
    EXPECT_TRUE(first.get().success);
    EXPECT_EQ(client.upload_calls.load(), 1u);
}

// ============================================================================
// Downloads
// ============================================================================

TEST_F(SyncOrchestratorTest, DownloadsAreAppliedAndCursorsAdvance) {
    client.download_script = {
        download_success(5000, {make_product("p-1", "Rice", 1000)}),
        download_success(5000, {}, {make_stock("st-1", "p-1", 12)})};

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();
    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.items_synced, 2u);

    db::product_record product;
    ASSERT_EQ(store.get_product("p-1", product), 1);
    EXPECT_EQ(product.server_synced_at, 5000u);

    db::stock_record stock;
    ASSERT_EQ(store.get_stock("st-1", stock), 1);
    EXPECT_EQ(stock.quantity, 12);

    uint64_t cursor = 0;
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_PRODUCTS, cursor), 1);
    EXPECT_EQ(cursor, 5000u);
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_STOCK, cursor), 1);
    EXPECT_EQ(cursor, 5000u);
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_ALL, cursor), 1);
    EXPECT_EQ(cursor, outcome.completed_at);
}

TEST_F(SyncOrchestratorTest, CursorNeverMovesBackwards) {
    client.download_script = {
        download_success(5000, {make_product("p-1", "Rice", 1000)}),
        download_success(5000),
        download_success(4000, {make_product("p-1", "Rice", 1100)}),
        download_success(4000)};

    ASSERT_TRUE(orchestrator.run_full_sync().success);
    ASSERT_TRUE(orchestrator.run_full_sync().success);

    ASSERT_EQ(client.download_since.size(), 4u);
    EXPECT_EQ(client.download_since[0], 0u);
    EXPECT_EQ(client.download_since[2], 5000u);

    uint64_t cursor = 0;
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_PRODUCTS, cursor), 1);
    EXPECT_EQ(cursor, 5000u);

    // Records are still applied even though the cursor holds.
    db::product_record product;
    ASSERT_EQ(store.get_product("p-1", product), 1);
    EXPECT_EQ(product.unit_price, 1100);
}

TEST_F(SyncOrchestratorTest, FailedProductsDoNotBlockStock) {
    remote::download_result failed;
    failed.success = false;
    failed.message = "Server responded with status 500";

    // Products fail on every attempt. Stock is served from the default result.
    client.download_script = {failed, failed, failed};
    client.default_download = download_success(9000, {}, {make_stock("st-1", "p-1", 3)});

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "Products: Server responded with status 500");
    EXPECT_EQ(outcome.items_synced, 1u);

    db::stock_record stock;
    EXPECT_EQ(store.get_stock("st-1", stock), 1);

    uint64_t cursor = 0;
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_PRODUCTS, cursor), 0);
    EXPECT_EQ(cursor, 0u);
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_ALL, cursor), 0);
    EXPECT_EQ(cursor, 0u);
}

TEST_F(SyncOrchestratorTest, ProgressIsReportedPerStage) {
    add_sales(2);
    std::vector<status::sync_progress_event> events;
    orchestrator.add_progress_listener([&](const status::sync_progress_event &ev) { events.push_back(ev); });

    ASSERT_TRUE(orchestrator.run_full_sync().success);

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().stage, syncer::STAGE_SALES);
    EXPECT_EQ(events.back().stage, syncer::STAGE_STOCK);
    EXPECT_TRUE(events.back().completed);

    bool sales_done = false;
    for (const status::sync_progress_event &ev : events) {
        if (ev.stage == syncer::STAGE_SALES && ev.completed) {
            sales_done = true;
            EXPECT_EQ(ev.total_items, 2u);
            EXPECT_EQ(ev.processed_items, 2u);
            EXPECT_EQ(ev.percentage, 100u);
        }
    }
    EXPECT_TRUE(sales_done);
}

TEST_F(SyncOrchestratorTest, ProgressListenersRunOutsideStoreLock) {
    client.download_script = {
        download_success(5000, {make_product("p-1", "Rice", 1000), make_product("p-2", "Tea", 300)}),
        download_success(5000, {}, {make_stock("st-1", "p-1", 12)})};

    std::vector<bool> free_during_event;
    orchestrator.add_progress_listener([&](const status::sync_progress_event &ev) {
        if (ev.total_items > 0)
            free_during_event.push_back(store_is_free_for_other_threads());
    });

    ASSERT_TRUE(orchestrator.run_full_sync().success);

    ASSERT_FALSE(free_during_event.empty());
    for (const bool is_free : free_during_event)
        EXPECT_TRUE(is_free);
}

TEST_F(SyncOrchestratorTest, ThrowingListenerLeavesStoreUsable) {
    client.download_script = {
        download_success(5000, {make_product("p-1", "Rice", 1000), make_product("p-2", "Tea", 300)})};

    orchestrator.add_progress_listener([](const status::sync_progress_event &ev) {
        if (ev.stage == syncer::STAGE_PRODUCTS && ev.processed_items > 0 && !ev.completed)
            throw std::runtime_error("listener threw");
    });

    const syncer::sync_outcome outcome = orchestrator.run_full_sync();
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_message, "listener threw");
    EXPECT_FALSE(orchestrator.is_sync_in_progress());

    // The downloaded products were committed before listeners ran.
    db::product_record product;
    EXPECT_EQ(store.get_product("p-1", product), 1);
    uint64_t cursor = 0;
    ASSERT_EQ(store.get_sync_cursor(db::CURSOR_PRODUCTS, cursor), 1);
    EXPECT_EQ(cursor, 5000u);

    // A later failed unit of work must still roll back on its own.
    EXPECT_EQ(store.run_in_transaction([&]() {
        if (store.insert_sale(make_sale("s-rolled-back", 1000)) == -1)
            return -1;
        return -1;
    }), -1);
    db::sale_record sale;
    EXPECT_EQ(store.get_sale("s-rolled-back", sale), 0);
}

// ============================================================================
// Background sync
// ============================================================================

TEST_F(SyncOrchestratorTest, BackgroundTimersTriggerSync) {
    ASSERT_EQ(orchestrator.start_background_sync(), 0);
    EXPECT_EQ(orchestrator.start_background_sync(), -1);
    EXPECT_EQ(timers.active_count(), 2u);
    EXPECT_TRUE(monitor.monitoring);

    monitor.reachable = false;
    timers.advance(1000);

    // Two unreachable probes. One periodic sync while connected.
    EXPECT_EQ(monitor.probe_calls.load(), 2u);
    EXPECT_EQ(client.download_calls.load(), 2u);

    orchestrator.stop_background_sync();
    EXPECT_EQ(timers.active_count(), 0u);
    EXPECT_FALSE(monitor.monitoring);

    timers.advance(2000);
    EXPECT_EQ(client.download_calls.load(), 2u);
}

TEST_F(SyncOrchestratorTest, StopDuringMonitoringStartupIsNotBlocked) {
    bool stop_returned = false;
    monitor.on_start_monitoring = [&]() {
        // The first connectivity check of a real monitor can run a whole sync cycle here.
        std::promise<void> stopped;
        std::future<void> done = stopped.get_future();
        std::thread stopper([&]() {
            orchestrator.stop_background_sync();
            stopped.set_value();
        });
        stop_returned = done.wait_for(std::chrono::seconds(2)) == std::future_status::ready;
        stopper.join();
    };

    ASSERT_EQ(orchestrator.start_background_sync(), 0);

    EXPECT_TRUE(stop_returned);
    EXPECT_EQ(timers.active_count(), 0u);
    EXPECT_FALSE(monitor.monitoring);

    // Background sync can be started again afterwards.
    monitor.on_start_monitoring = nullptr;
    EXPECT_EQ(orchestrator.start_background_sync(), 0);
    EXPECT_EQ(timers.active_count(), 2u);
    orchestrator.stop_background_sync();
}

TEST_F(SyncOrchestratorTest, ReachableProbeTriggersSync) {
    ASSERT_EQ(orchestrator.start_background_sync(), 0);

    timers.advance(500);

    EXPECT_EQ(monitor.probe_calls.load(), 1u);
    EXPECT_EQ(client.download_calls.load(), 2u);
}

TEST_F(SyncOrchestratorTest, RestoredConnectivityTriggersSyncAndIsForwarded) {
    std::vector<bool> changes;
    orchestrator.add_connectivity_listener([&](const bool connected) { changes.push_back(connected); });
    ASSERT_EQ(orchestrator.start_background_sync(), 0);

    monitor.set_connected(false);
    EXPECT_EQ(client.download_calls.load(), 0u);

    monitor.set_connected(true);
    EXPECT_EQ(client.download_calls.load(), 2u);
    EXPECT_EQ(changes, (std::vector<bool>{false, true}));
    EXPECT_TRUE(status::get_connected());
}
