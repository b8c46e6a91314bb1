/**
 * @file test_common.hpp
 * @brief Shared fakes and fixtures for possync unit tests
 */

#ifndef _POSSYNC_TESTS_TEST_COMMON_
#define _POSSYNC_TESTS_TEST_COMMON_

#include <gtest/gtest.h>
#include <deque>
#include "pchheader.hpp"
#include "db/sqlite_store.hpp"
#include "remote/api_client.hpp"
#include "conn/connectivity_monitor.hpp"
#include "util/timer.hpp"
#include "txstate/transaction_snapshot.hpp"

namespace possync_test
{
    // ============================================================================
    // Remote api
    // ============================================================================

    /**
     * Api client returning scripted results. Once a script runs out the default result is returned.
     */
    class fake_api_client : public remote::api_client
    {
    public:
        std::mutex mutex;
        std::deque<remote::api_result> upload_script;
        std::deque<remote::download_result> download_script;
        remote::api_result default_upload{true, "", 200};
        remote::download_result default_download;

        std::atomic<size_t> upload_calls = 0;
        std::atomic<size_t> download_calls = 0;
        std::vector<remote::upload_batch> uploaded;
        std::vector<uint64_t> download_since;

        bool throw_on_upload = false;
        std::function<void()> on_upload; // Runs inside upload_changes before the result is produced.

        fake_api_client()
        {
            default_download.success = true;
            default_download.status_code = 200;
            default_download.data = remote::download_data{};
            default_download.data->server_timestamp = 1000;
        }

        remote::api_result upload_changes(const remote::upload_batch &batch) override
        {
            upload_calls++;
            if (on_upload)
                on_upload();

            std::scoped_lock lock(mutex);
            uploaded.push_back(batch);
            if (throw_on_upload)
                throw std::runtime_error("Connection refused");

            if (upload_script.empty())
                return default_upload;

            const remote::api_result result = upload_script.front();
            upload_script.pop_front();
            return result;
        }

        remote::download_result download_changes(std::string_view device_id, const uint64_t since) override
        {
            download_calls++;

            std::scoped_lock lock(mutex);
            download_since.push_back(since);
            if (download_script.empty())
                return default_download;

            const remote::download_result result = download_script.front();
            download_script.pop_front();
            return result;
        }
    };

    inline remote::api_result upload_failure(std::string_view message)
    {
        return remote::api_result{false, std::string(message), 500};
    }

    inline remote::download_result download_success(const uint64_t server_timestamp,
                                                    std::vector<db::product_record> products = {},
                                                    std::vector<db::stock_record> stock = {})
    {
        remote::download_result result;
        result.success = true;
        result.status_code = 200;
        result.data = remote::download_data{std::move(products), std::move(stock), server_timestamp, false};
        return result;
    }

    // ============================================================================
    // Connectivity
    // ============================================================================

    class fake_connectivity_monitor : public conn::connectivity_monitor
    {
    public:
        std::atomic<bool> connected = true;
        std::atomic<bool> reachable = true;
        std::atomic<size_t> probe_calls = 0;
        std::atomic<bool> monitoring = false;
        std::vector<conn::connectivity_listener> listeners;
        std::function<void()> on_start_monitoring; // Runs inside start_monitoring like a first probe would.

        bool is_connected() override
        {
            return connected;
        }

        bool is_server_reachable(std::string_view url, const uint32_t timeout_ms) override
        {
            probe_calls++;
            return reachable;
        }

        void add_listener(conn::connectivity_listener listener) override
        {
            listeners.push_back(std::move(listener));
        }

        int start_monitoring() override
        {
            if (monitoring)
                return -1;
            monitoring = true;
            if (on_start_monitoring)
                on_start_monitoring();
            return 0;
        }

        void stop_monitoring() override
        {
            monitoring = false;
        }

        // Changes the connectivity state and notifies listeners like a real monitor would.
        void set_connected(const bool value)
        {
            if (connected.exchange(value) == value)
                return;
            for (const conn::connectivity_listener &listener : listeners)
                listener(value);
        }
    };

    // ============================================================================
    // Timers
    // ============================================================================

    /**
     * Timer service driven by the test. Time only moves when advance() is called.
     */
    class manual_timer_service : public util::timer_service
    {
    private:
        struct manual_timer
        {
            uint64_t interval_ms = 0;
            uint64_t elapsed_ms = 0;
            std::function<void()> callback;
        };

        std::mutex mutex;
        std::map<uint64_t, manual_timer> timers;
        uint64_t last_id = 0;

    public:
        uint64_t start(const uint64_t interval_ms, std::function<void()> callback) override
        {
            std::scoped_lock lock(mutex);
            const uint64_t id = ++last_id;
            timers.emplace(id, manual_timer{interval_ms == 0 ? 1 : interval_ms, 0, std::move(callback)});
            return id;
        }

        void stop(const uint64_t timer_id) override
        {
            std::scoped_lock lock(mutex);
            timers.erase(timer_id);
        }

        size_t active_count()
        {
            std::scoped_lock lock(mutex);
            return timers.size();
        }

        // Moves time forward one millisecond at a time, firing due timers without holding the lock.
        void advance(const uint64_t ms)
        {
            for (uint64_t t = 0; t < ms; t++)
            {
                std::vector<std::function<void()>> due;
                {
                    std::scoped_lock lock(mutex);
                    for (auto &[id, timer] : timers)
                    {
                        if (++timer.elapsed_ms >= timer.interval_ms)
                        {
                            timer.elapsed_ms = 0;
                            due.push_back(timer.callback);
                        }
                    }
                }

                for (const std::function<void()> &callback : due)
                    callback();
            }
        }
    };

    // ============================================================================
    // Local store
    // ============================================================================

    /**
     * In-memory sqlite store that counts snapshot writes.
     */
    class counting_store : public db::sqlite_store
    {
    public:
        std::atomic<size_t> snapshot_writes = 0;

        counting_store()
        {
            init(":memory:");
        }

        int put_snapshot(const db::snapshot_row &row) override
        {
            snapshot_writes++;
            return db::sqlite_store::put_snapshot(row);
        }
    };

    inline db::sale_record make_sale(const std::string &id, const uint64_t created_at, const int64_t total = 1500)
    {
        db::sale_record sale;
        sale.id = id;
        sale.invoice_number = "INV-" + id;
        sale.total_amount = total;
        sale.payment_method = "cash";
        sale.created_at = created_at;
        sale.device_id = "device-1";

        db::sale_item item;
        item.id = id + "-1";
        item.sale_id = id;
        item.product_id = "p-1";
        item.quantity = 1;
        item.unit_price = total;
        sale.items.push_back(item);
        return sale;
    }

    inline db::product_record make_product(const std::string &id, const std::string &name, const int64_t price)
    {
        db::product_record product;
        product.id = id;
        product.name = name;
        product.unit_price = price;
        product.created_at = 100;
        product.updated_at = 200;
        product.device_id = "server";
        return product;
    }

    inline db::stock_record make_stock(const std::string &id, const std::string &product_id, const int32_t quantity)
    {
        db::stock_record stock;
        stock.id = id;
        stock.product_id = product_id;
        stock.quantity = quantity;
        stock.last_updated_at = 300;
        return stock;
    }

    inline txstate::transaction_snapshot make_snapshot(const std::string &session_id, const size_t item_count, const int64_t grand_total)
    {
        txstate::transaction_snapshot snapshot;
        snapshot.session_id = session_id;
        snapshot.user_id = "user-1";
        snapshot.device_id = "device-1";
        snapshot.shop_id = "shop-1";
        snapshot.payment_method = "cash";
        for (size_t i = 0; i < item_count; i++)
        {
            txstate::snapshot_line_item item;
            item.product_id = "p-" + std::to_string(i);
            item.product_name = "Product " + std::to_string(i);
            item.quantity = 1;
            item.unit_price = item_count == 0 ? 0 : grand_total / item_count;
            item.line_total = item.unit_price;
            snapshot.line_items.push_back(item);
        }
        snapshot.subtotal = grand_total;
        snapshot.grand_total = grand_total;
        return snapshot;
    }

} // namespace possync_test

#endif
