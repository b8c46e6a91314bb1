/**
 * @file test_conflict_resolver.cpp
 * @brief Unit tests for server-wins merging of downloaded records
 */

#include <gtest/gtest.h>
#include "syncer/conflict_resolver.hpp"
#include "test_common.hpp"

namespace resolver = syncer::conflict_resolver;
using namespace possync_test;

class ConflictResolverTest : public ::testing::Test {
protected:
    counting_store store;
};

TEST_F(ConflictResolverTest, NewProductIsInsertedAsSynced) {
    const db::product_record remote = make_product("p-1", "Rice 5kg", 1250);

    ASSERT_EQ(resolver::apply_product(store, remote, 5000), 0);

    db::product_record local;
    ASSERT_EQ(store.get_product("p-1", local), 1);
    EXPECT_EQ(local.name, "Rice 5kg");
    EXPECT_EQ(local.unit_price, 1250);
    EXPECT_EQ(local.sync_status, db::SYNC_STATUS::SYNCED);
    EXPECT_EQ(local.server_synced_at, 5000u);
}

TEST_F(ConflictResolverTest, ServerValuesOverwriteLocalProduct) {
    db::product_record existing = make_product("p-1", "Rice", 1000);
    existing.created_at = 42;
    existing.device_id = "device-1";
    existing.category = "Grocery";
    ASSERT_EQ(store.insert_product(existing), 0);

    db::product_record remote = make_product("p-1", "Rice 5kg", 1250);
    remote.is_active = false;

    ASSERT_EQ(resolver::apply_product(store, remote, 6000), 0);

    db::product_record local;
    ASSERT_EQ(store.get_product("p-1", local), 1);
    EXPECT_EQ(local.name, "Rice 5kg");
    EXPECT_EQ(local.unit_price, 1250);
    EXPECT_FALSE(local.is_active);
    EXPECT_FALSE(local.category.has_value());
    EXPECT_EQ(local.updated_at, remote.updated_at);
    // Provenance fields stay local.
    EXPECT_EQ(local.created_at, 42u);
    EXPECT_EQ(local.device_id, "device-1");
    EXPECT_EQ(local.server_synced_at, 6000u);
}

TEST_F(ConflictResolverTest, ApplyingSameProductTwiceIsIdempotent) {
    const db::product_record remote = make_product("p-1", "Rice 5kg", 1250);

    ASSERT_EQ(resolver::apply_product(store, remote, 5000), 0);
    db::product_record first;
    ASSERT_EQ(store.get_product("p-1", first), 1);

    ASSERT_EQ(resolver::apply_product(store, remote, 5000), 0);
    db::product_record second;
    ASSERT_EQ(store.get_product("p-1", second), 1);

    EXPECT_EQ(first, second);
}

TEST_F(ConflictResolverTest, StockQuantityIsReplacedNotMerged) {
    db::stock_record existing = make_stock("st-1", "p-1", 10);
    existing.sync_status = db::SYNC_STATUS::NOT_SYNCED;
    ASSERT_EQ(store.insert_stock(existing), 0);

    ASSERT_EQ(resolver::apply_stock(store, make_stock("st-1", "p-1", 7), 7000), 0);

    db::stock_record local;
    ASSERT_EQ(store.get_stock("st-1", local), 1);
    EXPECT_EQ(local.quantity, 7);
    EXPECT_EQ(local.sync_status, db::SYNC_STATUS::SYNCED);
    EXPECT_EQ(local.server_synced_at, 7000u);
}

TEST_F(ConflictResolverTest, StockIsMatchedByProductNotId) {
    db::stock_record existing = make_stock("local-stock-1", "p-1", 5);
    existing.sync_status = db::SYNC_STATUS::NOT_SYNCED;
    ASSERT_EQ(store.insert_stock(existing), 0);

    db::stock_record remote = make_stock("srv-stock-9", "p-1", 42);
    remote.last_updated_at = 900;
    ASSERT_EQ(resolver::apply_stock(store, remote, 8000), 0);

    db::stock_record local;
    ASSERT_EQ(store.get_stock("local-stock-1", local), 1);
    EXPECT_EQ(local.quantity, 42);
    EXPECT_EQ(local.last_updated_at, 900u);
    EXPECT_EQ(local.sync_status, db::SYNC_STATUS::SYNCED);
    EXPECT_EQ(local.server_synced_at, 8000u);

    // No second row for the same product.
    db::stock_record server_row;
    EXPECT_EQ(store.get_stock("srv-stock-9", server_row), 0);
}

TEST_F(ConflictResolverTest, StockForUnknownProductIsInserted) {
    ASSERT_EQ(resolver::apply_stock(store, make_stock("srv-stock-9", "p-9", 3), 8000), 0);

    db::stock_record local;
    ASSERT_EQ(store.get_stock_by_product("p-9", local), 1);
    EXPECT_EQ(local.id, "srv-stock-9");
    EXPECT_EQ(local.quantity, 3);
}

TEST_F(ConflictResolverTest, ResolveWithoutLocalKeepsRemoteProvenance) {
    const db::product_record remote = make_product("p-2", "Tea", 300);
    const db::product_record resolved = resolver::resolve_product(std::nullopt, remote, 10);

    EXPECT_EQ(resolved.created_at, remote.created_at);
    EXPECT_EQ(resolved.device_id, remote.device_id);
    EXPECT_EQ(resolved.sync_status, db::SYNC_STATUS::SYNCED);
}
