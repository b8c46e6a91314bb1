#include "conflict_resolver.hpp"

namespace syncer::conflict_resolver
{
    /**
     * Produces the local product state after receiving a server delta.
     * Every business field comes from the server. Local creation time and originating device are record
     * provenance and are kept when the product already exists locally.
     * @param local Existing local product if any.
     * @param remote Product as reported by the server.
     * @param synced_at Server timestamp of the delta.
     */
    db::product_record resolve_product(const std::optional<db::product_record> &local, const db::product_record &remote, const uint64_t synced_at)
    {
        db::product_record resolved = remote;
        if (local)
        {
            resolved.created_at = local->created_at;
            resolved.device_id = local->device_id;
        }

        resolved.sync_status = db::SYNC_STATUS::SYNCED;
        resolved.server_synced_at = synced_at;
        return resolved;
    }

    /**
     * Produces the local stock state after receiving a server delta. The server quantity replaces the local
     * quantity as is. It is not recalculated from local movements. An existing local row of the product keeps
     * its own id so the product never ends up with two stock rows.
     */
    db::stock_record resolve_stock(const std::optional<db::stock_record> &local, const db::stock_record &remote, const uint64_t synced_at)
    {
        db::stock_record resolved = remote;
        if (local)
            resolved.id = local->id;

        resolved.sync_status = db::SYNC_STATUS::SYNCED;
        resolved.server_synced_at = synced_at;
        return resolved;
    }

    /**
     * Inserts or overwrites the local copy of a downloaded product.
     * @returns 0 on success. -1 on failure.
     */
    int apply_product(db::local_store &store, const db::product_record &remote, const uint64_t synced_at)
    {
        db::product_record existing;
        const int res = store.get_product(remote.id, existing);
        if (res == -1)
            return -1;

        if (res == 1)
        {
            LOG_DEBUG << "Resolving conflict for product " << remote.id << ". Server wins.";
            return store.update_product(resolve_product(existing, remote, synced_at));
        }

        return store.insert_product(resolve_product(std::nullopt, remote, synced_at));
    }

    /**
     * Inserts or overwrites the local stock of the product a downloaded stock record belongs to.
     * @returns 0 on success. -1 on failure.
     */
    int apply_stock(db::local_store &store, const db::stock_record &remote, const uint64_t synced_at)
    {
        db::stock_record existing;
        const int res = store.get_stock_by_product(remote.product_id, existing);
        if (res == -1)
            return -1;

        if (res == 1)
        {
            LOG_DEBUG << "Resolving conflict for stock of product " << remote.product_id << ". Server wins.";
            return store.update_stock(resolve_stock(existing, remote, synced_at));
        }

        return store.insert_stock(resolve_stock(std::nullopt, remote, synced_at));
    }

} // namespace syncer::conflict_resolver
