#ifndef _POSSYNC_SYNCER_CONFLICT_RESOLVER_
#define _POSSYNC_SYNCER_CONFLICT_RESOLVER_

#include "../pchheader.hpp"
#include "../db/local_store.hpp"

/**
 * Merge policy for downloaded catalog and stock records. The server is authoritative: its values replace the
 * local ones field by field and there is no user facing conflict resolution.
 */
namespace syncer::conflict_resolver
{
    db::product_record resolve_product(const std::optional<db::product_record> &local, const db::product_record &remote, const uint64_t synced_at);

    db::stock_record resolve_stock(const std::optional<db::stock_record> &local, const db::stock_record &remote, const uint64_t synced_at);

    int apply_product(db::local_store &store, const db::product_record &remote, const uint64_t synced_at);

    int apply_stock(db::local_store &store, const db::stock_record &remote, const uint64_t synced_at);

} // namespace syncer::conflict_resolver

#endif
