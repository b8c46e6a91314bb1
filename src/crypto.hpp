#ifndef _POSSYNC_CRYPTO_
#define _POSSYNC_CRYPTO_

#include "pchheader.hpp"

/**
 * Offers convenience functions wrapping libsodium.
 * Used for generating device, session and work item identifiers.
 */
namespace crypto
{
    int init();

    void random_bytes(std::string &result, const size_t len);

    const std::string generate_uuid();

} // namespace crypto

#endif
