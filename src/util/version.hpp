#ifndef _POSSYNC_UTIL_VERSION_
#define _POSSYNC_UTIL_VERSION_

#include "../pchheader.hpp"

namespace version
{
    // possync version. Written to new configs and recorded on every application session.
    constexpr const char *POSSYNC_VERSION = "1.2.0";

    // Minimum compatible config version (this will be used to validate configs).
    constexpr const char *MIN_CONFIG_VERSION = "1.0.0";

    // Platform string recorded on application sessions.
    constexpr const char *PLATFORM = "linux";

    int version_compare(const std::string &x, const std::string &y);

}

#endif
