#ifndef _POSSYNC_PSLOG_
#define _POSSYNC_PSLOG_

#include "pchheader.hpp"

namespace pslog
{
    void init();

} // namespace pslog

#endif
