#ifndef _POSSYNC_PCHHEADER_
#define _POSSYNC_PCHHEADER_

#include <algorithm>
#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/stacktrace.hpp>
#include <chrono>
#include <concurrentqueue.h>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <jsoncons/json.hpp>
#include <libgen.h>
#include <limits.h>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <plog/Log.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <set>
#include <shared_mutex>
#include <sodium.h>
#include <sqlite3.h>
#include <sstream>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <sys/types.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#endif
