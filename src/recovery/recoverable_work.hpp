#ifndef _POSSYNC_RECOVERY_RECOVERABLE_WORK_
#define _POSSYNC_RECOVERY_RECOVERABLE_WORK_

#include "../pchheader.hpp"
#include "../txstate/transaction_snapshot.hpp"

namespace recovery
{
    enum WORK_PRIORITY
    {
        LOW = 0,
        NORMAL = 1,
        HIGH = 2,
        CRITICAL = 3
    };

    // An in-flight sale left behind by a crashed session.
    struct sale_transaction_work
    {
        txstate::transaction_snapshot snapshot;
    };

    // Work whose kind this version does not know how to restore.
    struct unrecognized_work
    {
        std::string kind;
        std::string data;
    };

    typedef std::variant<sale_transaction_work, unrecognized_work> work_payload;

    struct recoverable_work_item
    {
        std::string id;
        work_payload payload;
        std::string title;
        std::string description;
        WORK_PRIORITY priority = WORK_PRIORITY::NORMAL;
        std::string user_id;
        std::string device_id;
        uint64_t last_modified = 0;
        uint64_t discovered_at = 0;
        bool restored = false;
        std::optional<uint64_t> restored_at;
    };

    struct restoration_result
    {
        bool success = false;
        std::string message;
        std::optional<std::string> restored_session_id;
        std::vector<std::string> actions_performed;
        std::vector<std::string> warnings;
    };

    struct crash_recovery_result
    {
        bool crash_detected = false;
        size_t recoverable_count = 0;
        size_t succeeded = 0;
        size_t failed = 0;
        std::vector<recoverable_work_item> available_work;
        std::vector<std::string> actions;
        std::vector<std::string> errors;
        uint64_t duration_ms = 0;
    };

    struct recovery_statistics
    {
        uint64_t period_start = 0;
        uint64_t period_end = 0;
        size_t total_crashes = 0;
        std::optional<uint64_t> last_crash_at;
        size_t restored_count = 0;
        size_t discarded_count = 0;
    };

    // Limits above which an unsaved sale is considered high priority.
    struct priority_thresholds
    {
        int64_t high_priority_total = 100000; // Cents.
        uint32_t high_priority_item_count = 10;
    };

} // namespace recovery

#endif
