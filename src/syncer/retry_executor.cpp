#include "retry_executor.hpp"

namespace syncer
{
    retry_executor::retry_executor(const retry_config &config, sleep_function sleeper)
        : config(config), sleeper(std::move(sleeper))
    {
    }

    void retry_executor::record_state(const std::string &key, const uint32_t attempt_count, const uint64_t next_delay_ms)
    {
        std::scoped_lock lock(state_mutex);
        retry_state &state = states[key];
        state.attempt_count = attempt_count;
        state.next_delay_ms = next_delay_ms;
    }

    void retry_executor::clear_state(const std::string &key)
    {
        std::scoped_lock lock(state_mutex);
        states.erase(key);
    }

    uint64_t retry_executor::capped(const uint64_t delay_ms) const
    {
        return (config.max_delay_ms > 0 && delay_ms > config.max_delay_ms) ? config.max_delay_ms : delay_ms;
    }

    uint64_t retry_executor::next_delay(const uint64_t delay_ms) const
    {
        return capped(static_cast<uint64_t>(delay_ms * config.backoff_multiplier));
    }

    /**
     * @returns Attempts recorded against the operation since its last success. 0 if none.
     */
    uint32_t retry_executor::get_attempts(const std::string &key)
    {
        std::scoped_lock lock(state_mutex);
        const auto itr = states.find(key);
        return itr == states.end() ? 0 : itr->second.attempt_count;
    }

    void retry_executor::clear_all()
    {
        std::scoped_lock lock(state_mutex);
        states.clear();
    }

} // namespace syncer
