#ifndef _POSSYNC_SYNCER_RETRY_EXECUTOR_
#define _POSSYNC_SYNCER_RETRY_EXECUTOR_

#include "../pchheader.hpp"
#include "../util/util.hpp"

namespace syncer
{
    struct retry_config
    {
        uint32_t max_attempts = 3;       // Attempts per operation including the first.
        uint64_t initial_delay_ms = 5000; // Delay before the first retry.
        double backoff_multiplier = 2.0;  // Applied to the delay after every retry.
        uint64_t max_delay_ms = 0;        // Delay ceiling. 0 means uncapped.
    };

    struct retry_state
    {
        uint32_t attempt_count = 0;
        uint64_t next_delay_ms = 0;
    };

    // Blocks the caller for the given number of milliseconds.
    typedef std::function<void(const uint64_t)> sleep_function;

    /**
     * Runs fallible remote operations with bounded exponential backoff. Operation results must expose
     * 'success' and 'message' fields and be default constructible.
     */
    class retry_executor
    {
    private:
        retry_config config;
        sleep_function sleeper;
        std::mutex state_mutex;
        std::unordered_map<std::string, retry_state> states; // Keyed by operation.

        void record_state(const std::string &key, const uint32_t attempt_count, const uint64_t next_delay_ms);

        void clear_state(const std::string &key);

        uint64_t capped(const uint64_t delay_ms) const;

        uint64_t next_delay(const uint64_t delay_ms) const;

    public:
        retry_executor(const retry_config &config, sleep_function sleeper = util::sleep);

        /**
         * Executes the operation until it succeeds or the attempts are exhausted. Exceptions thrown by the
         * operation count as failed attempts.
         * @param op The operation to run.
         * @param key Operation key used to track retry state.
         * @returns The successful result, the last failed result, or a failed result carrying the
         *          message of the exception thrown by the last attempt.
         */
        template <typename RESULT>
        RESULT execute(const std::function<RESULT()> &op, const std::string &key)
        {
            const uint32_t max_attempts = MAX(config.max_attempts, 1u);
            uint64_t delay = capped(config.initial_delay_ms);

            for (uint32_t attempt = 1;; attempt++)
            {
                RESULT result;
                try
                {
                    result = op();
                }
                catch (const std::exception &e)
                {
                    LOG_WARNING << "Operation " << key << " threw an exception. " << e.what();
                    result = RESULT();
                    result.success = false;
                    result.message = e.what();
                }

                if (result.success)
                {
                    clear_state(key);
                    return result;
                }

                if (attempt >= max_attempts)
                {
                    LOG_ERROR << "Operation " << key << " failed after " << max_attempts << " attempts. " << result.message;
                    record_state(key, max_attempts, delay);
                    return result;
                }

                LOG_WARNING << "Operation " << key << " failed (attempt " << attempt << "/" << max_attempts << "). "
                            << result.message << " Retrying in " << delay << "ms.";
                record_state(key, attempt, delay);
                sleeper(delay);
                delay = next_delay(delay);
            }
        }

        uint32_t get_attempts(const std::string &key);

        void clear_all();
    };

} // namespace syncer

#endif
