#ifndef _POSSYNC_UTIL_TIMER_
#define _POSSYNC_UTIL_TIMER_

#include "../pchheader.hpp"

namespace util
{
    /**
     * Schedules recurring callbacks. Each started timer fires its callback once per interval
     * until it is stopped. Components own the timer ids they start.
     */
    class timer_service
    {
    public:
        /**
         * Starts a recurring timer.
         * @param interval_ms Interval between two consecutive callback invocations.
         * @param callback Function to invoke on each tick.
         * @returns Id of the started timer (never 0).
         */
        virtual uint64_t start(const uint64_t interval_ms, std::function<void()> callback) = 0;

        /**
         * Stops the timer with the given id. Stopping an unknown or already stopped timer does nothing.
         */
        virtual void stop(const uint64_t timer_id) = 0;

        virtual ~timer_service() {}
    };

    /**
     * Timer service backed by one worker thread per timer.
     */
    class thread_timer_service : public timer_service
    {
    private:
        struct timer_worker
        {
            uint64_t interval_ms = 0;
            std::function<void()> callback;
            std::atomic<bool> is_shutting_down = false;
            std::thread thread;
        };

        std::mutex timers_mutex;
        std::unordered_map<uint64_t, std::shared_ptr<timer_worker>> timers;
        uint64_t last_timer_id = 0;

        static void timer_loop(std::shared_ptr<timer_worker> worker);

    public:
        uint64_t start(const uint64_t interval_ms, std::function<void()> callback);

        void stop(const uint64_t timer_id);

        void stop_all();

        ~thread_timer_service();
    };

} // namespace util

#endif
