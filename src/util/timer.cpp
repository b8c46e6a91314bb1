#include "timer.hpp"
#include "util.hpp"

namespace util
{
    // Max slice the timer workers sleep before re-checking for shutdown (milliseconds).
    constexpr uint64_t IDLE_WAIT = 100;

    uint64_t thread_timer_service::start(const uint64_t interval_ms, std::function<void()> callback)
    {
        std::shared_ptr<timer_worker> worker = std::make_shared<timer_worker>();
        worker->interval_ms = interval_ms == 0 ? 1 : interval_ms;
        worker->callback = std::move(callback);

        std::scoped_lock lock(timers_mutex);
        const uint64_t timer_id = ++last_timer_id;
        worker->thread = std::thread(&thread_timer_service::timer_loop, worker);
        timers.emplace(timer_id, worker);
        return timer_id;
    }

    void thread_timer_service::stop(const uint64_t timer_id)
    {
        std::shared_ptr<timer_worker> worker;
        {
            std::scoped_lock lock(timers_mutex);
            const auto itr = timers.find(timer_id);
            if (itr == timers.end())
                return;

            worker = itr->second;
            timers.erase(itr);
        }

        worker->is_shutting_down = true;

        // A timer may be stopped from within its own callback. We cannot join ourselves in that case.
        // The worker is kept alive by the loop's own shared_ptr until the thread exits.
        if (worker->thread.get_id() == std::this_thread::get_id())
            worker->thread.detach();
        else if (worker->thread.joinable())
            worker->thread.join();
    }

    void thread_timer_service::stop_all()
    {
        std::vector<uint64_t> timer_ids;
        {
            std::scoped_lock lock(timers_mutex);
            for (const auto &[id, worker] : timers)
                timer_ids.push_back(id);
        }

        for (const uint64_t id : timer_ids)
            stop(id);
    }

    thread_timer_service::~thread_timer_service()
    {
        stop_all();
    }

    /**
     * Runs a single timer. Sleeps in small slices so a stop request is honoured promptly.
     */
    void thread_timer_service::timer_loop(std::shared_ptr<timer_worker> worker)
    {
        util::mask_signal();

        uint64_t elapsed = 0;
        while (!worker->is_shutting_down)
        {
            const uint64_t wait = MIN(IDLE_WAIT, worker->interval_ms - elapsed);
            util::sleep(wait);
            elapsed += wait;

            if (worker->is_shutting_down)
                break;

            if (elapsed >= worker->interval_ms)
            {
                elapsed = 0;
                worker->callback();
            }
        }
    }

} // namespace util
