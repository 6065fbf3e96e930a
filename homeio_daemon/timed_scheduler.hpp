#ifndef TIMED_SCHEDULER_HPP
#define TIMED_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// Longer delays are clamped; now() + delay must stay representable
#define TIMED_DELAY_MAX_MS  (100LL * 365 * 24 * 3600 * 1000)

/**
 * TimedScheduler - Delayed per-pin actions
 *
 * At most one live operation per pin. Scheduling on a pin replaces the
 * previous operation; cancel() removes it. Each pin carries a generation
 * counter that every schedule/cancel bumps, and an operation fires only
 * if its generation is still current.
 *
 * Actions run on the scheduler thread with the scheduler lock held, so
 * a cancel() that returns has either prevented the action or waited for
 * it to finish. Actions must not call back into the scheduler.
 */
class TimedScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Action = std::function<void()>;

    TimedScheduler();
    ~TimedScheduler();

    TimedScheduler(const TimedScheduler &) = delete;
    TimedScheduler &operator=(const TimedScheduler &) = delete;

    /**
     * Run action on pin after delay, clamped to TIMED_DELAY_MAX_MS.
     * Returns the operation's generation.
     */
    uint64_t schedule(int pin, std::chrono::milliseconds delay, Action action);

    /**
     * Cancel the live operation on pin. Returns true if one was pending.
     */
    bool cancel(int pin);

    bool isPending(int pin) const;
    size_t pendingCount() const;

    // Current generation for pin (0 if never touched)
    uint64_t generation(int pin) const;

    uint32_t firedCount() const;

    /**
     * Stop the worker thread. Pending operations are dropped unfired.
     */
    void shutdown();

private:
    struct Operation {
        Clock::time_point fire_at;
        uint64_t generation = 0;
        Action action;
    };

    void run();

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<int, Operation> m_pending;
    std::map<int, uint64_t> m_generation;
    uint32_t m_fired = 0;
    bool m_running = true;
    std::thread m_worker;
};

#endif // TIMED_SCHEDULER_HPP
