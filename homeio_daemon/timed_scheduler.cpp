/**
 * TimedScheduler Implementation
 */

#include "timed_scheduler.hpp"
#include "logger.h"

#include <exception>

static const char *TAG = "Timer";

TimedScheduler::TimedScheduler() {
    m_worker = std::thread(&TimedScheduler::run, this);
}

TimedScheduler::~TimedScheduler() {
    shutdown();
}

uint64_t TimedScheduler::schedule(int pin, std::chrono::milliseconds delay, Action action) {
    if (delay.count() > TIMED_DELAY_MAX_MS) {
        LOG_WARN(TAG, "Pin %d: delay %lld ms clamped to %lld ms", pin,
                 static_cast<long long>(delay.count()), TIMED_DELAY_MAX_MS);
        delay = std::chrono::milliseconds(TIMED_DELAY_MAX_MS);
    } else if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    uint64_t gen = ++m_generation[pin];
    if (m_pending.erase(pin) > 0) {
        LOG_INFO(TAG, "Pin %d: replaced pending operation", pin);
    }

    Operation op;
    op.fire_at = Clock::now() + delay;
    op.generation = gen;
    op.action = std::move(action);
    m_pending[pin] = std::move(op);

    LOG_INFO(TAG, "Pin %d: scheduled in %lld ms (gen %llu)", pin,
             static_cast<long long>(delay.count()), static_cast<unsigned long long>(gen));
    m_cv.notify_all();
    return gen;
}

bool TimedScheduler::cancel(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    ++m_generation[pin];
    if (m_pending.erase(pin) == 0) {
        return false;
    }

    LOG_INFO(TAG, "Pin %d: pending operation cancelled", pin);
    m_cv.notify_all();
    return true;
}

bool TimedScheduler::isPending(int pin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.find(pin) != m_pending.end();
}

size_t TimedScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

uint64_t TimedScheduler::generation(int pin) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_generation.find(pin);
    return it == m_generation.end() ? 0 : it->second;
}

uint32_t TimedScheduler::firedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_fired;
}

void TimedScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        if (!m_pending.empty()) {
            LOG_INFO(TAG, "Dropping %zu pending operations", m_pending.size());
        }
        m_pending.clear();
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void TimedScheduler::run() {
    std::unique_lock<std::mutex> lock(m_mutex);

    while (m_running) {
        if (m_pending.empty()) {
            m_cv.wait(lock);
            continue;
        }

        auto next = m_pending.begin();
        for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
            if (it->second.fire_at < next->second.fire_at) {
                next = it;
            }
        }

        Clock::time_point deadline = next->second.fire_at;
        if (Clock::now() < deadline) {
            // Table may change while waiting; re-scan on wake
            m_cv.wait_until(lock, deadline);
            continue;
        }

        int pin = next->first;
        Operation op = std::move(next->second);
        m_pending.erase(next);

        if (op.generation != m_generation[pin]) {
            LOG_DEBUG(TAG, "Pin %d: stale operation (gen %llu) discarded", pin,
                      static_cast<unsigned long long>(op.generation));
            continue;
        }

        LOG_INFO(TAG, "Pin %d: firing (gen %llu)", pin,
                 static_cast<unsigned long long>(op.generation));
        m_fired++;
        try {
            op.action();
        } catch (const std::exception &e) {
            LOG_ERROR(TAG, "Pin %d: action failed: %s", pin, e.what());
        }
    }
}
