#ifndef ERROR_HANDLER_HPP
#define ERROR_HANDLER_HPP

#include <string>
#include <cstdint>
#include <mutex>

/**
 * Error severity levels
 */
enum class ErrorLevel {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * ErrorHandler - Centralized failure accounting
 *
 * Features:
 * - Per-level counters (reported by the dispatcher and timed operations)
 * - Rate-limited logging; CRITICAL is never suppressed
 */
class ErrorHandler {
public:
    ErrorHandler();

    /**
     * Report a failure.
     */
    void report(ErrorLevel level, const std::string &message);

    /**
     * Get count by level.
     */
    uint32_t getCount(ErrorLevel level) const;

    /**
     * Total of all levels.
     */
    uint32_t getTotal() const;

    /**
     * Clear counts.
     */
    void clearCounts();

private:
    mutable std::mutex m_mutex;

    uint32_t m_info_count = 0;
    uint32_t m_warning_count = 0;
    uint32_t m_error_count = 0;
    uint32_t m_critical_count = 0;

    uint64_t m_last_log_time_ms = 0;
    uint32_t m_suppressed_count = 0;
};

#endif // ERROR_HANDLER_HPP
