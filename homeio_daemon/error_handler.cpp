/**
 * ErrorHandler Implementation
 */

#include "error_handler.hpp"
#include "logger.h"

#include <chrono>

#define LOG_RATE_LIMIT_MS 100  // Minimum time between logs

static const char *TAG = "Error";

static uint64_t now_ms() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

ErrorHandler::ErrorHandler() {
}

void ErrorHandler::report(ErrorLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (level) {
        case ErrorLevel::INFO:
            m_info_count++;
            break;
        case ErrorLevel::WARNING:
            m_warning_count++;
            break;
        case ErrorLevel::ERROR:
            m_error_count++;
            break;
        case ErrorLevel::CRITICAL:
            m_critical_count++;
            break;
    }

    // Rate limiting
    uint64_t now = now_ms();
    if (m_last_log_time_ms != 0 && now - m_last_log_time_ms < LOG_RATE_LIMIT_MS &&
        level != ErrorLevel::CRITICAL) {
        m_suppressed_count++;
        return;
    }
    m_last_log_time_ms = now;

    std::string suffix;
    if (m_suppressed_count > 0) {
        suffix = " (+" + std::to_string(m_suppressed_count) + " suppressed)";
        m_suppressed_count = 0;
    }

    switch (level) {
        case ErrorLevel::INFO:
            LOG_INFO(TAG, "%s%s", message.c_str(), suffix.c_str());
            break;
        case ErrorLevel::WARNING:
            LOG_WARN(TAG, "%s%s", message.c_str(), suffix.c_str());
            break;
        case ErrorLevel::ERROR:
            LOG_ERROR(TAG, "%s%s", message.c_str(), suffix.c_str());
            break;
        case ErrorLevel::CRITICAL:
            LOG_ERROR(TAG, "CRITICAL: %s%s", message.c_str(), suffix.c_str());
            break;
    }
}

uint32_t ErrorHandler::getCount(ErrorLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (level) {
        case ErrorLevel::INFO:     return m_info_count;
        case ErrorLevel::WARNING:  return m_warning_count;
        case ErrorLevel::ERROR:    return m_error_count;
        case ErrorLevel::CRITICAL: return m_critical_count;
    }
    return 0;
}

uint32_t ErrorHandler::getTotal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_info_count + m_warning_count + m_error_count + m_critical_count;
}

void ErrorHandler::clearCounts() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_info_count = 0;
    m_warning_count = 0;
    m_error_count = 0;
    m_critical_count = 0;
}
