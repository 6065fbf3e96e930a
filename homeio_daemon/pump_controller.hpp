#ifndef PUMP_CONTROLLER_HPP
#define PUMP_CONTROLLER_HPP

#include <mutex>

#include "gpio_backend.hpp"
#include "timed_scheduler.hpp"
#include "tool_dispatcher.hpp"
#include "error_handler.hpp"

/**
 * Pump run state, derived from the pin level and the scheduler.
 */
enum class PumpState {
    STOPPED,            // level 0, nothing scheduled
    RUNNING_INDEFINITE, // level 1, nothing scheduled
    RUNNING_TIMED       // level 1, auto-stop pending
};

/**
 * PumpController - control_pump tool
 *
 * start [duration]: drive the relay high; with a duration, schedule an
 *                   auto-stop. Every start cancels any older auto-stop
 *                   on the pin first, so a re-arm restarts the countdown.
 * stop:             cancel the auto-stop, drive the relay low.
 * status:           RUNNING/STOPPED from the pin level only.
 */
class PumpController {
public:
    PumpController(GpioBackend &gpio, TimedScheduler &scheduler, ErrorHandler &error_handler);

    void registerTools(ToolDispatcher &dispatcher);

    /**
     * duration is a JSON number of seconds, or null for an untimed run.
     */
    ToolResult start(int pin, const nlohmann::json &duration);
    ToolResult stop(int pin);
    ToolResult status(int pin);

    /**
     * Finer state than status(): tells timed from indefinite runs.
     */
    PumpState state(int pin);

private:
    void autoStop(int pin, const std::string &duration_text);

    GpioBackend &m_gpio;
    TimedScheduler &m_scheduler;
    ErrorHandler &m_error_handler;
    std::mutex m_mutex;
};

#endif // PUMP_CONTROLLER_HPP
