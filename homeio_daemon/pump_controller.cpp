/**
 * PumpController Implementation
 *
 * Lock order: pump mutex -> scheduler -> backend. The auto-stop runs
 * on the scheduler thread under the scheduler lock and only touches the
 * backend, so it never waits on the pump mutex.
 */

#include "pump_controller.hpp"
#include "gpio_tools.hpp"
#include "logger.h"

#include <chrono>
#include <cmath>

extern "C" {
#include "pin_limits.h"
}

static const char *TAG = "Pump";

PumpController::PumpController(GpioBackend &gpio, TimedScheduler &scheduler,
                               ErrorHandler &error_handler)
    : m_gpio(gpio), m_scheduler(scheduler), m_error_handler(error_handler) {
}

void PumpController::registerTools(ToolDispatcher &dispatcher) {
    dispatcher.registerTool(
        ToolSchema(TOOL_CONTROL_PUMP, "Control water pump or irrigation system")
            .oneOf("action", "Pump control action", true,
                   std::vector<std::string>{"start", "stop", "status"})
            .integer("pin", "GPIO pin connected to the pump relay", true, PIN_ID_MIN, PIN_ID_MAX)
            .number("duration", "Duration in seconds for timed operation", false,
                    PUMP_DURATION_MIN_S),
        [this](const nlohmann::json &args) {
            const std::string action = args.at("action").get<std::string>();
            int pin = intArg(args, "pin");

            if (action == "start") return start(pin, args.value("duration", nlohmann::json()));
            if (action == "stop") return stop(pin);
            return status(pin);
        });
}

ToolResult PumpController::start(int pin, const nlohmann::json &duration) {
    std::lock_guard<std::mutex> lock(m_mutex);

    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    // Once cancel() returns, no older auto-stop can fire on this pin
    m_scheduler.cancel(pin);

    st = m_gpio.write(pin, PIN_LEVEL_HIGH);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    std::string text = "Pump on pin " + std::to_string(pin) + " started";

    if (duration.is_number()) {
        std::string duration_text = numberText(duration);
        double delay_ms = duration.get<double>() * 1000.0;
        if (delay_ms > static_cast<double>(TIMED_DELAY_MAX_MS)) {
            delay_ms = static_cast<double>(TIMED_DELAY_MAX_MS);
        }
        auto delay = std::chrono::milliseconds(std::llround(delay_ms));

        m_scheduler.schedule(pin, delay, [this, pin, duration_text]() {
            autoStop(pin, duration_text);
        });

        LOG_INFO(TAG, "Pin %d started for %s seconds", pin, duration_text.c_str());
        text += " for " + duration_text + " seconds";
    } else {
        LOG_INFO(TAG, "Pin %d started", pin);
    }

    return ToolResult::success(text);
}

ToolResult PumpController::stop(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    if (m_scheduler.cancel(pin)) {
        LOG_INFO(TAG, "Pin %d: manual stop pre-empted auto-stop", pin);
    }

    st = m_gpio.write(pin, PIN_LEVEL_LOW);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    LOG_INFO(TAG, "Pin %d stopped", pin);
    return ToolResult::success("Pump on pin " + std::to_string(pin) + " stopped");
}

ToolResult PumpController::status(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    int value = PIN_LEVEL_LOW;
    st = m_gpio.read(pin, value);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    return ToolResult::success("Pump on pin " + std::to_string(pin) + " is " +
                               (value == PIN_LEVEL_HIGH ? "RUNNING" : "STOPPED"));
}

PumpState PumpController::state(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    int value = PIN_LEVEL_LOW;
    if (!m_gpio.read(pin, value).ok() || value != PIN_LEVEL_HIGH) {
        return PumpState::STOPPED;
    }
    return m_scheduler.isPending(pin) ? PumpState::RUNNING_TIMED : PumpState::RUNNING_INDEFINITE;
}

void PumpController::autoStop(int pin, const std::string &duration_text) {
    GpioStatus st = m_gpio.write(pin, PIN_LEVEL_LOW);
    if (!st.ok()) {
        m_error_handler.report(ErrorLevel::ERROR,
            "Auto-stop of pump on pin " + std::to_string(pin) + " failed: " + st.message);
        return;
    }
    LOG_INFO(TAG, "Pump on pin %d stopped after %s seconds", pin, duration_text.c_str());
}
