/**
 * LightController Implementation
 */

#include "light_controller.hpp"
#include "gpio_tools.hpp"
#include "logger.h"

extern "C" {
#include "pin_limits.h"
}

static const char *TAG = "Light";

static const char *onOff(int value) {
    return value == PIN_LEVEL_HIGH ? "ON" : "OFF";
}

LightController::LightController(GpioBackend &gpio) : m_gpio(gpio) {
}

void LightController::registerTools(ToolDispatcher &dispatcher) {
    dispatcher.registerTool(
        ToolSchema(TOOL_CONTROL_LIGHT, "Control smart home lighting")
            .oneOf("action", "Light control action", true,
                   std::vector<std::string>{"on", "off", "toggle", "dim"})
            .integer("pin", "GPIO pin connected to the light relay", true, PIN_ID_MIN, PIN_ID_MAX)
            .number("brightness", "Brightness level (0-100) for dimming", false,
                    BRIGHTNESS_MIN, BRIGHTNESS_MAX),
        [this](const nlohmann::json &args) {
            const std::string action = args.at("action").get<std::string>();
            int pin = intArg(args, "pin");

            if (action == "on") return turnOn(pin);
            if (action == "off") return turnOff(pin);
            if (action == "toggle") return toggle(pin);
            return dim(pin, args.value("brightness", nlohmann::json()));
        });
}

GpioStatus LightController::writeLevel(int pin, int value) {
    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return st;
    }
    st = m_gpio.write(pin, value);
    if (st.ok()) {
        LOG_INFO(TAG, "Pin %d %s", pin, onOff(value));
    }
    return st;
}

ToolResult LightController::turnOn(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GpioStatus st = writeLevel(pin, PIN_LEVEL_HIGH);
    if (!st.ok()) {
        return gpioFailure(st);
    }
    return ToolResult::success("Light on pin " + std::to_string(pin) + " turned ON");
}

ToolResult LightController::turnOff(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);
    GpioStatus st = writeLevel(pin, PIN_LEVEL_LOW);
    if (!st.ok()) {
        return gpioFailure(st);
    }
    return ToolResult::success("Light on pin " + std::to_string(pin) + " turned OFF");
}

ToolResult LightController::toggle(int pin) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Read first: nothing is written if the current level is unknown
    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }
    int current = PIN_LEVEL_LOW;
    st = m_gpio.read(pin, current);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    int next = current == PIN_LEVEL_HIGH ? PIN_LEVEL_LOW : PIN_LEVEL_HIGH;
    st = writeLevel(pin, next);
    if (!st.ok()) {
        return gpioFailure(st);
    }
    return ToolResult::success("Light on pin " + std::to_string(pin) + " toggled to " + onOff(next));
}

ToolResult LightController::dim(int pin, const nlohmann::json &brightness) {
    if (!brightness.is_number()) {
        return ToolResult::softError("Brightness value required for dimming");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    int value = brightness_to_level(brightness.get<double>());
    GpioStatus st = writeLevel(pin, value);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    return ToolResult::success("Light on pin " + std::to_string(pin) + " dimmed to " +
                               numberText(brightness) + "% (" + onOff(value) + ")");
}
