/**
 * GpioTools Implementation
 */

#include "gpio_tools.hpp"
#include "logger.h"

#include <cctype>

extern "C" {
#include "pin_limits.h"
}

static const char *TAG = "GPIO";

GpioStatus ensurePin(GpioBackend &gpio, int pin, GpioBackend::Direction dir) {
    if (gpio.isConfigured(pin)) {
        return GpioStatus::success();
    }
    LOG_DEBUG(TAG, "Implicit setup of pin %d as %s", pin, GpioBackend::directionName(dir));
    return gpio.setup(pin, dir);
}

ToolResult gpioFailure(const GpioStatus &status) {
    return ToolResult::failure(RPC_ERR_INTERNAL, status.message);
}

GpioTools::GpioTools(GpioBackend &gpio) : m_gpio(gpio) {
}

void GpioTools::registerTools(ToolDispatcher &dispatcher) {
    dispatcher.registerTool(
        ToolSchema(TOOL_GPIO_READ_PIN, "Read the current state of a GPIO pin")
            .integer("pin", "GPIO pin number to read", true, PIN_ID_MIN, PIN_ID_MAX),
        [this](const nlohmann::json &args) {
            return readPin(intArg(args, "pin"));
        });

    dispatcher.registerTool(
        ToolSchema(TOOL_GPIO_WRITE_PIN, "Set the state of a GPIO pin (HIGH/LOW)")
            .integer("pin", "GPIO pin number to control", true, PIN_ID_MIN, PIN_ID_MAX)
            .oneOf("value", "Pin value: 0 for LOW, 1 for HIGH", true,
                   std::vector<int>{PIN_LEVEL_LOW, PIN_LEVEL_HIGH}),
        [this](const nlohmann::json &args) {
            return writePin(intArg(args, "pin"), intArg(args, "value"));
        });

    dispatcher.registerTool(
        ToolSchema(TOOL_GPIO_SETUP_PIN, "Setup a GPIO pin as input or output")
            .integer("pin", "GPIO pin number to setup", true, PIN_ID_MIN, PIN_ID_MAX)
            .oneOf("direction", "Pin direction: in for input, out for output", true,
                   std::vector<std::string>{"in", "out"}),
        [this](const nlohmann::json &args) {
            GpioBackend::Direction dir = GpioBackend::Direction::INPUT;
            GpioBackend::parseDirection(args.at("direction").get<std::string>(), dir);
            return setupPin(intArg(args, "pin"), dir);
        });

    dispatcher.registerTool(
        ToolSchema(TOOL_GPIO_LIST_PINS, "List all configured GPIO pins and their current states"),
        [this](const nlohmann::json &) {
            return listPins();
        });
}

ToolResult GpioTools::readPin(int pin) {
    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::INPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    int value = 0;
    st = m_gpio.read(pin, value);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    return ToolResult::success("GPIO pin " + std::to_string(pin) + " current state: " +
                               levelName(value) + " (" + std::to_string(value) + ")");
}

ToolResult GpioTools::writePin(int pin, int value) {
    GpioStatus st = ensurePin(m_gpio, pin, GpioBackend::Direction::OUTPUT);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    st = m_gpio.write(pin, value);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    return ToolResult::success("GPIO pin " + std::to_string(pin) + " set to " +
                               levelName(value) + " (" + std::to_string(value) + ")");
}

ToolResult GpioTools::setupPin(int pin, GpioBackend::Direction dir) {
    GpioStatus st = m_gpio.setup(pin, dir);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    std::string dir_upper = GpioBackend::directionName(dir);
    for (char &c : dir_upper) {
        c = toupper(c);
    }
    return ToolResult::success("GPIO pin " + std::to_string(pin) + " configured as " + dir_upper);
}

ToolResult GpioTools::listPins() {
    std::map<int, GpioBackend::PinState> pins;
    GpioStatus st = m_gpio.list(pins);
    if (!st.ok()) {
        return gpioFailure(st);
    }

    // ordered_json keeps numeric pin order ("2" before "10")
    nlohmann::ordered_json status = nlohmann::ordered_json::object();
    for (const auto &entry : pins) {
        nlohmann::ordered_json pin_state;
        pin_state["direction"] = GpioBackend::directionName(entry.second.direction);
        pin_state["value"] = entry.second.value;
        status[std::to_string(entry.first)] = pin_state;
    }

    return ToolResult::success("GPIO Pin Status:\n" + status.dump(2));
}
