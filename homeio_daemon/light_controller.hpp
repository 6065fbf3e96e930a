#ifndef LIGHT_CONTROLLER_HPP
#define LIGHT_CONTROLLER_HPP

#include <mutex>

#include "gpio_backend.hpp"
#include "tool_dispatcher.hpp"

/**
 * LightController - control_light tool
 *
 * Lights hang off relay outputs, so dimming is on/off only:
 * brightness above 50 switches on, 50 and below switches off.
 */
class LightController {
public:
    explicit LightController(GpioBackend &gpio);

    void registerTools(ToolDispatcher &dispatcher);

    ToolResult turnOn(int pin);
    ToolResult turnOff(int pin);
    ToolResult toggle(int pin);
    ToolResult dim(int pin, const nlohmann::json &brightness);

private:
    GpioStatus writeLevel(int pin, int value);

    GpioBackend &m_gpio;
    std::mutex m_mutex;
};

#endif // LIGHT_CONTROLLER_HPP
