#ifndef GPIO_TOOLS_HPP
#define GPIO_TOOLS_HPP

#include "gpio_backend.hpp"
#include "tool_dispatcher.hpp"

/**
 * GpioTools - Raw pin primitives
 *
 * gpio_read_pin, gpio_write_pin, gpio_setup_pin, gpio_list_pins.
 * Each is one backend call plus a text summary. Unknown pins are set
 * up on first use: input for a read, output for a write.
 */
class GpioTools {
public:
    explicit GpioTools(GpioBackend &gpio);

    void registerTools(ToolDispatcher &dispatcher);

    ToolResult readPin(int pin);
    ToolResult writePin(int pin, int value);
    ToolResult setupPin(int pin, GpioBackend::Direction dir);
    ToolResult listPins();

private:
    GpioBackend &m_gpio;
};

/**
 * Set up pin with dir unless it is already configured.
 */
GpioStatus ensurePin(GpioBackend &gpio, int pin, GpioBackend::Direction dir);

/**
 * Backend failure as a hard tool failure.
 */
ToolResult gpioFailure(const GpioStatus &status);

inline const char *levelName(int value) {
    return value == 1 ? "HIGH" : "LOW";
}

#endif // GPIO_TOOLS_HPP
