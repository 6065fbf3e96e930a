/**
 * Simulated GPIO backend
 *
 * In-memory pin registry for development hosts and tests.
 * Mirrors the sysfs backend's semantics exactly.
 */

#include "gpio_backend.hpp"
#include "logger.h"

#include <mutex>

extern "C" {
#include "pin_limits.h"
}

static const char *TAG = "SimGPIO";

class GpioSimulated : public GpioBackend {
public:
    GpioSimulated() = default;
    ~GpioSimulated() override { cleanup(); }

    bool init() override {
        LOG_INFO(TAG, "Simulated GPIO backend initialized");
        return true;
    }

    GpioStatus setup(int pin, Direction dir) override {
        if (!pin_id_valid(pin)) {
            return invalidPin(pin);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pins.find(pin);
        if (it != m_pins.end()) {
            if (it->second.direction == dir) {
                return GpioStatus::success();
            }
            LOG_DEBUG(TAG, "Re-configuring pin %d as %s", pin, directionName(dir));
            it->second.direction = dir;
            it->second.value = PIN_LEVEL_LOW;
            return GpioStatus::success();
        }

        LOG_DEBUG(TAG, "Initializing pin %d with direction %s", pin, directionName(dir));
        PinState state;
        state.direction = dir;
        state.value = PIN_LEVEL_LOW;
        m_pins[pin] = state;
        return GpioStatus::success();
    }

    GpioStatus read(int pin, int &value) override {
        if (!pin_id_valid(pin)) {
            return invalidPin(pin);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pins.find(pin);
        if (it == m_pins.end()) {
            return GpioStatus::failure(GpioError::NOT_INITIALIZED, notInitializedMessage(pin));
        }
        value = it->second.value;
        LOG_DEBUG(TAG, "Read pin %d -> %d", pin, value);
        return GpioStatus::success();
    }

    GpioStatus write(int pin, int value) override {
        if (!pin_id_valid(pin)) {
            return invalidPin(pin);
        }
        if (!pin_level_valid(value)) {
            return GpioStatus::failure(GpioError::INVALID_ARGUMENT,
                "Invalid value " + std::to_string(value) + " for pin " +
                std::to_string(pin) + " (must be 0 or 1)");
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pins.find(pin);
        if (it == m_pins.end()) {
            return GpioStatus::failure(GpioError::NOT_INITIALIZED, notInitializedMessage(pin));
        }
        it->second.value = value;
        LOG_DEBUG(TAG, "Wrote %d to pin %d", value, pin);
        return GpioStatus::success();
    }

    GpioStatus list(std::map<int, PinState> &pins) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        pins = m_pins;
        return GpioStatus::success();
    }

    bool isConfigured(int pin) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pins.find(pin) != m_pins.end();
    }

    void cleanup() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_pins.empty()) {
            LOG_DEBUG(TAG, "Releasing %zu pins", m_pins.size());
        }
        m_pins.clear();
    }

    bool isSimulated() const override { return true; }

private:
    static GpioStatus invalidPin(int pin) {
        return GpioStatus::failure(GpioError::INVALID_ARGUMENT,
            "Invalid pin " + std::to_string(pin) + " (must be 0-40)");
    }

    std::mutex m_mutex;
    std::map<int, PinState> m_pins;
};

std::unique_ptr<GpioBackend> createSimulatedGpioBackend() {
    return std::unique_ptr<GpioBackend>(new GpioSimulated());
}
