/**
 * sysfs GPIO backend
 *
 * Linux /sys/class/gpio under a configurable root. Pins are exported
 * on first setup and unexported on cleanup.
 */

#include "gpio_backend.hpp"
#include "logger.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <mutex>
#include <set>

extern "C" {
#include "pin_limits.h"
}

static const char *TAG = "SysfsGPIO";

class GpioSysfs : public GpioBackend {
public:
    explicit GpioSysfs(const std::string &root) : m_root(root) {}
    ~GpioSysfs() override { cleanup(); }

    bool init() override {
        if (access(m_root.c_str(), W_OK) != 0) {
            LOG_WARN(TAG, "%s not writable: %s", m_root.c_str(), strerror(errno));
            return false;
        }
        std::string export_path = m_root + "/export";
        if (access(export_path.c_str(), W_OK) != 0) {
            LOG_WARN(TAG, "%s not writable: %s", export_path.c_str(), strerror(errno));
            return false;
        }
        m_initialized = true;
        LOG_INFO(TAG, "sysfs GPIO backend at %s", m_root.c_str());
        return true;
    }

    GpioStatus setup(int pin, Direction dir) override {
        if (!pin_id_valid(pin)) {
            return invalidPin(pin);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_initialized) {
            return GpioStatus::failure(GpioError::INTERNAL, "GPIO backend not initialized");
        }

        auto it = m_pins.find(pin);
        if (it != m_pins.end() && it->second == dir) {
            return GpioStatus::success();
        }

        if (it == m_pins.end()) {
            GpioStatus st = exportPin(pin);
            if (!st.ok()) {
                return st;
            }
        }

        GpioStatus st = setDirection(pin, dir);
        if (!st.ok()) {
            return st;
        }

        // Fresh and re-configured outputs start low
        if (dir == Direction::OUTPUT) {
            st = writeValue(pin, PIN_LEVEL_LOW);
            if (!st.ok()) {
                return st;
            }
        }

        m_pins[pin] = dir;
        LOG_DEBUG(TAG, "Pin %d configured as %s", pin, directionName(dir));
        return GpioStatus::success();
    }

    GpioStatus read(int pin, int &value) override {
        if (!pin_id_valid(pin)) {
            return invalidPin(pin);
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pins.find(pin) == m_pins.end()) {
            return GpioStatus::failure(GpioError::NOT_INITIALIZED, notInitializedMessage(pin));
        }
        return readValue(pin, value);
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
        if (m_pins.find(pin) == m_pins.end()) {
            return GpioStatus::failure(GpioError::NOT_INITIALIZED, notInitializedMessage(pin));
        }
        return writeValue(pin, value);
    }

    GpioStatus list(std::map<int, PinState> &pins) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        pins.clear();
        for (const auto &entry : m_pins) {
            PinState state;
            state.direction = entry.second;
            GpioStatus st = readValue(entry.first, state.value);
            if (!st.ok()) {
                return st;
            }
            pins[entry.first] = state;
        }
        return GpioStatus::success();
    }

    bool isConfigured(int pin) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pins.find(pin) != m_pins.end();
    }

    void cleanup() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (int pin : m_exported) {
            if (!unexportPin(pin)) {
                LOG_WARN(TAG, "Failed to unexport pin %d: %s", pin, strerror(errno));
            }
        }
        m_exported.clear();
        m_pins.clear();
        m_initialized = false;
    }

    bool isSimulated() const override { return false; }

private:
    static GpioStatus invalidPin(int pin) {
        return GpioStatus::failure(GpioError::INVALID_ARGUMENT,
            "Invalid pin " + std::to_string(pin) + " (must be 0-40)");
    }

    static GpioStatus ioFailure(const char *what, int pin) {
        char buf[128];
        snprintf(buf, sizeof(buf), "Failed to %s pin %d: %s", what, pin, strerror(errno));
        return GpioStatus::failure(GpioError::INTERNAL, buf);
    }

    std::string pinPath(int pin, const char *attr) const {
        char buf[32];
        snprintf(buf, sizeof(buf), "/gpio%d/%s", pin, attr);
        return m_root + buf;
    }

    bool writeFile(const std::string &path, const char *data) {
        int fd = open(path.c_str(), O_WRONLY | O_TRUNC);
        if (fd < 0) {
            return false;
        }
        size_t len = strlen(data);
        ssize_t written = ::write(fd, data, len);
        int saved_errno = errno;
        close(fd);
        errno = saved_errno;
        return written == static_cast<ssize_t>(len);
    }

    GpioStatus exportPin(int pin) {
        char dir_path[32];
        snprintf(dir_path, sizeof(dir_path), "/gpio%d", pin);
        if (access((m_root + dir_path).c_str(), F_OK) == 0) {
            return GpioStatus::success();
        }

        char buf[16];
        snprintf(buf, sizeof(buf), "%d", pin);
        if (!writeFile(m_root + "/export", buf)) {
            return ioFailure("export", pin);
        }
        m_exported.insert(pin);

        // udev needs a moment to fix up permissions on the new node
        usleep(SYSFS_EXPORT_SETTLE_US);
        return GpioStatus::success();
    }

    bool unexportPin(int pin) {
        char buf[16];
        snprintf(buf, sizeof(buf), "%d", pin);
        return writeFile(m_root + "/unexport", buf);
    }

    GpioStatus setDirection(int pin, Direction dir) {
        if (!writeFile(pinPath(pin, "direction"), directionName(dir))) {
            return ioFailure("set direction of", pin);
        }
        return GpioStatus::success();
    }

    GpioStatus writeValue(int pin, int value) {
        if (!writeFile(pinPath(pin, "value"), value != 0 ? "1" : "0")) {
            return ioFailure("write", pin);
        }
        return GpioStatus::success();
    }

    GpioStatus readValue(int pin, int &value) {
        int fd = open(pinPath(pin, "value").c_str(), O_RDONLY);
        if (fd < 0) {
            return ioFailure("read", pin);
        }

        char buf[4] = {0};
        ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
        int saved_errno = errno;
        close(fd);

        if (n <= 0) {
            errno = n == 0 ? EIO : saved_errno;
            return ioFailure("read", pin);
        }

        value = (buf[0] == '1') ? PIN_LEVEL_HIGH : PIN_LEVEL_LOW;
        return GpioStatus::success();
    }

    std::string m_root;
    bool m_initialized = false;
    std::mutex m_mutex;
    std::map<int, Direction> m_pins;
    std::set<int> m_exported;
};

std::unique_ptr<GpioBackend> createSysfsGpioBackend(const std::string &sysfs_root) {
    return std::unique_ptr<GpioBackend>(new GpioSysfs(sysfs_root));
}
