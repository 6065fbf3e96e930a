#ifndef GPIO_BACKEND_HPP
#define GPIO_BACKEND_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>

/**
 * GPIO error kinds reported by a backend.
 */
enum class GpioError {
    NONE,
    NOT_INITIALIZED,    // pin used before setup
    INVALID_ARGUMENT,   // pin out of range, value not 0/1
    INTERNAL            // line access failed
};

/**
 * Outcome of a backend operation.
 */
struct GpioStatus {
    GpioError error = GpioError::NONE;
    std::string message;

    bool ok() const { return error == GpioError::NONE; }

    static GpioStatus success() { return GpioStatus(); }
    static GpioStatus failure(GpioError error, const std::string &message) {
        GpioStatus s;
        s.error = error;
        s.message = message;
        return s;
    }
};

/**
 * GPIO Backend Interface
 *
 * Uniform pin capability over real and simulated lines.
 * Implementations: sysfs, simulated
 *
 * All operations are synchronous and safe to call from the dispatch
 * thread and the timed-operation thread concurrently.
 */
class GpioBackend {
public:
    virtual ~GpioBackend() = default;

    enum class Direction {
        INPUT,
        OUTPUT
    };

    struct PinState {
        Direction direction = Direction::INPUT;
        int value = 0;
    };

    /**
     * Initialize GPIO subsystem.
     */
    virtual bool init() = 0;

    /**
     * Register a pin with a direction.
     * Same direction again is a no-op; a different direction overwrites
     * it and resets the value to 0.
     */
    virtual GpioStatus setup(int pin, Direction dir) = 0;

    /**
     * Read pin level (0 or 1) into value.
     */
    virtual GpioStatus read(int pin, int &value) = 0;

    /**
     * Write 0 or 1 to a pin.
     */
    virtual GpioStatus write(int pin, int value) = 0;

    /**
     * Snapshot of every registered pin, ascending by pin number.
     */
    virtual GpioStatus list(std::map<int, PinState> &pins) = 0;

    /**
     * True if the pin has been set up.
     */
    virtual bool isConfigured(int pin) = 0;

    /**
     * Release all pins. Process shutdown only.
     */
    virtual void cleanup() = 0;

    virtual bool isSimulated() const = 0;

    static const char *directionName(Direction dir) {
        return dir == Direction::OUTPUT ? "out" : "in";
    }

    static bool parseDirection(const std::string &name, Direction &dir) {
        if (name == "in") {
            dir = Direction::INPUT;
            return true;
        }
        if (name == "out") {
            dir = Direction::OUTPUT;
            return true;
        }
        return false;
    }

    static std::string notInitializedMessage(int pin) {
        return "Pin " + std::to_string(pin) + " is not initialized.";
    }
};

#define SYSFS_GPIO_ROOT_DEFAULT "/sys/class/gpio"

/**
 * Linux sysfs backend rooted at sysfs_root.
 */
std::unique_ptr<GpioBackend> createSysfsGpioBackend(const std::string &sysfs_root = SYSFS_GPIO_ROOT_DEFAULT);

/**
 * In-memory backend with identical semantics.
 */
std::unique_ptr<GpioBackend> createSimulatedGpioBackend();

#endif // GPIO_BACKEND_HPP
