#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <string>

#include "gpio_backend.hpp"

extern "C" {
#include "tool_protocol.h"
}

#define CONFIG_PATH_DEFAULT "/etc/homeio/config.json"

/**
 * ConfigStore - Daemon configuration
 *
 * Loaded from a JSON file; command-line options override it.
 * Only main() reads this; the tool core takes everything as arguments.
 */
class ConfigStore {
public:
    enum class LoadResult {
        OK,
        NOT_FOUND,
        INVALID
    };

    ConfigStore();

    /**
     * Load configuration from file. Keys absent from the file keep
     * their defaults.
     */
    LoadResult load(const std::string &path);

    /**
     * Parse configuration from a JSON document.
     */
    LoadResult parse(const std::string &content);

    const std::string &getError() const { return m_error; }

    // "auto", "sysfs" or "simulated"
    std::string backend = "auto";
    std::string sysfs_root = SYSFS_GPIO_ROOT_DEFAULT;
    std::string log_level = "INFO";
    std::string log_file;
    bool mark_simulated = true;
    std::string server_name = SERVER_NAME_DEFAULT;

private:
    std::string m_error;
};

#endif // CONFIG_STORE_HPP
