/**
 * HomeIO - GPIO Tool Daemon
 *
 * Serves the GPIO, light and pump tools over JSON-RPC on stdin/stdout.
 *
 * Responsibilities:
 * - Select the GPIO backend (sysfs on hardware, simulated elsewhere)
 * - Own the timed-operation scheduler for pump auto-stop
 * - Route tool calls through the dispatcher
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <cstdlib>
#include <memory>
#include <getopt.h>

#include "config_store.hpp"
#include "error_handler.hpp"
#include "gpio_backend.hpp"
#include "gpio_tools.hpp"
#include "json_rpc.hpp"
#include "light_controller.hpp"
#include "logger.h"
#include "pump_controller.hpp"
#include "stdio_server.hpp"
#include "timed_scheduler.hpp"
#include "tool_dispatcher.hpp"

#define POLL_INTERVAL_MS 100

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static std::unique_ptr<GpioBackend> selectBackend(const ConfigStore &config, ErrorHandler &error_handler) {
    if (config.backend == "simulated") {
        std::unique_ptr<GpioBackend> sim = createSimulatedGpioBackend();
        sim->init();
        return sim;
    }

    std::unique_ptr<GpioBackend> sysfs = createSysfsGpioBackend(config.sysfs_root);
    if (sysfs->init()) {
        return sysfs;
    }

    if (config.backend == "sysfs") {
        error_handler.report(ErrorLevel::CRITICAL, "sysfs GPIO unavailable at " + config.sysfs_root);
        return nullptr;
    }

    LOG_WARN("HomeIO", "sysfs GPIO unavailable, using simulated backend");
    std::unique_ptr<GpioBackend> sim = createSimulatedGpioBackend();
    sim->init();
    return sim;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config PATH      Config file (default: " << CONFIG_PATH_DEFAULT << ")\n"
              << "  -B, --backend NAME     GPIO backend: auto, sysfs, simulated (default: auto)\n"
              << "  -r, --sysfs-root PATH  sysfs GPIO directory (default: " << SYSFS_GPIO_ROOT_DEFAULT << ")\n"
              << "  -l, --log-level LEVEL  DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "  -f, --log-file PATH    Log to file (in addition to stderr)\n"
              << "  -n, --no-sim-marker    Do not tag simulated results\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",        required_argument, 0, 'c'},
        {"backend",       required_argument, 0, 'B'},
        {"sysfs-root",    required_argument, 0, 'r'},
        {"log-level",     required_argument, 0, 'l'},
        {"log-file",      required_argument, 0, 'f'},
        {"no-sim-marker", no_argument,       0, 'n'},
        {"help",          no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    std::string config_path = CONFIG_PATH_DEFAULT;
    bool config_explicit = false;
    std::string backend;
    std::string sysfs_root;
    std::string log_level;
    std::string log_file;
    bool no_sim_marker = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:B:r:l:f:nh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            config_explicit = true;
            break;
        case 'B':
            backend = optarg;
            break;
        case 'r':
            sysfs_root = optarg;
            break;
        case 'l':
            log_level = optarg;
            break;
        case 'f':
            log_file = optarg;
            break;
        case 'n':
            no_sim_marker = true;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    ConfigStore config;
    ConfigStore::LoadResult loaded = config.load(config_path);
    if (loaded == ConfigStore::LoadResult::INVALID) {
        std::cerr << "Invalid config " << config_path << ": " << config.getError() << std::endl;
        return 1;
    }

    if (!backend.empty()) {
        if (backend != "auto" && backend != "sysfs" && backend != "simulated") {
            std::cerr << "Unknown backend: " << backend << std::endl;
            print_usage(argv[0]);
            return 1;
        }
        config.backend = backend;
    }
    if (!sysfs_root.empty()) config.sysfs_root = sysfs_root;
    if (!log_level.empty()) config.log_level = log_level;
    if (!log_file.empty()) config.log_file = log_file;
    if (no_sim_marker) config.mark_simulated = false;

    if (!Logger::instance().setLevel(config.log_level)) {
        std::cerr << "Unknown log level: " << config.log_level << std::endl;
        return 1;
    }
    if (!config.log_file.empty()) {
        if (!Logger::instance().openFile(config.log_file)) {
            std::cerr << "Warning: Could not open log file: " << config.log_file << std::endl;
        }
    }

    if (loaded == ConfigStore::LoadResult::NOT_FOUND) {
        if (config_explicit) {
            LOG_WARN("HomeIO", "Config %s not found, using defaults", config_path.c_str());
        } else {
            LOG_DEBUG("HomeIO", "No config at %s, using defaults", config_path.c_str());
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    LOG_INFO("HomeIO", "GPIO tool daemon %s starting...", SERVER_VERSION);

    ErrorHandler error_handler;

    std::unique_ptr<GpioBackend> gpio = selectBackend(config, error_handler);
    if (!gpio) {
        LOG_ERROR("HomeIO", "Initialization failed");
        return 1;
    }

    TimedScheduler scheduler;

    ToolDispatcher dispatcher(error_handler);
    if (gpio->isSimulated() && config.mark_simulated) {
        dispatcher.setResultMarker(" [simulated]");
    }

    GpioTools gpio_tools(*gpio);
    LightController lights(*gpio);
    PumpController pumps(*gpio, scheduler, error_handler);

    gpio_tools.registerTools(dispatcher);
    lights.registerTools(dispatcher);
    pumps.registerTools(dispatcher);

    JsonRpc rpc(dispatcher, config.server_name);
    StdioServer server(rpc);

    LOG_INFO("HomeIO", "Ready (%s backend, %zu tools)",
             gpio->isSimulated() ? "simulated" : "sysfs", dispatcher.listTools().size());

    while (!g_shutdown.load()) {
        if (!server.tick(POLL_INTERVAL_MS)) {
            break;
        }
    }

    LOG_INFO("HomeIO", "Shutting down...");

    // Drop pending auto-stops before the pins go away
    scheduler.shutdown();
    gpio->cleanup();

    LOG_INFO("HomeIO", "Exited cleanly (%u requests, %u errors)",
             rpc.getRequestCount(), error_handler.getTotal());
    return 0;
}
