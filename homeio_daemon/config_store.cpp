/**
 * ConfigStore Implementation
 *
 * Uses nlohmann/json for parsing (single-header library).
 */

#include "config_store.hpp"
#include "logger.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char *TAG = "Config";

ConfigStore::ConfigStore() {
}

ConfigStore::LoadResult ConfigStore::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        m_error = "cannot open " + path;
        return LoadResult::NOT_FOUND;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LoadResult result = parse(buffer.str());
    if (result == LoadResult::OK) {
        LOG_INFO(TAG, "Loaded from %s", path.c_str());
    }
    return result;
}

ConfigStore::LoadResult ConfigStore::parse(const std::string &content) {
    try {
        json root = json::parse(content);

        if (!root.is_object()) {
            m_error = "top level must be an object";
            return LoadResult::INVALID;
        }

        std::string new_backend = root.value("backend", backend);
        if (new_backend != "auto" && new_backend != "sysfs" && new_backend != "simulated") {
            m_error = "backend must be auto, sysfs or simulated";
            return LoadResult::INVALID;
        }

        std::string new_level = root.value("log_level", log_level);
        LogLevel parsed;
        if (!Logger::parseLevel(new_level, parsed)) {
            m_error = "unknown log_level " + new_level;
            return LoadResult::INVALID;
        }

        // Type errors throw here, before anything is applied
        std::string new_root = root.value("sysfs_root", sysfs_root);
        std::string new_log_file = root.value("log_file", log_file);
        bool new_mark = root.value("mark_simulated", mark_simulated);
        std::string new_name = root.value("server_name", server_name);

        backend = new_backend;
        log_level = new_level;
        sysfs_root = new_root;
        log_file = new_log_file;
        mark_simulated = new_mark;
        server_name = new_name;

        return LoadResult::OK;
    } catch (const json::exception &e) {
        m_error = e.what();
        return LoadResult::INVALID;
    }
}
