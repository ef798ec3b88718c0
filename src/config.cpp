// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace waypoint {

Config* Config::instance{NULL};

Config::Config() {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

json Config::defaults() {
    return {{"log_level", "info"},
            {"log_target", "console"},
            {"log_file", ""},
            {"log_backtrace", 32},
            {"root_region", "main"},
            {"initial_view", "shell"},
            {"views",
             {{"shell", {{"regions", json::array({"content"})}}},
              {"home", json::object()},
              {"settings", {{"regions", json::array({"detail"})}}},
              {"about", json::object()}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::ifstream in(config_path);
        data = json::parse(in);
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = defaults();
    }

    // Fill in any top-level key an older file is missing
    json fallback = defaults();
    for (auto it = fallback.begin(); it != fallback.end(); ++it) {
        if (!data.contains(it.key()) || data[it.key()].is_null()) {
            data[it.key()] = it.value();
        }
    }

    save();

    spdlog::debug("[Config] Initialized: root_region={}, initial_view={}, {} views",
                  get<std::string>("/root_region"), get<std::string>("/initial_view"),
                  data["views"].size());
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::debug("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::debug("[Config] Saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace waypoint
