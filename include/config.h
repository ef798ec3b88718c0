// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __WAYPOINT_CONFIG_H__
#define __WAYPOINT_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include <nlohmann/json.hpp>

namespace waypoint {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/waypoint.json");
 *
 * std::string root = cfg->get<std::string>("/root_region", "main");
 * cfg->set<std::string>("/log_level", "debug");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults when it does not
     * exist. Missing top-level keys are filled with defaults and written back.
     *
     * @param config_path Path to JSON configuration file
     * @throws nlohmann::json::parse_error if an existing file is malformed
     */
    void init(const std::string& config_path);

    /**
     * @brief Default configuration document
     */
    static json defaults();

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if path doesn't exist or holds null.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr) && !data[ptr].is_null()) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path (created as null when missing)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    std::string get_path();

    static Config* get_instance();
};

} // namespace waypoint

#endif // __WAYPOINT_CONFIG_H__
