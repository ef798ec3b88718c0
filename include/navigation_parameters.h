// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file navigation_parameters.h
 * @brief Ordered key/value bag passed through a navigation operation
 *
 * @pattern Insertion-ordered vector of (key, json) pairs; lookups are linear.
 * @threading Main thread only
 * @gotchas add() rejects duplicate keys, set() overwrites in place. The region
 *          core uses set() for the direction key so a bag can be reused.
 */

#pragma once

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace waypoint {

using json = nlohmann::json;

/**
 * @brief Well-known parameter keys written by the navigation core
 */
struct KnownNavigationParameters {
    static constexpr const char* NavigationDirection = "__NavigationDirection";
};

/**
 * @brief Ordered key/value parameter container
 *
 * Values are stored as json so hooks can carry strings, numbers and
 * structured payloads without a variant type of their own.
 *
 * @code
 * NavigationParameters params;
 * params.add("file", "benchy.gcode");
 * params.add("copies", 2);
 * region->push("print_detail", params);
 * @endcode
 */
class NavigationParameters {
  public:
    using Entry = std::pair<std::string, json>;
    using const_iterator = std::vector<Entry>::const_iterator;

    NavigationParameters() = default;
    NavigationParameters(std::initializer_list<Entry> entries);

    /**
     * @brief Append a new key
     * @throws std::invalid_argument if the key is already present
     */
    void add(const std::string& key, json value);

    /**
     * @brief Insert a key or overwrite its value, keeping its original position
     */
    void set(const std::string& key, json value);

    bool contains(const std::string& key) const;

    /**
     * @brief Remove a key
     * @return true if the key was present
     */
    bool remove(const std::string& key);

    /**
     * @brief Get a value converted to T
     * @throws std::out_of_range if the key is missing
     * @throws nlohmann::json::exception if the value does not convert
     */
    template <typename T> T get(const std::string& key) const {
        const json* value = find(key);
        if (!value) {
            throw std::out_of_range("Navigation parameter not found: " + key);
        }
        return value->template get<T>();
    }

    /**
     * @brief Get a value converted to T, or default_value when missing
     */
    template <typename T> T get(const std::string& key, const T& default_value) const {
        const json* value = find(key);
        if (!value) {
            return default_value;
        }
        return value->template get<T>();
    }

    size_t size() const {
        return entries_.size();
    }

    bool empty() const {
        return entries_.empty();
    }

    void clear() {
        entries_.clear();
    }

    const_iterator begin() const {
        return entries_.begin();
    }

    const_iterator end() const {
        return entries_.end();
    }

    /// Render as "k=v, k=v" for logging
    std::string to_string() const;

  private:
    const json* find(const std::string& key) const;
    json* find(const std::string& key);

    std::vector<Entry> entries_;
};

} // namespace waypoint
