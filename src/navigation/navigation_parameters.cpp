// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_parameters.h"

#include <algorithm>

namespace waypoint {

NavigationParameters::NavigationParameters(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        add(entry.first, entry.second);
    }
}

void NavigationParameters::add(const std::string& key, json value) {
    if (find(key)) {
        throw std::invalid_argument("Navigation parameter already present: " + key);
    }
    entries_.emplace_back(key, std::move(value));
}

void NavigationParameters::set(const std::string& key, json value) {
    json* existing = find(key);
    if (existing) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(key, std::move(value));
}

bool NavigationParameters::contains(const std::string& key) const {
    return find(key) != nullptr;
}

bool NavigationParameters::remove(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::string NavigationParameters::to_string() const {
    std::string out;
    for (const auto& entry : entries_) {
        if (!out.empty()) {
            out += ", ";
        }
        out += entry.first;
        out += '=';
        out += entry.second.is_string() ? entry.second.get<std::string>() : entry.second.dump();
    }
    return out;
}

const json* NavigationParameters::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

json* NavigationParameters::find(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

} // namespace waypoint
