// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "region_manager.h"

#include "region.h"
#include "region_host.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace waypoint {

RegionManager::RegionManager(ViewProvider& views) : views_(views) {}

RegionManager::~RegionManager() {
    // Regions left registered are released without their destroy hooks
    if (!entries_.empty()) {
        spdlog::debug("[RegionManager] Released with {} regions still registered",
                      entries_.size());
    }
}

std::shared_ptr<Region> RegionManager::create_region(const std::string& name,
                                                     std::unique_ptr<RegionHost> host,
                                                     const View* owner) {
    if (name.empty()) {
        throw std::invalid_argument("Region name must not be empty");
    }
    if (get_region(name)) {
        throw std::invalid_argument("Region already registered: " + name);
    }

    auto region = std::make_shared<Region>(name, views_, *this, std::move(host));
    entries_.push_back(Entry{name, owner, region});

    spdlog::debug("[RegionManager] Registered region '{}' ({}, total: {})", name,
                  owner ? "nested" : "root", entries_.size());
    return region;
}

std::shared_ptr<Region> RegionManager::get_region(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry.region;
        }
    }
    return nullptr;
}

const View* RegionManager::get_owner(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry.owner;
        }
    }
    return nullptr;
}

std::vector<std::shared_ptr<Region>> RegionManager::get_regions(const View* host_view) const {
    std::vector<std::shared_ptr<Region>> regions;
    for (const auto& entry : entries_) {
        if (entry.owner == host_view) {
            regions.push_back(entry.region);
        }
    }
    return regions;
}

void RegionManager::remove_holder(const std::string& region_name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&region_name](const Entry& entry) { return entry.name == region_name; });
    if (it == entries_.end()) {
        return;
    }

    // Keep the region alive until the erase has finished; it may be the caller
    std::shared_ptr<Region> keep_alive = it->region;
    entries_.erase(it);
    spdlog::trace("[RegionManager] Removed region '{}' (remaining: {})", region_name,
                  entries_.size());
}

std::vector<std::string> RegionManager::region_names() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& entry : entries_) {
        names.push_back(entry.name);
    }
    return names;
}

void RegionManager::destroy_all() {
    if (entries_.empty()) {
        spdlog::debug("[RegionManager] No regions registered, nothing to destroy");
        return;
    }

    spdlog::trace("[RegionManager] Destroying {} regions...", entries_.size());

    // Roots in reverse registration order; each takes its nested regions along
    auto roots = root_regions();
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        (*it)->destroy_all();
    }

    // Orphans: nested regions whose owner never reached a region stack
    while (!entries_.empty()) {
        std::shared_ptr<Region> region = entries_.back().region;
        std::string name = entries_.back().name;
        region->destroy_all();
        remove_holder(name);
    }

    spdlog::trace("[RegionManager] All regions destroyed");
}

} // namespace waypoint
