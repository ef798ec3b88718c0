// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "declared_view.h"

#include "region_host.h"
#include "region_manager.h"
#include "view_registry.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace waypoint {

namespace {

std::string direction_of(const NavigationParameters& parameters) {
    return parameters.get<std::string>(KnownNavigationParameters::NavigationDirection, "?");
}

/// "detail", then "detail#2", "detail#3" ... for repeated instances
std::string unique_region_name(const RegionManager& regions, const std::string& base) {
    if (!regions.get_region(base)) {
        return base;
    }
    for (int n = 2;; n++) {
        std::string candidate = base + "#" + std::to_string(n);
        if (!regions.get_region(candidate)) {
            return candidate;
        }
    }
}

} // namespace

DeclaredView::DeclaredView(std::string name, RegionManager& regions,
                           std::vector<std::string> region_names)
    : View(std::move(name)), regions_(regions), region_names_(std::move(region_names)) {}

void DeclaredView::initialize(const NavigationParameters& parameters) {
    spdlog::info("[View {}] initialize ({})", get_name(), parameters.to_string());

    for (const auto& base : region_names_) {
        std::string name = unique_region_name(regions_, base);
        regions_.create_region(name, std::make_unique<RegionHost>(), this);
        hosted_regions_.push_back(name);
    }
}

void DeclaredView::on_navigated_to(const NavigationParameters& parameters) {
    spdlog::info("[View {}] navigated to ({})", get_name(), direction_of(parameters));
}

void DeclaredView::on_navigated_from(const NavigationParameters& parameters) {
    spdlog::info("[View {}] navigated from ({})", get_name(), direction_of(parameters));
}

void DeclaredView::destroy() {
    spdlog::info("[View {}] destroy", get_name());
}

void DeclaredView::on_resume() {
    spdlog::info("[View {}] resume", get_name());
}

void DeclaredView::on_sleep() {
    spdlog::info("[View {}] sleep", get_name());
}

void DeclaredView::on_appearing() {
    spdlog::info("[View {}] appearing", get_name());
}

void DeclaredView::on_disappearing() {
    spdlog::info("[View {}] disappearing", get_name());
}

size_t register_declared_views(ViewRegistry& registry, RegionManager& regions,
                               const nlohmann::json& views) {
    if (!views.is_object()) {
        throw std::invalid_argument("\"views\" must be a JSON object");
    }

    size_t count = 0;
    for (auto it = views.begin(); it != views.end(); ++it) {
        std::vector<std::string> region_names;
        if (it.value().is_object() && it.value().contains("regions")) {
            region_names = it.value()["regions"].get<std::vector<std::string>>();
        }

        RegionManager* manager = &regions;
        registry.register_view(it.key(), [manager, region_names](const std::string& name) {
            return std::make_unique<DeclaredView>(name, *manager, region_names);
        });
        spdlog::debug("[DeclaredView] Registered '{}' hosting {} regions", it.key(),
                      region_names.size());
        count++;
    }

    return count;
}

} // namespace waypoint
