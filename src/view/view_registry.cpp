// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "view_registry.h"

#include "navigation_result.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace waypoint {

void ViewRegistry::register_view(const std::string& name, ViewFactory view_factory,
                                 ControllerFactory controller_factory) {
    if (name.empty()) {
        throw std::invalid_argument("View name must not be empty");
    }
    if (!view_factory) {
        throw std::invalid_argument("View factory for '" + name + "' must not be null");
    }

    if (views_.count(name)) {
        spdlog::debug("[ViewRegistry] Replacing registration for '{}'", name);
    }
    views_[name] = Registration{std::move(view_factory), std::move(controller_factory)};
    spdlog::trace("[ViewRegistry] Registered '{}' (total: {})", name, views_.size());
}

void ViewRegistry::register_behavior(const std::string& name, BehaviorFactory behavior_factory) {
    if (!behavior_factory) {
        throw std::invalid_argument("Behavior factory for '" + name + "' must not be null");
    }
    behaviors_[name].push_back(std::move(behavior_factory));
}

bool ViewRegistry::is_registered(const std::string& name) const {
    return views_.count(name) != 0;
}

std::vector<std::string> ViewRegistry::registered_names() const {
    std::vector<std::string> names;
    names.reserve(views_.size());
    for (const auto& entry : views_) {
        names.push_back(entry.first);
    }
    return names;
}

std::unique_ptr<View> ViewRegistry::resolve(const std::string& name) {
    auto it = views_.find(name);
    if (it == views_.end()) {
        throw ViewNotFoundError(name);
    }

    std::unique_ptr<View> view = it->second.view_factory(name);
    if (!view) {
        throw std::runtime_error("View factory for '" + name + "' returned null");
    }

    if (it->second.controller_factory) {
        view->set_binding_context(it->second.controller_factory());
    }

    spdlog::trace("[ViewRegistry] Resolved '{}'{}", name,
                  view->get_binding_context() ? " with controller" : "");
    return view;
}

void ViewRegistry::apply_behaviors(View& view) {
    auto it = behaviors_.find(view.get_name());
    if (it == behaviors_.end()) {
        return;
    }
    for (const auto& factory : it->second) {
        view.attach_behavior(factory());
    }
}

} // namespace waypoint
