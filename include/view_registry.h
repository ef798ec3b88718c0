// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file view_registry.h
 * @brief Name-to-factory registry implementing ViewProvider
 *
 * @pattern Factories registered at startup; resolve() builds a fresh view and
 *          controller on every call.
 * @threading Main thread only
 */

#pragma once

#include "view.h"
#include "view_provider.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace waypoint {

using ViewFactory = std::function<std::unique_ptr<View>(const std::string& name)>;
using ControllerFactory = std::function<std::shared_ptr<ViewController>()>;
using BehaviorFactory = std::function<std::unique_ptr<ViewBehavior>()>;

/**
 * @brief Default ViewProvider backed by registered factories
 *
 * Usage:
 * @code
 * ViewRegistry views;
 * views.register_view<HomeView>("home");
 * views.register_view("settings",
 *                     [](const std::string& n) { return std::make_unique<SettingsView>(n); },
 *                     [] { return std::make_shared<SettingsController>(); });
 * views.register_behavior("settings", [] { return std::make_unique<AutoSaveBehavior>(); });
 * @endcode
 */
class ViewRegistry : public ViewProvider {
  public:
    ViewRegistry() = default;

    ViewRegistry(const ViewRegistry&) = delete;
    ViewRegistry& operator=(const ViewRegistry&) = delete;

    /**
     * @brief Register a view factory, with an optional controller factory
     *
     * Re-registering a name replaces the previous factories.
     *
     * @throws std::invalid_argument on an empty name or null view factory
     */
    void register_view(const std::string& name, ViewFactory view_factory,
                       ControllerFactory controller_factory = nullptr);

    /// Register view type V (constructed from its name) with no controller
    template <typename V> void register_view(const std::string& name) {
        register_view(name, [](const std::string& n) { return std::make_unique<V>(n); });
    }

    /// Register view type V with controller type C
    template <typename V, typename C> void register_view(const std::string& name) {
        register_view(
            name, [](const std::string& n) { return std::make_unique<V>(n); },
            [] { return std::make_shared<C>(); });
    }

    /**
     * @brief Add a behavior attached to every view resolved under @p name
     *
     * Behaviors attach in registration order.
     */
    void register_behavior(const std::string& name, BehaviorFactory behavior_factory);

    bool is_registered(const std::string& name) const;

    /// Registered names in lexical order
    std::vector<std::string> registered_names() const;

    std::unique_ptr<View> resolve(const std::string& name) override;
    void apply_behaviors(View& view) override;

  private:
    struct Registration {
        ViewFactory view_factory;
        ControllerFactory controller_factory;
    };

    std::map<std::string, Registration> views_;
    std::map<std::string, std::vector<BehaviorFactory>> behaviors_;
};

} // namespace waypoint
