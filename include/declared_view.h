// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file declared_view.h
 * @brief Views described by configuration rather than code
 *
 * Used by waypoint-shell. A declared view logs every lifecycle hook and
 * creates the nested regions listed for it when it is initialized.
 */

#pragma once

#include "view.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace waypoint {

class RegionManager;
class ViewRegistry;

class DeclaredView : public View,
                     public IInitializeAware,
                     public INavigationAware,
                     public IDestructible,
                     public IWindowLifecycleAware,
                     public IPageLifecycleAware {
  public:
    DeclaredView(std::string name, RegionManager& regions, std::vector<std::string> region_names);

    void initialize(const NavigationParameters& parameters) override;
    void on_navigated_to(const NavigationParameters& parameters) override;
    void on_navigated_from(const NavigationParameters& parameters) override;
    void destroy() override;
    void on_resume() override;
    void on_sleep() override;
    void on_appearing() override;
    void on_disappearing() override;

    /// Names the nested regions were registered under (may carry a #N suffix)
    const std::vector<std::string>& get_hosted_regions() const {
        return hosted_regions_;
    }

  private:
    RegionManager& regions_;
    std::vector<std::string> region_names_;
    std::vector<std::string> hosted_regions_;
};

/**
 * @brief Register one DeclaredView per entry of a "views" config object
 *
 * @code
 * {"shell": {"regions": ["content"]}, "home": {}}
 * @endcode
 *
 * @return Number of views registered
 * @throws std::invalid_argument if @p views is not an object
 */
size_t register_declared_views(ViewRegistry& registry, RegionManager& regions,
                               const nlohmann::json& views);

} // namespace waypoint
