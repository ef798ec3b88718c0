// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file region_manager.h
 * @brief Region registry and nested-region discovery
 *
 * @pattern Regions register with the view that hosts them (nullptr for
 *          roots). The tree is never stored as edges: a region asks the
 *          manager for the regions hosted by its current view on demand.
 * @threading Main thread only
 * @gotchas get_regions() returns shared_ptr copies. Keep the copy alive while
 *          calling destroy_all() on an entry, since that removes the entry
 *          from the registry.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace waypoint {

class Region;
class RegionHost;
class View;
class ViewProvider;

/**
 * @brief Traversal contract regions rely on
 */
class IRegionManager {
  public:
    virtual ~IRegionManager() = default;

    /**
     * @brief Regions nested inside @p host_view, in registration order
     *
     * @param host_view View hosting the regions (nullptr yields root regions)
     */
    virtual std::vector<std::shared_ptr<Region>> get_regions(const View* host_view) const = 0;

    /**
     * @brief Deregister a region by name (no-op when absent)
     */
    virtual void remove_holder(const std::string& region_name) = 0;
};

/**
 * @brief Owns the name → region registry
 *
 * Usage:
 * @code
 * ViewRegistry views;
 * RegionManager regions(views);
 * auto main = regions.create_region("main", std::make_unique<RegionHost>());
 * main->replace_all("shell");
 * // ShellView::initialize() calls
 * //   regions.create_region("content", std::make_unique<RegionHost>(), this);
 * regions.get_region("content")->push("home");
 * @endcode
 */
class RegionManager : public IRegionManager {
  public:
    explicit RegionManager(ViewProvider& views);
    ~RegionManager() override;

    RegionManager(const RegionManager&) = delete;
    RegionManager& operator=(const RegionManager&) = delete;

    /**
     * @brief Create and register a region
     *
     * @param name Unique region name
     * @param host Display surface the region owns
     * @param owner View hosting the region, nullptr for a root region
     * @return The new region
     * @throws std::invalid_argument on an empty or already registered name,
     *         or a null host
     */
    std::shared_ptr<Region> create_region(const std::string& name,
                                          std::unique_ptr<RegionHost> host,
                                          const View* owner = nullptr);

    /// Region registered under @p name, nullptr when absent
    std::shared_ptr<Region> get_region(const std::string& name) const;

    /// View that hosts region @p name, nullptr for roots and unknown names
    const View* get_owner(const std::string& name) const;

    std::vector<std::shared_ptr<Region>> get_regions(const View* host_view) const override;
    void remove_holder(const std::string& region_name) override;

    /// Regions without a hosting view
    std::vector<std::shared_ptr<Region>> root_regions() const {
        return get_regions(nullptr);
    }

    /// Registered names in registration order
    std::vector<std::string> region_names() const;

    size_t size() const {
        return entries_.size();
    }

    /**
     * @brief Destroy every root region, and with it the whole tree
     *
     * Regions whose owner is no longer displayed by any region are also
     * destroyed, so the registry is empty afterwards.
     */
    void destroy_all();

  private:
    struct Entry {
        std::string name;
        const View* owner;
        std::shared_ptr<Region> region;
    };

    ViewProvider& views_;
    std::vector<Entry> entries_;
};

} // namespace waypoint
