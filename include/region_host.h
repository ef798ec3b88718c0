// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file region_host.h
 * @brief Surface that displays a region's current view
 *
 * @pattern Headless base class; presentation back ends override
 *          on_content_changed() (see LvglRegionHost).
 * @threading Main thread only
 * @gotchas The attached HostScope is released exactly once, by
 *          Region::destroy_all(). Never release it from a view hook.
 */

#pragma once

#include <memory>
#include <utility>

namespace waypoint {

class View;

/**
 * @brief Resource whose lifetime is bound to one region host
 *
 * Typical use is a per-region service container shared by the views the
 * region displays. Released when the region is destroyed.
 */
class HostScope {
  public:
    virtual ~HostScope() = default;
};

/**
 * @brief Displays at most one view at a time
 */
class RegionHost {
  public:
    RegionHost() = default;
    virtual ~RegionHost() = default;

    RegionHost(const RegionHost&) = delete;
    RegionHost& operator=(const RegionHost&) = delete;

    /// Currently displayed view, or nullptr
    View* get_content() const {
        return content_;
    }

    /**
     * @brief Display @p view (nullptr clears the host)
     */
    void set_content(View* view);

    void attach_scope(std::unique_ptr<HostScope> scope) {
        scope_ = std::move(scope);
    }

    HostScope* get_scope() const {
        return scope_.get();
    }

    /**
     * @brief Destroy the attached scope
     * @return true if a scope was attached
     */
    bool release_scope();

    /**
     * @brief Called by the owning region just before @p view is freed
     *
     * Default implementation does nothing.
     */
    virtual void on_view_destroyed(View& view) {
        (void)view;
    }

  protected:
    /**
     * @brief Presentation hook, called after the content pointer changed
     *
     * Default implementation does nothing.
     */
    virtual void on_content_changed(View* view) {
        (void)view;
    }

  private:
    View* content_ = nullptr;
    std::unique_ptr<HostScope> scope_;
};

} // namespace waypoint
