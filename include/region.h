// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file region.h
 * @brief Stack-based navigation host for one region of the UI
 *
 * @pattern Owned view stack plus a current pointer into it. Every navigation
 *          follows the same protocol: resolve the target, tag the direction,
 *          notify navigated-from, mutate the stack, display, notify
 *          navigated-to, then destroy evicted views.
 * @threading Main thread only, one navigation in flight per region
 * @gotchas Nested regions are discovered through IRegionManager on every
 *          traversal. A view that hosts a region leading back to one of its
 *          ancestors recurses without bound.
 */

#pragma once

#include "navigation_parameters.h"
#include "navigation_result.h"
#include "region_host.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace waypoint {

class IRegionManager;
class View;
class ViewProvider;

/**
 * @brief Navigation host owning an ordered stack of views
 *
 * Stack policies:
 * - replace_all(): every existing entry is evicted, new view appended
 * - push(): entries after current are evicted, new view appended
 * - push_backwards(): entries before current are evicted, new view inserted
 *   at the former current's index
 * - go_back() / go_forward(): current moves to a neighbour, nothing evicted
 *
 * Evicted views are destroyed only after the navigated-to notification, and
 * always before the operation returns.
 *
 * Regions are created through RegionManager::create_region(), which also
 * registers them for discovery by parent regions.
 */
class Region {
  public:
    /**
     * @brief Construct a region
     *
     * @param name Registry name, used for remove_holder() on destroy_all()
     * @param views Resolves view names into views
     * @param regions Discovers nested regions and owns the registry entry
     * @param host Display surface (must not be null)
     * @throws std::invalid_argument if @p host is null
     */
    Region(std::string name, ViewProvider& views, IRegionManager& regions,
           std::unique_ptr<RegionHost> host);

    virtual ~Region();

    Region(const Region&) = delete;
    Region& operator=(const Region&) = delete;

    //
    // === Navigation (never throw) ===
    //

    /**
     * @brief Replace the whole stack with a new view
     *
     * @param view_name Logical name resolved through the ViewProvider
     * @param parameters Bag passed to hooks; receives the direction key
     */
    virtual NavigationResult replace_all(const std::string& view_name,
                                         NavigationParameters& parameters);
    NavigationResult replace_all(const std::string& view_name);

    /**
     * @brief Push a view after the current one, discarding forward history
     */
    virtual NavigationResult push(const std::string& view_name, NavigationParameters& parameters);
    NavigationResult push(const std::string& view_name);

    /**
     * @brief Push a view before the current one, discarding backward history
     *
     * Without a current view the new view goes to index 0 and nothing is
     * discarded.
     */
    virtual NavigationResult push_backwards(const std::string& view_name,
                                            NavigationParameters& parameters);
    NavigationResult push_backwards(const std::string& view_name);

    /**
     * @brief Make the previous stack entry current
     *
     * Fails with INVALID_OPERATION when can_go_back() is false.
     */
    virtual NavigationResult go_back(NavigationParameters& parameters);
    NavigationResult go_back();

    /**
     * @brief Make the next stack entry current
     *
     * Fails with INVALID_OPERATION when can_go_forward() is false.
     */
    virtual NavigationResult go_forward(NavigationParameters& parameters);
    NavigationResult go_forward();

    virtual bool can_go_back() const;
    virtual bool can_go_forward() const;

    //
    // === Teardown ===
    //

    /**
     * @brief Destroy every stack entry and deregister this region
     *
     * Entries are destroyed most recent first. Releases the host scope and
     * removes the registry entry. Safe to call more than once.
     *
     * @note The registry may drop its last reference to this region here;
     *       callers that need the object afterwards must hold a shared_ptr.
     */
    virtual void destroy_all();

    //
    // === Recursion entry points (used by parent regions) ===
    //

    /**
     * @brief Notify the current view and every nested region
     *
     * navigated-to is pre-order (own view, then children); navigated-from is
     * post-order (children, then own view). No-op without a current view.
     */
    virtual void navigated_recursively(const NavigationParameters& parameters, bool to);

    /**
     * @brief Tear down @p view and every region it hosts
     *
     * Child regions are destroyed before the view's own destroy hook runs.
     * Behaviors are detached and the binding context is severed afterwards.
     */
    virtual void destroy_recursively(View& view);

    /**
     * @brief Broadcast window resume/sleep to every stack entry, then children
     */
    virtual void on_window_lifecycle_recursively(bool resume);

    /**
     * @brief Broadcast page appearing/disappearing
     *
     * Appearing: own entries in stack order, then children. Disappearing:
     * children first, then own entries in reverse order.
     */
    virtual void on_page_lifecycle_recursively(bool appearing);

    //
    // === Queries ===
    //

    const std::string& get_name() const {
        return name_;
    }

    /// Current view, or nullptr before the first navigation / after destroy_all()
    View* get_current_view() const {
        return current_;
    }

    size_t get_stack_size() const {
        return stack_.size();
    }

    /// Stack entry at @p index, or nullptr when out of range
    View* get_view_at(size_t index) const;

    /// Index of the current view, -1 when there is none
    int get_current_index() const;

    RegionHost& get_host() const {
        return *host_;
    }

  protected:
    /**
     * @brief Resolve a view, run its initialize hook and attach behaviors
     *
     * A view that fails initialization is torn down before the fault
     * propagates, so regions it created do not outlive it.
     */
    virtual std::unique_ptr<View> init_view(const std::string& view_name,
                                            const NavigationParameters& parameters);

    ViewProvider& views_;
    IRegionManager& regions_;

  private:
    /**
     * @brief Navigated-from pass for a navigation that created @p incoming
     *
     * On failure @p incoming is destroyed recursively before the fault
     * propagates. No-op without a current view.
     */
    void leave_current(View& incoming, const NavigationParameters& parameters);

    int index_of(const View* view) const;
    void set_current(View* view);

    /// Remove @p evicted from the stack and destroy them, in the given order
    void evict(const std::vector<View*>& evicted);

    std::string name_;
    std::unique_ptr<RegionHost> host_;
    std::vector<std::unique_ptr<View>> stack_;
    View* current_ = nullptr;
};

} // namespace waypoint
