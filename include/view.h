// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file view.h
 * @brief Navigable content unit, its controller and attachable behaviors
 *
 * @pattern Capability interfaces are mixed into View and ViewController
 *          subclasses; lifecycle dispatch (view_lifecycle.h) probes for each
 *          one and calls the view first, then its controller.
 * @threading Main thread only
 * @gotchas A View is owned by exactly one Region stack. Never keep raw View
 *          pointers past the navigation that evicted it.
 */

#pragma once

#include "navigation_parameters.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace waypoint {

class View;

//
// === Lifecycle capabilities ===
//

/// Receives the parameter bag once, right after the view is produced
class IInitializeAware {
  public:
    virtual ~IInitializeAware() = default;
    virtual void initialize(const NavigationParameters& parameters) = 0;
};

/// Receives navigated-to / navigated-from notifications
class INavigationAware {
  public:
    virtual ~INavigationAware() = default;
    virtual void on_navigated_to(const NavigationParameters& parameters) = 0;
    virtual void on_navigated_from(const NavigationParameters& parameters) = 0;
};

/// Teardown hook, called once when the view leaves its region for good
class IDestructible {
  public:
    virtual ~IDestructible() = default;
    virtual void destroy() = 0;
};

/// Application window resumed / suspended
class IWindowLifecycleAware {
  public:
    virtual ~IWindowLifecycleAware() = default;
    virtual void on_resume() = 0;
    virtual void on_sleep() = 0;
};

/// Hosting page appearing / disappearing
class IPageLifecycleAware {
  public:
    virtual ~IPageLifecycleAware() = default;
    virtual void on_appearing() = 0;
    virtual void on_disappearing() = 0;
};

/**
 * @brief Controller attached to a view as its binding context
 *
 * Derive and mix in the capability interfaces the controller cares about.
 */
class ViewController {
  public:
    virtual ~ViewController() = default;
};

/**
 * @brief Attachable behavior, detached when the view is destroyed
 */
class ViewBehavior {
  public:
    virtual ~ViewBehavior() = default;

    /// Called once the behavior has been added to @p view
    virtual void on_attached(View& view) {
        (void)view;
    }

    /// Called before the behavior is removed from @p view
    virtual void on_detaching(View& view) {
        (void)view;
    }
};

/**
 * @brief Content unit hosted by a Region
 *
 * The base class carries identity, binding context and behaviors. Subclasses
 * add presentation (see LvglView) and may implement any lifecycle capability.
 */
class View {
  public:
    explicit View(std::string name);
    virtual ~View();

    // Non-copyable, non-movable (regions and managers hold raw pointers)
    View(const View&) = delete;
    View& operator=(const View&) = delete;
    View(View&&) = delete;
    View& operator=(View&&) = delete;

    /// Logical name the view was resolved from
    const std::string& get_name() const {
        return name_;
    }

    ViewController* get_binding_context() const {
        return binding_context_.get();
    }

    void set_binding_context(std::shared_ptr<ViewController> controller) {
        binding_context_ = std::move(controller);
    }

    /// Sever the link to the controller
    void clear_binding_context() {
        binding_context_.reset();
    }

    /**
     * @brief Add a behavior and call its on_attached()
     *
     * @note Null behaviors are ignored
     */
    void attach_behavior(std::unique_ptr<ViewBehavior> behavior);

    /**
     * @brief Detach and drop every behavior, most recently attached first
     */
    void clear_behaviors();

    size_t behavior_count() const {
        return behaviors_.size();
    }

    const std::vector<std::unique_ptr<ViewBehavior>>& get_behaviors() const {
        return behaviors_;
    }

  private:
    std::string name_;
    std::shared_ptr<ViewController> binding_context_;
    std::vector<std::unique_ptr<ViewBehavior>> behaviors_;
};

} // namespace waypoint
