// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "view_lifecycle.h"

#include "view.h"

namespace waypoint {
namespace lifecycle {

namespace {

// View first, then binding context
template <typename Capability, typename Fn> void dispatch(View& view, Fn&& fn) {
    if (auto* target = dynamic_cast<Capability*>(&view)) {
        fn(*target);
    }
    if (auto* target = dynamic_cast<Capability*>(view.get_binding_context())) {
        fn(*target);
    }
}

} // namespace

void initialize(View& view, const NavigationParameters& parameters) {
    dispatch<IInitializeAware>(view,
                               [&](IInitializeAware& aware) { aware.initialize(parameters); });
}

void navigated(View& view, const NavigationParameters& parameters, bool to) {
    dispatch<INavigationAware>(view, [&](INavigationAware& aware) {
        if (to) {
            aware.on_navigated_to(parameters);
        } else {
            aware.on_navigated_from(parameters);
        }
    });
}

void destroy(View& view) {
    dispatch<IDestructible>(view, [](IDestructible& destructible) { destructible.destroy(); });
}

void window_lifecycle(View& view, bool resume) {
    dispatch<IWindowLifecycleAware>(view, [resume](IWindowLifecycleAware& aware) {
        if (resume) {
            aware.on_resume();
        } else {
            aware.on_sleep();
        }
    });
}

void page_lifecycle(View& view, bool appearing) {
    dispatch<IPageLifecycleAware>(view, [appearing](IPageLifecycleAware& aware) {
        if (appearing) {
            aware.on_appearing();
        } else {
            aware.on_disappearing();
        }
    });
}

} // namespace lifecycle
} // namespace waypoint
