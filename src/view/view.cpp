// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "view.h"

#include <spdlog/spdlog.h>

namespace waypoint {

View::View(std::string name) : name_(std::move(name)) {}

View::~View() {
    // Behaviors normally go through clear_behaviors() during region teardown
    if (!behaviors_.empty()) {
        spdlog::trace("[View {}] Destroyed with {} behaviors still attached", name_,
                      behaviors_.size());
    }
}

void View::attach_behavior(std::unique_ptr<ViewBehavior> behavior) {
    if (!behavior) {
        return;
    }
    behaviors_.push_back(std::move(behavior));
    behaviors_.back()->on_attached(*this);
}

void View::clear_behaviors() {
    while (!behaviors_.empty()) {
        behaviors_.back()->on_detaching(*this);
        behaviors_.pop_back();
    }
}

} // namespace waypoint
