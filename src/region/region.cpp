// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "region.h"

#include "region_manager.h"
#include "view.h"
#include "view_lifecycle.h"
#include "view_provider.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace waypoint {

namespace {

void tag_direction(NavigationParameters& parameters, NavigationDirection direction) {
    parameters.set(KnownNavigationParameters::NavigationDirection,
                   navigation_direction_name(direction));
}

} // namespace

Region::Region(std::string name, ViewProvider& views, IRegionManager& regions,
               std::unique_ptr<RegionHost> host)
    : views_(views), regions_(regions), name_(std::move(name)), host_(std::move(host)) {
    if (!host_) {
        throw std::invalid_argument("Region '" + name_ + "' requires a host");
    }
}

Region::~Region() {
    if (!stack_.empty()) {
        spdlog::trace("[Region {}] Released with {} views never destroyed", name_, stack_.size());
    }
}

// ============================================================================
// NAVIGATION
// ============================================================================

NavigationResult Region::replace_all(const std::string& view_name,
                                     NavigationParameters& parameters) {
    try {
        std::unique_ptr<View> view = init_view(view_name, parameters);

        // Most recent first
        std::vector<View*> evicted;
        evicted.reserve(stack_.size());
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            evicted.push_back(it->get());
        }

        tag_direction(parameters, NavigationDirection::New);
        leave_current(*view, parameters);

        View* target = view.get();
        stack_.push_back(std::move(view));
        set_current(target);
        navigated_recursively(parameters, true);

        evict(evicted);

        spdlog::debug("[Region {}] replace_all '{}' (evicted {})", name_, view_name,
                      evicted.size());
        return NavigationResult::ok();
    } catch (...) {
        auto error = NavigationError::from_current_exception();
        spdlog::warn("[Region {}] replace_all '{}' failed: [{}] {}", name_, view_name,
                     error.get_type_string(), error.message);
        return NavigationResult::failed(std::move(error));
    }
}

NavigationResult Region::replace_all(const std::string& view_name) {
    NavigationParameters parameters;
    return replace_all(view_name, parameters);
}

NavigationResult Region::push(const std::string& view_name, NavigationParameters& parameters) {
    try {
        std::unique_ptr<View> view = init_view(view_name, parameters);

        int index = static_cast<int>(stack_.size()) - 1;

        tag_direction(parameters, NavigationDirection::New);

        if (current_) {
            leave_current(*view, parameters);
            index = index_of(current_);
        }

        // Forward history, most recent first
        std::vector<View*> evicted;
        for (int i = static_cast<int>(stack_.size()) - 1; i > index; --i) {
            evicted.push_back(stack_[i].get());
        }

        View* target = view.get();
        stack_.push_back(std::move(view));
        set_current(target);
        navigated_recursively(parameters, true);

        evict(evicted);

        spdlog::debug("[Region {}] push '{}' (depth {}, evicted {})", name_, view_name,
                      stack_.size(), evicted.size());
        return NavigationResult::ok();
    } catch (...) {
        auto error = NavigationError::from_current_exception();
        spdlog::warn("[Region {}] push '{}' failed: [{}] {}", name_, view_name,
                     error.get_type_string(), error.message);
        return NavigationResult::failed(std::move(error));
    }
}

NavigationResult Region::push(const std::string& view_name) {
    NavigationParameters parameters;
    return push(view_name, parameters);
}

NavigationResult Region::push_backwards(const std::string& view_name,
                                        NavigationParameters& parameters) {
    try {
        std::unique_ptr<View> view = init_view(view_name, parameters);

        int index = 0;

        tag_direction(parameters, NavigationDirection::New);

        if (current_) {
            leave_current(*view, parameters);
            index = index_of(current_);
        }

        // Backward history, nearest to current first
        std::vector<View*> evicted;
        for (int i = index - 1; i >= 0; --i) {
            evicted.push_back(stack_[i].get());
        }

        View* target = view.get();
        stack_.insert(stack_.begin() + index, std::move(view));
        set_current(target);
        navigated_recursively(parameters, true);

        evict(evicted);

        spdlog::debug("[Region {}] push_backwards '{}' (depth {}, evicted {})", name_, view_name,
                      stack_.size(), evicted.size());
        return NavigationResult::ok();
    } catch (...) {
        auto error = NavigationError::from_current_exception();
        spdlog::warn("[Region {}] push_backwards '{}' failed: [{}] {}", name_, view_name,
                     error.get_type_string(), error.message);
        return NavigationResult::failed(std::move(error));
    }
}

NavigationResult Region::push_backwards(const std::string& view_name) {
    NavigationParameters parameters;
    return push_backwards(view_name, parameters);
}

NavigationResult Region::go_back(NavigationParameters& parameters) {
    try {
        if (!can_go_back()) {
            throw InvalidNavigationError("Cannot go back");
        }

        View* target = stack_[index_of(current_) - 1].get();

        tag_direction(parameters, NavigationDirection::Back);

        navigated_recursively(parameters, false);
        set_current(target);
        navigated_recursively(parameters, true);

        spdlog::debug("[Region {}] go_back -> '{}' (index {})", name_, target->get_name(),
                      get_current_index());
        return NavigationResult::ok();
    } catch (...) {
        auto error = NavigationError::from_current_exception();
        spdlog::warn("[Region {}] go_back failed: [{}] {}", name_, error.get_type_string(),
                     error.message);
        return NavigationResult::failed(std::move(error));
    }
}

NavigationResult Region::go_back() {
    NavigationParameters parameters;
    return go_back(parameters);
}

NavigationResult Region::go_forward(NavigationParameters& parameters) {
    try {
        if (!can_go_forward()) {
            throw InvalidNavigationError("Cannot go forward");
        }

        View* target = stack_[index_of(current_) + 1].get();

        tag_direction(parameters, NavigationDirection::Forward);

        navigated_recursively(parameters, false);
        set_current(target);
        navigated_recursively(parameters, true);

        spdlog::debug("[Region {}] go_forward -> '{}' (index {})", name_, target->get_name(),
                      get_current_index());
        return NavigationResult::ok();
    } catch (...) {
        auto error = NavigationError::from_current_exception();
        spdlog::warn("[Region {}] go_forward failed: [{}] {}", name_, error.get_type_string(),
                     error.message);
        return NavigationResult::failed(std::move(error));
    }
}

NavigationResult Region::go_forward() {
    NavigationParameters parameters;
    return go_forward(parameters);
}

bool Region::can_go_back() const {
    return current_ && stack_.size() > 1 && index_of(current_) >= 1;
}

bool Region::can_go_forward() const {
    return current_ && stack_.size() > 1 &&
           index_of(current_) <= static_cast<int>(stack_.size()) - 2;
}

std::unique_ptr<View> Region::init_view(const std::string& view_name,
                                        const NavigationParameters& parameters) {
    std::unique_ptr<View> view = views_.resolve(view_name);

    try {
        lifecycle::initialize(*view, parameters);
        views_.apply_behaviors(*view);
    } catch (...) {
        spdlog::trace("[Region {}] Initialization of '{}' failed, tearing it down", name_,
                      view_name);
        destroy_recursively(*view);
        throw;
    }

    return view;
}

void Region::leave_current(View& incoming, const NavigationParameters& parameters) {
    try {
        navigated_recursively(parameters, false);
    } catch (...) {
        // incoming is not on the stack yet; nothing else would tear it down
        spdlog::trace("[Region {}] navigated-from failed, tearing down '{}'", name_,
                      incoming.get_name());
        destroy_recursively(incoming);
        throw;
    }
}

// ============================================================================
// RECURSION
// ============================================================================

void Region::navigated_recursively(const NavigationParameters& parameters, bool to) {
    if (!current_) {
        return;
    }

    // Hold a pointer: a hook must not be able to change what we finish with
    View* view = current_;

    if (to) {
        lifecycle::navigated(*view, parameters, true);
    }

    for (const auto& region : regions_.get_regions(view)) {
        region->navigated_recursively(parameters, to);
    }

    if (!to) {
        lifecycle::navigated(*view, parameters, false);
    }
}

void Region::destroy_all() {
    spdlog::trace("[Region {}] destroy_all ({} views)", name_, stack_.size());

    set_current(nullptr);

    while (!stack_.empty()) {
        std::unique_ptr<View> view = std::move(stack_.back());
        stack_.pop_back();
        destroy_recursively(*view);
        host_->on_view_destroyed(*view);
    }

    host_->release_scope();

    // May drop the registry's reference to this region; nothing below touches members
    regions_.remove_holder(name_);
}

void Region::destroy_recursively(View& view) {
    for (const auto& region : regions_.get_regions(&view)) {
        region->destroy_all();
    }

    lifecycle::destroy(view);

    view.clear_behaviors();
    view.clear_binding_context();
}

void Region::on_window_lifecycle_recursively(bool resume) {
    for (const auto& view : stack_) {
        lifecycle::window_lifecycle(*view, resume);
    }

    // Nested regions are only reachable through a displayed view
    if (!current_) {
        return;
    }

    for (const auto& region : regions_.get_regions(current_)) {
        region->on_window_lifecycle_recursively(resume);
    }
}

void Region::on_page_lifecycle_recursively(bool appearing) {
    if (appearing) {
        for (const auto& view : stack_) {
            lifecycle::page_lifecycle(*view, true);
        }
    }

    if (current_) {
        for (const auto& region : regions_.get_regions(current_)) {
            region->on_page_lifecycle_recursively(appearing);
        }
    }

    if (!appearing) {
        for (auto it = stack_.rbegin(); it != stack_.rend(); ++it) {
            lifecycle::page_lifecycle(**it, false);
        }
    }
}

// ============================================================================
// QUERIES / HELPERS
// ============================================================================

View* Region::get_view_at(size_t index) const {
    if (index >= stack_.size()) {
        return nullptr;
    }
    return stack_[index].get();
}

int Region::get_current_index() const {
    return current_ ? index_of(current_) : -1;
}

int Region::index_of(const View* view) const {
    auto it = std::find_if(stack_.begin(), stack_.end(),
                           [view](const std::unique_ptr<View>& entry) { return entry.get() == view; });
    if (it == stack_.end()) {
        return -1;
    }
    return static_cast<int>(std::distance(stack_.begin(), it));
}

void Region::set_current(View* view) {
    current_ = view;
    host_->set_content(view);
}

void Region::evict(const std::vector<View*>& evicted) {
    for (View* target : evicted) {
        int index = index_of(target);
        if (index < 0) {
            continue;
        }

        std::unique_ptr<View> view = std::move(stack_[index]);
        stack_.erase(stack_.begin() + index);

        spdlog::trace("[Region {}] Evicting '{}'", name_, view->get_name());
        destroy_recursively(*view);
        host_->on_view_destroyed(*view);
    }
}

} // namespace waypoint
