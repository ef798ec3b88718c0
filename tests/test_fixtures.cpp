// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "test_fixtures.h"

#include <algorithm>

// ============================================================================
// EventLog
// ============================================================================

size_t EventLog::count(const std::string& hook) const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(), [&](const std::string& e) {
        auto colon = e.find(':');
        return colon != std::string::npos && e.substr(colon + 1) == hook;
    }));
}

std::vector<std::string> EventLog::of(const std::string& source) const {
    std::vector<std::string> out;
    for (const auto& e : events) {
        auto colon = e.find(':');
        if (colon != std::string::npos && e.substr(0, colon) == source) {
            out.push_back(e.substr(colon + 1));
        }
    }
    return out;
}

int EventLog::index_of(const std::string& event) const {
    auto it = std::find(events.begin(), events.end(), event);
    if (it == events.end()) {
        return -1;
    }
    return static_cast<int>(it - events.begin());
}

// ============================================================================
// RecordingView
// ============================================================================

RecordingView::RecordingView(std::string name, EventLog& log, RegionManager& regions,
                             RecordingOptions options)
    : View(std::move(name)), log_(log), regions_(regions), options_(std::move(options)) {}

void RecordingView::initialize(const NavigationParameters&) {
    log_.record(get_name() + ":init");
    if (options_.fail_on == FailOn::Initialize) {
        throw std::runtime_error(get_name() + " refused to initialize");
    }
    for (const auto& region_name : options_.nested_regions) {
        regions_.create_region(region_name, std::make_unique<RegionHost>(), this);
    }
}

void RecordingView::on_navigated_to(const NavigationParameters& parameters) {
    log_.record(get_name() + ":to");
    last_direction =
        parameters.get<std::string>(KnownNavigationParameters::NavigationDirection, "");
    if (options_.fail_on == FailOn::NavigatedTo) {
        throw std::runtime_error(get_name() + " failed in navigated-to");
    }
}

void RecordingView::on_navigated_from(const NavigationParameters& parameters) {
    log_.record(get_name() + ":from");
    last_direction =
        parameters.get<std::string>(KnownNavigationParameters::NavigationDirection, "");
    if (options_.fail_on == FailOn::NavigatedFrom) {
        throw std::runtime_error(get_name() + " failed in navigated-from");
    }
}

void RecordingView::destroy() {
    log_.record(get_name() + ":destroy");
    if (options_.fail_on == FailOn::Destroy) {
        throw std::runtime_error(get_name() + " failed in destroy");
    }
}

void RecordingView::on_resume() {
    log_.record(get_name() + ":resume");
}

void RecordingView::on_sleep() {
    log_.record(get_name() + ":sleep");
}

void RecordingView::on_appearing() {
    log_.record(get_name() + ":appear");
}

void RecordingView::on_disappearing() {
    log_.record(get_name() + ":disappear");
}

// ============================================================================
// RegionTestFixture
// ============================================================================

RegionTestFixture::RegionTestFixture() : regions(views) {}

void RegionTestFixture::register_recording(const std::string& name, RecordingOptions options) {
    EventLog* event_log = &log;
    RegionManager* manager = &regions;
    bool with_controller = options.with_controller;

    ControllerFactory controller_factory;
    if (with_controller) {
        controller_factory = [event_log, name]() {
            return std::make_shared<RecordingController>(name + ".ctrl", *event_log);
        };
    }

    views.register_view(
        name,
        [event_log, manager, options](const std::string& view_name) {
            return std::make_unique<RecordingView>(view_name, *event_log, *manager, options);
        },
        controller_factory);
}

void RegionTestFixture::register_recordings(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        register_recording(name);
    }
}

std::shared_ptr<Region> RegionTestFixture::create_root(const std::string& name) {
    return regions.create_region(name, std::make_unique<RegionHost>());
}

std::vector<std::string> RegionTestFixture::stack_names(const Region& region) {
    std::vector<std::string> names;
    for (size_t i = 0; i < region.get_stack_size(); i++) {
        names.push_back(region.get_view_at(i)->get_name());
    }
    return names;
}

std::string RegionTestFixture::current_name(const Region& region) {
    View* current = region.get_current_view();
    return current ? current->get_name() : "";
}
