// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_result.h"

namespace waypoint {

const char* navigation_direction_name(NavigationDirection direction) {
    switch (direction) {
    case NavigationDirection::New:
        return "New";
    case NavigationDirection::Back:
        return "Back";
    case NavigationDirection::Forward:
        return "Forward";
    }
    return "Unknown";
}

NavigationDirection parse_navigation_direction(const std::string& name) {
    if (name == "New")
        return NavigationDirection::New;
    if (name == "Back")
        return NavigationDirection::Back;
    if (name == "Forward")
        return NavigationDirection::Forward;
    throw std::invalid_argument("Unknown navigation direction: " + name);
}

std::string NavigationError::get_type_string() const {
    switch (type) {
    case NavigationErrorType::NONE:
        return "NONE";
    case NavigationErrorType::VIEW_NOT_FOUND:
        return "VIEW_NOT_FOUND";
    case NavigationErrorType::INVALID_OPERATION:
        return "INVALID_OPERATION";
    case NavigationErrorType::UNKNOWN:
        return "UNKNOWN";
    default:
        return "UNKNOWN";
    }
}

NavigationError NavigationError::from_current_exception() {
    NavigationError err;
    err.exception = std::current_exception();

    try {
        std::rethrow_exception(err.exception);
    } catch (const ViewNotFoundError& e) {
        err.type = NavigationErrorType::VIEW_NOT_FOUND;
        err.message = e.what();
    } catch (const InvalidNavigationError& e) {
        err.type = NavigationErrorType::INVALID_OPERATION;
        err.message = e.what();
    } catch (const std::exception& e) {
        err.type = NavigationErrorType::UNKNOWN;
        err.message = e.what();
    } catch (...) {
        // Non-std fault: still reported, original kept in err.exception
        err.type = NavigationErrorType::UNKNOWN;
        err.message = "Unknown exception";
    }

    return err;
}

void NavigationResult::rethrow() const {
    if (!success_ && error_.exception) {
        std::rethrow_exception(error_.exception);
    }
}

} // namespace waypoint
