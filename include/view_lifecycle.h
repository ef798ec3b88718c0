// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file view_lifecycle.h
 * @brief Deliver lifecycle hooks to a view and its binding context
 *
 * Each helper calls the view first when it implements the capability, then
 * its controller when that implements it. Hook exceptions propagate.
 */

#pragma once

#include "navigation_parameters.h"

namespace waypoint {

class View;

namespace lifecycle {

void initialize(View& view, const NavigationParameters& parameters);

/// @param to true for navigated-to, false for navigated-from
void navigated(View& view, const NavigationParameters& parameters, bool to);

void destroy(View& view);

/// @param resume true for on_resume, false for on_sleep
void window_lifecycle(View& view, bool resume);

/// @param appearing true for on_appearing, false for on_disappearing
void page_lifecycle(View& view, bool appearing);

} // namespace lifecycle
} // namespace waypoint
