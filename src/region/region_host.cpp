// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "region_host.h"

#include <spdlog/spdlog.h>

namespace waypoint {

void RegionHost::set_content(View* view) {
    if (content_ == view) {
        return;
    }
    content_ = view;
    on_content_changed(view);
}

bool RegionHost::release_scope() {
    if (!scope_) {
        return false;
    }
    scope_.reset();
    spdlog::trace("[RegionHost] Scope released");
    return true;
}

} // namespace waypoint
