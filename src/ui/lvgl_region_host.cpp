// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_region_host.h"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace waypoint {

// ============================================================================
// LvglView
// ============================================================================

LvglView::~LvglView() {
    release_widgets();
}

lv_obj_t* LvglView::ensure_created(lv_obj_t* parent) {
    if (root_) {
        return root_;
    }

    root_ = create(parent);
    if (!root_) {
        throw std::runtime_error("View '" + get_name() + "' failed to create its widgets");
    }
    spdlog::trace("[LvglView {}] Widgets created ({})", get_name(), (void*)root_);
    return root_;
}

void LvglView::release_widgets() {
    if (!root_) {
        return;
    }
    // Widgets may already be gone if LVGL was torn down first
    if (lv_is_initialized() && lv_obj_is_valid(root_)) {
        lv_obj_delete(root_);
    }
    root_ = nullptr;
}

lv_obj_t* LvglView::create(lv_obj_t* parent) {
    lv_obj_t* obj = lv_obj_create(parent);
    lv_obj_set_size(obj, LV_PCT(100), LV_PCT(100));
    return obj;
}

// ============================================================================
// LvglRegionHost
// ============================================================================

LvglRegionHost::LvglRegionHost(lv_obj_t* container) : container_(container) {
    if (!container_) {
        throw std::invalid_argument("LvglRegionHost requires a container");
    }
}

void LvglRegionHost::on_content_changed(View* view) {
    // Hide everything first; exactly one view root is visible at a time
    uint32_t count = lv_obj_get_child_count(container_);
    for (uint32_t i = 0; i < count; i++) {
        lv_obj_add_flag(lv_obj_get_child(container_, static_cast<int32_t>(i)),
                        LV_OBJ_FLAG_HIDDEN);
    }

    auto* lvgl_view = dynamic_cast<LvglView*>(view);
    if (!lvgl_view) {
        if (view) {
            spdlog::trace("[LvglRegionHost] '{}' has no widgets to show", view->get_name());
        }
        return;
    }

    lv_obj_t* root = lvgl_view->ensure_created(container_);
    lv_obj_remove_flag(root, LV_OBJ_FLAG_HIDDEN);
}

void LvglRegionHost::on_view_destroyed(View& view) {
    if (auto* lvgl_view = dynamic_cast<LvglView*>(&view)) {
        lvgl_view->release_widgets();
    }
}

} // namespace waypoint
