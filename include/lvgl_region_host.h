// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file lvgl_region_host.h
 * @brief RegionHost that shows views inside an LVGL container
 *
 * @pattern Each LvglView builds its widget tree lazily under the container the
 *          first time it is displayed. Switching content toggles
 *          LV_OBJ_FLAG_HIDDEN; widgets are deleted when the view is destroyed.
 * @threading Main thread only (LVGL is not thread-safe)
 * @gotchas The container must outlive the host. Views that are not LvglView
 *          are tracked as content but have nothing to show.
 */

#pragma once

#include "region_host.h"
#include "view.h"

#include "lvgl/lvgl.h"

#include <string>
#include <utility>

namespace waypoint {

/**
 * @brief View backed by an LVGL widget tree
 *
 * Override create() to build the widgets; the default builds an empty
 * full-size container.
 */
class LvglView : public View {
  public:
    explicit LvglView(std::string name) : View(std::move(name)) {}
    ~LvglView() override;

    /**
     * @brief Build the widget tree once
     * @return Root widget (existing one on later calls)
     */
    lv_obj_t* ensure_created(lv_obj_t* parent);

    /// Root widget, nullptr until displayed once or after release_widgets()
    lv_obj_t* get_root() const {
        return root_;
    }

    /// Delete the widget tree
    void release_widgets();

  protected:
    virtual lv_obj_t* create(lv_obj_t* parent);

  private:
    lv_obj_t* root_ = nullptr;
};

/**
 * @brief Region host bound to an LVGL container
 *
 * @code
 * lv_obj_t* slot = lv_obj_find_by_name(panel, "content_slot");
 * regions.create_region("content", std::make_unique<LvglRegionHost>(slot), this);
 * @endcode
 */
class LvglRegionHost : public RegionHost {
  public:
    explicit LvglRegionHost(lv_obj_t* container);

    lv_obj_t* get_container() const {
        return container_;
    }

    void on_view_destroyed(View& view) override;

  protected:
    void on_content_changed(View* view) override;

  private:
    lv_obj_t* container_;
};

} // namespace waypoint
