// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <memory>
#include <string>

namespace waypoint {

class View;

/**
 * @brief Produces views by logical name
 *
 * Regions depend on this interface only. ViewRegistry is the stock
 * implementation; tests substitute their own.
 */
class ViewProvider {
  public:
    virtual ~ViewProvider() = default;

    /**
     * @brief Create the view registered under @p name
     *
     * The returned view already has its controller set as binding context.
     *
     * @throws ViewNotFoundError if @p name is not registered
     */
    virtual std::unique_ptr<View> resolve(const std::string& name) = 0;

    /**
     * @brief Attach the behaviors registered for the view's name
     */
    virtual void apply_behaviors(View& view) = 0;
};

} // namespace waypoint
