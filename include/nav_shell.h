// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_shell.h
 * @brief Line-oriented command interpreter over a RegionManager
 *
 * Commands:
 *   replace|push|pushback <region> <view> [key=value ...]
 *   back|forward <region>
 *   resume | sleep | appear | disappear
 *   destroy <region>
 *   tree | help | quit
 *
 * Every command yields one status line ("ok: ..." or "error: ...") except
 * tree and help, which yield a listing.
 */

#pragma once

#include "navigation_parameters.h"

#include <string>
#include <vector>

namespace waypoint {

class Region;
class RegionManager;
class View;

class NavShell {
  public:
    explicit NavShell(RegionManager& regions);

    /**
     * @brief Execute one command line
     * @return Text to show the user (no trailing newline). Exceptions from
     *         view hooks come back as an "error: " line.
     */
    std::string execute(const std::string& line);

    /// True after a "quit" command
    bool is_quit_requested() const {
        return quit_requested_;
    }

    /**
     * @brief Render every root region and what it hosts
     *
     * One line per region: name, then stack entries with the current one
     * marked by '*'. Nested regions are indented under their region.
     */
    std::string render_tree() const;

    /**
     * @brief Parse "key=value" tokens into parameters
     *
     * Values that parse as JSON (numbers, booleans, quoted strings) keep their
     * type; anything else is stored as a string.
     *
     * @throws std::invalid_argument for a token without '='
     */
    static NavigationParameters parse_parameters(const std::vector<std::string>& tokens,
                                                 size_t first);

    static std::string help_text();

  private:
    std::string dispatch(const std::vector<std::string>& tokens);
    std::string navigate(const std::string& command, const std::vector<std::string>& tokens);
    void render_region(const Region& region, int depth, std::string& out) const;

    RegionManager& regions_;
    bool quit_requested_ = false;
};

} // namespace waypoint
