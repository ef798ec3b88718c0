// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for waypoint-shell
 */

#include <string>

namespace waypoint {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "waypoint.json";
    std::string script_path; // empty = read commands from stdin

    // Logging
    int verbosity = 0;        // -v=debug, -vv=trace
    std::string log_dest;     // overrides config log_target
    std::string log_file;     // overrides config log_file

    bool show_help = false;

    /** @brief Commands come from a file rather than stdin */
    bool has_script() const {
        return !script_path.empty();
    }
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false on a usage error (message already printed)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

} // namespace waypoint
