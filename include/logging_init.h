// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file logging_init.h
 * @brief spdlog setup: console sink plus an optional system sink
 *
 * @pattern The "log_*" keys of the config document become a LogConfig
 *          (config_from_json), command-line flags override fields, then init()
 *          installs the "waypoint" default logger.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace waypoint {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal or syslog on Linux, console elsewhere
    Journal, ///< systemd journal (WAYPOINT_HAS_SYSTEMD builds), syslog otherwise
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path;      ///< LogTarget::File only; empty = XDG data dir
    size_t backtrace_size = 32; ///< Messages kept for dump_backtrace(), 0 disables
};

/**
 * @brief Read log_level, log_target, log_file and log_backtrace
 *
 * Missing keys keep the LogConfig defaults, except that a missing or
 * unknown log_level means info.
 */
LogConfig config_from_json(const nlohmann::json& doc);

/**
 * @brief Replace the spdlog default logger with the "waypoint" logger
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "critical", "off", "warning", "err")
 * @return @p default_level for unknown names (matching is case-sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Parse "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// Default rotating log file: $XDG_DATA_HOME/waypoint/waypoint.log
std::string default_log_file();

} // namespace logging
} // namespace waypoint
