// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef WAYPOINT_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace waypoint {
namespace logging {

namespace {

constexpr size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

const std::pair<const char*, LogTarget> kTargetNames[] = {
    {"auto", LogTarget::Auto},       {"journal", LogTarget::Journal},
    {"syslog", LogTarget::Syslog},   {"file", LogTarget::File},
    {"console", LogTarget::Console},
};

LogTarget resolve_target(LogTarget requested) {
    if (requested != LogTarget::Auto) {
        return requested;
    }
#if defined(__linux__) && defined(WAYPOINT_HAS_SYSTEMD)
    std::error_code ec;
    return std::filesystem::exists("/run/systemd/journal/socket", ec) ? LogTarget::Journal
                                                                      : LogTarget::Syslog;
#elif defined(__linux__)
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Sink for @p target, nullptr when the console is all there is
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File: {
        std::string path = file_path.empty() ? default_log_file() : file_path;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, kMaxLogFileBytes,
                                                                      kMaxLogFiles);
    }
#ifdef __linux__
    case LogTarget::Journal:
#ifdef WAYPOINT_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>("waypoint");
#else
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>("waypoint", LOG_PID, LOG_USER,
                                                               false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

std::string default_log_file() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".local" / "share";
    } else {
        base = std::filesystem::temp_directory_path();
    }

    std::filesystem::path dir = base / "waypoint";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return (dir / "waypoint.log").string();
}

LogConfig config_from_json(const nlohmann::json& doc) {
    LogConfig config;
    auto text = [&doc](const char* key) -> std::string {
        auto it = doc.find(key);
        return (it != doc.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };

    config.level = parse_level(text("log_level"), spdlog::level::info);
    config.target = parse_log_target(text("log_target"));
    config.file_path = text("log_file");

    auto backtrace = doc.find("log_backtrace");
    if (backtrace != doc.end() && backtrace->is_number_integer() && backtrace->get<long>() >= 0) {
        config.backtrace_size = backtrace->get<size_t>();
    }
    return config;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget target = resolve_target(config.target);
    if (auto sink = make_target_sink(target, config.file_path)) {
        sinks.push_back(std::move(sink));
    }

    auto logger = std::make_shared<spdlog::logger>("waypoint", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    if (config.backtrace_size > 0) {
        spdlog::enable_backtrace(config.backtrace_size);
    } else {
        spdlog::disable_backtrace();
    }

    spdlog::debug("[Logging] target={} sinks={} backtrace={}", log_target_name(target),
                  sinks.size(), config.backtrace_size);
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    // from_str() maps unknown names to off, so off has to be matched first
    if (str == "off") {
        return spdlog::level::off;
    }
    spdlog::level::level_enum level = spdlog::level::from_str(str);
    return level == spdlog::level::off ? default_level : level;
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : kTargetNames) {
        if (str == entry.first) {
            return entry.second;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : kTargetNames) {
        if (entry.second == target) {
            return entry.first;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace waypoint
