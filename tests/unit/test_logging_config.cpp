// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <nlohmann/json.hpp>

using namespace waypoint;
using namespace waypoint::logging;

// ============================================================================
// parse_level()
// ============================================================================

TEST_CASE("parse_level: known level names", "[logging][config]") {
    CHECK(parse_level("trace") == spdlog::level::trace);
    CHECK(parse_level("debug") == spdlog::level::debug);
    CHECK(parse_level("info") == spdlog::level::info);
    CHECK(parse_level("warn") == spdlog::level::warn);
    CHECK(parse_level("warning") == spdlog::level::warn);
    CHECK(parse_level("error") == spdlog::level::err);
    CHECK(parse_level("critical") == spdlog::level::critical);
    CHECK(parse_level("off") == spdlog::level::off);
}

TEST_CASE("parse_level: unknown input falls back to the default", "[logging][config]") {
    CHECK(parse_level("") == spdlog::level::warn);
    CHECK(parse_level("", spdlog::level::info) == spdlog::level::info);
    CHECK(parse_level("DEBUG", spdlog::level::info) == spdlog::level::info); // case sensitive
}

// ============================================================================
// parse_log_target()
// ============================================================================

TEST_CASE("parse_log_target: names map to targets", "[logging][config]") {
    CHECK(parse_log_target("journal") == LogTarget::Journal);
    CHECK(parse_log_target("syslog") == LogTarget::Syslog);
    CHECK(parse_log_target("file") == LogTarget::File);
    CHECK(parse_log_target("console") == LogTarget::Console);
    CHECK(parse_log_target("auto") == LogTarget::Auto);
    CHECK(parse_log_target("carrier-pigeon") == LogTarget::Auto);
}

TEST_CASE("log_target_name: inverse of parse_log_target", "[logging][config]") {
    for (LogTarget target : {LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                             LogTarget::Console}) {
        CHECK(parse_log_target(log_target_name(target)) == target);
    }
    CHECK(std::string(log_target_name(LogTarget::Auto)) == "auto");
}

// ============================================================================
// config_from_json()
// ============================================================================

TEST_CASE("config_from_json: reads the log keys of the config document", "[logging][config]") {
    nlohmann::json doc = {{"log_level", "trace"},
                          {"log_target", "file"},
                          {"log_file", "/tmp/waypoint-test.log"},
                          {"log_backtrace", 8},
                          {"root_region", "main"}};

    LogConfig config = config_from_json(doc);

    CHECK(config.level == spdlog::level::trace);
    CHECK(config.target == LogTarget::File);
    CHECK(config.file_path == "/tmp/waypoint-test.log");
    CHECK(config.backtrace_size == 8);
    CHECK(config.enable_console);
}

TEST_CASE("config_from_json: missing or malformed keys keep defaults", "[logging][config]") {
    SECTION("empty document") {
        LogConfig config = config_from_json(nlohmann::json::object());
        CHECK(config.level == spdlog::level::info);
        CHECK(config.target == LogTarget::Auto);
        CHECK(config.file_path.empty());
        CHECK(config.backtrace_size == 32);
    }

    SECTION("wrong types and negative backtrace") {
        nlohmann::json doc = {{"log_level", 3},
                              {"log_target", nullptr},
                              {"log_file", false},
                              {"log_backtrace", -4}};
        LogConfig config = config_from_json(doc);
        CHECK(config.level == spdlog::level::info);
        CHECK(config.target == LogTarget::Auto);
        CHECK(config.file_path.empty());
        CHECK(config.backtrace_size == 32);
    }

    SECTION("backtrace can be switched off") {
        LogConfig config = config_from_json(nlohmann::json{{"log_backtrace", 0}});
        CHECK(config.backtrace_size == 0);
    }
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("logging::init: installs the waypoint logger", "[logging]") {
    auto previous = spdlog::default_logger();

    SECTION("console only") {
        LogConfig config;
        config.level = spdlog::level::debug;
        config.target = LogTarget::Console;
        init(config);

        CHECK(spdlog::default_logger()->name() == "waypoint");
        CHECK(spdlog::default_logger()->level() == spdlog::level::debug);
        CHECK(spdlog::default_logger()->sinks().size() == 1);
    }

    SECTION("file target writes to the given path") {
        auto path = std::filesystem::temp_directory_path() / "waypoint_logging_test.log";
        std::filesystem::remove(path);

        LogConfig config;
        config.level = spdlog::level::info;
        config.target = LogTarget::File;
        config.enable_console = false;
        config.file_path = path.string();
        init(config);

        spdlog::info("[Test] hello");
        spdlog::default_logger()->flush();

        CHECK(spdlog::default_logger()->sinks().size() == 1);
        CHECK(std::filesystem::exists(path));
        CHECK(std::filesystem::file_size(path) > 0);
    }

    spdlog::disable_backtrace();
    spdlog::set_default_logger(previous);
}

TEST_CASE("logging::init: backtrace keeps the configured number of messages",
          "[logging]") {
    auto previous = spdlog::default_logger();
    auto path = std::filesystem::temp_directory_path() / "waypoint_backtrace_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = path.string();
    config.backtrace_size = 2;
    init(config);

    spdlog::debug("[Test] first");
    spdlog::debug("[Test] second");
    spdlog::debug("[Test] third");
    spdlog::dump_backtrace();
    spdlog::default_logger()->flush();

    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(text.find("first") == std::string::npos);
    CHECK(text.find("second") != std::string::npos);
    CHECK(text.find("third") != std::string::npos);

    spdlog::disable_backtrace();
    spdlog::set_default_logger(previous);
}
