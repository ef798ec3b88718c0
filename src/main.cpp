// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "declared_view.h"
#include "logging_init.h"
#include "nav_shell.h"
#include "region.h"
#include "region_host.h"
#include "region_manager.h"
#include "view_registry.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace waypoint;

namespace {

logging::LogConfig build_log_config(Config& config, const CliArgs& args) {
    logging::LogConfig log_config = logging::config_from_json(config.get_json(""));

    if (args.verbosity == 1) {
        log_config.level = spdlog::level::debug;
    } else if (args.verbosity >= 2) {
        log_config.level = spdlog::level::trace;
    }

    if (!args.log_dest.empty()) {
        log_config.target = logging::parse_log_target(args.log_dest);
    }
    if (!args.log_file.empty()) {
        log_config.file_path = args.log_file;
    }

    return log_config;
}

int run_shell(NavShell& shell, std::istream& in, bool interactive) {
    std::string line;
    while (!shell.is_quit_requested()) {
        if (interactive) {
            std::cout << "> " << std::flush;
        }
        if (!std::getline(in, line)) {
            break;
        }
        std::string output = shell.execute(line);
        if (!output.empty()) {
            std::cout << output << std::endl;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return 1;
    }
    if (args.show_help) {
        print_help(argv[0]);
        return 0;
    }

    Config* config = Config::get_instance();
    try {
        config->init(args.config_path);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to load %s: %s\n", args.config_path.c_str(), e.what());
        return 1;
    }

    logging::init(build_log_config(*config, args));

    ViewRegistry views;
    RegionManager regions(views);

    try {
        size_t count = register_declared_views(views, regions, config->get_json("/views"));
        spdlog::info("[Main] Registered {} views from {}", count, config->get_path());
    } catch (const std::exception& e) {
        spdlog::error("[Main] Invalid view declarations: {}", e.what());
        return 1;
    }

    std::string root_name = config->get<std::string>("/root_region", "main");
    std::shared_ptr<Region> root = regions.create_region(root_name, std::make_unique<RegionHost>());

    std::string initial_view = config->get<std::string>("/initial_view", "");
    if (!initial_view.empty()) {
        NavigationResult result = root->replace_all(initial_view);
        if (!result) {
            spdlog::error("[Main] Initial view '{}' failed: {}", initial_view,
                          result.error().message);
        }
    }

    NavShell shell(regions);
    int rc = 0;

    if (args.has_script()) {
        std::ifstream script(args.script_path);
        if (!script.is_open()) {
            spdlog::error("[Main] Cannot open script {}", args.script_path);
            rc = 1;
        } else {
            rc = run_shell(shell, script, false);
        }
    } else {
        rc = run_shell(shell, std::cin, true);
    }

    regions.destroy_all();
    spdlog::info("[Main] Shutdown complete");
    return rc;
}
