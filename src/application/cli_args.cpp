// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace waypoint {

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("\n");
    printf("Drive a region navigation tree from text commands.\n");
    printf("\n");
    printf("Options:\n");
    printf("  -c, --config PATH    Configuration file (default: waypoint.json)\n");
    printf("  -s, --script PATH    Read commands from PATH instead of stdin\n");
    printf("  -v, --verbose        Increase verbosity (-v=debug, -vv=trace)\n");
    printf("  --log-dest TARGET    Log target: auto, journal, syslog, file, console\n");
    printf("  --log-file PATH      Log file path (with --log-dest file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\n");
    printf("Type 'help' at the prompt for the command list.\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c/--config requires an argument\n");
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 || strcmp(argv[i], "--script") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -s/--script requires an argument\n");
                return false;
            }
            args.script_path = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0) {
            // Count 'v' characters (-v = 1, -vv = 2)
            for (const char* p = argv[i] + 1; *p == 'v'; p++) {
                args.verbosity++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            args.log_dest = argv[++i];
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires an argument\n");
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace waypoint
