// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace sdcpwatch {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

std::string help_text(const char* program_name) {
    std::string text = fmt::format("Usage: {} [options]\n", program_name);
    text += "Discover SDCP 3D printers on the local network and report status changes.\n";
    text += "Options:\n";
    text += fmt::format("  -c, --config <path>  Configuration file (default: {})\n",
                        default_config_path());
    text += "  -t, --timeout <ms>   Discovery idle window in milliseconds (100-60000)\n";
    text += "  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n";
    text += "  --log-target <t>     Log target: auto, journal, syslog, file, console\n";
    text += "  --log-file <path>    Log file path (with --log-target file)\n";
    text += "  --no-color           Plain status lines without ANSI colors\n";
    text += "  --no-bell            Never ring the terminal bell\n";
    text += "  -h, --help           Show this help message\n";
    return text;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/sdcp-watch/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/sdcp-watch/config.json";
    }
    return "sdcp-watch.json";
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c/--config requires a path argument\n");
                return false;
            }
            args.config_path = argv[++i];
        }
        // Discovery idle window
        else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--timeout") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -t/--timeout requires an argument\n");
                return false;
            }
            if (!parse_int(argv[++i], 100, 60000, args.discovery_timeout_ms, "timeout")) {
                return false;
            }
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging
        else if (strcmp(argv[i], "--log-target") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-target requires an argument\n");
                return false;
            }
            const char* target = argv[++i];
            if (strcmp(target, "auto") != 0 && strcmp(target, "journal") != 0 &&
                strcmp(target, "syslog") != 0 && strcmp(target, "file") != 0 &&
                strcmp(target, "console") != 0) {
                printf("Error: unknown log target: %s\n", target);
                printf("Available targets: auto, journal, syslog, file, console\n");
                return false;
            }
            args.log_target = target;
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 < argc) {
                args.log_file = argv[++i];
            } else {
                printf("Error: --log-file requires a path argument\n");
                return false;
            }
        }
        // Display
        else if (strcmp(argv[i], "--no-color") == 0) {
            args.no_color = true;
        } else if (strcmp(argv[i], "--no-bell") == 0) {
            args.no_bell = true;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printf("%s", help_text(argv[0]).c_str());
            args.help_requested = true;
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    return true;
}

} // namespace sdcpwatch
