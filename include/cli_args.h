// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for sdcp-watch
 */

#include <string>

namespace sdcpwatch {

/**
 * @brief Parsed command-line arguments
 *
 * Empty strings and -1 mean "not given on the command line": the config file value
 * (or its default) applies.
 */
struct CliArgs {
    std::string config_path; // -c/--config

    // Discovery
    int discovery_timeout_ms = -1; // -t/--timeout: idle window

    // Logging
    int verbosity = 0;
    std::string log_target; // --log-target
    std::string log_file;   // --log-file

    // Display
    bool no_color = false;
    bool no_bell = false;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stdout. --help prints usage and sets help_requested.
 *
 * @return true to continue running, false if help was shown or an argument was invalid
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/// Usage text printed by --help
std::string help_text(const char* program_name);

/// Default config location: $XDG_CONFIG_HOME/sdcp-watch/config.json (or ~/.config/...)
std::string default_config_path();

} // namespace sdcpwatch
