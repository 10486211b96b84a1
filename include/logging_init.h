// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace sdcpwatch {
namespace logging {

/// Where log output goes in addition to the colored console
enum class LogTarget {
    Auto,    ///< Journal or syslog on Linux, console elsewhere
    Journal, ///< systemd journal (falls back to syslog without systemd support)
    Syslog,
    File,    ///< Rotating file, 5MB x 3
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Console;
    std::string file_path; ///< File target only; empty picks a default location
};

/// Replace the default spdlog logger according to @p config
void init(const LogConfig& config);

/// Log @p reason as an error, then replay the backtrace buffer (messages below the level)
void report_fatal(const std::string& reason);

/// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off" (case sensitive)
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Number of -v flags to level: 0=warn, 1=info, 2=debug, 3+=trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// CLI verbosity wins over the config file; warn when neither says anything
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// Matching libhv log level (libhv has no trace level)
int to_hv_level(spdlog::level::level_enum level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace sdcpwatch
