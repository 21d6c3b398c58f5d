// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the lanprint tool and library users
 *
 * Builds the default logger from a console sink plus an optional file or
 * syslog sink, and keeps libhv's own logger in step with the chosen level.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace lanprint {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< File if a path is configured, console otherwise
    Syslog,  ///< syslog(3), Linux only
    File,    ///< Rotating file (5MB x 3)
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Empty = $XDG_DATA_HOME/lanprint/lanprint.log
};

/**
 * @brief Install the default "lanprint" logger
 *
 * Safe to call more than once; the last call wins.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" alias)
 *
 * Case sensitive. Returns default_level for empty or unrecognized input.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map CLI -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief CLI verbosity beats the config file, which beats the built-in default
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/**
 * @brief Map an spdlog level to libhv's hlog level (VERBOSE=0 .. SILENT=6)
 */
int to_hv_level(spdlog::level::level_enum level);

LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace lanprint
