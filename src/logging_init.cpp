// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include "hv/hlog.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace lanprint {
namespace logging {

namespace {

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string user_dir = get_xdg_data_home() + "/lanprint";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/lanprint.log";
}

/// Add system sink based on target
void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("lanprint", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    default:
        // Console-only, or syslog requested on a platform without it
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always, unless explicitly disabled). stderr keeps stdout clean for
    // command output such as the device list.
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target = config.target;
    if (effective_target == LogTarget::Auto) {
        effective_target = config.file_path.empty() ? LogTarget::Console : LogTarget::File;
    }

    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("lanprint", sinks.begin(), sinks.end());
    logger->set_level(config.level);

    spdlog::set_default_logger(logger);

    // Keep recent messages around so failures can dump what led up to them
    spdlog::enable_backtrace(32);

    // libhv logs to its own file by default; route it to our level and keep it quiet
    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG;
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    case spdlog::level::off:
    default:
        return LOG_LEVEL_SILENT;
    }
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace lanprint
