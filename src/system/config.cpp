// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace lanprint {

Config* Config::instance{NULL};

namespace {

/// Discovery defaults (Snapmaker 2.0 announce protocol)
json get_default_discovery_config() {
    return {{"announce_port", 20054},
            {"listen_port", 20054},
            {"probe_message", "discover"},
            {"probe_interval_ms", 6000},
            {"sweep_interval_ms", 1000},
            {"unreachable_after_ms", 12000},
            {"staleness_ms", 20000},
            {"model_prefix", "Snapmaker 2"},
            {"broadcast_addresses", json::array()}};
}

/// Transfer defaults (Snapmaker 2.0 HTTP API)
json get_default_transfer_config() {
    return {{"port", 8080},
            {"api_prefix", "/api/v1"},
            {"connect_timeout_ms", 3000},
            {"request_timeout_ms", 5000},
            {"authorization_timeout_ms", 60000},
            {"authorization_poll_ms", 1500},
            {"upload_chunk_bytes", 40960},
            {"token_file", ""}};
}

/// Header encoder defaults
json get_default_encoder_config() {
    return {{"thumbnail_width", 240},
            {"thumbnail_height", 160},
            {"time_factor", 1.07},
            {"processed_identity", "Processed by LanPrint"}};
}

/// Default root-level config
json get_default_config() {
    return {{"config_version", CURRENT_CONFIG_VERSION},
            {"log_level", "warn"},
            {"log_path", ""},
            {"log_target", "console"},
            {"discovery", get_default_discovery_config()},
            {"transfer", get_default_transfer_config()},
            {"encoder", get_default_encoder_config()}};
}

/// Add keys missing from a section, keeping everything the user set
bool fill_section_defaults(json& data, const char* section, const json& defaults) {
    bool modified = false;
    if (!data.contains(section) || !data[section].is_object()) {
        data[section] = defaults;
        return true;
    }

    auto& target = data[section];
    for (auto& [key, value] : defaults.items()) {
        if (!target.contains(key)) {
            target[key] = value;
            modified = true;
        }
    }
    return modified;
}

/// Run all versioned migrations in sequence up to CURRENT_CONFIG_VERSION
void run_versioned_migrations(json& config) {
    int version = 0;
    if (config.contains("config_version") && config["config_version"].is_number_integer()) {
        version = config["config_version"].get<int>();
    }

    if (version < 1) {
        // Pre-release configs stored tokens inline; they now live in tokens.json
        if (config.contains("tokens")) {
            spdlog::info("[Config] Migration v1: dropping inline tokens (moved to token file)");
            config.erase("tokens");
        }
    }

    config["config_version"] = CURRENT_CONFIG_VERSION;
}

bool write_json_atomic(const std::string& target, const json& data) {
    std::string tmp = target + ".tmp";
    {
        std::ofstream o(tmp);
        if (!o.is_open()) {
            return false;
        }
        o << std::setw(2) << data << std::endl;
        if (!o.good()) {
            return false;
        }
    }
    return std::rename(tmp.c_str(), target.c_str()) == 0;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

std::string Config::default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/lanprint";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/lanprint";
    }

    return "/tmp/lanprint";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);

            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object, resetting to defaults");
            data = get_default_config();
            config_modified = true;
        }

        int version_before = data.value("config_version", 0);
        run_versioned_migrations(data);
        if (data["config_version"].get<int>() != version_before) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    config_modified |= fill_section_defaults(data, "discovery", get_default_discovery_config());
    config_modified |= fill_section_defaults(data, "transfer", get_default_transfer_config());
    config_modified |= fill_section_defaults(data, "encoder", get_default_encoder_config());

    if (config_modified) {
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
        }

        if (write_json_atomic(config_path, data)) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        } else {
            spdlog::warn("[Config] Could not write config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: announce_port={} transfer_port={}",
                  get<int>("/discovery/announce_port", 0), get<int>("/transfer/port", 0));
}

std::string Config::get_path() {
    return path;
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        if (!write_json_atomic(path, data)) {
            spdlog::error("[Config] Failed to write config file: {}", path);
            return false;
        }
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace lanprint
