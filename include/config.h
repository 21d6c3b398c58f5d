// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __LANPRINT_CONFIG_H__
#define __LANPRINT_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace lanprint {

/// Bumped whenever a versioned migration is added to config.cpp
constexpr int CURRENT_CONFIG_VERSION = 1;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and read from the main thread only; typed settings structs are copied
 * out of it before any worker thread starts.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/config.json");
 *
 * int port = cfg->get<int>("/discovery/announce_port", 20054);
 * cfg->set<int>("/transfer/port", 8080);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, fills in any missing sections with defaults and
     * writes the result back. Creates the file if it doesn't exist. A file
     * that fails to parse is renamed to <path>.corrupt and replaced by defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has unexpected type ({}), using default", json_ptr,
                             e.what());
            }
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Save current configuration to file
     *
     * Written to a temp file and renamed into place.
     *
     * @return true on success
     */
    bool save();

    /**
     * @brief Get configuration file path
     */
    std::string get_path();

    /**
     * @brief Directory holding config.json and tokens.json
     *
     * $XDG_CONFIG_HOME/lanprint, falling back to ~/.config/lanprint and /tmp/lanprint.
     */
    static std::string default_config_dir();

    /**
     * @brief Get singleton instance
     */
    static Config* get_instance();
};

} // namespace lanprint

#endif // __LANPRINT_CONFIG_H__
