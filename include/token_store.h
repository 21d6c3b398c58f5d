// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lanprint {

/**
 * @brief Remembered authorization tokens, one per device id
 *
 * A device that still honours a token skips the touchscreen prompt. Stored as
 * a flat JSON object {"<device id>": "<token>"}; thread-safe.
 */
class TokenStore {
  public:
    /// @param path JSON file; empty keeps tokens in memory only
    explicit TokenStore(std::string path = "");

    /// Load from disk; a missing or unreadable file leaves the store empty
    void load();

    /// Write to disk (temp file + rename). No-op without a path.
    bool save() const;

    std::optional<std::string> get(const std::string& device_id) const;
    void put(const std::string& device_id, const std::string& token);
    void erase(const std::string& device_id);
    size_t size() const;

    const std::string& path() const {
        return path_;
    }

  private:
    const std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> tokens_;
};

} // namespace lanprint
