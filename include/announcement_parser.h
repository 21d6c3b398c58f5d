// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"

#include <cstdint>
#include <optional>
#include <string>

namespace lanprint {

/// Longest announcement we accept; real ones are well under 200 bytes
constexpr size_t MAX_ANNOUNCEMENT_BYTES = 1024;

/**
 * @brief Fields pulled out of one announcement datagram
 */
struct Announcement {
    std::string name;    ///< Text before the last '@' of the first part
    std::string host;    ///< Announced IPv4 (or the sender address if that was unusable)
    std::string model;   ///< "model:" property
    std::string status;  ///< "status:" property, verbatim
    uint16_t port = 0;   ///< "port:" property, 0 if absent or invalid
};

/**
 * @brief Parse a device announcement
 *
 * Format: `<name>@<ipv4>|model:<model>|status:<status>[|key:value...]`
 *
 * @param datagram Raw datagram bytes
 * @param sender_ip Address the datagram came from, used when the announced
 *                  address is not a dotted IPv4 address
 * @param model_prefix Models not starting with this are rejected (empty = accept all)
 * @return The announcement, or std::nullopt for anything malformed or foreign
 */
std::optional<Announcement> parse_announcement(const std::string& datagram,
                                               const std::string& sender_ip,
                                               const std::string& model_prefix);

/**
 * @brief Build the registry record for an announcement
 *
 * @param default_port Transfer port used when the announcement has none
 */
DeviceRecord make_device_record(const Announcement& announcement, uint16_t default_port,
                                std::chrono::steady_clock::time_point seen_at);

/**
 * @brief true if text is a dotted-quad IPv4 address
 */
bool is_valid_ipv4(const std::string& text);

} // namespace lanprint
