// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lanprint {

/**
 * @brief Device state as last announced (or inferred by the registry sweep)
 */
enum class DeviceStatus {
    IDLE,       ///< Ready to accept a job
    PRINTING,   ///< Running a job
    BUSY,       ///< Paused, stopped, or any state we do not recognize
    UNREACHABLE ///< Missed announcements, not yet evicted
};

/**
 * @brief Network endpoint used for file transfer
 */
struct DeviceAddress {
    std::string host; ///< Dotted IPv4 address
    uint16_t port = 0;

    bool operator==(const DeviceAddress& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const DeviceAddress& other) const { return !(*this == other); }

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief A printer seen on the LAN
 *
 * Records live in the DeviceRegistry only while now - last_seen is inside the
 * staleness window.
 */
struct DeviceRecord {
    std::string id;           ///< "<name>@<model>", stable across address changes
    std::string display_name; ///< Name shown to the user
    std::string model;        ///< e.g. "Snapmaker 2 Model A350"
    DeviceAddress address;
    DeviceStatus status = DeviceStatus::IDLE;
    std::string raw_status; ///< Status string exactly as announced
    std::chrono::steady_clock::time_point last_seen{};
};

/**
 * @brief Map an announced status string to DeviceStatus
 *
 * "IDLE" and "RUNNING" are recognized; everything else is BUSY.
 */
inline DeviceStatus parse_device_status(const std::string& status) {
    if (status == "IDLE") {
        return DeviceStatus::IDLE;
    }
    if (status == "RUNNING") {
        return DeviceStatus::PRINTING;
    }
    return DeviceStatus::BUSY;
}

inline const char* device_status_name(DeviceStatus status) {
    switch (status) {
    case DeviceStatus::IDLE:
        return "IDLE";
    case DeviceStatus::PRINTING:
        return "PRINTING";
    case DeviceStatus::BUSY:
        return "BUSY";
    case DeviceStatus::UNREACHABLE:
        return "UNREACHABLE";
    }
    return "UNKNOWN";
}

} // namespace lanprint
