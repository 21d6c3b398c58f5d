// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lanprint {

class Config;

/**
 * @brief Discovery tuning, copied out of Config before the listener starts
 */
struct DiscoverySettings {
    uint16_t listen_port = 20054;   ///< Local UDP port (0 = ephemeral, used by tests)
    uint16_t announce_port = 20054; ///< Port devices listen on for probes
    std::string bind_address;       ///< Empty = all interfaces
    std::string probe_message = "discover";
    std::chrono::milliseconds probe_interval{6000};     ///< 0 disables periodic probes
    std::chrono::milliseconds sweep_interval{1000};
    std::chrono::milliseconds unreachable_after{12000};
    std::chrono::milliseconds staleness{20000};
    std::string model_prefix = "Snapmaker 2";
    std::vector<std::string> broadcast_addresses; ///< Empty = every interface broadcast address
    uint16_t default_transfer_port = 8080;        ///< Used when an announcement has no port

    /// Read /discovery/* (and /transfer/port) from the config
    static DiscoverySettings from_config(Config& config);
};

/**
 * @brief Abstract interface for LAN device discovery
 *
 * Allows dependency injection of mock implementations for testing.
 */
class IDiscoveryListener {
  public:
    using DeviceListCallback = std::function<void(const std::vector<DeviceRecord>&)>;

    virtual ~IDiscoveryListener() = default;

    /**
     * @brief Start listening
     *
     * @param on_change Invoked on the discovery thread with the full list
     *                  whenever it changes (may be empty)
     * @return false if the socket could not be opened
     */
    virtual bool start(DeviceListCallback on_change) = 0;
    virtual void stop() = 0;
    virtual bool is_running() const = 0;

    /// Snapshot of live devices; never blocks on network I/O
    virtual std::vector<DeviceRecord> list_devices() const = 0;
    virtual std::optional<DeviceRecord> find_device(const std::string& id) const = 0;

    /// Send a probe right away instead of waiting for the next interval
    virtual void probe_now() = 0;
};

/**
 * @brief UDP announce listener maintaining the device registry
 *
 * Threading model:
 * - One background thread receives datagrams, sends periodic probes and sweeps
 *   the registry; it is the only writer
 * - list_devices() / find_device() read a published snapshot and never wait
 *   on the receive loop
 * - stop() blocks until the thread has exited
 *
 * Usage:
 * @code
 * DiscoveryListener discovery(DiscoverySettings::from_config(*Config::get_instance()));
 * discovery.start([](const std::vector<DeviceRecord>& devices) {
 *     spdlog::info("{} printers on the LAN", devices.size());
 * });
 * @endcode
 */
class DiscoveryListener : public IDiscoveryListener {
  public:
    explicit DiscoveryListener(DiscoverySettings settings);
    ~DiscoveryListener() override;

    // Non-copyable (owns background thread)
    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    bool start(DeviceListCallback on_change) override;
    void stop() override;
    bool is_running() const override;

    std::vector<DeviceRecord> list_devices() const override;
    std::optional<DeviceRecord> find_device(const std::string& id) const override;

    void probe_now() override;

    /// Local port the socket is bound to, 0 when not running
    uint16_t bound_port() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanprint
