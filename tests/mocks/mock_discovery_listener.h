// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_DISCOVERY_LISTENER_H
#define MOCK_DISCOVERY_LISTENER_H

/**
 * @file mock_discovery_listener.h
 * @brief Mock LAN discovery for testing
 *
 * Provides a discovery listener that:
 * - Doesn't start background threads
 * - Doesn't do real network I/O
 * - Returns an empty device list (or configured fake devices)
 *
 * @example
 * MockDiscoveryListener mock;
 * mock.add_fake_device("Shop", "Snapmaker 2 Model A350", "192.168.1.20");
 * mock.start([](const std::vector<DeviceRecord>& devices) { ... });
 */

#include "discovery_listener.h"

#include <mutex>
#include <vector>

using namespace lanprint;

/**
 * @brief Mock discovery that finds nothing (by default)
 *
 * Thread-safe: the orchestrator looks devices up from caller threads.
 */
class MockDiscoveryListener : public IDiscoveryListener {
  public:
    MockDiscoveryListener() = default;
    ~MockDiscoveryListener() override = default;

    // Non-copyable
    MockDiscoveryListener(const MockDiscoveryListener&) = delete;
    MockDiscoveryListener& operator=(const MockDiscoveryListener&) = delete;

    /**
     * @brief Start "listening" - immediately calls callback with configured devices
     */
    bool start(DeviceListCallback on_change) override {
        std::vector<DeviceRecord> devices;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_start_) {
                return false;
            }
            callback_ = std::move(on_change);
            running_ = true;
            devices = fake_devices_;
        }
        if (callback_) {
            callback_(devices);
        }
        return true;
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        callback_ = nullptr;
        ++stop_count_;
    }

    bool is_running() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    std::vector<DeviceRecord> list_devices() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return fake_devices_;
    }

    std::optional<DeviceRecord> find_device(const std::string& id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& d : fake_devices_) {
            if (d.id == id) {
                return d;
            }
        }
        return std::nullopt;
    }

    void probe_now() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probe_count_;
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    /**
     * @brief Add a fake device; returns its id ("<name>@<model>")
     */
    std::string add_fake_device(const std::string& name, const std::string& model,
                                const std::string& ip, uint16_t port = 8080,
                                DeviceStatus status = DeviceStatus::IDLE) {
        DeviceRecord rec;
        rec.id = name + "@" + model;
        rec.display_name = name;
        rec.model = model;
        rec.address = {ip, port};
        rec.status = status;
        rec.raw_status = device_status_name(status);
        rec.last_seen = std::chrono::steady_clock::now();

        std::lock_guard<std::mutex> lock(mutex_);
        fake_devices_.push_back(rec);
        return rec.id;
    }

    void clear_fake_devices() {
        std::lock_guard<std::mutex> lock(mutex_);
        fake_devices_.clear();
    }

    /// Make the next start() fail as if the port were taken
    void set_fail_start(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_start_ = fail;
    }

    int probe_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probe_count_;
    }

    int stop_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stop_count_;
    }

  private:
    mutable std::mutex mutex_;
    bool running_ = false;
    bool fail_start_ = false;
    int probe_count_ = 0;
    int stop_count_ = 0;
    DeviceListCallback callback_;
    std::vector<DeviceRecord> fake_devices_;
};

#endif // MOCK_DISCOVERY_LISTENER_H
