// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanprint {

/**
 * @brief Live set of announced devices with staleness eviction
 *
 * Single writer (the discovery thread) calls upsert() and sweep(); any number of
 * readers call snapshot() / find(). Every write publishes a new immutable vector,
 * so readers never take the writer lock and never see a half-updated record.
 *
 * snapshot() also filters by age, so a record is never returned once
 * now - last_seen >= staleness, even if the sweep has not run yet.
 */
class DeviceRegistry {
  public:
    using Clock = std::chrono::steady_clock;
    using Snapshot = std::shared_ptr<const std::vector<DeviceRecord>>;

    DeviceRegistry(std::chrono::milliseconds unreachable_after,
                   std::chrono::milliseconds staleness);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Insert or refresh a record
     *
     * @return true if the visible list changed (new device, or address, name
     *         or status differ from what was published)
     */
    bool upsert(const DeviceRecord& record);

    /**
     * @brief Mark quiet devices UNREACHABLE and evict stale ones
     *
     * @return true if anything changed
     */
    bool sweep(Clock::time_point now);

    /// Remove everything (orchestrator shutdown)
    void clear();

    /// Current records younger than the staleness window, ordered by id
    std::vector<DeviceRecord> snapshot(Clock::time_point now = Clock::now()) const;

    std::optional<DeviceRecord> find(const std::string& id,
                                     Clock::time_point now = Clock::now()) const;

    std::chrono::milliseconds staleness() const {
        return staleness_;
    }

  private:
    void publish_locked();

    const std::chrono::milliseconds unreachable_after_;
    const std::chrono::milliseconds staleness_;

    std::mutex write_mutex_;
    std::map<std::string, DeviceRecord> records_; // Protected by write_mutex_

    Snapshot published_; // Accessed via std::atomic_load / std::atomic_store
};

} // namespace lanprint
