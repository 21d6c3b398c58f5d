// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_registry.h"

#include <spdlog/spdlog.h>

namespace lanprint {

DeviceRegistry::DeviceRegistry(std::chrono::milliseconds unreachable_after,
                               std::chrono::milliseconds staleness)
    : unreachable_after_(unreachable_after), staleness_(staleness),
      published_(std::make_shared<const std::vector<DeviceRecord>>()) {}

bool DeviceRegistry::upsert(const DeviceRecord& record) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto it = records_.find(record.id);
    if (it == records_.end()) {
        spdlog::info("[Discovery] New device {} at {} ({})", record.id,
                     record.address.to_string(), record.raw_status);
        records_.emplace(record.id, record);
        publish_locked();
        return true;
    }

    DeviceRecord& existing = it->second;
    bool changed = existing.address != record.address ||
                   existing.display_name != record.display_name ||
                   existing.status != record.status || existing.raw_status != record.raw_status;

    if (existing.address != record.address) {
        spdlog::info("[Discovery] Device {} moved {} -> {}", record.id,
                     existing.address.to_string(), record.address.to_string());
    }
    if (existing.status != record.status) {
        spdlog::debug("[Discovery] Device {} status {} -> {}", record.id,
                      device_status_name(existing.status), device_status_name(record.status));
    }

    existing = record;

    // last_seen alone still has to be published so snapshot()'s age filter sees it
    publish_locked();
    return changed;
}

bool DeviceRegistry::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    bool changed = false;
    for (auto it = records_.begin(); it != records_.end();) {
        auto age = now - it->second.last_seen;
        if (age >= staleness_) {
            spdlog::info("[Discovery] Device {} went away (no announcement for {}ms)", it->first,
                         std::chrono::duration_cast<std::chrono::milliseconds>(age).count());
            it = records_.erase(it);
            changed = true;
            continue;
        }
        if (age >= unreachable_after_ && it->second.status != DeviceStatus::UNREACHABLE) {
            spdlog::debug("[Discovery] Device {} is quiet, marking unreachable", it->first);
            it->second.status = DeviceStatus::UNREACHABLE;
            changed = true;
        }
        ++it;
    }

    if (changed) {
        publish_locked();
    }
    return changed;
}

void DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    records_.clear();
    publish_locked();
}

std::vector<DeviceRecord> DeviceRegistry::snapshot(Clock::time_point now) const {
    Snapshot current = std::atomic_load(&published_);

    std::vector<DeviceRecord> result;
    result.reserve(current->size());
    for (const auto& record : *current) {
        if (now - record.last_seen < staleness_) {
            result.push_back(record);
        }
    }
    return result;
}

std::optional<DeviceRecord> DeviceRegistry::find(const std::string& id,
                                                 Clock::time_point now) const {
    Snapshot current = std::atomic_load(&published_);
    for (const auto& record : *current) {
        if (record.id == id && now - record.last_seen < staleness_) {
            return record;
        }
    }
    return std::nullopt;
}

void DeviceRegistry::publish_locked() {
    auto next = std::make_shared<std::vector<DeviceRecord>>();
    next->reserve(records_.size());
    for (const auto& [id, record] : records_) {
        next->push_back(record);
    }
    std::atomic_store(&published_, Snapshot(std::move(next)));
}

} // namespace lanprint
