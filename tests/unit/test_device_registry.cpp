// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_registry.h"

#include <catch2/catch_all.hpp>

#include <atomic>
#include <thread>

using namespace lanprint;
using namespace std::chrono_literals;

namespace {

DeviceRecord make_record(const std::string& name, const std::string& host,
                         DeviceRegistry::Clock::time_point seen,
                         DeviceStatus status = DeviceStatus::IDLE) {
    DeviceRecord rec;
    rec.id = name + "@Snapmaker 2 Model A350";
    rec.display_name = name;
    rec.model = "Snapmaker 2 Model A350";
    rec.address = {host, 8080};
    rec.status = status;
    rec.raw_status = device_status_name(status);
    rec.last_seen = seen;
    return rec;
}

} // namespace

// ============================================================================
// upsert()
// ============================================================================

TEST_CASE("DeviceRegistry: upsert reports visible changes only", "[discovery][registry]") {
    DeviceRegistry registry(12000ms, 20000ms);
    auto t0 = DeviceRegistry::Clock::now();

    REQUIRE(registry.upsert(make_record("A", "10.0.0.1", t0)));
    REQUIRE(registry.snapshot(t0).size() == 1);

    SECTION("same content again is not a change") {
        REQUIRE_FALSE(registry.upsert(make_record("A", "10.0.0.1", t0 + 1s)));
    }

    SECTION("address change replaces the record") {
        REQUIRE(registry.upsert(make_record("A", "10.0.0.99", t0 + 1s)));
        auto devices = registry.snapshot(t0 + 1s);
        REQUIRE(devices.size() == 1);
        REQUIRE(devices[0].address.host == "10.0.0.99");
    }

    SECTION("status change is a change") {
        REQUIRE(registry.upsert(make_record("A", "10.0.0.1", t0 + 1s, DeviceStatus::PRINTING)));
        REQUIRE(registry.find("A@Snapmaker 2 Model A350", t0 + 1s)->status ==
                DeviceStatus::PRINTING);
    }

    SECTION("a second device is added") {
        REQUIRE(registry.upsert(make_record("B", "10.0.0.2", t0)));
        REQUIRE(registry.snapshot(t0).size() == 2);
    }
}

// ============================================================================
// sweep() and staleness
// ============================================================================

TEST_CASE("DeviceRegistry: quiet devices go unreachable then disappear",
          "[discovery][registry]") {
    DeviceRegistry registry(12000ms, 20000ms);
    auto t0 = DeviceRegistry::Clock::now();
    registry.upsert(make_record("A", "10.0.0.1", t0));

    REQUIRE_FALSE(registry.sweep(t0 + 5s));
    REQUIRE(registry.snapshot(t0 + 5s)[0].status == DeviceStatus::IDLE);

    REQUIRE(registry.sweep(t0 + 13s));
    auto devices = registry.snapshot(t0 + 13s);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].status == DeviceStatus::UNREACHABLE);

    // Already unreachable: no further change until eviction
    REQUIRE_FALSE(registry.sweep(t0 + 14s));

    REQUIRE(registry.sweep(t0 + 20s));
    REQUIRE(registry.snapshot(t0 + 20s).empty());
    REQUIRE_FALSE(registry.find("A@Snapmaker 2 Model A350", t0 + 20s).has_value());
}

TEST_CASE("DeviceRegistry: a fresh announcement revives an unreachable device",
          "[discovery][registry]") {
    DeviceRegistry registry(12000ms, 20000ms);
    auto t0 = DeviceRegistry::Clock::now();
    registry.upsert(make_record("A", "10.0.0.1", t0));
    registry.sweep(t0 + 13s);

    REQUIRE(registry.upsert(make_record("A", "10.0.0.1", t0 + 14s)));
    REQUIRE(registry.snapshot(t0 + 14s)[0].status == DeviceStatus::IDLE);
}

TEST_CASE("DeviceRegistry: snapshot hides stale records before any sweep",
          "[discovery][registry][edge]") {
    DeviceRegistry registry(12000ms, 20000ms);
    auto t0 = DeviceRegistry::Clock::now();
    registry.upsert(make_record("A", "10.0.0.1", t0));
    registry.upsert(make_record("B", "10.0.0.2", t0 + 10s));

    auto devices = registry.snapshot(t0 + 25s);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].display_name == "B");
    REQUIRE_FALSE(registry.find("A@Snapmaker 2 Model A350", t0 + 25s).has_value());
}

TEST_CASE("DeviceRegistry: clear empties the list", "[discovery][registry]") {
    DeviceRegistry registry(12000ms, 20000ms);
    auto t0 = DeviceRegistry::Clock::now();
    registry.upsert(make_record("A", "10.0.0.1", t0));

    registry.clear();
    REQUIRE(registry.snapshot(t0).empty());
}

TEST_CASE("DeviceRegistry: readers see whole records while the writer runs",
          "[discovery][registry][threading]") {
    DeviceRegistry registry(12000ms, 20000ms);
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::thread writer([&]() {
        int i = 0;
        while (!stop.load()) {
            auto now = DeviceRegistry::Clock::now();
            // host and display name always change together
            std::string n = std::to_string(i++ % 50);
            DeviceRecord rec = make_record("A", "10.0.0." + n, now);
            rec.raw_status = n;
            registry.upsert(rec);
        }
    });

    for (int i = 0; i < 2000; ++i) {
        for (const auto& rec : registry.snapshot()) {
            if (rec.address.host != "10.0.0." + rec.raw_status) {
                torn++;
            }
        }
    }
    stop.store(true);
    writer.join();

    REQUIRE(torn.load() == 0);
}
