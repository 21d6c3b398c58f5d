// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "announcement_parser.h"

#include <catch2/catch_all.hpp>

using namespace lanprint;

namespace {
const std::string kPrefix = "Snapmaker 2";
}

// ============================================================================
// Well-formed announcements
// ============================================================================

TEST_CASE("parse_announcement: typical announcement", "[discovery][parser]") {
    auto ann = parse_announcement("Workshop@192.168.1.20|model:Snapmaker 2 Model A350|status:IDLE",
                                  "192.168.1.20", kPrefix);
    REQUIRE(ann.has_value());
    REQUIRE(ann->name == "Workshop");
    REQUIRE(ann->host == "192.168.1.20");
    REQUIRE(ann->model == "Snapmaker 2 Model A350");
    REQUIRE(ann->status == "IDLE");
    REQUIRE(ann->port == 0);
}

TEST_CASE("parse_announcement: tolerates trailing newline and NUL", "[discovery][parser]") {
    std::string datagram = "A@10.0.0.5|model:Snapmaker 2 Model A250|status:RUNNING\n";
    datagram.push_back('\0');

    auto ann = parse_announcement(datagram, "10.0.0.5", kPrefix);
    REQUIRE(ann.has_value());
    REQUIRE(ann->status == "RUNNING");
}

TEST_CASE("parse_announcement: name may contain '@'", "[discovery][parser]") {
    auto ann = parse_announcement("lab@north@10.0.0.7|model:Snapmaker 2 Model A150|status:IDLE",
                                  "10.0.0.7", kPrefix);
    REQUIRE(ann.has_value());
    REQUIRE(ann->name == "lab@north");
    REQUIRE(ann->host == "10.0.0.7");
}

TEST_CASE("parse_announcement: optional and unknown properties", "[discovery][parser]") {
    SECTION("port property is honoured") {
        auto ann = parse_announcement(
            "A@10.0.0.5|model:Snapmaker 2 Model A350|status:IDLE|port:8888", "10.0.0.5", kPrefix);
        REQUIRE(ann.has_value());
        REQUIRE(ann->port == 8888);
    }

    SECTION("invalid port is ignored, not fatal") {
        auto ann = parse_announcement(
            "A@10.0.0.5|model:Snapmaker 2 Model A350|status:IDLE|port:99999", "10.0.0.5", kPrefix);
        REQUIRE(ann.has_value());
        REQUIRE(ann->port == 0);
    }

    SECTION("unknown keys are skipped") {
        auto ann = parse_announcement(
            "A@10.0.0.5|model:Snapmaker 2 Model A350|firmware:1.19|status:IDLE", "10.0.0.5",
            kPrefix);
        REQUIRE(ann.has_value());
        REQUIRE(ann->status == "IDLE");
    }
}

TEST_CASE("parse_announcement: unusable address falls back to sender", "[discovery][parser]") {
    auto ann = parse_announcement("A@snapmaker.local|model:Snapmaker 2 Model A350|status:IDLE",
                                  "192.168.1.33", kPrefix);
    REQUIRE(ann.has_value());
    REQUIRE(ann->host == "192.168.1.33");
}

TEST_CASE("parse_announcement: empty prefix accepts any model", "[discovery][parser]") {
    auto ann = parse_announcement("J1@10.0.0.9|model:Snapmaker J1|status:IDLE", "10.0.0.9", "");
    REQUIRE(ann.has_value());
    REQUIRE(ann->model == "Snapmaker J1");
}

// ============================================================================
// Malformed or foreign input is dropped
// ============================================================================

TEST_CASE("parse_announcement: rejects malformed input", "[discovery][parser][edge]") {
    SECTION("empty") {
        REQUIRE_FALSE(parse_announcement("", "10.0.0.1", kPrefix).has_value());
    }
    SECTION("no '@'") {
        REQUIRE_FALSE(parse_announcement("A|model:Snapmaker 2|status:IDLE", "10.0.0.1", kPrefix)
                          .has_value());
    }
    SECTION("empty name") {
        REQUIRE_FALSE(
            parse_announcement("@10.0.0.1|model:Snapmaker 2|status:IDLE", "10.0.0.1", kPrefix)
                .has_value());
    }
    SECTION("missing model") {
        REQUIRE_FALSE(
            parse_announcement("A@10.0.0.1|status:IDLE", "10.0.0.1", kPrefix).has_value());
    }
    SECTION("missing status") {
        REQUIRE_FALSE(parse_announcement("A@10.0.0.1|model:Snapmaker 2 Model A350", "10.0.0.1",
                                         kPrefix)
                          .has_value());
    }
    SECTION("control bytes") {
        REQUIRE_FALSE(parse_announcement("A\x01@10.0.0.1|model:Snapmaker 2|status:IDLE",
                                         "10.0.0.1", kPrefix)
                          .has_value());
    }
    SECTION("oversized") {
        std::string big = "A@10.0.0.1|model:Snapmaker 2|status:IDLE|x:" +
                          std::string(MAX_ANNOUNCEMENT_BYTES, 'x');
        REQUIRE_FALSE(parse_announcement(big, "10.0.0.1", kPrefix).has_value());
    }
    SECTION("foreign model") {
        REQUIRE_FALSE(parse_announcement("A@10.0.0.1|model:Ultimaker S5|status:IDLE", "10.0.0.1",
                                         kPrefix)
                          .has_value());
    }
    SECTION("no usable address at all") {
        REQUIRE_FALSE(parse_announcement("A@nowhere|model:Snapmaker 2|status:IDLE", "",
                                         kPrefix)
                          .has_value());
    }
    SECTION("the probe message itself") {
        REQUIRE_FALSE(parse_announcement("discover", "10.0.0.1", kPrefix).has_value());
    }
}

// ============================================================================
// make_device_record()
// ============================================================================

TEST_CASE("make_device_record: id, status and port", "[discovery][parser]") {
    auto seen = std::chrono::steady_clock::now();

    SECTION("default port and IDLE") {
        auto ann = parse_announcement("Shop@10.0.0.2|model:Snapmaker 2 Model A350|status:IDLE",
                                      "10.0.0.2", kPrefix);
        REQUIRE(ann.has_value());
        DeviceRecord rec = make_device_record(*ann, 8080, seen);
        REQUIRE(rec.id == "Shop@Snapmaker 2 Model A350");
        REQUIRE(rec.display_name == "Shop");
        REQUIRE(rec.address == DeviceAddress{"10.0.0.2", 8080});
        REQUIRE(rec.status == DeviceStatus::IDLE);
        REQUIRE(rec.last_seen == seen);
    }

    SECTION("announced port wins, RUNNING is PRINTING, other is BUSY") {
        auto running = parse_announcement(
            "Shop@10.0.0.2|model:Snapmaker 2 Model A350|status:RUNNING|port:9000", "10.0.0.2",
            kPrefix);
        REQUIRE(running.has_value());
        DeviceRecord rec = make_device_record(*running, 8080, seen);
        REQUIRE(rec.address.port == 9000);
        REQUIRE(rec.status == DeviceStatus::PRINTING);

        auto paused = parse_announcement("Shop@10.0.0.2|model:Snapmaker 2 Model A350|status:PAUSED",
                                         "10.0.0.2", kPrefix);
        REQUIRE(paused.has_value());
        DeviceRecord busy = make_device_record(*paused, 8080, seen);
        REQUIRE(busy.status == DeviceStatus::BUSY);
        REQUIRE(busy.raw_status == "PAUSED");
    }
}

TEST_CASE("is_valid_ipv4", "[discovery][parser]") {
    REQUIRE(is_valid_ipv4("192.168.1.1"));
    REQUIRE(is_valid_ipv4("0.0.0.0"));
    REQUIRE_FALSE(is_valid_ipv4("256.1.1.1"));
    REQUIRE_FALSE(is_valid_ipv4("printer.local"));
    REQUIRE_FALSE(is_valid_ipv4(""));
}
