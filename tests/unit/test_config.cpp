// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "device_transport.h"
#include "discovery_listener.h"
#include "gcode_header_encoder.h"

#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>

using namespace lanprint;
namespace fs = std::filesystem;

namespace lanprint {

// Test fixture for Config class testing (friend of Config)
class ConfigTestFixture {
  protected:
    Config config;
    fs::path temp_dir;

    ConfigTestFixture() {
        temp_dir = fs::temp_directory_path() / "lanprint_config_test";
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    void set_data_empty() {
        config.data = {};
    }

    void setup_default_config() {
        // Manually populate config.data with realistic test JSON
        config.data = {{"config_version", 1},
                       {"log_level", "debug"},
                       {"discovery",
                        {{"announce_port", 20054},
                         {"model_prefix", "Snapmaker 2"},
                         {"broadcast_addresses", json::array({"192.168.1.255"})}}},
                       {"transfer", {{"port", 8080}, {"api_prefix", "/api/v1/"}}}};
    }

    json& data() {
        return config.data;
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::string path = (temp_dir / name).string();
        std::ofstream out(path);
        out << content;
        return path;
    }
};

} // namespace lanprint

// ============================================================================
// get() without default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing string value",
                 "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get<std::string>("/discovery/model_prefix") == "Snapmaker 2");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing int value",
                 "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get<int>("/transfer/port") == 8080);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with missing key throws exception",
                 "[core][config][get]") {
    setup_default_config();

    REQUIRE_THROWS_AS(config.get<std::string>("/discovery/nonexistent_key"),
                      nlohmann::detail::type_error);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with type mismatch throws exception",
                 "[config][get]") {
    setup_default_config();

    REQUIRE_THROWS(config.get<int>("/discovery/model_prefix"));
}

// ============================================================================
// get() with default parameter
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default returns value when key exists",
                 "[config][get][default]") {
    setup_default_config();

    REQUIRE(config.get<int>("/transfer/port", 9999) == 8080);
    REQUIRE(config.get<std::string>("/log_level", "warn") == "debug");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default returns default when key missing",
                 "[core][config][get][default]") {
    setup_default_config();

    REQUIRE(config.get<int>("/transfer/request_timeout_ms", 5000) == 5000);
    REQUIRE(config.get<std::string>("/nonexistent/path/key", "fallback") == "fallback");
    REQUIRE(config.get<bool>("/discovery/enabled", false) == false);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default survives a wrong type",
                 "[config][get][default]") {
    setup_default_config();

    REQUIRE(config.get<int>("/discovery/model_prefix", 7) == 7);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default handles empty config",
                 "[config][edge]") {
    set_data_empty();

    REQUIRE(config.get<std::string>("/discovery/model_prefix", "Snapmaker 2") == "Snapmaker 2");
}

// ============================================================================
// set() operations
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates and updates values", "[config][set]") {
    setup_default_config();

    config.set<std::string>("/new_key", "new_value");
    REQUIRE(config.get<std::string>("/new_key") == "new_value");

    config.set<int>("/transfer/port", 8888);
    REQUIRE(config.get<int>("/transfer/port") == 8888);

    config.set<std::string>("/encoder/nested/level1/level2", "deep");
    REQUIRE(config.get<std::string>("/encoder/nested/level1/level2") == "deep");
}

// ============================================================================
// init() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates default file when missing",
                 "[core][config][init]") {
    std::string path = (temp_dir / "sub" / "config.json").string();

    config.init(path);

    REQUIRE(fs::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<int>("/config_version") == CURRENT_CONFIG_VERSION);
    REQUIRE(config.get<int>("/discovery/announce_port") == 20054);
    REQUIRE(config.get<std::string>("/discovery/probe_message") == "discover");
    REQUIRE(config.get<int>("/transfer/port") == 8080);
    REQUIRE(config.get<int>("/encoder/thumbnail_width") == 240);
    REQUIRE(config.get<int>("/encoder/thumbnail_height") == 160);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills missing keys",
                 "[config][init]") {
    std::string path = write_file(
        "config.json",
        R"({"config_version": 1, "transfer": {"port": 9090}, "discovery": {"staleness_ms": 5000}})");

    config.init(path);

    REQUIRE(config.get<int>("/transfer/port") == 9090);
    REQUIRE(config.get<int>("/discovery/staleness_ms") == 5000);
    REQUIRE(config.get<std::string>("/transfer/api_prefix") == "/api/v1");
    REQUIRE(config.get<double>("/encoder/time_factor") == Catch::Approx(1.07));

    // Filled defaults were written back
    std::ifstream in(path);
    json on_disk = json::parse(in);
    REQUIRE(on_disk["transfer"]["request_timeout_ms"] == 5000);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() backs up a corrupt file",
                 "[config][init][edge]") {
    std::string path = write_file("config.json", "{ not json");

    config.init(path);

    REQUIRE(fs::exists(path + ".corrupt"));
    REQUIRE(config.get<int>("/transfer/port") == 8080);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: migration drops inline tokens",
                 "[config][init][migration]") {
    std::string path = write_file("config.json", R"({"tokens": {"a@b": "x"}})");

    config.init(path);

    REQUIRE_FALSE(data().contains("tokens"));
    REQUIRE(config.get<int>("/config_version") == CURRENT_CONFIG_VERSION);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() round-trips through init()",
                 "[config][save]") {
    std::string path = (temp_dir / "config.json").string();
    config.init(path);
    config.set<std::string>("/discovery/model_prefix", "Snapmaker J1");
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<std::string>("/discovery/model_prefix") == "Snapmaker J1");
}

// ============================================================================
// Typed settings
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: DiscoverySettings::from_config",
                 "[config][settings]") {
    setup_default_config();
    config.set<int>("/discovery/unreachable_after_ms", 30000);
    config.set<int>("/discovery/staleness_ms", 20000);

    DiscoverySettings s = DiscoverySettings::from_config(config);

    REQUIRE(s.announce_port == 20054);
    REQUIRE(s.listen_port == 20054); // default
    REQUIRE(s.model_prefix == "Snapmaker 2");
    REQUIRE(s.broadcast_addresses == std::vector<std::string>{"192.168.1.255"});
    REQUIRE(s.default_transfer_port == 8080);
    // Clamped so a device is marked unreachable before it is evicted
    REQUIRE(s.unreachable_after == s.staleness);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: DiscoverySettings::from_config rejects bad windows",
                 "[config][settings]") {
    setup_default_config();

    SECTION("zero and negative windows fall back to the defaults") {
        config.set<int>("/discovery/staleness_ms", 0);
        config.set<int>("/discovery/unreachable_after_ms", -5);

        DiscoverySettings s = DiscoverySettings::from_config(config);
        REQUIRE(s.staleness == std::chrono::milliseconds(20000));
        REQUIRE(s.unreachable_after == std::chrono::milliseconds(12000));
    }

    SECTION("negative staleness with a valid unreachable window") {
        config.set<int>("/discovery/staleness_ms", -1000);
        config.set<int>("/discovery/unreachable_after_ms", 5000);

        DiscoverySettings s = DiscoverySettings::from_config(config);
        REQUIRE(s.staleness == std::chrono::milliseconds(20000));
        REQUIRE(s.unreachable_after == std::chrono::milliseconds(5000));
    }

    SECTION("negative probe interval disables periodic probes") {
        config.set<int>("/discovery/probe_interval_ms", -1);
        REQUIRE(DiscoverySettings::from_config(config).probe_interval.count() == 0);
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: TransferSettings::from_config",
                 "[config][settings]") {
    setup_default_config();

    SECTION("trailing slash stripped from api_prefix") {
        TransferSettings s = TransferSettings::from_config(config);
        REQUIRE(s.api_prefix == "/api/v1");
        REQUIRE(s.port == 8080);
        REQUIRE_FALSE(s.token_file.empty());
    }

    SECTION("out-of-range port keeps default") {
        config.set<int>("/transfer/port", 70000);
        REQUIRE(TransferSettings::from_config(config).port == 8080);
    }

    SECTION("explicit token file is used") {
        config.set<std::string>("/transfer/token_file", "/tmp/x/tokens.json");
        REQUIRE(TransferSettings::from_config(config).token_file == "/tmp/x/tokens.json");
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: EncoderSettings::from_config rejects bad sizes",
                 "[config][settings]") {
    setup_default_config();
    config.set<int>("/encoder/thumbnail_width", 0);

    EncoderSettings s = EncoderSettings::from_config(config);
    REQUIRE(s.thumbnail_width == 240);
    REQUIRE(s.thumbnail_height == 160);
    REQUIRE(s.processed_identity == "Processed by LanPrint");
}
