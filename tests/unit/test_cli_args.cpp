// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for command-line parsing
 */

#include "cli_args.h"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

using namespace lanprint;

namespace {

/// Owns argv storage for parse_cli_args
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        storage_.emplace_back("lanprint");
        for (const char* a : args) {
            storage_.emplace_back(a);
        }
        for (auto& s : storage_) {
            ptrs_.push_back(s.data());
        }
        ptrs_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }
    char** argv() {
        return ptrs_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

bool parse(std::initializer_list<const char*> args, CliArgs& out) {
    Argv a(args);
    return parse_cli_args(a.argc(), a.argv(), out);
}

} // namespace

// ============================================================================
// Commands
// ============================================================================

TEST_CASE("CLI: list with defaults", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"list"}, args));
    REQUIRE(args.command == CliCommand::LIST);
    REQUIRE(args.wait_sec == 5);
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.config_path.empty());
}

TEST_CASE("CLI: send takes a device id and a file", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"send", "Workshop@Snapmaker 2 Model A350", "benchy.gcode", "--preview",
                   "benchy.png", "--job=Benchy", "--material", "PLA"},
                  args));
    REQUIRE(args.command == CliCommand::SEND);
    REQUIRE(args.device_id == "Workshop@Snapmaker 2 Model A350");
    REQUIRE(args.input_path == "benchy.gcode");
    REQUIRE(args.preview_path == "benchy.png");
    REQUIRE(args.job_name == "Benchy");
    REQUIRE(args.material == "PLA");
}

TEST_CASE("CLI: save takes input and output", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"-c", "/tmp/lp.json", "save", "in.gcode", "out.gcode"}, args));
    REQUIRE(args.command == CliCommand::SAVE);
    REQUIRE(args.input_path == "in.gcode");
    REQUIRE(args.output_path == "out.gcode");
    REQUIRE(args.config_path == "/tmp/lp.json");
}

TEST_CASE("CLI: wrong argument count", "[cli_args][error]") {
    CliArgs args;

    SECTION("send missing file") {
        REQUIRE_FALSE(parse({"send", "a@b"}, args));
    }
    SECTION("list with extra argument") {
        REQUIRE_FALSE(parse({"list", "extra"}, args));
    }
    SECTION("no command") {
        REQUIRE_FALSE(parse({"-v"}, args));
    }
    SECTION("unknown command") {
        REQUIRE_FALSE(parse({"print", "x"}, args));
    }

    REQUIRE(args.command == CliCommand::NONE);
    REQUIRE_FALSE(args.help_shown);
}

// ============================================================================
// Options
// ============================================================================

TEST_CASE("CLI: header parameters", "[cli_args][encode]") {
    CliArgs args;
    REQUIRE(parse({"save", "a.gcode", "b.gcode", "--nozzle-temp", "210", "--bed-temp=60",
                   "--speed", "45.5"},
                  args));
    REQUIRE(args.nozzle_temp.value() == Catch::Approx(210));
    REQUIRE(args.bed_temp.value() == Catch::Approx(60));
    REQUIRE(args.speed.value() == Catch::Approx(45.5));
}

TEST_CASE("CLI: header parameters are validated", "[cli_args][encode][error]") {
    CliArgs args;
    REQUIRE_FALSE(parse({"save", "a", "b", "--nozzle-temp", "hot"}, args));
    REQUIRE_FALSE(parse({"save", "a", "b", "--bed-temp", "250"}, args));
    REQUIRE_FALSE(parse({"save", "a", "b", "--speed", "0"}, args));
    REQUIRE_FALSE(parse({"save", "a", "b", "--speed"}, args));
}

TEST_CASE("CLI: wait range", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"list", "-w", "12"}, args));
    REQUIRE(args.wait_sec == 12);

    CliArgs bad;
    REQUIRE_FALSE(parse({"list", "--wait", "0"}, bad));
    REQUIRE_FALSE(parse({"list", "--wait=301"}, bad));
    REQUIRE_FALSE(parse({"list", "--wait", "5s"}, bad));
}

TEST_CASE("CLI: verbosity flags accumulate", "[cli_args][logging]") {
    CliArgs args;
    REQUIRE(parse({"-vv", "list", "--verbose"}, args));
    REQUIRE(args.verbosity == 3);
}

TEST_CASE("CLI: log destination", "[cli_args][logging]") {
    CliArgs args;
    REQUIRE(parse({"list", "--log-dest", "file", "--log-file", "/tmp/lanprint.log"}, args));
    REQUIRE(args.log_dest == "file");
    REQUIRE(args.log_file == "/tmp/lanprint.log");

    CliArgs bad;
    REQUIRE_FALSE(parse({"list", "--log-dest", "journal"}, bad));
}

TEST_CASE("CLI: unknown option", "[cli_args][error]") {
    CliArgs args;
    REQUIRE_FALSE(parse({"list", "--frobnicate"}, args));
    REQUIRE_FALSE(args.help_shown);
}

TEST_CASE("CLI: help and version exit cleanly", "[cli_args]") {
    CliArgs args;

    SECTION("help") {
        REQUIRE_FALSE(parse({"--help"}, args));
    }
    SECTION("version") {
        REQUIRE_FALSE(parse({"list", "-V"}, args));
    }

    REQUIRE(args.help_shown);
}

TEST_CASE("CLI: command names", "[cli_args]") {
    REQUIRE(std::string(cli_command_name(CliCommand::SEND)) == "send");
    REQUIRE(std::string(cli_command_name(CliCommand::NONE)) == "none");
}
