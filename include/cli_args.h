// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the lanprint tool
 */

#include <optional>
#include <string>

namespace lanprint {

enum class CliCommand { NONE, LIST, SEND, SAVE };

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    CliCommand command = CliCommand::NONE;

    // Positionals
    std::string device_id;   // send
    std::string input_path;  // send, save
    std::string output_path; // save

    // list
    int wait_sec = 5;

    // Encoding
    std::string preview_path;
    std::string job_name; // Empty = input file stem
    std::string material;
    std::optional<double> nozzle_temp;
    std::optional<double> bed_temp;
    std::optional<double> speed; // mm/s

    // Config / logging
    std::string config_path; // Empty = default location
    int verbosity = 0;
    std::string log_dest; // Empty = from config
    std::string log_file;

    bool help_shown = false; // -h or -V: exit 0 without doing anything
};

/**
 * @brief Parse command-line arguments
 *
 * Options may appear before or after the command. Errors are printed to stdout.
 *
 * @return true if a command is ready to run; false on error or when help/version was shown
 *         (check args.help_shown)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

const char* cli_command_name(CliCommand command);

} // namespace lanprint
