// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#ifndef LANPRINT_VERSION
#define LANPRINT_VERSION "dev"
#endif

namespace lanprint {

const char* cli_command_name(CliCommand command) {
    switch (command) {
    case CliCommand::NONE:
        return "none";
    case CliCommand::LIST:
        return "list";
    case CliCommand::SEND:
        return "send";
    case CliCommand::SAVE:
        return "save";
    }
    return "unknown";
}

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Helper to parse double with validation
static bool parse_double(const char* str, double min_val, double max_val,
                         std::optional<double>& out, const char* name) {
    char* endptr;
    double val = strtod(str, &endptr);
    if (*str == '\0' || *endptr != '\0') {
        printf("Error: %s requires a numeric value\n", name);
        return false;
    }
    if (val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %g-%g): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = val;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options] <command> [arguments]\n", program_name);
    printf("\nCommands:\n");
    printf("  list                          Discover printers on the LAN and print them\n");
    printf("  send <device-id> <file>       Encode a G-code file and send it to a printer\n");
    printf("  save <file> <out>             Encode a G-code file and write it to disk\n");
    printf("\nOptions:\n");
    printf("  -c, --config <path>   Config file (default: ~/.config/lanprint/config.json)\n");
    printf("  -w, --wait <sec>      Seconds to listen for announcements (list, send; "
           "default: 5)\n");
    printf("  --preview <png>       Preview image embedded as the thumbnail\n");
    printf("  --job <name>          Job name used for the upload filename\n");
    printf("  --material <name>     Material name used for the upload filename\n");
    printf("  --nozzle-temp <C>     Nozzle temperature written to the header\n");
    printf("  --bed-temp <C>        Build plate temperature written to the header\n");
    printf("  --speed <mm/s>        Work speed written to the header\n");
    printf("  -v, --verbose         Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>     Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>     Log file path (when --log-dest=file)\n");
    printf("  -h, --help            Show this help message\n");
    printf("  -V, --version         Show version information\n");
    printf("\nExamples:\n");
    printf("  %s list --wait 10\n", program_name);
    printf("  %s send \"Workshop@Snapmaker 2 Model A350\" benchy.gcode --preview benchy.png\n",
           program_name);
    printf("  %s save benchy.gcode benchy-sm2.gcode\n", program_name);
}

// Accepts "--name value" and "--name=value"; advances i past the value
static bool take_value(int argc, char** argv, int& i, const char* name, const char*& value) {
    size_t len = strlen(name);
    if (strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    if (i + 1 >= argc) {
        printf("Error: %s requires an argument\n", name);
        return false;
    }
    value = argv[++i];
    return true;
}

static bool matches(const char* arg, const char* name) {
    size_t len = strlen(name);
    return strncmp(arg, name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    std::vector<const char*> positionals;

    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;

        if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            if (!take_value(argc, argv, i, strcmp(argv[i], "-c") == 0 ? "-c" : "--config",
                            value))
                return false;
            args.config_path = value;
        } else if (strcmp(argv[i], "-w") == 0 || matches(argv[i], "--wait")) {
            if (!take_value(argc, argv, i, strcmp(argv[i], "-w") == 0 ? "-w" : "--wait", value))
                return false;
            if (!parse_int(value, 1, 300, args.wait_sec, "--wait"))
                return false;
        } else if (matches(argv[i], "--preview")) {
            if (!take_value(argc, argv, i, "--preview", value))
                return false;
            args.preview_path = value;
        } else if (matches(argv[i], "--job")) {
            if (!take_value(argc, argv, i, "--job", value))
                return false;
            args.job_name = value;
        } else if (matches(argv[i], "--material")) {
            if (!take_value(argc, argv, i, "--material", value))
                return false;
            args.material = value;
        } else if (matches(argv[i], "--nozzle-temp")) {
            if (!take_value(argc, argv, i, "--nozzle-temp", value) ||
                !parse_double(value, 0, 500, args.nozzle_temp, "--nozzle-temp"))
                return false;
        } else if (matches(argv[i], "--bed-temp")) {
            if (!take_value(argc, argv, i, "--bed-temp", value) ||
                !parse_double(value, 0, 200, args.bed_temp, "--bed-temp"))
                return false;
        } else if (matches(argv[i], "--speed")) {
            if (!take_value(argc, argv, i, "--speed", value) ||
                !parse_double(value, 0.1, 1000, args.speed, "--speed"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            if (!take_value(argc, argv, i, "--log-dest", value))
                return false;
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            if (!take_value(argc, argv, i, "--log-file", value))
                return false;
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.help_shown = true;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("lanprint %s\n", LANPRINT_VERSION);
            args.help_shown = true;
            return false;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        } else {
            positionals.push_back(argv[i]);
        }
    }

    if (positionals.empty()) {
        printf("Error: no command given\n");
        printf("Use --help for usage information\n");
        return false;
    }

    const char* command = positionals[0];
    size_t expected = 0;
    if (strcmp(command, "list") == 0) {
        args.command = CliCommand::LIST;
        expected = 1;
    } else if (strcmp(command, "send") == 0) {
        args.command = CliCommand::SEND;
        expected = 3;
    } else if (strcmp(command, "save") == 0) {
        args.command = CliCommand::SAVE;
        expected = 3;
    } else {
        printf("Unknown command: %s\n", command);
        printf("Available commands: list, send, save\n");
        return false;
    }

    if (positionals.size() != expected) {
        printf("Error: '%s' takes %zu argument(s), got %zu\n", command, expected - 1,
               positionals.size() - 1);
        printf("Use --help for usage information\n");
        args.command = CliCommand::NONE;
        return false;
    }

    if (args.command == CliCommand::SEND) {
        args.device_id = positionals[1];
        args.input_path = positionals[2];
    } else if (args.command == CliCommand::SAVE) {
        args.input_path = positionals[1];
        args.output_path = positionals[2];
    }

    spdlog::trace("[CLI] command={} input={} output={}", cli_command_name(args.command),
                  args.input_path, args.output_path);
    return true;
}

} // namespace lanprint
