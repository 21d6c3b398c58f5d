// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "device_transport.h"
#include "discovery_listener.h"
#include "gcode_header_encoder.h"
#include "logging_init.h"
#include "preview_encoder.h"
#include "session_orchestrator.h"
#include "snapmaker_http_transport.h"
#include "token_store.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

using namespace lanprint;

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return in.good() || in.eof();
}

/// Configure spdlog from CLI (wins) and config file
void init_logging(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/log_level", ""));
    log_config.target = logging::parse_log_target(
        args.log_dest.empty() ? config.get<std::string>("/log_target", "console") : args.log_dest);
    log_config.file_path =
        args.log_file.empty() ? config.get<std::string>("/log_path", "") : args.log_file;
    logging::init(log_config);
}

/// Read the G-code and optional preview, then build the device payload
std::shared_ptr<TransferPayload> build_payload(const CliArgs& args, Config& config,
                                               std::string& upload_name) {
    std::string gcode;
    if (!read_file(args.input_path, gcode)) {
        printf("Error: cannot read %s\n", args.input_path.c_str());
        return nullptr;
    }

    PreviewImage preview;
    if (!args.preview_path.empty()) {
        std::string bytes;
        if (!read_file(args.preview_path, bytes)) {
            printf("Error: cannot read %s\n", args.preview_path.c_str());
            return nullptr;
        }
        std::string error;
        auto decoded = decode_preview(std::vector<uint8_t>(bytes.begin(), bytes.end()), &error);
        if (!decoded) {
            // A missing thumbnail is not fatal, the header just goes without one
            spdlog::warn("[Main] Preview {} unusable ({}), sending without thumbnail",
                         args.preview_path, error);
        } else {
            preview = std::move(*decoded);
        }
    }

    PrintParameters params;
    params.nozzle_temperature = args.nozzle_temp;
    params.bed_temperature = args.bed_temp;
    params.work_speed_mm_s = args.speed;
    params.merge_missing(parse_slicer_header(gcode));

    EncoderSettings settings = EncoderSettings::from_config(config);
    auto payload = std::make_shared<TransferPayload>(
        encode_payload(gcode, preview, params, settings));

    std::string job = args.job_name.empty()
                          ? std::filesystem::path(args.input_path).stem().string()
                          : args.job_name;
    upload_name = make_upload_filename(job, args.material, params.estimated_time_s.value_or(0));
    return payload;
}

void print_devices(const std::vector<DeviceRecord>& devices) {
    if (devices.empty()) {
        printf("No printers found\n");
        return;
    }
    for (const auto& d : devices) {
        printf("%-40s %-21s %s\n", d.id.c_str(), d.address.to_string().c_str(),
               device_status_name(d.status));
    }
}

// ============================================================================
// Commands
// ============================================================================

int run_save(const CliArgs& args, Config& config) {
    std::string upload_name;
    auto payload = build_payload(args, config, upload_name);
    if (!payload) {
        return 1;
    }

    std::string error;
    if (!write_payload_file(*payload, args.output_path, &error)) {
        printf("Error: cannot write %s: %s\n", args.output_path.c_str(), error.c_str());
        return 1;
    }
    printf("Wrote %s (%zu bytes)\n", args.output_path.c_str(), payload->size());
    return 0;
}

int run_list(const CliArgs& args, SessionOrchestrator& orch) {
    if (!orch.start()) {
        printf("Error: cannot listen for printers (is port in use?)\n");
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(args.wait_sec);
    while (std::chrono::steady_clock::now() < deadline && !g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    print_devices(orch.list_devices());
    return 0;
}

int run_send(const CliArgs& args, Config& config, SessionOrchestrator& orch) {
    std::string upload_name;
    auto payload = build_payload(args, config, upload_name);
    if (!payload) {
        return 1;
    }

    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    SessionState final_state = SessionState::FAILED;
    int last_percent = -1;

    orch.set_event_callback([&](const SessionEvent& ev) {
        if (ev.device_id != args.device_id) {
            return;
        }
        if (ev.state == SessionState::UPLOADING) {
            if (ev.progress_percent != last_percent) {
                last_percent = ev.progress_percent;
                printf("\r%s: %3d%% (%zu/%zu bytes)", session_state_name(ev.state),
                       ev.progress_percent, ev.bytes_sent, ev.bytes_total);
                fflush(stdout);
            }
        } else {
            printf("%s%s: %s\n", last_percent >= 0 ? "\n" : "", session_state_name(ev.state),
                   ev.message.c_str());
            last_percent = -1;
        }
        if (is_terminal(ev.state)) {
            std::lock_guard<std::mutex> lock(mutex);
            done = true;
            final_state = ev.state;
            cv.notify_all();
        }
    });

    if (!orch.start()) {
        printf("Error: cannot listen for printers (is port in use?)\n");
        return 1;
    }

    // Wait for the target to announce itself
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(args.wait_sec);
    TransferError err = orch.send(args.device_id, payload, upload_name);
    while (err.type == TransferErrorType::DEVICE_NOT_FOUND &&
           std::chrono::steady_clock::now() < deadline && !g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        err = orch.send(args.device_id, payload, upload_name);
    }

    if (err.has_error()) {
        printf("Error: %s\n", err.user_message().c_str());
        if (err.type == TransferErrorType::DEVICE_NOT_FOUND) {
            print_devices(orch.list_devices());
        }
        return 1;
    }

    std::unique_lock<std::mutex> lock(mutex);
    while (!done) {
        cv.wait_for(lock, std::chrono::milliseconds(200));
        if (g_interrupted.load() && !done) {
            lock.unlock();
            orch.cancel(args.device_id);
            lock.lock();
        }
    }
    lock.unlock();

    if (final_state != SessionState::COMPLETED) {
        auto snap = orch.session(args.device_id);
        if (snap && snap->error.has_error()) {
            printf("Error: %s\n", snap->error.user_message().c_str());
        }
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_shown ? 0 : 1;
    }

    // Console-only logging until the config says otherwise
    logging::LogConfig early;
    early.level = logging::verbosity_to_level(args.verbosity);
    early.target = logging::LogTarget::Console;
    logging::init(early);

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_config_dir() + "/config.json"
                                          : args.config_path);
    init_logging(args, *config);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    // A device that drops the connection mid-upload must fail the send, not kill us
    std::signal(SIGPIPE, SIG_IGN);

    if (args.command == CliCommand::SAVE) {
        return run_save(args, *config);
    }

    TransferSettings transfer_settings = TransferSettings::from_config(*config);
    auto tokens = std::make_shared<TokenStore>(transfer_settings.token_file);
    tokens->load();

    SessionOrchestrator orch(
        std::make_unique<DiscoveryListener>(DiscoverySettings::from_config(*config)),
        SnapmakerHttpTransport::factory(transfer_settings), transfer_settings, tokens);

    int rc = 1;
    switch (args.command) {
    case CliCommand::LIST:
        rc = run_list(args, orch);
        break;
    case CliCommand::SEND:
        rc = run_send(args, *config, orch);
        break;
    default:
        break;
    }

    orch.shutdown();
    spdlog::shutdown();
    return rc;
}
