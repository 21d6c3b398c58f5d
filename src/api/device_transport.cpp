// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_transport.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace lanprint {

namespace {

std::chrono::milliseconds positive_ms(Config& config, const char* ptr,
                                      std::chrono::milliseconds fallback) {
    int value = config.get<int>(ptr, static_cast<int>(fallback.count()));
    if (value <= 0) {
        spdlog::warn("[Config] {} must be positive, using {}", ptr, fallback.count());
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

TransferSettings TransferSettings::from_config(Config& config) {
    TransferSettings s;

    int port = config.get<int>("/transfer/port", s.port);
    if (port > 0 && port <= 65535) {
        s.port = static_cast<uint16_t>(port);
    } else {
        spdlog::warn("[Config] /transfer/port {} out of range, using {}", port, s.port);
    }

    s.api_prefix = config.get<std::string>("/transfer/api_prefix", s.api_prefix);
    while (!s.api_prefix.empty() && s.api_prefix.back() == '/') {
        s.api_prefix.pop_back();
    }

    s.connect_timeout = positive_ms(config, "/transfer/connect_timeout_ms", s.connect_timeout);
    s.request_timeout = positive_ms(config, "/transfer/request_timeout_ms", s.request_timeout);
    s.authorization_timeout =
        positive_ms(config, "/transfer/authorization_timeout_ms", s.authorization_timeout);
    s.authorization_poll =
        positive_ms(config, "/transfer/authorization_poll_ms", s.authorization_poll);

    int chunk = config.get<int>("/transfer/upload_chunk_bytes", static_cast<int>(s.upload_chunk_bytes));
    if (chunk >= 1024) {
        s.upload_chunk_bytes = static_cast<size_t>(chunk);
    }

    s.token_file = config.get<std::string>("/transfer/token_file", "");
    if (s.token_file.empty()) {
        s.token_file = Config::default_config_dir() + "/tokens.json";
    }
    return s;
}

const char* auth_request_result_name(AuthRequestResult result) {
    switch (result) {
    case AuthRequestResult::ACCEPTED:
        return "ACCEPTED";
    case AuthRequestResult::TOKEN_EXPIRED:
        return "TOKEN_EXPIRED";
    case AuthRequestResult::REJECTED:
        return "REJECTED";
    case AuthRequestResult::NO_RESPONSE:
        return "NO_RESPONSE";
    case AuthRequestResult::BAD_RESPONSE:
        return "BAD_RESPONSE";
    }
    return "UNKNOWN";
}

const char* auth_poll_result_name(AuthPollResult result) {
    switch (result) {
    case AuthPollResult::GRANTED:
        return "GRANTED";
    case AuthPollResult::PENDING:
        return "PENDING";
    case AuthPollResult::DENIED:
        return "DENIED";
    case AuthPollResult::NO_RESPONSE:
        return "NO_RESPONSE";
    }
    return "UNKNOWN";
}

const char* upload_result_name(UploadResult result) {
    switch (result) {
    case UploadResult::CONFIRMED:
        return "CONFIRMED";
    case UploadResult::INTERRUPTED:
        return "INTERRUPTED";
    case UploadResult::CONNECTION_LOST:
        return "CONNECTION_LOST";
    case UploadResult::REJECTED:
        return "REJECTED";
    case UploadResult::BAD_RESPONSE:
        return "BAD_RESPONSE";
    }
    return "UNKNOWN";
}

} // namespace lanprint
