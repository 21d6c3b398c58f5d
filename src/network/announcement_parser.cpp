// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "announcement_parser.h"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cstdlib>
#include <vector>

namespace lanprint {

namespace {

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

bool has_control_bytes(const std::string& s) {
    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7f) {
            return true;
        }
    }
    return false;
}

uint16_t parse_port(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return 0;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return 0;
        }
    }
    long value = std::strtol(text.c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) {
        return 0;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

bool is_valid_ipv4(const std::string& text) {
    struct in_addr addr;
    return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

std::optional<Announcement> parse_announcement(const std::string& datagram,
                                               const std::string& sender_ip,
                                               const std::string& model_prefix) {
    if (datagram.empty() || datagram.size() > MAX_ANNOUNCEMENT_BYTES) {
        return std::nullopt;
    }

    // Some firmware versions terminate the datagram with a newline
    std::string text = datagram;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == '\0')) {
        text.pop_back();
    }
    if (text.empty() || has_control_bytes(text)) {
        return std::nullopt;
    }

    auto parts = split(text, '|');
    const std::string& identity = parts.front();
    size_t at = identity.rfind('@');
    if (at == std::string::npos || at == 0) {
        return std::nullopt;
    }

    Announcement ann;
    ann.name = trim(identity.substr(0, at));
    ann.host = trim(identity.substr(at + 1));
    if (ann.name.empty()) {
        return std::nullopt;
    }

    bool have_model = false;
    bool have_status = false;
    for (size_t i = 1; i < parts.size(); ++i) {
        size_t colon = parts[i].find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(parts[i].substr(0, colon));
        std::string value = trim(parts[i].substr(colon + 1));
        if (key == "model") {
            ann.model = value;
            have_model = !value.empty();
        } else if (key == "status") {
            ann.status = value;
            have_status = !value.empty();
        } else if (key == "port") {
            ann.port = parse_port(value);
        }
    }

    if (!have_model || !have_status) {
        return std::nullopt;
    }

    if (!model_prefix.empty() && ann.model.compare(0, model_prefix.size(), model_prefix) != 0) {
        spdlog::trace("[Discovery] Ignoring foreign model '{}' from {}", ann.model, sender_ip);
        return std::nullopt;
    }

    if (!is_valid_ipv4(ann.host)) {
        if (!is_valid_ipv4(sender_ip)) {
            return std::nullopt;
        }
        spdlog::trace("[Discovery] Announced address '{}' unusable, using sender {}", ann.host,
                      sender_ip);
        ann.host = sender_ip;
    }

    return ann;
}

DeviceRecord make_device_record(const Announcement& announcement, uint16_t default_port,
                                std::chrono::steady_clock::time_point seen_at) {
    DeviceRecord record;
    record.id = announcement.name + "@" + announcement.model;
    record.display_name = announcement.name;
    record.model = announcement.model;
    record.address.host = announcement.host;
    record.address.port = announcement.port != 0 ? announcement.port : default_port;
    record.raw_status = announcement.status;
    record.status = parse_device_status(announcement.status);
    record.last_seen = seen_at;
    return record;
}

} // namespace lanprint
