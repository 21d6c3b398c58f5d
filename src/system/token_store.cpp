// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "token_store.h"

#include "hv/json.hpp"
#include "spdlog/spdlog.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace lanprint {

TokenStore::TokenStore(std::string path) : path_(std::move(path)) {}

void TokenStore::load() {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::debug("[TokenStore] No token file at {}", path_);
        return;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::warn("[TokenStore] Cannot open {}", path_);
        return;
    }

    json data;
    try {
        data = json::parse(in);
    } catch (const json::exception& e) {
        spdlog::warn("[TokenStore] Ignoring corrupt token file {}: {}", path_, e.what());
        return;
    }

    if (!data.is_object()) {
        spdlog::warn("[TokenStore] Token file {} is not an object, ignoring", path_);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.clear();
    for (auto& [id, token] : data.items()) {
        if (token.is_string() && !token.get<std::string>().empty()) {
            tokens_[id] = token.get<std::string>();
        }
    }
    spdlog::debug("[TokenStore] Loaded {} token(s) from {}", tokens_.size(), path_);
}

bool TokenStore::save() const {
    if (path_.empty()) {
        return true;
    }

    json data = json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, token] : tokens_) {
            data[id] = token;
        }
    }

    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            spdlog::warn("[TokenStore] Cannot write {}", tmp);
            return false;
        }
        out << std::setw(2) << data << std::endl;
        if (!out.good()) {
            spdlog::warn("[TokenStore] Write to {} failed", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        spdlog::warn("[TokenStore] Cannot move {} into place", tmp);
        std::remove(tmp.c_str());
        return false;
    }

    spdlog::trace("[TokenStore] Saved {} token(s) to {}", data.size(), path_);
    return true;
}

std::optional<std::string> TokenStore::get(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(device_id);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TokenStore::put(const std::string& device_id, const std::string& token) {
    if (token.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_[device_id] = token;
}

void TokenStore::erase(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(device_id);
}

size_t TokenStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

} // namespace lanprint
