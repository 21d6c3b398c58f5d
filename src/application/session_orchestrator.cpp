// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file session_orchestrator.cpp
 * @brief Discovery plus one TransferSession per device
 *
 * @pattern Sessions held by shared_ptr; calls into a session happen outside mutex_
 * @threading Public methods are callable from any thread. Session events arrive
 *            on session threads and are forwarded with no orchestrator lock held.
 * @gotchas A session replaced by a new send() is parked in retired_ until its
 *          worker exits, so send() never blocks on a join
 */

#include "session_orchestrator.h"

#include "token_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanprint {

SessionOrchestrator::SessionOrchestrator(std::unique_ptr<IDiscoveryListener> discovery,
                                         TransportFactory transport_factory,
                                         TransferSettings settings,
                                         std::shared_ptr<TokenStore> tokens)
    : discovery_(std::move(discovery)), transport_factory_(std::move(transport_factory)),
      settings_(std::move(settings)), tokens_(std::move(tokens)) {}

SessionOrchestrator::~SessionOrchestrator() {
    shutdown();
}

bool SessionOrchestrator::start(IDiscoveryListener::DeviceListCallback on_devices) {
    if (!discovery_) {
        spdlog::error("[SessionOrchestrator] No discovery listener");
        return false;
    }
    if (!on_devices) {
        on_devices = [](const std::vector<DeviceRecord>&) {};
    }
    if (!discovery_->start(std::move(on_devices))) {
        spdlog::error("[SessionOrchestrator] Discovery failed to start");
        return false;
    }
    spdlog::debug("[SessionOrchestrator] Started");
    return true;
}

void SessionOrchestrator::shutdown() {
    std::vector<std::shared_ptr<TransferSession>> to_stop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (auto& [id, session] : sessions_) {
            to_stop.push_back(session);
        }
        to_stop.insert(to_stop.end(), retired_.begin(), retired_.end());
        retired_.clear();
    }

    spdlog::debug("[SessionOrchestrator] Shutting down ({} session(s))", to_stop.size());

    for (auto& session : to_stop) {
        session->cancel();
    }
    for (auto& session : to_stop) {
        session->join();
    }

    if (discovery_) {
        discovery_->stop();
    }
    if (tokens_) {
        tokens_->save();
    }
}

void SessionOrchestrator::set_event_callback(SessionEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

std::vector<DeviceRecord> SessionOrchestrator::list_devices() const {
    if (!discovery_) {
        return {};
    }
    return discovery_->list_devices();
}

void SessionOrchestrator::refresh() {
    if (discovery_) {
        discovery_->probe_now();
    }
}

// ============================================================================
// Sessions
// ============================================================================

TransferError SessionOrchestrator::send(const std::string& device_id,
                                        std::shared_ptr<const TransferPayload> payload,
                                        const std::string& filename) {
    std::optional<DeviceRecord> device;
    if (discovery_) {
        device = discovery_->find_device(device_id);
    }
    if (!device) {
        spdlog::warn("[SessionOrchestrator] Send to unknown device '{}'", device_id);
        return TransferError::make(TransferErrorType::DEVICE_NOT_FOUND, "send",
                                   "no device '" + device_id + "' on the network");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return TransferError::make(TransferErrorType::CANCELLED, "send", "shutting down");
    }

    reap_retired_locked();

    auto it = sessions_.find(device_id);
    if (it != sessions_.end() && it->second->is_active()) {
        spdlog::info("[SessionOrchestrator] {} busy ({})", device_id,
                     session_state_name(it->second->state()));
        return TransferError::make(TransferErrorType::DEVICE_BUSY, "send",
                                   "a transfer to '" + device_id + "' is already running");
    }

    std::unique_ptr<IDeviceTransport> transport =
        transport_factory_ ? transport_factory_() : nullptr;
    if (!transport) {
        return TransferError::make(TransferErrorType::PROTOCOL_ERROR, "send",
                                   "no transport available");
    }

    auto session = std::make_shared<TransferSession>(
        *device, std::move(payload), filename, std::move(transport), settings_, tokens_,
        [this](const SessionEvent& ev) { on_session_event(ev); });

    if (it != sessions_.end()) {
        if (it->second->is_finished()) {
            it->second->join();
        } else {
            retired_.push_back(it->second);
        }
        it->second = session;
    } else {
        sessions_.emplace(device_id, session);
    }

    spdlog::info("[SessionOrchestrator] Sending {} to {}", filename, device_id);
    // Worker only calls back into on_session_event, which never takes mutex_
    session->start();
    return TransferError::none();
}

void SessionOrchestrator::cancel(const std::string& device_id) {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(device_id);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
    }

    if (!session->cancel()) {
        spdlog::debug("[SessionOrchestrator] Cancel {}: nothing active", device_id);
    }
}

std::optional<SessionSnapshot> SessionOrchestrator::session(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(device_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

TransferError SessionOrchestrator::retry(const std::string& device_id) {
    std::shared_ptr<const TransferPayload> payload;
    std::string filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(device_id);
        if (it == sessions_.end()) {
            return TransferError::make(TransferErrorType::DEVICE_NOT_FOUND, "retry",
                                       "nothing was sent to '" + device_id + "' yet");
        }
        if (it->second->is_active()) {
            return TransferError::make(TransferErrorType::DEVICE_BUSY, "retry",
                                       "a transfer to '" + device_id + "' is already running");
        }
        payload = it->second->payload();
        filename = it->second->filename();
    }

    spdlog::info("[SessionOrchestrator] Retrying {} to {}", filename, device_id);
    return send(device_id, std::move(payload), filename);
}

bool SessionOrchestrator::save_to_file(const TransferPayload& payload, const std::string& path,
                                       std::string* error) const {
    return write_payload_file(payload, path, error);
}

// ============================================================================
// Internals
// ============================================================================

void SessionOrchestrator::on_session_event(const SessionEvent& ev) {
    SessionEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }
    // Called unlocked so a handler may cancel or send to any device
    if (callback) {
        callback(ev);
    }
}

void SessionOrchestrator::reap_retired_locked() {
    auto finished = std::partition(retired_.begin(), retired_.end(),
                                   [](const std::shared_ptr<TransferSession>& s) {
                                       return !s->is_finished();
                                   });
    for (auto it = finished; it != retired_.end(); ++it) {
        (*it)->join();
    }
    retired_.erase(finished, retired_.end());
}

} // namespace lanprint
