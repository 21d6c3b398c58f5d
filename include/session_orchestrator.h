// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"
#include "device_transport.h"
#include "discovery_listener.h"
#include "gcode_header_encoder.h"
#include "transfer_error.h"
#include "transfer_session.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanprint {

class TokenStore;

/**
 * @brief Single entry point for hosts (CLI, UI) to find printers and send jobs
 *
 * Owns discovery and every TransferSession. At most one active session per
 * device; sessions to different devices run concurrently. Device status from
 * discovery is advisory: sending to a PRINTING device is attempted and the
 * device decides.
 *
 * Usage:
 * @code
 * SessionOrchestrator orch(std::make_unique<DiscoveryListener>(discovery_settings),
 *                          SnapmakerHttpTransport::factory(transfer_settings),
 *                          transfer_settings, tokens);
 * orch.set_event_callback([](const SessionEvent& ev) { ... });
 * orch.start();
 * auto err = orch.send(id, payload, filename);
 * @endcode
 */
class SessionOrchestrator {
  public:
    SessionOrchestrator(std::unique_ptr<IDiscoveryListener> discovery,
                        TransportFactory transport_factory, TransferSettings settings,
                        std::shared_ptr<TokenStore> tokens);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /**
     * @brief Start discovery
     *
     * @param on_devices Optional, invoked on the discovery thread when the list changes
     * @return false if discovery could not start
     */
    bool start(IDiscoveryListener::DeviceListCallback on_devices = nullptr);

    /// Cancel all sessions, wait for them, stop discovery and save tokens
    void shutdown();

    /**
     * @brief Session events for all devices; set before start()
     *
     * Events for one device arrive in order. Events for different devices may
     * arrive concurrently on different threads, so the callback must be
     * thread-safe. It may call cancel(), send() or retry().
     */
    void set_event_callback(SessionEventCallback callback);

    std::vector<DeviceRecord> list_devices() const;

    /// Probe for devices right away
    void refresh();

    /**
     * @brief Start a transfer
     *
     * @return NONE if a session was started; DEVICE_NOT_FOUND (no connection
     *         attempted) or DEVICE_BUSY (existing session untouched) otherwise
     */
    TransferError send(const std::string& device_id,
                       std::shared_ptr<const TransferPayload> payload,
                       const std::string& filename);

    /// Cancel the active session for device_id; no-op if there is none
    void cancel(const std::string& device_id);

    /// Latest session for device_id, active or finished
    std::optional<SessionSnapshot> session(const std::string& device_id) const;

    /**
     * @brief Re-send the last payload of a finished session
     *
     * Returns DEVICE_BUSY if that session is still active and DEVICE_NOT_FOUND
     * if there is no previous session or the device has disappeared.
     */
    TransferError retry(const std::string& device_id);

    /// Write the payload to disk instead of a device
    bool save_to_file(const TransferPayload& payload, const std::string& path,
                      std::string* error = nullptr) const;

  private:
    void on_session_event(const SessionEvent& ev);
    void reap_retired_locked();

    const std::unique_ptr<IDiscoveryListener> discovery_;
    const TransportFactory transport_factory_;
    const TransferSettings settings_;
    const std::shared_ptr<TokenStore> tokens_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TransferSession>> sessions_; // Protected by mutex_
    std::vector<std::shared_ptr<TransferSession>> retired_; // Replaced, worker not yet exited
    bool shut_down_ = false;                                // Protected by mutex_

    std::mutex callback_mutex_;
    SessionEventCallback event_callback_; // Protected by callback_mutex_
};

} // namespace lanprint
