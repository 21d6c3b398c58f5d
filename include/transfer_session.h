// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"
#include "device_transport.h"
#include "gcode_header_encoder.h"
#include "transfer_error.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lanprint {

class TokenStore;

enum class SessionState {
    CONNECTING,
    AWAITING_AUTHORIZATION,
    UPLOADING,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* session_state_name(SessionState state);

inline bool is_terminal(SessionState state) {
    return state == SessionState::COMPLETED || state == SessionState::FAILED ||
           state == SessionState::CANCELLED;
}

/**
 * @brief One state change or progress step of a session
 */
struct SessionEvent {
    std::string device_id;
    SessionState state = SessionState::CONNECTING;
    TransferErrorType failure = TransferErrorType::NONE; ///< Set with FAILED and CANCELLED
    int progress_percent = 0;                            ///< Never decreases within a session
    size_t bytes_sent = 0;
    size_t bytes_total = 0;
    std::string message;
};

using SessionEventCallback = std::function<void(const SessionEvent&)>;

/**
 * @brief Copy of a session's observable state
 */
struct SessionSnapshot {
    std::string device_id;
    std::string filename;
    SessionState state = SessionState::CONNECTING;
    TransferError error;
    int progress_percent = 0;
    size_t bytes_sent = 0;
    size_t bytes_total = 0;
};

/**
 * @brief Delivers one payload to one device
 *
 * Runs Connect -> Authorize -> Upload -> Confirm on its own worker thread.
 * Never retries; every failure is terminal and carries a TransferError.
 *
 * Threading model:
 * - Events are queued under the state lock and delivered in order with no
 *   lock held, so handlers may call back into this or any other session
 * - Delivery happens on the worker, or on a cancel() caller that finds the
 *   queue idle; one thread delivers at a time
 * - cancel() never blocks on network I/O; it interrupts the transport and
 *   the transport is closed on every exit path
 * - The destructor cancels and joins
 */
class TransferSession {
  public:
    TransferSession(DeviceRecord device, std::shared_ptr<const TransferPayload> payload,
                    std::string filename, std::unique_ptr<IDeviceTransport> transport,
                    TransferSettings settings, std::shared_ptr<TokenStore> tokens,
                    SessionEventCallback on_event);
    ~TransferSession();

    // Non-copyable (owns worker thread)
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /// Launch the worker; call once
    void start();

    /**
     * @brief Cancel if not yet terminal
     *
     * @return true if this call moved the session to CANCELLED, false if it
     *         was already terminal (no-op)
     */
    bool cancel();

    /// Block until terminal or timeout; true if terminal
    bool wait_for(std::chrono::milliseconds timeout) const;

    /// Block until the worker thread has exited
    void join();

    SessionState state() const;
    bool is_active() const;

    /// true once the worker thread has returned (join() will not block)
    bool is_finished() const {
        return finished_.load();
    }
    SessionSnapshot snapshot() const;

    const std::string& device_id() const {
        return device_.id;
    }
    const std::string& filename() const {
        return filename_;
    }
    std::shared_ptr<const TransferPayload> payload() const {
        return payload_;
    }

  private:
    void run();
    void run_protocol();
    bool authorize(std::string& token);
    void upload(const std::string& token);

    /// Move to next if still active and emit; false if already terminal
    bool transition(SessionState next, const std::string& message = "");
    bool complete(const std::string& message);
    bool fail(TransferErrorType type, const std::string& operation, const std::string& message,
              int code = 0);
    void report_progress(size_t sent, size_t total);

    /// Hand queued events to on_event_ with no lock held; no-op if another thread is at it
    void deliver_events();

    /// Sleep up to timeout; false if the session stopped being active
    bool sleep_while_active(std::chrono::milliseconds timeout);

    void post_event_locked();

    const DeviceRecord device_;
    const std::shared_ptr<const TransferPayload> payload_;
    const std::string filename_;
    const std::unique_ptr<IDeviceTransport> transport_;
    const TransferSettings settings_;
    const std::shared_ptr<TokenStore> tokens_;
    const SessionEventCallback on_event_;

    std::thread worker_;
    std::atomic<bool> finished_{false};

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    SessionState state_ = SessionState::CONNECTING; // Protected by state_mutex_
    TransferError error_;                           // Protected by state_mutex_
    std::string message_;                           // Protected by state_mutex_
    int progress_percent_ = 0;                      // Protected by state_mutex_
    size_t bytes_sent_ = 0;                         // Protected by state_mutex_
    size_t bytes_total_ = 0;                        // Protected by state_mutex_
    std::deque<SessionEvent> pending_events_;       // Protected by state_mutex_
    bool delivering_ = false;                       // Protected by state_mutex_
};

} // namespace lanprint
