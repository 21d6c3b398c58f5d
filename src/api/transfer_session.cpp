// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file transfer_session.cpp
 * @brief Connect / authorize / upload / confirm against one device
 *
 * @pattern Worker thread per session; state machine guarded by state_mutex_
 * @threading cancel() may come from any thread; everything else runs on the worker.
 *            Events are queued under state_mutex_ and delivered with no lock held.
 * @gotchas cancel() interrupts the transport, which shuts its socket down; the
 *          result of the aborted call is discarded because the session is already
 *          CANCELLED
 */

#include "transfer_session.h"

#include "token_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lanprint {

namespace {

/**
 * @brief Closes the transport when the worker leaves run(), whatever the exit path
 */
class ConnectionGuard {
  public:
    explicit ConnectionGuard(IDeviceTransport* transport) : transport_(transport) {}
    ~ConnectionGuard() {
        if (transport_) {
            transport_->close();
        }
    }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

  private:
    IDeviceTransport* transport_;
};

} // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
    case SessionState::CONNECTING:
        return "CONNECTING";
    case SessionState::AWAITING_AUTHORIZATION:
        return "AWAITING_AUTHORIZATION";
    case SessionState::UPLOADING:
        return "UPLOADING";
    case SessionState::COMPLETED:
        return "COMPLETED";
    case SessionState::FAILED:
        return "FAILED";
    case SessionState::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

TransferSession::TransferSession(DeviceRecord device,
                                 std::shared_ptr<const TransferPayload> payload,
                                 std::string filename,
                                 std::unique_ptr<IDeviceTransport> transport,
                                 TransferSettings settings, std::shared_ptr<TokenStore> tokens,
                                 SessionEventCallback on_event)
    : device_(std::move(device)), payload_(std::move(payload)), filename_(std::move(filename)),
      transport_(std::move(transport)), settings_(std::move(settings)),
      tokens_(std::move(tokens)), on_event_(std::move(on_event)) {
    bytes_total_ = payload_ ? payload_->size() : 0;
}

TransferSession::~TransferSession() {
    cancel();
    join();
}

void TransferSession::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread(&TransferSession::run, this);
}

bool TransferSession::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        spdlog::info("[TransferSession] {}: cancelled in {}", device_.id,
                     session_state_name(state_));
        state_ = SessionState::CANCELLED;
        error_ = TransferError::make(TransferErrorType::CANCELLED, "cancel", "cancelled by caller");
        message_ = "Transfer cancelled";
        post_event_locked();
    }
    state_cv_.notify_all();

    // Unblocks a transport call in flight
    if (transport_) {
        transport_->interrupt();
    }

    deliver_events();
    return true;
}

bool TransferSession::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this]() { return is_terminal(state_); });
}

void TransferSession::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

SessionState TransferSession::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool TransferSession::is_active() const {
    return !is_terminal(state());
}

SessionSnapshot TransferSession::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    SessionSnapshot snap;
    snap.device_id = device_.id;
    snap.filename = filename_;
    snap.state = state_;
    snap.error = error_;
    snap.progress_percent = progress_percent_;
    snap.bytes_sent = bytes_sent_;
    snap.bytes_total = bytes_total_;
    return snap;
}

// ============================================================================
// Worker
// ============================================================================

void TransferSession::run() {
    run_protocol();
    deliver_events();
    finished_.store(true);
}

void TransferSession::run_protocol() {
    ConnectionGuard guard(transport_.get());

    spdlog::info("[TransferSession] {}: sending {} ({} bytes) to {}", device_.id, filename_,
                 bytes_total_, device_.address.to_string());

    // Initial CONNECTING event
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return;
        }
        message_ = "Connecting to " + device_.address.to_string();
        post_event_locked();
    }
    deliver_events();

    if (!payload_) {
        fail(TransferErrorType::PROTOCOL_ERROR, "send", "no payload");
        return;
    }

    if (!transport_ || !transport_->open(device_.address)) {
        fail(TransferErrorType::UNREACHABLE, "connect",
             "cannot connect to " + device_.address.to_string());
        return;
    }

    if (!transition(SessionState::AWAITING_AUTHORIZATION,
                    "Waiting for approval on the touchscreen")) {
        return;
    }

    std::string token;
    if (!authorize(token)) {
        return;
    }

    if (!transition(SessionState::UPLOADING, "Uploading " + filename_)) {
        return;
    }

    upload(token);
}

bool TransferSession::authorize(std::string& token) {
    std::string remembered;
    if (tokens_) {
        remembered = tokens_->get(device_.id).value_or("");
    }

    AuthRequestReply reply = transport_->request_authorization(remembered);
    spdlog::debug("[TransferSession] {}: connection request {} (HTTP {})", device_.id,
                  auth_request_result_name(reply.result), reply.http_code);
    if (!is_active()) {
        return false;
    }

    if (reply.result == AuthRequestResult::TOKEN_EXPIRED) {
        spdlog::info("[TransferSession] {}: remembered token expired, asking for a new one",
                     device_.id);
        if (tokens_) {
            tokens_->erase(device_.id);
            tokens_->save();
        }
        reply = transport_->request_authorization("");
        if (!is_active()) {
            return false;
        }
    }

    switch (reply.result) {
    case AuthRequestResult::ACCEPTED:
        token = reply.token;
        break;
    case AuthRequestResult::TOKEN_EXPIRED:
    case AuthRequestResult::REJECTED:
        fail(TransferErrorType::DENIED, "connect", "device refused the connection",
             reply.http_code);
        return false;
    case AuthRequestResult::NO_RESPONSE:
        fail(TransferErrorType::CONNECTION_LOST, "connect", "no answer to connection request");
        return false;
    case AuthRequestResult::BAD_RESPONSE:
    default:
        fail(TransferErrorType::PROTOCOL_ERROR, "connect", reply.detail, reply.http_code);
        return false;
    }

    spdlog::debug("[TransferSession] {}: got token, waiting for operator", device_.id);

    const auto deadline = std::chrono::steady_clock::now() + settings_.authorization_timeout;

    while (true) {
        AuthPollReply poll = transport_->poll_authorization(token);
        spdlog::trace("[TransferSession] {}: authorization {}", device_.id,
                      auth_poll_result_name(poll.result));
        if (!is_active()) {
            return false;
        }

        switch (poll.result) {
        case AuthPollResult::GRANTED:
            spdlog::info("[TransferSession] {}: authorized (device status {})", device_.id,
                         poll.device_status);
            if (tokens_) {
                tokens_->put(device_.id, token);
                tokens_->save();
            }
            return true;

        case AuthPollResult::DENIED:
            if (tokens_) {
                tokens_->erase(device_.id);
                tokens_->save();
            }
            fail(TransferErrorType::DENIED, "authorize", "operator rejected the connection",
                 poll.http_code);
            return false;

        case AuthPollResult::NO_RESPONSE:
            fail(TransferErrorType::CONNECTION_LOST, "authorize",
                 "device stopped answering while waiting for approval");
            return false;

        case AuthPollResult::PENDING:
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            fail(TransferErrorType::TIMEOUT, "authorize",
                 "no answer on the touchscreen within " +
                     std::to_string(settings_.authorization_timeout.count() / 1000) + "s");
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (!sleep_while_active(std::min(settings_.authorization_poll, remaining))) {
            return false;
        }
    }
}

void TransferSession::upload(const std::string& token) {
    UploadReply reply = transport_->upload(
        token, filename_, *payload_,
        [this](size_t sent, size_t total) { report_progress(sent, total); });
    spdlog::debug("[TransferSession] {}: upload {} (HTTP {})", device_.id,
                  upload_result_name(reply.result), reply.http_code);

    switch (reply.result) {
    case UploadResult::CONFIRMED:
        if (complete("Sent " + filename_)) {
            spdlog::info("[TransferSession] {}: {} delivered", device_.id, filename_);
            transport_->disconnect(token);
        }
        break;

    case UploadResult::INTERRUPTED:
        // Normally cancel() already moved us to CANCELLED
        if (is_active()) {
            cancel();
        }
        break;

    case UploadResult::CONNECTION_LOST:
        fail(TransferErrorType::CONNECTION_LOST, "upload",
             reply.detail.empty() ? "connection dropped during upload" : reply.detail,
             reply.http_code);
        break;

    case UploadResult::REJECTED:
        if (tokens_) {
            tokens_->erase(device_.id);
            tokens_->save();
        }
        fail(TransferErrorType::DENIED, "upload", "device refused the upload", reply.http_code);
        break;

    case UploadResult::BAD_RESPONSE:
        fail(TransferErrorType::PROTOCOL_ERROR, "upload", reply.detail, reply.http_code);
        break;
    }
}

// ============================================================================
// State helpers
// ============================================================================

void TransferSession::post_event_locked() {
    SessionEvent ev;
    ev.device_id = device_.id;
    ev.state = state_;
    ev.failure = error_.type;
    ev.progress_percent = progress_percent_;
    ev.bytes_sent = bytes_sent_;
    ev.bytes_total = bytes_total_;
    ev.message = message_;
    pending_events_.push_back(std::move(ev));
}

void TransferSession::deliver_events() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (delivering_) {
        // The delivering thread picks up whatever was queued
        return;
    }
    delivering_ = true;
    while (!pending_events_.empty()) {
        SessionEvent ev = std::move(pending_events_.front());
        pending_events_.pop_front();
        lock.unlock();
        if (on_event_) {
            on_event_(ev);
        }
        lock.lock();
    }
    delivering_ = false;
}

bool TransferSession::transition(SessionState next, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        spdlog::debug("[TransferSession] {}: {} -> {}", device_.id, session_state_name(state_),
                      session_state_name(next));
        state_ = next;
        if (!message.empty()) {
            message_ = message;
        }
        post_event_locked();
    }
    state_cv_.notify_all();

    deliver_events();
    return true;
}

bool TransferSession::complete(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        spdlog::debug("[TransferSession] {}: {} -> COMPLETED", device_.id,
                      session_state_name(state_));
        state_ = SessionState::COMPLETED;
        progress_percent_ = 100;
        bytes_sent_ = bytes_total_;
        message_ = message;
        post_event_locked();
    }
    state_cv_.notify_all();

    deliver_events();
    return true;
}

bool TransferSession::fail(TransferErrorType type, const std::string& operation,
                           const std::string& message, int code) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (is_terminal(state_)) {
            return false;
        }
        error_ = TransferError::make(type, operation, message, code);
        spdlog::warn("[TransferSession] {}: failed in {} ({}): {}", device_.id,
                     session_state_name(state_), error_.get_type_string(), message);
        state_ = SessionState::FAILED;
        message_ = error_.user_message();
        post_event_locked();
    }
    state_cv_.notify_all();

    // Recent debug/trace lines that led up to the failure, if a backtrace is enabled
    spdlog::dump_backtrace();

    deliver_events();
    return true;
}

void TransferSession::report_progress(size_t sent, size_t total) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::UPLOADING || total == 0) {
            return;
        }

        // Map transport bytes (which include framing) onto the payload size
        size_t mapped = static_cast<size_t>(static_cast<double>(sent) / total * bytes_total_);
        int percent = static_cast<int>(static_cast<double>(sent) * 100.0 / total);
        percent = std::min(percent, 99); // 100 only once the device confirms

        if (mapped <= bytes_sent_ && percent <= progress_percent_) {
            return;
        }
        bytes_sent_ = std::max(bytes_sent_, std::min(mapped, bytes_total_));
        progress_percent_ = std::max(progress_percent_, percent);
        spdlog::trace("[TransferSession] {}: {}% ({}/{})", device_.id, progress_percent_,
                      bytes_sent_, bytes_total_);
        post_event_locked();
    }

    deliver_events();
}

bool TransferSession::sleep_while_active(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, timeout, [this]() { return is_terminal(state_); });
    return !is_terminal(state_);
}

} // namespace lanprint
