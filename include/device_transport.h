// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_record.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lanprint {

class Config;
struct TransferPayload;

/**
 * @brief Transfer tuning, copied out of Config before a session starts
 */
struct TransferSettings {
    uint16_t port = 8080;
    std::string api_prefix = "/api/v1";
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds request_timeout{5000};
    std::chrono::milliseconds authorization_timeout{60000};
    std::chrono::milliseconds authorization_poll{1500};
    size_t upload_chunk_bytes = 40960;
    std::string token_file; ///< Empty = <config dir>/tokens.json

    static TransferSettings from_config(Config& config);
};

enum class AuthRequestResult {
    ACCEPTED,      ///< Token issued (or remembered token still good)
    TOKEN_EXPIRED, ///< Remembered token no longer valid; retry without one
    REJECTED,      ///< Device refused outright
    NO_RESPONSE,   ///< Request failed at the socket level
    BAD_RESPONSE   ///< Unexpected status or body
};

struct AuthRequestReply {
    AuthRequestResult result = AuthRequestResult::NO_RESPONSE;
    std::string token;
    int http_code = 0;
    std::string detail;
};

enum class AuthPollResult {
    GRANTED,    ///< Operator tapped Yes (or the token was already trusted)
    PENDING,    ///< Prompt still showing
    DENIED,     ///< Operator tapped No
    NO_RESPONSE ///< Request failed at the socket level
};

struct AuthPollReply {
    AuthPollResult result = AuthPollResult::NO_RESPONSE;
    std::string device_status; ///< Reported with GRANTED, e.g. "IDLE"
    int http_code = 0;
};

enum class UploadResult {
    CONFIRMED,       ///< Device acknowledged the complete payload
    INTERRUPTED,     ///< interrupt() was called
    CONNECTION_LOST, ///< Send failed or no acknowledgement arrived
    REJECTED,        ///< Device refused the token
    BAD_RESPONSE     ///< Acknowledgement with an unexpected status
};

struct UploadReply {
    UploadResult result = UploadResult::CONNECTION_LOST;
    int http_code = 0;
    std::string detail;
};

/// bytes_sent never decreases within one upload() call
using UploadProgressCallback = std::function<void(size_t bytes_sent, size_t bytes_total)>;

/**
 * @brief One connection to one device, used by a single TransferSession
 *
 * All methods except interrupt() are called from the session's worker thread
 * only. interrupt() may be called from any thread and makes a running
 * upload() return INTERRUPTED promptly, including while it waits for the
 * device to acknowledge the file.
 */
class IDeviceTransport {
  public:
    virtual ~IDeviceTransport() = default;

    /**
     * @brief Establish the connection
     *
     * @return false if the device cannot be reached
     */
    virtual bool open(const DeviceAddress& address) = 0;

    /// Ask for a token; an empty token makes the device prompt its operator
    virtual AuthRequestReply request_authorization(const std::string& token) = 0;

    /// Ask whether the operator has answered yet
    virtual AuthPollReply poll_authorization(const std::string& token) = 0;

    virtual UploadReply upload(const std::string& token, const std::string& filename,
                               const TransferPayload& payload,
                               const UploadProgressCallback& on_progress) = 0;

    /// Best-effort goodbye after a completed upload
    virtual void disconnect(const std::string& token) = 0;

    virtual void interrupt() = 0;

    /// Release the connection; safe to call more than once
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<IDeviceTransport>()>;

const char* auth_request_result_name(AuthRequestResult result);
const char* auth_poll_result_name(AuthPollResult result);
const char* upload_result_name(UploadResult result);

} // namespace lanprint
