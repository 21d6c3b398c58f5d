// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_transport.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace hv {
class HttpClient;
}

namespace lanprint {

/**
 * @brief Snapmaker 2.0 HTTP API (/api/v1) over one libhv client
 *
 * Endpoints:
 * - POST /connect     form: token            -> 200 {"token"} | 403 expired | 401 refused
 * - GET  /status?token=&_=<ms>               -> 200 granted | 204 waiting | 401 denied
 * - POST /upload      form: token, file      -> 200 once the file is stored
 * - POST /disconnect  form: token
 *
 * The upload body is streamed with the client's low-level API in
 * upload_chunk_bytes pieces so progress can be reported. interrupt() shuts
 * the upload socket down, which ends a blocked send or the wait for the
 * device's acknowledgement right away.
 */
class SnapmakerHttpTransport : public IDeviceTransport {
  public:
    explicit SnapmakerHttpTransport(TransferSettings settings);
    ~SnapmakerHttpTransport() override;

    SnapmakerHttpTransport(const SnapmakerHttpTransport&) = delete;
    SnapmakerHttpTransport& operator=(const SnapmakerHttpTransport&) = delete;

    bool open(const DeviceAddress& address) override;
    AuthRequestReply request_authorization(const std::string& token) override;
    AuthPollReply poll_authorization(const std::string& token) override;
    UploadReply upload(const std::string& token, const std::string& filename,
                       const TransferPayload& payload,
                       const UploadProgressCallback& on_progress) override;
    void disconnect(const std::string& token) override;
    void interrupt() override;
    void close() override;

    /// Factory for SessionOrchestrator
    static TransportFactory factory(TransferSettings settings);

  private:
    std::string url(const std::string& endpoint) const;

    /// Forget the upload socket before the client closes it
    void release_upload_fd();

    const TransferSettings settings_;
    DeviceAddress address_;
    std::unique_ptr<hv::HttpClient> client_;
    std::atomic<bool> interrupted_{false};

    // Socket of the upload in flight; shut down by interrupt() from another thread
    std::mutex fd_mutex_;
    int upload_fd_ = -1; // Protected by fd_mutex_
};

} // namespace lanprint
