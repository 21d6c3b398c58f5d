// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snapmaker_http_transport.h"

#include "gcode_header_encoder.h"

#include "hv/HttpClient.h"
#include "hv/hurl.h"
#include "hv/json.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <sys/socket.h>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace lanprint {

namespace {

// The device writes the file to storage before answering
constexpr int UPLOAD_RESPONSE_TIMEOUT_S = 120;

int to_seconds(std::chrono::milliseconds ms) {
    auto s = (ms.count() + 999) / 1000;
    return static_cast<int>(std::max<long long>(1, s));
}

std::string make_boundary() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    char buf[48];
    std::snprintf(buf, sizeof(buf), "----LanPrintBoundary%016llx",
                  static_cast<unsigned long long>(gen()));
    return buf;
}

std::string now_ms_string() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return std::to_string(ms);
}

/// Parse a JSON body without throwing; null on failure
json parse_body(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return json();
    }
    return j;
}

} // namespace

SnapmakerHttpTransport::SnapmakerHttpTransport(TransferSettings settings)
    : settings_(std::move(settings)) {}

SnapmakerHttpTransport::~SnapmakerHttpTransport() {
    close();
}

TransportFactory SnapmakerHttpTransport::factory(TransferSettings settings) {
    return [settings]() -> std::unique_ptr<IDeviceTransport> {
        return std::make_unique<SnapmakerHttpTransport>(settings);
    };
}

std::string SnapmakerHttpTransport::url(const std::string& endpoint) const {
    return "http://" + address_.host + ":" + std::to_string(address_.port) + settings_.api_prefix +
           endpoint;
}

bool SnapmakerHttpTransport::open(const DeviceAddress& address) {
    close();
    address_ = address;
    interrupted_.store(false);

    client_ = std::make_unique<hv::HttpClient>();
    client_->setTimeout(to_seconds(settings_.request_timeout));

    int fd = client_->connect(address_.host.c_str(), address_.port, 0,
                              to_seconds(settings_.connect_timeout));
    if (fd < 0) {
        spdlog::warn("[HttpTransport] Cannot connect to {}", address_.to_string());
        client_.reset();
        return false;
    }

    spdlog::debug("[HttpTransport] Connected to {}", address_.to_string());
    return true;
}

AuthRequestReply SnapmakerHttpTransport::request_authorization(const std::string& token) {
    AuthRequestReply reply;
    if (!client_) {
        reply.detail = "not connected";
        return reply;
    }

    HttpRequest req;
    req.method = HTTP_POST;
    req.url = url("/connect");
    req.timeout = to_seconds(settings_.request_timeout);
    req.SetFormData("token", token);
    req.SetFormData("_", now_ms_string());

    HttpResponse resp;
    int ret = client_->send(&req, &resp);
    if (ret != 0) {
        spdlog::debug("[HttpTransport] POST /connect failed (error {})", ret);
        reply.result = AuthRequestResult::NO_RESPONSE;
        reply.detail = "no response to /connect";
        return reply;
    }

    reply.http_code = resp.status_code;
    spdlog::debug("[HttpTransport] POST /connect -> {}", resp.status_code);

    if (resp.status_code == 200) {
        json body = parse_body(resp.body);
        if (body.is_object() && body.contains("token") && body["token"].is_string() &&
            !body["token"].get<std::string>().empty()) {
            reply.result = AuthRequestResult::ACCEPTED;
            reply.token = body["token"].get<std::string>();
        } else {
            spdlog::warn("[HttpTransport] /connect answered 200 without a token");
            reply.result = AuthRequestResult::BAD_RESPONSE;
            reply.detail = "no token in /connect reply";
        }
    } else if (resp.status_code == 403 && !token.empty()) {
        reply.result = AuthRequestResult::TOKEN_EXPIRED;
    } else if (resp.status_code == 401 || resp.status_code == 403) {
        reply.result = AuthRequestResult::REJECTED;
        reply.detail = "device refused the connection";
    } else {
        reply.result = AuthRequestResult::BAD_RESPONSE;
        reply.detail = "unexpected HTTP " + std::to_string(resp.status_code) + " from /connect";
    }
    return reply;
}

AuthPollReply SnapmakerHttpTransport::poll_authorization(const std::string& token) {
    AuthPollReply reply;
    if (!client_) {
        return reply;
    }

    HttpRequest req;
    req.method = HTTP_GET;
    req.url = url("/status?token=" + HUrl::escape(token) + "&_=" + now_ms_string());
    req.timeout = to_seconds(settings_.request_timeout);

    HttpResponse resp;
    int ret = client_->send(&req, &resp);
    if (ret != 0) {
        spdlog::debug("[HttpTransport] GET /status failed (error {})", ret);
        reply.result = AuthPollResult::NO_RESPONSE;
        return reply;
    }

    reply.http_code = resp.status_code;
    spdlog::trace("[HttpTransport] GET /status -> {}", resp.status_code);

    switch (resp.status_code) {
    case 200: {
        reply.result = AuthPollResult::GRANTED;
        json body = parse_body(resp.body);
        if (body.is_object() && body.contains("status") && body["status"].is_string()) {
            reply.device_status = body["status"].get<std::string>();
        } else {
            reply.device_status = "UNKNOWN";
        }
        break;
    }
    case 401:
        reply.result = AuthPollResult::DENIED;
        break;
    case 204:
    default:
        // 204 = prompt still on screen; anything else is treated as "not yet"
        reply.result = AuthPollResult::PENDING;
        break;
    }
    return reply;
}

UploadReply SnapmakerHttpTransport::upload(const std::string& token, const std::string& filename,
                                           const TransferPayload& payload,
                                           const UploadProgressCallback& on_progress) {
    UploadReply reply;
    if (!client_) {
        reply.detail = "not connected";
        return reply;
    }

    // Fresh connection for the long streaming request, as libhv's uploadLargeFile does
    client_->close();
    int fd = client_->connect(address_.host.c_str(), address_.port, 0,
                              to_seconds(settings_.connect_timeout));
    if (fd < 0) {
        reply.result = UploadResult::CONNECTION_LOST;
        reply.detail = "reconnect for upload failed";
        return reply;
    }
    {
        std::lock_guard<std::mutex> lock(fd_mutex_);
        upload_fd_ = fd;
    }

    const std::string boundary = make_boundary();
    const std::string preamble = "--" + boundary +
                                 "\r\n"
                                 "Content-Disposition: form-data; name=\"token\"\r\n\r\n" +
                                 token + "\r\n--" + boundary +
                                 "\r\n"
                                 "Content-Disposition: form-data; name=\"file\"; filename=\"" +
                                 filename +
                                 "\"\r\n"
                                 "Content-Type: application/octet-stream\r\n\r\n";
    const std::string epilogue = "\r\n--" + boundary + "--\r\n";

    const std::vector<std::pair<const char*, size_t>> segments = {
        {preamble.data(), preamble.size()},
        {payload.header.data(), payload.header.size()},
        {payload.body.data(), payload.body.size()},
        {epilogue.data(), epilogue.size()}};

    size_t total_bytes = 0;
    for (const auto& seg : segments) {
        total_bytes += seg.second;
    }

    HttpRequest req;
    req.method = HTTP_POST;
    req.url = url("/upload");
    req.timeout = UPLOAD_RESPONSE_TIMEOUT_S;
    req.ParseUrl();
    req.SetHeader("Content-Type", "multipart/form-data; boundary=" + boundary);
    req.SetHeader("Content-Length", std::to_string(total_bytes));

    spdlog::info("[HttpTransport] Uploading {} ({} bytes) to {}", filename, payload.size(),
                 address_.to_string());

    if (client_->sendHeader(&req) != 0) {
        release_upload_fd();
        reply.result = interrupted_.load() ? UploadResult::INTERRUPTED
                                           : UploadResult::CONNECTION_LOST;
        reply.detail = "sending upload headers failed";
        return reply;
    }

    size_t sent_bytes = 0;
    for (const auto& seg : segments) {
        size_t offset = 0;
        while (offset < seg.second) {
            if (interrupted_.load()) {
                spdlog::info("[HttpTransport] Upload interrupted at {}/{} bytes", sent_bytes,
                             total_bytes);
                release_upload_fd();
                client_->close();
                reply.result = UploadResult::INTERRUPTED;
                return reply;
            }

            size_t chunk = std::min(settings_.upload_chunk_bytes, seg.second - offset);
            int nsend = client_->sendData(seg.first + offset, static_cast<int>(chunk));
            if (nsend != static_cast<int>(chunk)) {
                release_upload_fd();
                if (interrupted_.load()) {
                    spdlog::info("[HttpTransport] Upload interrupted at {}/{} bytes",
                                 sent_bytes, total_bytes);
                    reply.result = UploadResult::INTERRUPTED;
                    return reply;
                }
                spdlog::warn("[HttpTransport] Send failed after {}/{} bytes", sent_bytes,
                             total_bytes);
                reply.result = UploadResult::CONNECTION_LOST;
                reply.detail = "connection dropped during upload";
                return reply;
            }

            offset += chunk;
            sent_bytes += chunk;
            if (on_progress) {
                on_progress(sent_bytes, total_bytes);
            }
        }
    }

    client_->setTimeout(UPLOAD_RESPONSE_TIMEOUT_S);
    HttpResponse resp;
    int ret = client_->recvResponse(&resp);
    client_->setTimeout(to_seconds(settings_.request_timeout));
    release_upload_fd();
    if (ret != 0 && interrupted_.load()) {
        spdlog::info("[HttpTransport] Interrupted while waiting for the upload acknowledgement");
        client_->close();
        reply.result = UploadResult::INTERRUPTED;
        return reply;
    }
    if (ret != 0) {
        reply.result = UploadResult::CONNECTION_LOST;
        reply.detail = "no acknowledgement for upload";
        return reply;
    }

    reply.http_code = resp.status_code;
    spdlog::debug("[HttpTransport] POST /upload -> {}", resp.status_code);

    if (resp.status_code == 200) {
        reply.result = UploadResult::CONFIRMED;
    } else if (resp.status_code == 401 || resp.status_code == 403) {
        reply.result = UploadResult::REJECTED;
        reply.detail = "device refused the upload";
    } else {
        reply.result = UploadResult::BAD_RESPONSE;
        reply.detail = "unexpected HTTP " + std::to_string(resp.status_code) + " from /upload";
    }
    return reply;
}

void SnapmakerHttpTransport::disconnect(const std::string& token) {
    if (!client_ || token.empty()) {
        return;
    }

    HttpRequest req;
    req.method = HTTP_POST;
    req.url = url("/disconnect");
    req.timeout = to_seconds(settings_.request_timeout);
    req.SetFormData("token", token);
    req.SetFormData("_", now_ms_string());

    HttpResponse resp;
    int ret = client_->send(&req, &resp);
    if (ret != 0) {
        spdlog::debug("[HttpTransport] POST /disconnect failed (error {}), ignoring", ret);
        return;
    }
    spdlog::debug("[HttpTransport] POST /disconnect -> {}", resp.status_code);
}

void SnapmakerHttpTransport::interrupt() {
    interrupted_.store(true);

    std::lock_guard<std::mutex> lock(fd_mutex_);
    if (upload_fd_ >= 0) {
        // The client still owns the descriptor; only wake whoever is blocked on it
        ::shutdown(upload_fd_, SHUT_RDWR);
        spdlog::debug("[HttpTransport] Shut down the upload connection");
    }
}

void SnapmakerHttpTransport::release_upload_fd() {
    std::lock_guard<std::mutex> lock(fd_mutex_);
    upload_fd_ = -1;
}

void SnapmakerHttpTransport::close() {
    release_upload_fd();
    if (client_) {
        client_->close();
        client_.reset();
        spdlog::trace("[HttpTransport] Closed connection to {}", address_.to_string());
    }
}

} // namespace lanprint
