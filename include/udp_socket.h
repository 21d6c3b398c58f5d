// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

namespace lanprint {

/**
 * @brief Minimal IPv4 UDP socket with broadcast support
 *
 * Owns the file descriptor; closed on destruction.
 */
class UdpSocket {
  public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Create, configure and bind the socket
     *
     * Sets SO_REUSEADDR, SO_BROADCAST when requested, and a receive timeout so
     * receive_from() returns periodically and the caller can check for shutdown.
     *
     * @param port Local port, 0 for an ephemeral one
     * @param bind_address Dotted IPv4, empty or "0.0.0.0" for any
     * @return false with last_error() set on failure
     */
    bool open(uint16_t port, const std::string& bind_address, bool allow_broadcast,
              std::chrono::milliseconds receive_timeout);

    void close();

    bool is_open() const {
        return fd_ >= 0;
    }

    /// Port actually bound (useful after open(0, ...))
    uint16_t local_port() const;

    const std::string& last_error() const {
        return last_error_;
    }

    bool send_to(const std::string& data, const std::string& host, uint16_t port);

    /**
     * @brief Receive one datagram
     *
     * @return Bytes received, 0 on timeout, -1 on error
     */
    ssize_t receive_from(std::string& data, std::string& sender_host, uint16_t& sender_port);

  private:
    int fd_ = -1;
    std::string last_error_;
};

/**
 * @brief IPv4 broadcast addresses of all up, non-loopback interfaces
 */
std::vector<std::string> local_broadcast_addresses();

} // namespace lanprint
