// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "udp_socket.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanprint {

namespace {

// Large enough for any announcement plus slack; oversized datagrams get truncated and rejected
constexpr size_t RECEIVE_BUFFER_SIZE = 2048;

bool make_sockaddr(const std::string& address, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (address.empty() || address == "0.0.0.0") {
        out.sin_addr.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, address.c_str(), &out.sin_addr) == 1;
}

std::string errno_string(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

} // namespace

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::open(uint16_t port, const std::string& bind_address, bool allow_broadcast,
                     std::chrono::milliseconds receive_timeout) {
    if (fd_ >= 0) {
        return true;
    }

    sockaddr_in addr;
    if (!make_sockaddr(bind_address, port, addr)) {
        last_error_ = "invalid bind address '" + bind_address + "'";
        return false;
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        last_error_ = errno_string("socket()");
        return false;
    }

    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        last_error_ = errno_string("setsockopt(SO_REUSEADDR)");
        close();
        return false;
    }

    if (allow_broadcast) {
        int broadcast = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
            last_error_ = errno_string("setsockopt(SO_BROADCAST)");
            close();
            return false;
        }
    }

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(receive_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((receive_timeout.count() % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        last_error_ = errno_string("setsockopt(SO_RCVTIMEO)");
        close();
        return false;
    }

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        last_error_ = "bind(" + (bind_address.empty() ? std::string("0.0.0.0") : bind_address) +
                      ":" + std::to_string(port) + ") failed: " + std::strerror(errno);
        close();
        return false;
    }

    return true;
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint16_t UdpSocket::local_port() const {
    if (fd_ < 0) {
        return 0;
    }
    sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::send_to(const std::string& data, const std::string& host, uint16_t port) {
    sockaddr_in addr;
    if (!make_sockaddr(host, port, addr)) {
        last_error_ = "invalid destination '" + host + "'";
        return false;
    }
    ssize_t sent = ::sendto(fd_, data.data(), data.size(), 0,
                            reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (sent < 0) {
        last_error_ = errno_string("sendto()");
        return false;
    }
    return static_cast<size_t>(sent) == data.size();
}

ssize_t UdpSocket::receive_from(std::string& data, std::string& sender_host,
                                uint16_t& sender_port) {
    char buffer[RECEIVE_BUFFER_SIZE];
    sockaddr_in from;
    socklen_t from_len = sizeof(from);

    ssize_t n = ::recvfrom(fd_, buffer, sizeof(buffer), 0, reinterpret_cast<sockaddr*>(&from),
                           &from_len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return 0;
        }
        last_error_ = errno_string("recvfrom()");
        return -1;
    }

    data.assign(buffer, static_cast<size_t>(n));

    char host[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &from.sin_addr, host, sizeof(host))) {
        sender_host = host;
    } else {
        sender_host.clear();
    }
    sender_port = ntohs(from.sin_port);

    // Zero-length datagrams are valid on UDP; report at least 1 so callers don't treat them
    // as a timeout. The empty payload is rejected by the parser.
    return n == 0 ? 1 : n;
}

std::vector<std::string> local_broadcast_addresses() {
    std::vector<std::string> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        spdlog::debug("[Discovery] getifaddrs failed: {}", std::strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK) ||
            !(ifa->ifa_flags & IFF_BROADCAST) || !ifa->ifa_broadaddr) {
            continue;
        }

        auto* bcast = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_broadaddr);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &bcast->sin_addr, buf, sizeof(buf))) {
            std::string addr(buf);
            if (std::find(result.begin(), result.end(), addr) == result.end()) {
                spdlog::trace("[Discovery] Interface {} broadcast {}", ifa->ifa_name, addr);
                result.push_back(addr);
            }
        }
    }

    freeifaddrs(ifaddr);
    return result;
}

} // namespace lanprint
