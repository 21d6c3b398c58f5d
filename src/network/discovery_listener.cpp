// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file discovery_listener.cpp
 * @brief UDP announcement listener for Snapmaker 2 printers
 *
 * @pattern PIMPL with background thread for network I/O
 * @threading Receive, probe and sweep all run on one thread; callbacks are invoked there
 * @gotchas Socket may fail on systems without network; start() reports it instead of throwing
 */

#include "discovery_listener.h"

#include "announcement_parser.h"
#include "config.h"
#include "device_registry.h"
#include "udp_socket.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace lanprint {

namespace {

// Receive timeout; bounds how long stop() and probe_now() wait for the loop
constexpr auto RECEIVE_TIMEOUT = std::chrono::milliseconds(200);

// Sent when no interface reports a broadcast address
constexpr const char* LIMITED_BROADCAST = "255.255.255.255";

uint16_t to_port(int value, uint16_t fallback) {
    if (value < 0 || value > 65535) {
        return fallback;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

DiscoverySettings DiscoverySettings::from_config(Config& config) {
    DiscoverySettings s;
    s.listen_port = to_port(config.get<int>("/discovery/listen_port", s.listen_port),
                            s.listen_port);
    s.announce_port = to_port(config.get<int>("/discovery/announce_port", s.announce_port),
                              s.announce_port);
    s.bind_address = config.get<std::string>("/discovery/bind_address", "");
    s.probe_message = config.get<std::string>("/discovery/probe_message", s.probe_message);
    s.probe_interval = std::chrono::milliseconds(
        config.get<int>("/discovery/probe_interval_ms", static_cast<int>(s.probe_interval.count())));
    s.sweep_interval = std::chrono::milliseconds(
        config.get<int>("/discovery/sweep_interval_ms", static_cast<int>(s.sweep_interval.count())));
    s.unreachable_after = std::chrono::milliseconds(config.get<int>(
        "/discovery/unreachable_after_ms", static_cast<int>(s.unreachable_after.count())));
    s.staleness = std::chrono::milliseconds(
        config.get<int>("/discovery/staleness_ms", static_cast<int>(s.staleness.count())));
    s.model_prefix = config.get<std::string>("/discovery/model_prefix", s.model_prefix);
    s.broadcast_addresses =
        config.get<std::vector<std::string>>("/discovery/broadcast_addresses", {});
    s.default_transfer_port =
        to_port(config.get<int>("/transfer/port", s.default_transfer_port), s.default_transfer_port);

    if (s.sweep_interval.count() <= 0) {
        spdlog::warn("[Discovery] sweep_interval_ms must be positive, using 1000");
        s.sweep_interval = std::chrono::milliseconds(1000);
    }
    if (s.probe_interval.count() < 0) {
        spdlog::warn("[Discovery] probe_interval_ms is negative, periodic probes disabled");
        s.probe_interval = std::chrono::milliseconds(0);
    }
    // A non-positive window would evict every device on the first sweep
    if (s.staleness.count() <= 0) {
        spdlog::warn("[Discovery] staleness_ms must be positive, using {}",
                     DiscoverySettings{}.staleness.count());
        s.staleness = DiscoverySettings{}.staleness;
    }
    if (s.unreachable_after.count() <= 0) {
        spdlog::warn("[Discovery] unreachable_after_ms must be positive, using {}",
                     DiscoverySettings{}.unreachable_after.count());
        s.unreachable_after = DiscoverySettings{}.unreachable_after;
    }
    if (s.unreachable_after > s.staleness) {
        s.unreachable_after = s.staleness;
    }
    return s;
}

/**
 * @brief PIMPL implementation class
 */
class DiscoveryListener::Impl {
  public:
    explicit Impl(DiscoverySettings settings)
        : settings_(std::move(settings)),
          registry_(settings_.unreachable_after, settings_.staleness) {}

    ~Impl() {
        stop();
    }

    bool start(DeviceListCallback callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback_ = std::move(callback);

            // If already running, just dispatch current results
            if (running_.load()) {
                dispatch_update_locked();
                return true;
            }
        }

        if (!socket_.open(settings_.listen_port, settings_.bind_address, true, RECEIVE_TIMEOUT)) {
            spdlog::warn("[Discovery] Cannot listen for printers: {}", socket_.last_error());
            std::lock_guard<std::mutex> lock(mutex_);
            callback_ = nullptr;
            return false;
        }

        running_.store(true);
        probe_requested_.store(settings_.probe_interval.count() > 0);
        thread_ = std::thread(&Impl::discovery_loop, this);
        spdlog::info("[Discovery] Listening for printers on UDP port {}", socket_.local_port());
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.load()) {
                return;
            }
            running_.store(false);
            callback_ = nullptr;
        }

        // Wait for thread to exit (bounded by the receive timeout)
        if (thread_.joinable()) {
            thread_.join();
        }

        socket_.close();
        registry_.clear();
        spdlog::info("[Discovery] Stopped discovery");
    }

    bool is_running() const {
        return running_.load();
    }

    std::vector<DeviceRecord> list_devices() const {
        return registry_.snapshot();
    }

    std::optional<DeviceRecord> find_device(const std::string& id) const {
        return registry_.find(id);
    }

    void probe_now() {
        probe_requested_.store(true);
    }

    uint16_t bound_port() const {
        return running_.load() ? socket_.local_port() : 0;
    }

  private:
    /**
     * @brief Main loop running on background thread
     */
    void discovery_loop() {
        spdlog::debug("[Discovery] Discovery thread started");

        using Clock = std::chrono::steady_clock;
        auto next_probe = Clock::now() + settings_.probe_interval;
        auto next_sweep = Clock::now() + settings_.sweep_interval;

        std::string datagram;
        std::string sender_host;
        uint16_t sender_port = 0;

        while (running_.load()) {
            auto now = Clock::now();

            if (probe_requested_.exchange(false) ||
                (settings_.probe_interval.count() > 0 && now >= next_probe)) {
                send_probe();
                next_probe = now + settings_.probe_interval;
            }

            if (now >= next_sweep) {
                if (registry_.sweep(now)) {
                    dispatch_update();
                }
                next_sweep = now + settings_.sweep_interval;
            }

            ssize_t n = socket_.receive_from(datagram, sender_host, sender_port);
            if (n < 0) {
                spdlog::warn("[Discovery] Receive failed: {}", socket_.last_error());
                // Avoid spinning on a persistent socket error
                std::this_thread::sleep_for(RECEIVE_TIMEOUT);
                continue;
            }
            if (n == 0) {
                continue; // Timeout
            }

            handle_datagram(datagram, sender_host);
        }

        spdlog::debug("[Discovery] Discovery thread exiting");
    }

    void handle_datagram(const std::string& datagram, const std::string& sender_host) {
        auto announcement = parse_announcement(datagram, sender_host, settings_.model_prefix);
        if (!announcement) {
            // LAN noise (including our own probe echoing back)
            spdlog::trace("[Discovery] Dropped {}-byte datagram from {}", datagram.size(),
                          sender_host);
            return;
        }

        DeviceRecord record = make_device_record(*announcement, settings_.default_transfer_port,
                                                 std::chrono::steady_clock::now());
        if (registry_.upsert(record)) {
            dispatch_update();
        }
    }

    void send_probe() {
        std::vector<std::string> targets = settings_.broadcast_addresses;
        if (targets.empty()) {
            targets = local_broadcast_addresses();
            if (targets.empty()) {
                targets.push_back(LIMITED_BROADCAST);
            }
        }

        for (const auto& target : targets) {
            if (!socket_.send_to(settings_.probe_message, target, settings_.announce_port)) {
                spdlog::debug("[Discovery] Probe to {}:{} failed: {}", target,
                              settings_.announce_port, socket_.last_error());
            } else {
                spdlog::trace("[Discovery] Probe sent to {}:{}", target, settings_.announce_port);
            }
        }
    }

    void dispatch_update() {
        std::lock_guard<std::mutex> lock(mutex_);
        dispatch_update_locked();
    }

    /**
     * @brief Invoke the change callback with the current list
     *
     * Must be called with mutex_ held.
     */
    void dispatch_update_locked() {
        if (!callback_) {
            return;
        }
        auto devices = registry_.snapshot();
        spdlog::debug("[Discovery] {} printer(s) visible", devices.size());
        callback_(devices);
    }

    const DiscoverySettings settings_;
    DeviceRegistry registry_;
    UdpSocket socket_;

    // Thread management
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> probe_requested_{false};

    // Protected by mutex_
    std::mutex mutex_;
    DeviceListCallback callback_;
};

// ============================================================================
// DiscoveryListener public interface
// ============================================================================

DiscoveryListener::DiscoveryListener(DiscoverySettings settings)
    : impl_(std::make_unique<Impl>(std::move(settings))) {}

DiscoveryListener::~DiscoveryListener() = default;

bool DiscoveryListener::start(DeviceListCallback on_change) {
    return impl_->start(std::move(on_change));
}

void DiscoveryListener::stop() {
    impl_->stop();
}

bool DiscoveryListener::is_running() const {
    return impl_->is_running();
}

std::vector<DeviceRecord> DiscoveryListener::list_devices() const {
    return impl_->list_devices();
}

std::optional<DeviceRecord> DiscoveryListener::find_device(const std::string& id) const {
    return impl_->find_device(id);
}

void DiscoveryListener::probe_now() {
    impl_->probe_now();
}

uint16_t DiscoveryListener::bound_port() const {
    return impl_->bound_port();
}

} // namespace lanprint
