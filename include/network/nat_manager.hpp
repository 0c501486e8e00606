// Copyright (c) 2025 The Unicity Foundation
// NAT port mapping service using UPnP

#pragma once

#include "network/multiaddr.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace rdvp {
namespace network {

/**
 * Maps the host's TCP listen port on the local Internet gateway so peers
 * behind the same NAT as this node can be reached from outside.
 *
 * Start() blocks for gateway discovery (bounded by the UPnP timeout), then
 * a refresh thread renews the lease until Stop(). No gateway is not an
 * error: Start() returns false and the host keeps running.
 */
class NATManager {
public:
    explicit NATManager(std::shared_ptr<spdlog::logger> logger);
    ~NATManager() noexcept;

    NATManager(const NATManager&) = delete;
    NATManager& operator=(const NATManager&) = delete;

    // Discover gateway and map internal_port; true if a mapping was created
    bool Start(uint16_t internal_port);

    // Remove mapping and stop refreshing
    // silent: skip logging (destructor path)
    // Must NOT be called while holding mapping_mutex_ (joins refresh thread)
    void Stop(bool silent = false);

    std::string GetExternalIP() const;
    uint16_t GetExternalPort() const;
    bool IsPortMapped() const { return port_mapped_; }

    // /ip4/<external ip>/tcp/<external port> once mapped with a known IP
    std::optional<Multiaddr> GetExternalAddress() const;

private:
    // All three require mapping_mutex_ held
    bool DiscoverGateway();
    bool AddMapping();
    void RemoveMapping(bool silent);

    void RefreshLoop();
    void Refresh();

    std::shared_ptr<spdlog::logger> logger_;

    // Gateway state
    std::string control_url_;
    std::string service_type_;
    std::string lan_addr_;
    std::string external_ip_;

    uint16_t internal_port_{0};
    uint16_t external_port_{0};

    std::atomic<bool> port_mapped_{false};
    std::atomic<bool> running_{false};

    std::thread refresh_thread_;
    std::condition_variable refresh_cv_;
    std::mutex refresh_mutex_;

    // Serializes discovery/map/unmap and protects gateway state
    mutable std::mutex mapping_mutex_;
};

} // namespace network
} // namespace rdvp
