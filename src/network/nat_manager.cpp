// Copyright (c) 2025 The Unicity Foundation
// NAT port mapping service implementation

#include "network/nat_manager.hpp"
#include <chrono>

#ifndef DISABLE_NAT_SUPPORT
#include <miniupnpc/miniupnpc.h>
#include <miniupnpc/upnpcommands.h>

// miniupnpc API version compatibility
#if defined(MINIUPNPC_API_VERSION) && MINIUPNPC_API_VERSION >= 18
// Version 2.2.8+ (API >= 18): 7 arguments with wanaddr
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr), nullptr, 0
#else
#define UPNP_GETVALIDIGD_ARGS(devlist, urls, data, lanaddr) \
    devlist, urls, data, lanaddr, sizeof(lanaddr)
#endif
#endif

namespace rdvp {
namespace network {

namespace {
constexpr int UPNP_DISCOVER_TIMEOUT_MS = 2000;
constexpr int UPNP_MULTICAST_TTL = 2;                // Limit to local network
constexpr int PORT_MAPPING_DURATION_SECONDS = 3600;  // 1 hour
constexpr int REFRESH_INTERVAL_SECONDS = 1800;       // 30 minutes
constexpr const char* MAPPING_DESCRIPTION = "rdvp rendezvous point";
}

NATManager::NATManager(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

NATManager::~NATManager() noexcept {
    Stop(true);
}

bool NATManager::Start(uint16_t internal_port) {
    if (internal_port == 0) {
        logger_->error("cannot map port 0 via UPnP");
        return false;
    }
    if (running_.exchange(true)) {
        logger_->trace("NAT service already running");
        return false;
    }

    {
        std::lock_guard<std::mutex> guard(mapping_mutex_);
        internal_port_ = internal_port;

        logger_->trace("starting UPnP port mapping for port {}", internal_port);

        if (!DiscoverGateway()) {
            logger_->debug("no UPnP-capable gateway found");
            running_ = false;
            return false;
        }
        if (!AddMapping()) {
            logger_->warn("UPnP port mapping for port {} failed", internal_port);
            running_ = false;
            return false;
        }
    }

    try {
        refresh_thread_ = std::thread([this]() { RefreshLoop(); });
    } catch (const std::exception& e) {
        logger_->error("failed to start UPnP refresh thread: {}", e.what());
        running_ = false;
        {
            std::lock_guard<std::mutex> guard(mapping_mutex_);
            RemoveMapping(false);
        }
        return false;
    }

    logger_->info("UPnP mapped external {}:{} -> internal port {}",
                  external_ip_.empty() ? "unknown" : external_ip_,
                  external_port_, internal_port_);
    return true;
}

void NATManager::Stop(bool silent) {
    if (!running_.exchange(false)) {
        return;
    }

    // Wake the refresh thread; miniupnpc calls are bounded by their own
    // timeouts so the join cannot hang indefinitely
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
    }
    refresh_cv_.notify_all();
    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
    }

    std::lock_guard<std::mutex> guard(mapping_mutex_);
    RemoveMapping(silent);
}

void NATManager::RefreshLoop() {
    std::unique_lock<std::mutex> lock(refresh_mutex_);
    while (running_) {
        if (refresh_cv_.wait_for(lock, std::chrono::seconds(REFRESH_INTERVAL_SECONDS),
                                 [this]() { return !running_; })) {
            break;
        }
        lock.unlock();
        try {
            Refresh();
        } catch (const std::exception& e) {
            logger_->error("UPnP refresh failed: {}; retrying next cycle", e.what());
        }
        lock.lock();
    }
}

bool NATManager::DiscoverGateway() {
#ifdef DISABLE_NAT_SUPPORT
    logger_->trace("NAT support disabled at compile time");
    return false;
#else
    control_url_.clear();
    service_type_.clear();
    lan_addr_.clear();
    external_ip_.clear();

    int error = 0;
    UPNPDev* devlist = upnpDiscover(UPNP_DISCOVER_TIMEOUT_MS,
                                    nullptr,  // multicast interface
                                    nullptr,  // minissdpd socket path
                                    0,        // sameport
                                    0,        // ipv6
                                    UPNP_MULTICAST_TTL, &error);
    if (!devlist) {
        logger_->debug("UPnP discovery failed: error code {}", error);
        return false;
    }

    UPNPUrls urls{};
    IGDdatas data{};
    char lanaddr[64] = {0};
    int result = UPNP_GetValidIGD(UPNP_GETVALIDIGD_ARGS(devlist, &urls, &data, lanaddr));
    freeUPNPDevlist(devlist);

    if (result != 1) {
        logger_->debug("no valid internet gateway device (result {})", result);
        FreeUPNPUrls(&urls);
        return false;
    }

    control_url_ = urls.controlURL ? urls.controlURL : "";
    service_type_ = data.first.servicetype;
    lan_addr_ = lanaddr;
    FreeUPNPUrls(&urls);

    char ext_ip[40] = {0};
    if (!control_url_.empty() &&
        UPNP_GetExternalIPAddress(control_url_.c_str(), service_type_.c_str(),
                                  ext_ip) == UPNPCOMMAND_SUCCESS) {
        external_ip_ = ext_ip;
    }
    logger_->trace("gateway found (LAN {}, WAN {})", lan_addr_,
                   external_ip_.empty() ? "unknown" : external_ip_);

    return !control_url_.empty() && !service_type_.empty() && !lan_addr_.empty();
#endif
}

bool NATManager::AddMapping() {
#ifdef DISABLE_NAT_SUPPORT
    return false;
#else
    // Ask for the same port externally
    external_port_ = internal_port_;

    const std::string internal_str = std::to_string(internal_port_);
    const std::string external_str = std::to_string(external_port_);
    const std::string duration_str = std::to_string(PORT_MAPPING_DURATION_SECONDS);

    int ret = UPNP_AddPortMapping(control_url_.c_str(), service_type_.c_str(),
                                  external_str.c_str(), internal_str.c_str(),
                                  lan_addr_.c_str(), MAPPING_DESCRIPTION, "TCP",
                                  nullptr,  // any remote host
                                  duration_str.c_str());
    if (ret != UPNPCOMMAND_SUCCESS) {
        logger_->debug("UPNP_AddPortMapping failed: error code {}", ret);
        return false;
    }

    port_mapped_ = true;
    return true;
#endif
}

void NATManager::RemoveMapping(bool silent) {
#ifndef DISABLE_NAT_SUPPORT
    if (!port_mapped_ || control_url_.empty() || service_type_.empty()) {
        return;
    }

    const std::string external_str = std::to_string(external_port_);
    int ret = UPNP_DeletePortMapping(control_url_.c_str(), service_type_.c_str(),
                                     external_str.c_str(), "TCP", nullptr);
    port_mapped_ = false;
    if (!silent) {
        if (ret == UPNPCOMMAND_SUCCESS) {
            logger_->debug("UPnP port mapping removed");
        } else {
            logger_->debug("UPnP port mapping removal failed: error code {}", ret);
        }
    }
#else
    (void)silent;
#endif
}

void NATManager::Refresh() {
    std::lock_guard<std::mutex> guard(mapping_mutex_);
    if (!running_) {
        return;
    }

    logger_->trace("refreshing UPnP port mapping");

    // Re-adding the same mapping extends the lease. A gateway that rebooted
    // has forgotten us: discover it again before giving up.
    if (AddMapping()) {
        return;
    }
    logger_->warn("UPnP refresh failed, rediscovering gateway");
    port_mapped_ = false;
    if (DiscoverGateway() && AddMapping()) {
        logger_->info("UPnP mapping restored");
        return;
    }
    logger_->warn("UPnP mapping lost; will retry on next refresh cycle");
}

std::string NATManager::GetExternalIP() const {
    std::lock_guard<std::mutex> guard(mapping_mutex_);
    return external_ip_;
}

uint16_t NATManager::GetExternalPort() const {
    std::lock_guard<std::mutex> guard(mapping_mutex_);
    return external_port_;
}

std::optional<Multiaddr> NATManager::GetExternalAddress() const {
    std::lock_guard<std::mutex> guard(mapping_mutex_);
    if (!port_mapped_ || external_ip_.empty()) {
        return std::nullopt;
    }
    return Multiaddr::Parse("/ip4/" + external_ip_ + "/tcp/" +
                            std::to_string(external_port_));
}

} // namespace network
} // namespace rdvp
