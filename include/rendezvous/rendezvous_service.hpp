// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Rendezvous service (/rendezvous/1.0.0)

 One JSON message per frame. Requests and replies:

   REGISTER   {"type":"REGISTER","ns":"topic",
               "peer":{"id":"<peer id>","addrs":["/ip4/..."]},"ttl":7200}
           -> {"type":"REGISTER_RESPONSE","status":"OK","status_text":"",
               "ttl":7200}

   UNREGISTER {"type":"UNREGISTER","ns":"topic","peer":"<peer id>"}
              (no reply; empty ns removes every registration of the peer)

   DISCOVER   {"type":"DISCOVER","ns":"topic","limit":100,"cookie":""}
           -> {"type":"DISCOVER_RESPONSE","status":"OK","status_text":"",
               "registrations":[{"ns":..,"peer":{"id":..,"addrs":[..]},
               "ttl":<seconds left>}],"cookie":"..."}

 A frame that is not a JSON object with a known type closes the stream.
*/

#include "network/host.hpp"
#include "rendezvous/registration_store.hpp"
#include "util/logging.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rdvp {
namespace rendezvous {

constexpr int64_t DEFAULT_TTL = 2 * 3600;
constexpr int64_t MAX_TTL = 72 * 3600;
constexpr size_t MAX_NAMESPACE_LENGTH = 256;
constexpr size_t MAX_PEER_ADDRESS_LENGTH = 2048;
constexpr size_t MAX_REGISTRATIONS = 1000;
constexpr size_t MAX_DISCOVER_LIMIT = 1000;

enum class Status {
  OK,
  E_INVALID_NAMESPACE,
  E_INVALID_PEER_INFO,
  E_INVALID_TTL,
  E_INVALID_COOKIE,
  E_NOT_AUTHORIZED,
  E_INTERNAL_ERROR,
  E_UNAVAILABLE,
};

const char *StatusName(Status status);

class RendezvousService {
public:
  // Registers the rendezvous protocol handler on host
  RendezvousService(network::Host &host, RegistrationStore &store,
                    std::shared_ptr<spdlog::logger> logger =
                        util::LogManager::GetLogger("rendezvous"));
  ~RendezvousService();

  RendezvousService(const RendezvousService &) = delete;
  RendezvousService &operator=(const RendezvousService &) = delete;

  // Remove the protocol handler and close open streams (idempotent)
  void Close();

  /**
   * Process one decoded request
   * @return reply, or std::nullopt when the request has no reply
   * Throws util::Error(InvalidArgument) for an unknown message type
   */
  std::optional<nlohmann::json> HandleRequest(const nlohmann::json &request);

private:
  void HandleStream(network::StreamPtr stream);
  void HandleMessage(const network::StreamPtr &stream,
                     const std::vector<uint8_t> &message);

  nlohmann::json HandleRegister(const nlohmann::json &request);
  void HandleUnregister(const nlohmann::json &request);
  nlohmann::json HandleDiscover(const nlohmann::json &request);

  network::Host &host_;
  RegistrationStore &store_;
  std::shared_ptr<spdlog::logger> logger_;

  std::mutex mutex_;
  bool closed_{false};
  std::map<uint64_t, network::StreamPtr> streams_;
};

} // namespace rendezvous
} // namespace rdvp
