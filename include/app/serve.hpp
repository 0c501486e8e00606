// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "app/supervisor.hpp"
#include "crypto/identity.hpp"
#include "network/host.hpp"
#include "rendezvous/registration_store.hpp"
#include "rendezvous/rendezvous_service.hpp"
#include "util/logging.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rdvp {
namespace app {

// Serve command configuration
struct ServeConfig {
  // Listen addresses (multiaddrs or host:port)
  std::vector<std::string> listen = {"/ip4/0.0.0.0/tcp/4040",
                                     "/ip4/0.0.0.0/udp/4141/quic"};

  // Serialized private key; a fresh key is generated when empty
  std::string private_key;

  // Registration store location (":memory:" or a JSON file path)
  std::string db = rendezvous::MEMORY_URN;

  bool enable_relay_hop = true;
  bool enable_nat_service = true;
};

// Collaborator factories, replaceable in tests
struct ServeDeps {
  std::function<std::shared_ptr<network::Host>(const crypto::PrivateKey &,
                                               const network::HostOptions &)>
      open_host;
  std::function<std::unique_ptr<rendezvous::RegistrationStore>(const std::string &urn)>
      open_store;
  std::function<std::unique_ptr<rendezvous::RendezvousService>(
      network::Host &, rendezvous::RegistrationStore &)>
      start_service;

  // Optional: called once the host and service are up
  std::function<void(const network::Host &)> on_started;
};

// AsioHost, RegistrationStore::Open, RendezvousService
ServeDeps DefaultServeDeps();

/**
 * Run the rendezvous point until scope is cancelled
 *
 * Startup order: resolve listen addresses, acquire identity, open host,
 * open registration store, start rendezvous service. Everything acquired is
 * released in reverse order on every exit path.
 *
 * Returns normally when the scope was cancelled with a Canceled error;
 * rethrows any other cancellation cause. Startup failures propagate tagged
 * (AddressParseError, DecodeError, KeyFormatError, KeyGenError, HostError,
 * StorageError, ServiceError).
 */
void Serve(const ServeConfig &config, CancellationScope &scope,
           const ServeDeps &deps = DefaultServeDeps(),
           std::shared_ptr<spdlog::logger> logger = util::LogManager::GetLogger("app"));

} // namespace app
} // namespace rdvp
