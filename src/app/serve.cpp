// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/serve.hpp"
#include "network/address_resolver.hpp"
#include "network/asio_host.hpp"
#include "util/error.hpp"

namespace rdvp {
namespace app {

using util::ErrorCode;

namespace {

/**
 * Releases acquired resources in reverse order when it goes out of scope
 */
class ReleaseStack {
public:
  explicit ReleaseStack(std::shared_ptr<spdlog::logger> logger)
      : logger_(std::move(logger)) {}

  ~ReleaseStack() {
    while (!releases_.empty()) {
      auto [name, release] = std::move(releases_.back());
      releases_.pop_back();
      try {
        release();
        logger_->debug("released {}", name);
      } catch (const std::exception &e) {
        logger_->error("releasing {} failed: {}", name, e.what());
      }
    }
  }

  ReleaseStack(const ReleaseStack &) = delete;
  ReleaseStack &operator=(const ReleaseStack &) = delete;

  void Push(std::string name, std::function<void()> release) {
    releases_.emplace_back(std::move(name), std::move(release));
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
  std::vector<std::pair<std::string, std::function<void()>>> releases_;
};

void LogHostInfo(const network::Host &host, spdlog::logger &logger) {
  std::string id = host.id().ToString();
  auto p2p = network::Multiaddr::Parse("/p2p/" + id);

  std::string addrs;
  for (const auto &addr : host.addrs()) {
    if (!addrs.empty()) {
      addrs += ", ";
    }
    addrs += p2p ? addr.Encapsulate(*p2p).ToString() : addr.ToString();
  }
  logger.info("host started: id={} addrs=[{}]", id, addrs);
}

} // anonymous namespace

ServeDeps DefaultServeDeps() {
  ServeDeps deps;
  deps.open_host = [](const crypto::PrivateKey &key,
                      const network::HostOptions &options) -> std::shared_ptr<network::Host> {
    return network::AsioHost::Create(key, options);
  };
  deps.open_store = [](const std::string &urn) {
    return rendezvous::RegistrationStore::Open(urn);
  };
  deps.start_service = [](network::Host &host, rendezvous::RegistrationStore &store) {
    return std::make_unique<rendezvous::RendezvousService>(host, store);
  };
  return deps;
}

void Serve(const ServeConfig &config, CancellationScope &scope,
           const ServeDeps &deps, std::shared_ptr<spdlog::logger> logger) {
  // Fail on configuration before any network resource is opened
  std::vector<network::Multiaddr> listen = network::ResolveAll(config.listen);
  crypto::PrivateKey key = crypto::AcquireIdentity(config.private_key);

  // Declared before the release stack: objects outlive every Close() so
  // host callbacks still in flight never see a destroyed service
  std::shared_ptr<network::Host> host;
  std::shared_ptr<rendezvous::RegistrationStore> store;
  std::shared_ptr<rendezvous::RendezvousService> service;
  ReleaseStack releases(logger);

  network::HostOptions options;
  options.listen_addrs = listen;
  options.enable_nat_service = config.enable_nat_service;
  options.enable_relay_hop = config.enable_relay_hop;

  try {
    host = deps.open_host(key, options);
    if (!host) {
      throw util::Error(ErrorCode::HostError, "no host created");
    }
  } catch (...) {
    util::RethrowWrapped(ErrorCode::HostError, "opening host");
  }
  releases.Push("host", [&host]() { host->Close(); });

  try {
    store = deps.open_store(config.db);
    if (!store) {
      throw util::Error(ErrorCode::StorageError, "no registration store opened");
    }
  } catch (...) {
    util::RethrowWrapped(ErrorCode::StorageError, "opening registration store " + config.db);
  }
  releases.Push("registration store", [&store]() { store->Close(); });

  try {
    service = deps.start_service(*host, *store);
    if (!service) {
      throw util::Error(ErrorCode::ServiceError, "no rendezvous service started");
    }
  } catch (...) {
    util::RethrowWrapped(ErrorCode::ServiceError, "starting rendezvous service");
  }
  releases.Push("rendezvous service", [&service]() { service->Close(); });

  LogHostInfo(*host, *logger);
  if (deps.on_started) {
    deps.on_started(*host);
  }

  scope.Wait();

  std::exception_ptr cause = scope.Cause();
  if (util::IsCancellation(cause)) {
    logger->info("shutting down: {}", util::DescribeError(cause));
    return;
  }
  std::rethrow_exception(cause);
}

} // namespace app
} // namespace rdvp
