// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "crypto/identity.hpp"
#include "network/multiaddr.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rdvp {
namespace network {

// Abstract host interface
// Allows dependency injection of different implementations:
// - AsioHost: TCP listeners via boost::asio
// - test fakes that record lifecycle calls (in test/)

class Stream;
using StreamPtr = std::shared_ptr<Stream>;

using MessageCallback = std::function<void(const std::vector<uint8_t> &message)>;
using CloseCallback = std::function<void()>;
using StreamHandler = std::function<void(StreamPtr stream)>;

// Stream - one negotiated protocol session carrying framed messages
class Stream {
public:
  virtual ~Stream() = default;

  // Protocol id the stream was opened for
  virtual const std::string &protocol() const = 0;

  // Remote endpoint as a multiaddr string (/ip4/1.2.3.4/tcp/5678)
  virtual std::string remote_address() const = 0;

  virtual uint64_t id() const = 0;

  // Queue one message (returns false if the stream is already closed)
  virtual bool Send(const std::vector<uint8_t> &message) = 0;

  virtual void Close() = 0;
  virtual bool is_open() const = 0;

  // Must be set from inside the StreamHandler to see the first message
  virtual void SetMessageCallback(MessageCallback callback) = 0;
  virtual void SetCloseCallback(CloseCallback callback) = 0;
};

struct HostOptions {
  std::vector<Multiaddr> listen_addrs;
  bool enable_nat_service = true;
  bool enable_relay_hop = true;
};

// Host - running network stack bound to one identity
class Host {
public:
  virtual ~Host() = default;

  virtual const crypto::PeerId &id() const = 0;

  // Bound listen addresses (port 0 resolved to the actual port)
  virtual std::vector<Multiaddr> listen_addrs() const = 0;

  // Listen addresses plus any externally mapped address
  virtual std::vector<Multiaddr> addrs() const = 0;

  // Handler runs on the IO thread when a remote selects protocol
  virtual void SetStreamHandler(const std::string &protocol,
                                StreamHandler handler) = 0;
  virtual void RemoveStreamHandler(const std::string &protocol) = 0;

  // Stop listening and close every stream (idempotent). After Close()
  // returns no stream callback runs, so objects that registered handlers
  // may be destroyed.
  virtual void Close() = 0;
};

} // namespace network
} // namespace rdvp
