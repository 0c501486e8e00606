// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Relay hop service

 Lets two peers that cannot reach each other directly talk through this
 node. Control messages are JSON documents, one per frame:

   -> {"type":"RESERVE","peer":"<peer id>"}
   <- {"type":"STATUS","status":"OK"}
      The stream is kept as the reservation for that peer id.

   -> {"type":"CONNECT","peer":"<peer id>"}
   <- {"type":"STATUS","status":"OK"}          (initiator)
   <- {"type":"CONNECT","from":"<address>"}    (reserved peer)
      From then on every frame on either stream is forwarded verbatim to
      the other one; closing either side closes both.

   -> {"type":"STATUS"}
   <- {"type":"STATUS","status":"OK","reservations":N,"circuits":M}

 Failures answer {"type":"STATUS","status":"<code>","text":"..."} with
 E_MALFORMED_MESSAGE, E_NO_RESERVATION or E_RESOURCE_LIMIT_EXCEEDED.
*/

#include "network/host.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace rdvp {
namespace network {

class RelayService {
public:
  static constexpr size_t MAX_RESERVATIONS = 128;
  static constexpr size_t MAX_CIRCUITS = 256;

  // Registers the relay hop protocol handler on host
  RelayService(Host &host, std::shared_ptr<spdlog::logger> logger);
  ~RelayService();

  RelayService(const RelayService &) = delete;
  RelayService &operator=(const RelayService &) = delete;

  // Remove the handler and close every reserved or spliced stream
  void Close();

  size_t reservation_count() const;
  size_t circuit_count() const;

private:
  void HandleStream(StreamPtr stream);
  void HandleMessage(const StreamPtr &stream, const std::vector<uint8_t> &message);
  void HandleClosed(uint64_t stream_id);

  void Reserve(const StreamPtr &stream, const std::string &peer);
  void Connect(const StreamPtr &stream, const std::string &peer);
  void SendStatus(const StreamPtr &stream, const std::string &status,
                  const std::string &text = "");

  Host &host_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  bool closed_{false};
  // Open control streams by id
  std::map<uint64_t, StreamPtr> streams_;
  // peer id -> reserved stream
  std::map<std::string, StreamPtr> reservations_;
  // stream id -> the other end of its circuit
  std::map<uint64_t, StreamPtr> circuits_;
};

} // namespace network
} // namespace rdvp
