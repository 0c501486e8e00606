// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Wire protocol constants and framing

 Every byte on a connection travels in frames:

   frame = <uvarint payload length> <payload>

 A connection starts with multistream-select 1.0 negotiation. Both sides
 send the header frame "/multistream/1.0.0\n"; the dialer then proposes a
 protocol ("/rendezvous/1.0.0\n") and the listener either echoes it
 (accepted) or answers "na\n". After acceptance each frame is one
 application message.
*/

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdvp {
namespace protocol {

constexpr const char *MULTISTREAM_ID = "/multistream/1.0.0";
constexpr const char *NOT_AVAILABLE = "na";

// Application protocols
constexpr const char *RENDEZVOUS_ID = "/rendezvous/1.0.0";
constexpr const char *RELAY_HOP_ID = "/rdvp/relay/hop/1.0.0";

// Maximum payload of one frame (1 MiB)
constexpr size_t MAX_MESSAGE_SIZE = 1024 * 1024;

// Negotiation lines are short; anything longer is a protocol violation
constexpr size_t MAX_NEGOTIATION_LINE = 1024;

// Outgoing bytes queued per stream before a slow reader is disconnected
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 4 * 1024 * 1024;

// Negotiation must complete within this many seconds of accept
constexpr int NEGOTIATION_TIMEOUT_SEC = 10;

// uvarint length prefix + payload
std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t> &payload);

// Negotiation frame for a protocol id: EncodeFrame(id + "\n")
std::vector<uint8_t> EncodeNegotiationLine(const std::string &line);

/**
 * Incremental frame decoder
 *
 * Feed() appends raw bytes; Next() pops complete payloads. A length prefix
 * above the limit (or one that overflows) puts the reader into the failed
 * state and Next() returns nothing from then on.
 */
class FrameReader {
public:
  explicit FrameReader(size_t max_payload = MAX_MESSAGE_SIZE)
      : max_payload_(max_payload) {}

  void Feed(const uint8_t *data, size_t size);

  std::optional<std::vector<uint8_t>> Next();

  bool failed() const { return failed_; }

  void set_max_payload(size_t max_payload) { max_payload_ = max_payload; }

private:
  std::vector<uint8_t> buffer_;
  size_t max_payload_;
  bool failed_{false};
};

} // namespace protocol
} // namespace rdvp
