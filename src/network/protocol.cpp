// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"
#include "util/encoding.hpp"
#include <span>

namespace rdvp {
namespace protocol {

std::vector<uint8_t> EncodeFrame(const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> out;
  out.reserve(payload.size() + 10);
  util::WriteUvarint(out, payload.size());
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

std::vector<uint8_t> EncodeNegotiationLine(const std::string &line) {
  std::vector<uint8_t> payload(line.begin(), line.end());
  payload.push_back('\n');
  return EncodeFrame(payload);
}

void FrameReader::Feed(const uint8_t *data, size_t size) {
  if (failed_) {
    return;
  }
  buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<std::vector<uint8_t>> FrameReader::Next() {
  if (failed_ || buffer_.empty()) {
    return std::nullopt;
  }

  uint64_t length = 0;
  int n = util::ReadUvarint(std::span<const uint8_t>(buffer_), length);
  if (n == 0) {
    return std::nullopt; // prefix incomplete
  }
  if (n < 0 || length > max_payload_) {
    failed_ = true;
    buffer_.clear();
    return std::nullopt;
  }

  size_t header = static_cast<size_t>(n);
  if (buffer_.size() - header < length) {
    return std::nullopt;
  }

  std::vector<uint8_t> payload(buffer_.begin() + header,
                               buffer_.begin() + header + length);
  buffer_.erase(buffer_.begin(), buffer_.begin() + header + length);
  return payload;
}

} // namespace protocol
} // namespace rdvp
