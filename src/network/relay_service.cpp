// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/relay_service.hpp"
#include "network/protocol.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rdvp {
namespace network {

namespace {

std::vector<uint8_t> ToBytes(const json &j) {
  std::string text = j.dump();
  return std::vector<uint8_t>(text.begin(), text.end());
}

// Empty if missing or not a string
std::string StringField(const json &j, const char *key) {
  if (!j.is_object()) {
    return "";
  }
  auto it = j.find(key);
  return it != j.end() && it->is_string() ? it->get<std::string>() : "";
}

} // anonymous namespace

RelayService::RelayService(Host &host, std::shared_ptr<spdlog::logger> logger)
    : host_(host), logger_(std::move(logger)) {
  host_.SetStreamHandler(protocol::RELAY_HOP_ID,
                         [this](StreamPtr stream) { HandleStream(std::move(stream)); });
  logger_->debug("relay hop service enabled on {}", protocol::RELAY_HOP_ID);
}

RelayService::~RelayService() { Close(); }

void RelayService::Close() {
  std::map<uint64_t, StreamPtr> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    streams.swap(streams_);
    reservations_.clear();
    circuits_.clear();
  }
  host_.RemoveStreamHandler(protocol::RELAY_HOP_ID);
  for (auto &[id, stream] : streams) {
    stream->Close();
  }
}

size_t RelayService::reservation_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reservations_.size();
}

size_t RelayService::circuit_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return circuits_.size() / 2;
}

void RelayService::HandleStream(StreamPtr stream) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      stream->Close();
      return;
    }
    streams_[stream->id()] = stream;
  }

  // Callbacks hold the stream weakly; streams_ owns it
  std::weak_ptr<Stream> weak = stream;
  stream->SetMessageCallback([this, weak](const std::vector<uint8_t> &message) {
    if (auto s = weak.lock()) {
      HandleMessage(s, message);
    }
  });
  uint64_t id = stream->id();
  stream->SetCloseCallback([this, id]() { HandleClosed(id); });
}

void RelayService::HandleMessage(const StreamPtr &stream,
                                 const std::vector<uint8_t> &message) {
  StreamPtr partner;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = circuits_.find(stream->id());
    if (it != circuits_.end()) {
      partner = it->second;
    }
  }
  if (partner) {
    if (!partner->Send(message)) {
      stream->Close();
    }
    return;
  }

  json request;
  try {
    request = json::parse(message.begin(), message.end());
  } catch (const json::parse_error &e) {
    logger_->debug("relay: malformed message on stream {}: {}", stream->id(), e.what());
    SendStatus(stream, "E_MALFORMED_MESSAGE", "invalid JSON");
    return;
  }

  std::string type = StringField(request, "type");
  std::string peer = StringField(request, "peer");

  if (type == "STATUS") {
    json reply = {{"type", "STATUS"}, {"status", "OK"}};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      reply["reservations"] = reservations_.size();
      reply["circuits"] = circuits_.size() / 2;
    }
    stream->Send(ToBytes(reply));
    return;
  }

  if (type != "RESERVE" && type != "CONNECT") {
    SendStatus(stream, "E_MALFORMED_MESSAGE", "unknown message type '" + type + "'");
    return;
  }
  if (!crypto::PeerId::FromString(peer)) {
    SendStatus(stream, "E_MALFORMED_MESSAGE", "invalid peer id");
    return;
  }

  if (type == "RESERVE") {
    Reserve(stream, peer);
  } else {
    Connect(stream, peer);
  }
}

void RelayService::Reserve(const StreamPtr &stream, const std::string &peer) {
  StreamPtr previous;
  bool refused = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(peer);
    if (it == reservations_.end() && reservations_.size() >= MAX_RESERVATIONS) {
      refused = true;
    } else {
      if (it != reservations_.end() && it->second->id() != stream->id()) {
        previous = it->second;
      }
      reservations_[peer] = stream;
    }
  }

  if (refused) {
    SendStatus(stream, "E_RESOURCE_LIMIT_EXCEEDED", "too many reservations");
    return;
  }
  if (previous) {
    logger_->debug("relay: reservation for {} moved from stream {} to {}", peer,
                   previous->id(), stream->id());
    previous->Close();
  }
  logger_->debug("relay: reservation for {} on stream {}", peer, stream->id());
  SendStatus(stream, "OK");
}

void RelayService::Connect(const StreamPtr &stream, const std::string &peer) {
  StreamPtr target;
  std::string failure;
  std::string failure_text;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reservations_.find(peer);
    if (it == reservations_.end()) {
      failure = "E_NO_RESERVATION";
      failure_text = "no reservation for " + peer;
    } else if (it->second->id() == stream->id()) {
      failure = "E_MALFORMED_MESSAGE";
      failure_text = "cannot connect a stream to its own reservation";
    } else if (circuits_.size() / 2 >= MAX_CIRCUITS) {
      failure = "E_RESOURCE_LIMIT_EXCEEDED";
      failure_text = "too many circuits";
    } else {
      target = it->second;
      // A spliced stream carries one circuit only
      for (auto r = reservations_.begin(); r != reservations_.end();) {
        if (r->second->id() == target->id() || r->second->id() == stream->id()) {
          r = reservations_.erase(r);
        } else {
          ++r;
        }
      }
      circuits_[stream->id()] = target;
      circuits_[target->id()] = stream;
    }
  }

  if (!target) {
    SendStatus(stream, failure, failure_text);
    return;
  }

  logger_->debug("relay: circuit {} <-> {} for {}", stream->remote_address(),
                 target->remote_address(), peer);
  json notice = {{"type", "CONNECT"}, {"from", stream->remote_address()}};
  target->Send(ToBytes(notice));
  SendStatus(stream, "OK");
}

void RelayService::SendStatus(const StreamPtr &stream, const std::string &status,
                              const std::string &text) {
  json reply = {{"type", "STATUS"}, {"status", status}};
  if (!text.empty()) {
    reply["text"] = text;
  }
  stream->Send(ToBytes(reply));
}

void RelayService::HandleClosed(uint64_t stream_id) {
  StreamPtr partner;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(stream_id);
    for (auto it = reservations_.begin(); it != reservations_.end();) {
      if (it->second->id() == stream_id) {
        it = reservations_.erase(it);
      } else {
        ++it;
      }
    }
    auto circuit = circuits_.find(stream_id);
    if (circuit != circuits_.end()) {
      partner = circuit->second;
      circuits_.erase(circuit);
      circuits_.erase(partner->id());
    }
  }
  if (partner) {
    partner->Close();
  }
}

} // namespace network
} // namespace rdvp
