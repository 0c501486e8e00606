// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rendezvous/rendezvous_service.hpp"
#include "crypto/identity.hpp"
#include "network/multiaddr.hpp"
#include "network/protocol.hpp"
#include "util/error.hpp"
#include "util/time.hpp"

using json = nlohmann::json;

namespace rdvp {
namespace rendezvous {

using util::Error;
using util::ErrorCode;

namespace {

// Carries a status code out of request validation
struct StatusError {
  Status status;
  std::string text;
};

json RegisterResponse(Status status, const std::string &text, int64_t ttl = 0) {
  json reply = {{"type", "REGISTER_RESPONSE"},
                {"status", StatusName(status)},
                {"status_text", text}};
  if (status == Status::OK) {
    reply["ttl"] = ttl;
  }
  return reply;
}

json DiscoverResponse(Status status, const std::string &text) {
  return {{"type", "DISCOVER_RESPONSE"},
          {"status", StatusName(status)},
          {"status_text", text},
          {"registrations", json::array()},
          {"cookie", ""}};
}

std::string StringField(const json &j, const char *key, Status on_error) {
  auto it = j.find(key);
  if (it == j.end()) {
    return "";
  }
  if (!it->is_string()) {
    throw StatusError{on_error, std::string(key) + " must be a string"};
  }
  return it->get<std::string>();
}

std::string ValidateNamespace(const json &request, bool allow_empty) {
  std::string ns = StringField(request, "ns", Status::E_INVALID_NAMESPACE);
  if (ns.empty() && !allow_empty) {
    throw StatusError{Status::E_INVALID_NAMESPACE, "empty namespace"};
  }
  if (ns.size() > MAX_NAMESPACE_LENGTH) {
    throw StatusError{Status::E_INVALID_NAMESPACE, "namespace too long"};
  }
  return ns;
}

std::string ValidatePeerId(const std::string &id) {
  if (!crypto::PeerId::FromString(id)) {
    throw StatusError{Status::E_INVALID_PEER_INFO, "invalid peer id"};
  }
  return id;
}

} // anonymous namespace

const char *StatusName(Status status) {
  switch (status) {
  case Status::OK:
    return "OK";
  case Status::E_INVALID_NAMESPACE:
    return "E_INVALID_NAMESPACE";
  case Status::E_INVALID_PEER_INFO:
    return "E_INVALID_PEER_INFO";
  case Status::E_INVALID_TTL:
    return "E_INVALID_TTL";
  case Status::E_INVALID_COOKIE:
    return "E_INVALID_COOKIE";
  case Status::E_NOT_AUTHORIZED:
    return "E_NOT_AUTHORIZED";
  case Status::E_INTERNAL_ERROR:
    return "E_INTERNAL_ERROR";
  case Status::E_UNAVAILABLE:
    return "E_UNAVAILABLE";
  }
  return "E_INTERNAL_ERROR";
}

RendezvousService::RendezvousService(network::Host &host, RegistrationStore &store,
                                     std::shared_ptr<spdlog::logger> logger)
    : host_(host), store_(store), logger_(std::move(logger)) {
  host_.SetStreamHandler(protocol::RENDEZVOUS_ID, [this](network::StreamPtr stream) {
    HandleStream(std::move(stream));
  });
  logger_->debug("rendezvous service listening on {}", protocol::RENDEZVOUS_ID);
}

RendezvousService::~RendezvousService() { Close(); }

void RendezvousService::Close() {
  std::map<uint64_t, network::StreamPtr> streams;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    closed_ = true;
    streams.swap(streams_);
  }
  host_.RemoveStreamHandler(protocol::RENDEZVOUS_ID);
  for (auto &[id, stream] : streams) {
    stream->Close();
  }
  logger_->debug("rendezvous service stopped");
}

void RendezvousService::HandleStream(network::StreamPtr stream) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      stream->Close();
      return;
    }
    streams_[stream->id()] = stream;
  }

  std::weak_ptr<network::Stream> weak = stream;
  stream->SetMessageCallback([this, weak](const std::vector<uint8_t> &message) {
    if (auto s = weak.lock()) {
      HandleMessage(s, message);
    }
  });
  uint64_t id = stream->id();
  stream->SetCloseCallback([this, id]() {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.erase(id);
  });
}

void RendezvousService::HandleMessage(const network::StreamPtr &stream,
                                      const std::vector<uint8_t> &message) {
  std::optional<json> reply;
  try {
    json request = json::parse(message.begin(), message.end());
    reply = HandleRequest(request);
  } catch (const json::exception &e) {
    logger_->debug("malformed rendezvous message from {}: {}",
                   stream->remote_address(), e.what());
    stream->Close();
    return;
  } catch (const Error &e) {
    logger_->debug("rejecting message from {}: {}", stream->remote_address(),
                   e.what());
    stream->Close();
    return;
  }

  if (reply) {
    std::string text = reply->dump();
    stream->Send(std::vector<uint8_t>(text.begin(), text.end()));
  }
}

std::optional<json> RendezvousService::HandleRequest(const json &request) {
  if (!request.is_object()) {
    throw Error(ErrorCode::InvalidArgument, "message is not a JSON object");
  }
  auto type_it = request.find("type");
  std::string type =
      type_it != request.end() && type_it->is_string() ? type_it->get<std::string>() : "";

  if (type == "REGISTER") {
    return HandleRegister(request);
  }
  if (type == "UNREGISTER") {
    HandleUnregister(request);
    return std::nullopt;
  }
  if (type == "DISCOVER") {
    return HandleDiscover(request);
  }
  throw Error(ErrorCode::InvalidArgument, "unknown message type '" + type + "'");
}

json RendezvousService::HandleRegister(const json &request) {
  std::string ns;
  std::string peer;
  std::vector<std::string> addrs;
  int64_t ttl = DEFAULT_TTL;

  try {
    ns = ValidateNamespace(request, false);

    auto info = request.find("peer");
    if (info == request.end() || !info->is_object()) {
      throw StatusError{Status::E_INVALID_PEER_INFO, "missing peer info"};
    }
    peer = ValidatePeerId(StringField(*info, "id", Status::E_INVALID_PEER_INFO));

    auto addrs_it = info->find("addrs");
    if (addrs_it == info->end() || !addrs_it->is_array() || addrs_it->empty()) {
      throw StatusError{Status::E_INVALID_PEER_INFO, "missing peer addresses"};
    }
    size_t total = 0;
    for (const auto &addr : *addrs_it) {
      if (!addr.is_string() || !network::Multiaddr::Parse(addr.get<std::string>())) {
        throw StatusError{Status::E_INVALID_PEER_INFO, "invalid peer address"};
      }
      total += addr.get<std::string>().size();
      addrs.push_back(addr.get<std::string>());
    }
    if (total > MAX_PEER_ADDRESS_LENGTH) {
      throw StatusError{Status::E_INVALID_PEER_INFO, "peer addresses too long"};
    }

    auto ttl_it = request.find("ttl");
    if (ttl_it != request.end()) {
      if (!ttl_it->is_number_integer() || ttl_it->get<int64_t>() < 0) {
        throw StatusError{Status::E_INVALID_TTL, "ttl must be a non-negative integer"};
      }
      int64_t requested = ttl_it->get<int64_t>();
      if (requested > MAX_TTL) {
        throw StatusError{Status::E_INVALID_TTL, "ttl too long"};
      }
      if (requested > 0) {
        ttl = requested;
      }
    }
  } catch (const StatusError &e) {
    logger_->debug("REGISTER rejected: {} ({})", StatusName(e.status), e.text);
    return RegisterResponse(e.status, e.text);
  }

  if (!store_.is_open()) {
    return RegisterResponse(Status::E_UNAVAILABLE, "registration store unavailable");
  }

  try {
    if (store_.CountRegistrations(peer) >= MAX_REGISTRATIONS) {
      return RegisterResponse(Status::E_NOT_AUTHORIZED, "too many registrations");
    }
    store_.Register(peer, ns, addrs, ttl);
  } catch (const Error &e) {
    logger_->error("REGISTER {} in '{}' failed: {}", peer, ns, e.what());
    return RegisterResponse(Status::E_INTERNAL_ERROR, "internal error");
  }

  logger_->info("registered peer {} in '{}' (ttl {}s)", peer, ns, ttl);
  return RegisterResponse(Status::OK, "", ttl);
}

void RendezvousService::HandleUnregister(const json &request) {
  std::string ns;
  std::string peer;
  try {
    ns = ValidateNamespace(request, true);
    peer = ValidatePeerId(StringField(request, "peer", Status::E_INVALID_PEER_INFO));
  } catch (const StatusError &e) {
    logger_->debug("UNREGISTER ignored: {} ({})", StatusName(e.status), e.text);
    return;
  }

  try {
    store_.Unregister(ns, peer);
  } catch (const Error &e) {
    logger_->error("UNREGISTER {} from '{}' failed: {}", peer, ns, e.what());
  }
}

json RendezvousService::HandleDiscover(const json &request) {
  std::string ns;
  std::string cookie;
  size_t limit = MAX_DISCOVER_LIMIT;

  try {
    ns = ValidateNamespace(request, true);
    cookie = StringField(request, "cookie", Status::E_INVALID_COOKIE);
    auto limit_it = request.find("limit");
    if (limit_it != request.end() && limit_it->is_number_integer()) {
      int64_t requested = limit_it->get<int64_t>();
      if (requested > 0 && requested < static_cast<int64_t>(MAX_DISCOVER_LIMIT)) {
        limit = static_cast<size_t>(requested);
      }
    }
  } catch (const StatusError &e) {
    return DiscoverResponse(e.status, e.text);
  }

  if (!store_.is_open()) {
    return DiscoverResponse(Status::E_UNAVAILABLE, "registration store unavailable");
  }

  DiscoverResult result;
  try {
    result = store_.Discover(ns, cookie, limit);
  } catch (const Error &e) {
    if (e.code() == ErrorCode::InvalidArgument) {
      return DiscoverResponse(Status::E_INVALID_COOKIE, "bad cookie");
    }
    logger_->error("DISCOVER in '{}' failed: {}", ns, e.what());
    return DiscoverResponse(Status::E_INTERNAL_ERROR, "internal error");
  }

  int64_t now = util::GetTime();
  json registrations = json::array();
  for (const auto &r : result.registrations) {
    registrations.push_back({{"ns", r.ns},
                             {"peer", {{"id", r.peer}, {"addrs", r.addrs}}},
                             {"ttl", r.expiry - now}});
  }

  json reply = DiscoverResponse(Status::OK, "");
  reply["registrations"] = std::move(registrations);
  reply["cookie"] = result.cookie;
  logger_->debug("DISCOVER '{}' returned {} registrations", ns,
                 result.registrations.size());
  return reply;
}

} // namespace rendezvous
} // namespace rdvp
