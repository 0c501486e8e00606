// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/multiaddr.hpp"
#include "crypto/identity.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

namespace rdvp {
namespace network {

namespace {

struct ProtocolInfo {
  Protocol protocol;
  const char *name;
  bool has_value;
};

constexpr ProtocolInfo PROTOCOLS[] = {
    {Protocol::IP4, "ip4", true},
    {Protocol::IP6, "ip6", true},
    {Protocol::DNS, "dns", true},
    {Protocol::DNS4, "dns4", true},
    {Protocol::DNS6, "dns6", true},
    {Protocol::TCP, "tcp", true},
    {Protocol::UDP, "udp", true},
    {Protocol::QUIC, "quic", false},
    {Protocol::QUIC_V1, "quic-v1", false},
    {Protocol::P2P, "p2p", true},
    {Protocol::P2P_CIRCUIT, "p2p-circuit", false},
    {Protocol::WS, "ws", false},
};

const ProtocolInfo *FindProtocol(const std::string &name) {
  if (name == "ipfs") {
    return FindProtocol("p2p");
  }
  for (const auto &info : PROTOCOLS) {
    if (name == info.name) {
      return &info;
    }
  }
  return nullptr;
}

// Validate and canonicalize a component value; empty optional on error
std::optional<std::string> TranscodeValue(Protocol protocol,
                                          const std::string &value,
                                          std::string &reason) {
  switch (protocol) {
  case Protocol::IP4: {
    auto ip = util::ValidateAndNormalizeIP(value);
    if (!ip || !util::ParseIPv4(*ip)) {
      reason = "failed to parse ip4 addr";
      return std::nullopt;
    }
    return ip;
  }
  case Protocol::IP6: {
    auto ip = util::ParseIPv6(value);
    if (!ip) {
      reason = "failed to parse ip6 addr";
      return std::nullopt;
    }
    return ip;
  }
  case Protocol::DNS:
  case Protocol::DNS4:
  case Protocol::DNS6:
    if (value.empty()) {
      reason = "empty dns addr";
      return std::nullopt;
    }
    return value;
  case Protocol::TCP:
  case Protocol::UDP: {
    auto port = util::SafeParsePort(value);
    if (!port) {
      reason = "failed to parse port";
      return std::nullopt;
    }
    return std::to_string(*port);
  }
  case Protocol::P2P:
    if (!crypto::PeerId::FromString(value)) {
      reason = "failed to parse p2p addr";
      return std::nullopt;
    }
    return value;
  default:
    return value;
  }
}

} // anonymous namespace

const char *ProtocolName(Protocol protocol) {
  for (const auto &info : PROTOCOLS) {
    if (info.protocol == protocol) {
      return info.name;
    }
  }
  return "unknown";
}

std::optional<Multiaddr> Multiaddr::Parse(const std::string &str,
                                          std::string *error) {
  auto fail = [&](const std::string &reason) -> std::optional<Multiaddr> {
    if (error) {
      *error = "failed to parse multiaddr \"" + str + "\": " + reason;
    }
    return std::nullopt;
  };

  std::string trimmed = str;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }

  std::vector<std::string> parts = util::SplitString(trimmed, '/');
  if (!parts[0].empty()) {
    return fail("must begin with /");
  }
  if (parts.size() == 1) {
    return fail("empty multiaddr");
  }

  std::vector<MultiaddrComponent> components;
  for (size_t i = 1; i < parts.size(); ++i) {
    const ProtocolInfo *info = FindProtocol(parts[i]);
    if (!info) {
      return fail("unknown protocol " + parts[i]);
    }
    if (!info->has_value) {
      components.push_back({info->protocol, ""});
      continue;
    }
    if (i + 1 >= parts.size()) {
      return fail("unexpected end of multiaddr");
    }
    const std::string &raw = parts[++i];
    std::string reason;
    auto value = TranscodeValue(info->protocol, raw, reason);
    if (!value) {
      return fail("invalid value \"" + raw + "\" for protocol " + info->name +
                  ": " + reason);
    }
    components.push_back({info->protocol, *value});
  }

  return Multiaddr(std::move(components));
}

std::string Multiaddr::ToString() const {
  std::string out;
  for (const auto &component : components_) {
    out += '/';
    out += ProtocolName(component.protocol);
    if (!component.value.empty()) {
      out += '/';
      out += component.value;
    }
  }
  return out;
}

Multiaddr Multiaddr::Encapsulate(const Multiaddr &other) const {
  std::vector<MultiaddrComponent> combined = components_;
  combined.insert(combined.end(), other.components_.begin(),
                  other.components_.end());
  return Multiaddr(std::move(combined));
}

bool Multiaddr::HasProtocol(Protocol protocol) const {
  return ValueForProtocol(protocol).has_value();
}

std::optional<std::string> Multiaddr::ValueForProtocol(Protocol protocol) const {
  for (const auto &component : components_) {
    if (component.protocol == protocol) {
      return component.value;
    }
  }
  return std::nullopt;
}

} // namespace network
} // namespace rdvp
