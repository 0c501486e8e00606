// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address_resolver.hpp"
#include "util/error.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

namespace rdvp {
namespace network {

namespace {
constexpr const char *DEFAULT_FALLBACK_HOST = "127.0.0.1";
}

std::optional<Multiaddr> ParseStructured(const std::string &input,
                                         std::string *error) {
  return Multiaddr::Parse(input, error);
}

std::optional<std::string> RewriteHostPort(const std::string &input,
                                           std::string *error) {
  std::string host;
  std::string port;
  if (!util::SplitHostPort(input, host, port, error)) {
    return std::nullopt;
  }
  if (host.empty()) {
    host = DEFAULT_FALLBACK_HOST;
  } else if (!util::ParseIPv4(host)) {
    // Only an IPv4 literal may be spliced in; anything else could add segments
    if (error) {
      *error = "failed to parse ip4 addr \"" + host + "\": not an IPv4 literal";
    }
    return std::nullopt;
  }
  return "/ip4/" + host + "/tcp/" + port + "/";
}

ResolvedAddress ResolveAddress(const std::string &input) {
  std::string structured_error;
  if (auto addr = ParseStructured(input, &structured_error)) {
    return {*addr, ResolutionStage::Structured};
  }

  std::string cause = structured_error;
  std::string host;
  std::string port;
  if (util::SplitHostPort(input, host, port)) {
    std::string hostport_error;
    if (auto rewritten = RewriteHostPort(input, &hostport_error)) {
      if (auto addr = Multiaddr::Parse(*rewritten, &hostport_error)) {
        return {*addr, ResolutionStage::HostPort};
      }
    }
    cause = hostport_error;
  }

  throw util::Error(util::ErrorCode::AddressParseError,
                    "invalid listen address \"" + input + "\": " + cause);
}

std::vector<Multiaddr> ResolveAll(const std::vector<std::string> &inputs) {
  std::vector<Multiaddr> out;
  out.reserve(inputs.size());
  for (const auto &input : inputs) {
    out.push_back(ResolveAddress(input).addr);
  }
  return out;
}

std::vector<std::string> SplitAddressList(const std::string &csv) {
  return util::SplitString(csv, ',');
}

} // namespace network
} // namespace rdvp
