// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Listen address resolution

 Turns operator-supplied address strings into multiaddrs. Each input goes
 through two stages:

   1. Structured: strict multiaddr parse ("/ip4/0.0.0.0/tcp/4040")
   2. Host:port:  "host:port" is rewritten to "/ip4/<host>/tcp/<port>/"
                  (empty host -> 127.0.0.1) and parsed strictly again

 The host must be empty or an IPv4 literal. Hostnames are not looked up,
 so "localhost:9999" is rejected, as is "1.2.3.4/udp/9:4040" which would
 otherwise splice extra segments into the address.
*/

#include "network/multiaddr.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rdvp {
namespace network {

enum class ResolutionStage {
  Structured,
  HostPort,
};

struct ResolvedAddress {
  Multiaddr addr;
  ResolutionStage stage;
};

// Stage 1
std::optional<Multiaddr> ParseStructured(const std::string &input,
                                         std::string *error = nullptr);

/**
 * Stage 2 rewrite (no parsing)
 *
 * @return "/ip4/<host>/tcp/<port>/" or std::nullopt if input does not
 *         have host:port shape or host is not an IPv4 literal (error
 *         receives the reason)
 */
std::optional<std::string> RewriteHostPort(const std::string &input,
                                           std::string *error = nullptr);

/**
 * Resolve one input through both stages
 *
 * Throws util::Error(AddressParseError) naming the input. The reported cause
 * is the stage 2 parse error when the input had host:port shape, otherwise
 * the stage 1 error.
 */
ResolvedAddress ResolveAddress(const std::string &input);

/**
 * Resolve every input, all-or-nothing
 *
 * Output order equals input order. The first failing input aborts the call
 * with util::Error(AddressParseError).
 */
std::vector<Multiaddr> ResolveAll(const std::vector<std::string> &inputs);

// Comma-separated list ("a,b" -> {"a", "b"}, "" -> {""})
std::vector<std::string> SplitAddressList(const std::string &csv);

} // namespace network
} // namespace rdvp
