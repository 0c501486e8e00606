// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Multiaddress: self-describing network address

 A multiaddr is an ordered list of (protocol, value) components written as
 "/proto/value/proto/value/...", e.g. /ip4/0.0.0.0/tcp/4040 or
 /ip4/1.2.3.4/udp/4141/quic/p2p/Qm...

 Supported protocols:
   ip4, ip6            IP literal (normalized on parse)
   dns, dns4, dns6     host name
   tcp, udp            port 0-65535
   p2p (alias ipfs)    base58btc peer id multihash
   quic, quic-v1, p2p-circuit, ws   no value

 Parse rules:
 - trailing '/' characters are ignored
 - the string must begin with '/' and name at least one protocol
 - a protocol that takes a value must be followed by one
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdvp {
namespace network {

enum class Protocol {
  IP4,
  IP6,
  DNS,
  DNS4,
  DNS6,
  TCP,
  UDP,
  QUIC,
  QUIC_V1,
  P2P,
  P2P_CIRCUIT,
  WS,
};

// Canonical protocol name ("ip4", "quic-v1", ...)
const char *ProtocolName(Protocol protocol);

struct MultiaddrComponent {
  Protocol protocol;
  std::string value; // empty for protocols without a value

  bool operator==(const MultiaddrComponent &) const = default;
};

class Multiaddr {
public:
  Multiaddr() = default;

  /**
   * Strict parse
   * @param error if non-null, receives
   *        'failed to parse multiaddr "<s>": <reason>' on failure
   */
  static std::optional<Multiaddr> Parse(const std::string &str,
                                        std::string *error = nullptr);

  // Canonical "/proto/value/..." rendering
  std::string ToString() const;

  // this followed by other ("/ip4/1.2.3.4/tcp/1" + "/p2p/Qm...")
  Multiaddr Encapsulate(const Multiaddr &other) const;

  const std::vector<MultiaddrComponent> &components() const { return components_; }
  bool empty() const { return components_.empty(); }

  bool HasProtocol(Protocol protocol) const;

  // Value of the first component with this protocol
  std::optional<std::string> ValueForProtocol(Protocol protocol) const;

  bool operator==(const Multiaddr &) const = default;

private:
  explicit Multiaddr(std::vector<MultiaddrComponent> components)
      : components_(std::move(components)) {}

  std::vector<MultiaddrComponent> components_;
};

} // namespace network
} // namespace rdvp
