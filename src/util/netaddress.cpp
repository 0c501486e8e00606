#include "util/netaddress.hpp"
#include <boost/asio/ip/address.hpp>

namespace rdvp {
namespace util {

namespace {

bool Fail(std::string* error, const std::string& hostport, const char* reason) {
  if (error) {
    *error = std::string(reason) + " in address \"" + hostport + "\"";
  }
  return false;
}

} // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  // Normalize IPv4-mapped IPv6 addresses to IPv4 format
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<std::string> ParseIPv4(const std::string& address) {
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address_v4(address, ec);
  if (ec) {
    return std::nullopt;
  }
  return ip.to_string();
}

std::optional<std::string> ParseIPv6(const std::string& address) {
  // Zone ids ("fe80::1%eth0") are not part of an ip6 component
  if (address.find('%') != std::string::npos) {
    return std::nullopt;
  }
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address_v6(address, ec);
  if (ec) {
    return std::nullopt;
  }
  return ip.to_string();
}

bool SplitHostPort(const std::string& hostport, std::string& out_host,
                   std::string& out_port, std::string* error) {
  size_t bracket_open_from = 0;
  size_t bracket_close_from = 0;

  size_t last_colon = hostport.rfind(':');
  if (last_colon == std::string::npos) {
    return Fail(error, hostport, "missing port");
  }

  std::string host;
  if (!hostport.empty() && hostport[0] == '[') {
    size_t end = hostport.find(']');
    if (end == std::string::npos) {
      return Fail(error, hostport, "missing ']'");
    }
    if (end + 1 == hostport.size()) {
      return Fail(error, hostport, "missing port");
    }
    if (end + 1 != last_colon) {
      // Either ']' is not followed by ':' or there is more than one ':'
      if (hostport[end + 1] == ':') {
        return Fail(error, hostport, "too many colons");
      }
      return Fail(error, hostport, "missing port");
    }
    host = hostport.substr(1, end - 1);
    bracket_open_from = 1;
    bracket_close_from = end + 1;
  } else {
    host = hostport.substr(0, last_colon);
    if (host.find(':') != std::string::npos) {
      return Fail(error, hostport, "too many colons");
    }
  }

  if (hostport.find('[', bracket_open_from) != std::string::npos) {
    return Fail(error, hostport, "unexpected '['");
  }
  if (hostport.find(']', bracket_close_from) != std::string::npos) {
    return Fail(error, hostport, "unexpected ']'");
  }

  out_host = host;
  out_port = hostport.substr(last_colon + 1);
  return true;
}

} // namespace util
} // namespace rdvp
