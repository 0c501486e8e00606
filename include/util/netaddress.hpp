#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Split "host:port" strings the way Go's net.SplitHostPort does

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseIPv4 / ParseIPv6: family-specific literal checks
 - SplitHostPort: "host:port", "[v6]:port" and ":port" (empty host)
*/

#include <optional>
#include <string>

namespace rdvp {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4). Hostnames are rejected.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:0db8::0001" -> "2001:db8::1"
 *   "localhost" -> std::nullopt
 *   "" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

/**
 * Strict dotted-quad IPv4 literal
 * @return canonical form, or std::nullopt
 */
std::optional<std::string> ParseIPv4(const std::string& address);

/**
 * IPv6 literal (no brackets, no zone)
 * @return canonical form, or std::nullopt
 */
std::optional<std::string> ParseIPv6(const std::string& address);

/**
 * Split "host:port" into host and port
 *
 * Port is not validated (it may be empty or non-numeric); the host may be
 * empty (":4040"). Brackets are required around hosts containing ':'.
 *
 * @param error if non-null, receives the reason on failure
 * @return true if the string has host:port shape
 *
 * Examples:
 *   "127.0.0.1:4040" -> ("127.0.0.1", "4040")
 *   "[::1]:4040" -> ("::1", "4040")
 *   ":4040" -> ("", "4040")
 *   "127.0.0.1" -> false (missing port in address)
 *   "::1:4040" -> false (too many colons in address)
 */
bool SplitHostPort(const std::string& hostport, std::string& out_host,
                   std::string& out_port, std::string* error = nullptr);

} // namespace util
} // namespace rdvp
