// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and environment values
 - Centralized input validation to prevent crashes from malformed input

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (0-65535)
 - ParseBool: Parse boolean switches (1/t/true, 0/f/false, any case of T/TRUE/True)
 - SplitString: Split on a single delimiter, keeping empty fields

 All parsers validate the entire input is consumed and return std::nullopt
 on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rdvp {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse port number string
 *
 * Port 0 is accepted: listen addresses use it to request an ephemeral port.
 *
 * Examples:
 *   SafeParsePort("4040") -> 4040
 *   SafeParsePort("0") -> 0
 *   SafeParsePort("65536") -> std::nullopt (out of range)
 *   SafeParsePort("+80") -> std::nullopt (sign not allowed)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse boolean string
 *
 * Accepts 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False.
 */
std::optional<bool> ParseBool(const std::string& str);

/**
 * Split on every occurrence of delim
 *
 * Empty fields are kept: SplitString("", ',') -> {""},
 * SplitString("a,,b", ',') -> {"a", "", "b"}
 */
std::vector<std::string> SplitString(const std::string& str, char delim);

} // namespace util
} // namespace rdvp
