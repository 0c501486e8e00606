// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>

namespace rdvp {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  // Digits only: std::stol would accept "+80" and "-0"
  if (str.empty() || str.size() > 5) {
    return std::nullopt;
  }
  for (char c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }

  auto value = SafeParseInt(str, 0, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<bool> ParseBool(const std::string& str) {
  if (str == "1" || str == "t" || str == "T" || str == "TRUE" ||
      str == "true" || str == "True") {
    return true;
  }
  if (str == "0" || str == "f" || str == "F" || str == "FALSE" ||
      str == "false" || str == "False") {
    return false;
  }
  return std::nullopt;
}

std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    size_t next = str.find(delim, pos);
    if (next == std::string::npos) {
      parts.push_back(str.substr(pos));
      break;
    }
    parts.push_back(str.substr(pos, next - pos));
    pos = next + 1;
  }
  return parts;
}

} // namespace util
} // namespace rdvp
