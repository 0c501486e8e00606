// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/encoding.hpp"
#include <algorithm>
#include <openssl/evp.h>

namespace rdvp {
namespace util {

namespace {

constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

bool IsBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

int Base58Index(char c) {
  const char *pos = std::find(BASE58_ALPHABET, BASE58_ALPHABET + 58, c);
  if (pos == BASE58_ALPHABET + 58) {
    return -1;
  }
  return static_cast<int>(pos - BASE58_ALPHABET);
}

} // namespace

std::string EncodeBase64(std::span<const uint8_t> data) {
  if (data.empty()) {
    return "";
  }
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                          data.data(), static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(n));
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase64(std::string_view encoded) {
  if (encoded.empty()) {
    return std::vector<uint8_t>{};
  }
  if (encoded.size() % 4 != 0) {
    return std::nullopt;
  }

  size_t padding = 0;
  for (size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      // Padding only in the final two positions, and only at the tail
      if (i < encoded.size() - 2) {
        return std::nullopt;
      }
      ++padding;
    } else if (padding > 0 || !IsBase64Char(c)) {
      return std::nullopt;
    }
  }

  std::vector<uint8_t> out(encoded.size() / 4 * 3);
  int n = EVP_DecodeBlock(out.data(),
                          reinterpret_cast<const unsigned char *>(encoded.data()),
                          static_cast<int>(encoded.size()));
  if (n < 0 || static_cast<size_t>(n) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts the zero bytes produced by padding
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

std::string EncodeBase58(std::span<const uint8_t> data) {
  size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) {
    ++zeros;
  }

  // log(256) / log(58), rounded up
  std::vector<uint8_t> b58((data.size() - zeros) * 138 / 100 + 1, 0);
  size_t length = 0;
  for (size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    size_t j = 0;
    for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend();
         ++it, ++j) {
      carry += 256 * (*it);
      *it = static_cast<uint8_t>(carry % 58);
      carry /= 58;
    }
    length = j;
  }

  auto it = b58.begin() + static_cast<std::ptrdiff_t>(b58.size() - length);
  while (it != b58.end() && *it == 0) {
    ++it;
  }

  std::string out(zeros, '1');
  for (; it != b58.end(); ++it) {
    out += BASE58_ALPHABET[*it];
  }
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view encoded) {
  size_t zeros = 0;
  while (zeros < encoded.size() && encoded[zeros] == '1') {
    ++zeros;
  }

  // log(58) / log(256), rounded up
  std::vector<uint8_t> b256((encoded.size() - zeros) * 733 / 1000 + 1, 0);
  size_t length = 0;
  for (size_t i = zeros; i < encoded.size(); ++i) {
    int carry = Base58Index(encoded[i]);
    if (carry < 0) {
      return std::nullopt;
    }
    size_t j = 0;
    for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend();
         ++it, ++j) {
      carry += 58 * (*it);
      *it = static_cast<uint8_t>(carry % 256);
      carry /= 256;
    }
    length = j;
  }

  auto it = b256.begin() + static_cast<std::ptrdiff_t>(b256.size() - length);
  std::vector<uint8_t> out(zeros, 0);
  out.insert(out.end(), it, b256.end());
  return out;
}

void WriteUvarint(std::vector<uint8_t> &out, uint64_t value) {
  while (value >= 0x80) {
    out.push_back(static_cast<uint8_t>(value | 0x80));
    value >>= 7;
  }
  out.push_back(static_cast<uint8_t>(value));
}

int ReadUvarint(std::span<const uint8_t> data, uint64_t &value) {
  uint64_t result = 0;
  unsigned shift = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    uint8_t b = data[i];
    if (i == 9 && b > 1) {
      return -static_cast<int>(i + 1);
    }
    if (b < 0x80) {
      value = result | (static_cast<uint64_t>(b) << shift);
      return static_cast<int>(i + 1);
    }
    result |= static_cast<uint64_t>(b & 0x7f) << shift;
    shift += 7;
  }
  return 0;
}

} // namespace util
} // namespace rdvp
