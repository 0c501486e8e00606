// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Binary encodings used on the wire and on the command line

 - Base64: RFC 4648 standard alphabet with padding (keys printed by genkey)
 - Base58: bitcoin alphabet (peer ids, "base58btc")
 - Uvarint: unsigned LEB128 (length prefixes, protobuf fields, multihash)
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rdvp {
namespace util {

std::string EncodeBase64(std::span<const uint8_t> data);

/**
 * Strict standard base64 decode
 *
 * Rejects: length not a multiple of 4, characters outside the alphabet
 * (including whitespace), padding anywhere but the last two positions.
 */
std::optional<std::vector<uint8_t>> DecodeBase64(std::string_view encoded);

std::string EncodeBase58(std::span<const uint8_t> data);
std::optional<std::vector<uint8_t>> DecodeBase58(std::string_view encoded);

// Append value as unsigned varint
void WriteUvarint(std::vector<uint8_t> &out, uint64_t value);

/**
 * Read an unsigned varint from the front of data
 *
 * @return n > 0: bytes consumed, value set
 *         n == 0: data ends before the varint does
 *         n < 0: value overflows 64 bits (-n bytes were examined)
 */
int ReadUvarint(std::span<const uint8_t> data, uint64_t &value);

} // namespace util
} // namespace rdvp
