// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Node identity: asymmetric keypair and the peer id derived from it

 Serialized private key (what genkey prints and --pk accepts):

   base64( envelope )
   envelope = 0x08 <key type varint> 0x12 <length varint> <key data>

   key type  data
   0 RSA     PKCS#1 RSAPrivateKey DER (>= 2048 bits)
   1 Ed25519 32-byte seed || 32-byte public key

 The public key uses the same envelope; RSA data is a PKIX
 SubjectPublicKeyInfo DER, Ed25519 data the raw 32-byte key.

 Peer id = multihash of the marshalled public key envelope: identity hash
 (0x00) when the envelope is at most 42 bytes, SHA2-256 (0x12) otherwise,
 rendered base58btc.

 All failures throw util::Error:
   DecodeError     base64 decoding failed
   KeyFormatError  envelope or key data malformed, unsupported type
   KeyGenError     key generation failed
*/

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace rdvp {
namespace crypto {

enum class KeyType : uint64_t {
  RSA = 0,
  Ed25519 = 1,
};

const char *KeyTypeName(KeyType type);

constexpr int DEFAULT_RSA_BITS = 2048;
constexpr int MIN_RSA_BITS = 2048;

class PublicKey {
public:
  KeyType type() const { return type_; }

  // Envelope bytes (input to the peer id hash)
  std::vector<uint8_t> Marshal() const;

  bool operator==(const PublicKey &other) const;

private:
  friend class PrivateKey;
  PublicKey(KeyType type, std::shared_ptr<EVP_PKEY> pkey)
      : type_(type), pkey_(std::move(pkey)) {}

  KeyType type_;
  std::shared_ptr<EVP_PKEY> pkey_;
};

class PrivateKey {
public:
  KeyType type() const { return type_; }

  // Modulus size for RSA, 256 for Ed25519
  int bits() const;

  PublicKey GetPublic() const;

  // Envelope bytes
  std::vector<uint8_t> Marshal() const;

  // Parse envelope bytes (throws KeyFormatError)
  static PrivateKey Unmarshal(std::span<const uint8_t> data);

  // Same type and same marshalled bytes
  bool operator==(const PrivateKey &other) const;

private:
  friend PrivateKey GenerateKey(KeyType type, int bits);
  PrivateKey(KeyType type, std::shared_ptr<EVP_PKEY> pkey)
      : type_(type), pkey_(std::move(pkey)) {}

  KeyType type_;
  std::shared_ptr<EVP_PKEY> pkey_;
};

class PeerId {
public:
  static PeerId FromPublicKey(const PublicKey &key);

  // Parse base58btc multihash; std::nullopt if malformed
  static std::optional<PeerId> FromString(const std::string &str);

  const std::vector<uint8_t> &bytes() const { return multihash_; }
  std::string ToString() const;

  bool operator==(const PeerId &) const = default;

private:
  explicit PeerId(std::vector<uint8_t> multihash) : multihash_(std::move(multihash)) {}

  std::vector<uint8_t> multihash_;
};

/**
 * Generate a fresh keypair from OpenSSL's CSPRNG
 * @param bits RSA modulus size (ignored for Ed25519)
 */
PrivateKey GenerateKey(KeyType type = KeyType::RSA, int bits = DEFAULT_RSA_BITS);

/**
 * Decode a serialized key (strict base64, then envelope)
 */
PrivateKey LoadKey(const std::string &encoded);

// Inverse of LoadKey
std::string SerializeKey(const PrivateKey &key);

/**
 * Identity policy: LoadKey when encoded is non-empty, GenerateKey otherwise
 */
PrivateKey AcquireIdentity(const std::string &encoded);

} // namespace crypto
} // namespace rdvp
