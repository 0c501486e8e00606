// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/identity.hpp"
#include "util/encoding.hpp"
#include "util/error.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <cstring>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace rdvp {
namespace crypto {

using util::Error;
using util::ErrorCode;

namespace {

constexpr uint8_t TAG_KEY_TYPE = 0x08; // field 1, varint
constexpr uint8_t TAG_KEY_DATA = 0x12; // field 2, length-delimited

constexpr size_t ED25519_KEY_SIZE = 32;

// Multihash codes
constexpr uint8_t MH_IDENTITY = 0x00;
constexpr uint8_t MH_SHA2_256 = 0x12;
constexpr size_t MAX_INLINE_KEY_LENGTH = 42;

std::shared_ptr<EVP_PKEY> WrapPkey(EVP_PKEY *pkey) {
  return std::shared_ptr<EVP_PKEY>(pkey, EVP_PKEY_free);
}

// Drain OpenSSL's error queue into a message
std::string OpenSSLError() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

std::vector<uint8_t> MarshalEnvelope(KeyType type, const std::vector<uint8_t> &data) {
  std::vector<uint8_t> out;
  out.push_back(TAG_KEY_TYPE);
  util::WriteUvarint(out, static_cast<uint64_t>(type));
  out.push_back(TAG_KEY_DATA);
  util::WriteUvarint(out, data.size());
  out.insert(out.end(), data.begin(), data.end());
  return out;
}

struct Envelope {
  uint64_t type;
  std::span<const uint8_t> data;
};

Envelope UnmarshalEnvelope(std::span<const uint8_t> in) {
  std::optional<uint64_t> type;
  std::optional<std::span<const uint8_t>> data;

  while (!in.empty()) {
    uint8_t tag = in[0];
    in = in.subspan(1);
    uint64_t value = 0;
    int n = util::ReadUvarint(in, value);
    if (n <= 0) {
      throw Error(ErrorCode::KeyFormatError, "truncated key envelope");
    }
    in = in.subspan(static_cast<size_t>(n));

    if (tag == TAG_KEY_TYPE) {
      if (type) {
        throw Error(ErrorCode::KeyFormatError, "duplicate key type field");
      }
      type = value;
    } else if (tag == TAG_KEY_DATA) {
      if (data) {
        throw Error(ErrorCode::KeyFormatError, "duplicate key data field");
      }
      if (value > in.size()) {
        throw Error(ErrorCode::KeyFormatError, "truncated key data");
      }
      data = in.first(static_cast<size_t>(value));
      in = in.subspan(static_cast<size_t>(value));
    } else {
      throw Error(ErrorCode::KeyFormatError,
                  "unexpected field tag " + std::to_string(tag) + " in key envelope");
    }
  }

  if (!type || !data) {
    throw Error(ErrorCode::KeyFormatError, "incomplete key envelope");
  }
  return {*type, *data};
}

// DER encoders write through an advancing pointer; size first, then fill
template <typename Encoder>
std::vector<uint8_t> EncodeDer(const EVP_PKEY *pkey, Encoder encode) {
  int len = encode(pkey, nullptr);
  if (len <= 0) {
    throw Error(ErrorCode::Internal, "DER encoding failed: " + OpenSSLError());
  }
  std::vector<uint8_t> out(static_cast<size_t>(len));
  unsigned char *p = out.data();
  if (encode(pkey, &p) != len) {
    throw Error(ErrorCode::Internal, "DER encoding failed: " + OpenSSLError());
  }
  return out;
}

std::vector<uint8_t> RawEd25519(const EVP_PKEY *pkey, bool private_part) {
  std::vector<uint8_t> out(ED25519_KEY_SIZE);
  size_t len = out.size();
  int ok = private_part ? EVP_PKEY_get_raw_private_key(pkey, out.data(), &len)
                        : EVP_PKEY_get_raw_public_key(pkey, out.data(), &len);
  if (ok != 1 || len != ED25519_KEY_SIZE) {
    throw Error(ErrorCode::Internal, "ed25519 key export failed: " + OpenSSLError());
  }
  return out;
}

std::shared_ptr<EVP_PKEY> ParseRsaPrivate(std::span<const uint8_t> der) {
  const unsigned char *p = der.data();
  EVP_PKEY *raw = d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &p, static_cast<long>(der.size()));
  if (!raw) {
    throw Error(ErrorCode::KeyFormatError, "malformed RSA private key: " + OpenSSLError());
  }
  auto pkey = WrapPkey(raw);
  if (p != der.data() + der.size()) {
    throw Error(ErrorCode::KeyFormatError, "trailing data after RSA private key");
  }
  int bits = EVP_PKEY_bits(pkey.get());
  if (bits < MIN_RSA_BITS) {
    throw Error(ErrorCode::KeyFormatError,
                "RSA key of " + std::to_string(bits) + " bits is smaller than " +
                    std::to_string(MIN_RSA_BITS));
  }

  // DER framing says nothing about whether n, e, d, p, q and the CRT values agree
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr), EVP_PKEY_CTX_free);
  if (!ctx) {
    throw Error(ErrorCode::Internal, "RSA key check context: " + OpenSSLError());
  }
  if (EVP_PKEY_private_check(ctx.get()) != 1 || EVP_PKEY_pairwise_check(ctx.get()) != 1) {
    throw Error(ErrorCode::KeyFormatError, "inconsistent RSA private key: " + OpenSSLError());
  }
  return pkey;
}

std::shared_ptr<EVP_PKEY> ParseEd25519Private(std::span<const uint8_t> data) {
  // seed || public, optionally followed by a redundant copy of the public key
  if (data.size() != 2 * ED25519_KEY_SIZE && data.size() != 3 * ED25519_KEY_SIZE) {
    throw Error(ErrorCode::KeyFormatError,
                "ed25519 private key must be 64 bytes, got " + std::to_string(data.size()));
  }
  auto seed = data.first(ED25519_KEY_SIZE);
  auto pub = data.subspan(ED25519_KEY_SIZE, ED25519_KEY_SIZE);
  if (data.size() == 3 * ED25519_KEY_SIZE &&
      !std::equal(pub.begin(), pub.end(), data.begin() + 2 * ED25519_KEY_SIZE)) {
    throw Error(ErrorCode::KeyFormatError, "ed25519 private key has inconsistent public halves");
  }

  EVP_PKEY *raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                               seed.data(), seed.size());
  if (!raw) {
    throw Error(ErrorCode::KeyFormatError, "malformed ed25519 seed: " + OpenSSLError());
  }
  auto pkey = WrapPkey(raw);
  auto derived = RawEd25519(pkey.get(), false);
  if (!std::equal(derived.begin(), derived.end(), pub.begin())) {
    throw Error(ErrorCode::KeyFormatError, "ed25519 public key does not match seed");
  }
  return pkey;
}

} // anonymous namespace

const char *KeyTypeName(KeyType type) {
  switch (type) {
  case KeyType::RSA:
    return "RSA";
  case KeyType::Ed25519:
    return "Ed25519";
  }
  return "unknown";
}

// PublicKey

std::vector<uint8_t> PublicKey::Marshal() const {
  if (type_ == KeyType::RSA) {
    return MarshalEnvelope(type_, EncodeDer(pkey_.get(), [](const EVP_PKEY *k, unsigned char **pp) {
                             return i2d_PUBKEY(k, pp);
                           }));
  }
  return MarshalEnvelope(type_, RawEd25519(pkey_.get(), false));
}

bool PublicKey::operator==(const PublicKey &other) const {
  return type_ == other.type_ && Marshal() == other.Marshal();
}

// PrivateKey

int PrivateKey::bits() const { return EVP_PKEY_bits(pkey_.get()); }

PublicKey PrivateKey::GetPublic() const { return PublicKey(type_, pkey_); }

std::vector<uint8_t> PrivateKey::Marshal() const {
  if (type_ == KeyType::RSA) {
    // i2d_PrivateKey emits the type-specific (PKCS#1) form for RSA
    return MarshalEnvelope(type_, EncodeDer(pkey_.get(), [](const EVP_PKEY *k, unsigned char **pp) {
                             return i2d_PrivateKey(k, pp);
                           }));
  }
  std::vector<uint8_t> data = RawEd25519(pkey_.get(), true);
  std::vector<uint8_t> pub = RawEd25519(pkey_.get(), false);
  data.insert(data.end(), pub.begin(), pub.end());
  return MarshalEnvelope(type_, data);
}

PrivateKey PrivateKey::Unmarshal(std::span<const uint8_t> data) {
  Envelope env = UnmarshalEnvelope(data);
  switch (env.type) {
  case static_cast<uint64_t>(KeyType::RSA):
    return PrivateKey(KeyType::RSA, ParseRsaPrivate(env.data));
  case static_cast<uint64_t>(KeyType::Ed25519):
    return PrivateKey(KeyType::Ed25519, ParseEd25519Private(env.data));
  default:
    throw Error(ErrorCode::KeyFormatError,
                "unsupported key type " + std::to_string(env.type));
  }
}

bool PrivateKey::operator==(const PrivateKey &other) const {
  return type_ == other.type_ && Marshal() == other.Marshal();
}

// PeerId

PeerId PeerId::FromPublicKey(const PublicKey &key) {
  std::vector<uint8_t> envelope = key.Marshal();
  std::vector<uint8_t> multihash;

  if (envelope.size() <= MAX_INLINE_KEY_LENGTH) {
    multihash.push_back(MH_IDENTITY);
    util::WriteUvarint(multihash, envelope.size());
    multihash.insert(multihash.end(), envelope.begin(), envelope.end());
    return PeerId(std::move(multihash));
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(envelope.data(), envelope.size(), digest, &digest_len,
                 EVP_sha256(), nullptr) != 1) {
    throw Error(ErrorCode::Internal, "sha256 failed: " + OpenSSLError());
  }
  multihash.push_back(MH_SHA2_256);
  util::WriteUvarint(multihash, digest_len);
  multihash.insert(multihash.end(), digest, digest + digest_len);
  return PeerId(std::move(multihash));
}

std::optional<PeerId> PeerId::FromString(const std::string &str) {
  auto decoded = util::DecodeBase58(str);
  if (!decoded || decoded->empty()) {
    return std::nullopt;
  }

  // <code varint><length varint><digest>
  std::span<const uint8_t> rest(*decoded);
  uint64_t code = 0;
  int n = util::ReadUvarint(rest, code);
  if (n <= 0) {
    return std::nullopt;
  }
  rest = rest.subspan(static_cast<size_t>(n));
  uint64_t length = 0;
  n = util::ReadUvarint(rest, length);
  if (n <= 0 || rest.size() - static_cast<size_t>(n) != length) {
    return std::nullopt;
  }
  return PeerId(std::move(*decoded));
}

std::string PeerId::ToString() const { return util::EncodeBase58(multihash_); }

// Free functions

PrivateKey GenerateKey(KeyType type, int bits) {
  int id = type == KeyType::RSA ? EVP_PKEY_RSA : EVP_PKEY_ED25519;
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_id(id, nullptr), EVP_PKEY_CTX_free);
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw Error(ErrorCode::KeyGenError, "keygen init failed: " + OpenSSLError());
  }
  if (type == KeyType::RSA) {
    if (bits < MIN_RSA_BITS) {
      throw Error(ErrorCode::KeyGenError,
                  "RSA keys must be at least " + std::to_string(MIN_RSA_BITS) + " bits");
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) != 1) {
      throw Error(ErrorCode::KeyGenError, "keygen setup failed: " + OpenSSLError());
    }
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
    throw Error(ErrorCode::KeyGenError, "keygen failed: " + OpenSSLError());
  }

  PrivateKey key(type, WrapPkey(raw));
  util::LogManager::GetLogger("crypto")->debug("generated {} key ({} bits)",
                                               KeyTypeName(type), key.bits());
  return key;
}

PrivateKey LoadKey(const std::string &encoded) {
  auto bytes = util::DecodeBase64(encoded);
  if (!bytes) {
    throw Error(ErrorCode::DecodeError, "private key is not valid base64");
  }
  return PrivateKey::Unmarshal(*bytes);
}

std::string SerializeKey(const PrivateKey &key) {
  return util::EncodeBase64(key.Marshal());
}

PrivateKey AcquireIdentity(const std::string &encoded) {
  if (encoded.empty()) {
    return GenerateKey();
  }
  return LoadKey(encoded);
}

} // namespace crypto
} // namespace rdvp
