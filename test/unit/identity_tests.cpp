// Unit tests for key generation, key envelopes and peer ids
#include <catch2/catch_test_macros.hpp>
#include "crypto/identity.hpp"
#include "util/encoding.hpp"
#include "util/error.hpp"
#include <openssl/rsa.h>
#include <openssl/x509.h>

using namespace rdvp::crypto;
using rdvp::util::Error;
using rdvp::util::ErrorCode;

namespace {

ErrorCode LoadErrorCode(const std::string &encoded) {
    try {
        LoadKey(encoded);
    } catch (const Error &e) {
        return e.code();
    }
    FAIL("LoadKey accepted " << encoded);
    return ErrorCode::Internal;
}

std::string Envelope(uint8_t type, const std::vector<uint8_t> &data) {
    std::vector<uint8_t> out = {0x08, type, 0x12};
    rdvp::util::WriteUvarint(out, data.size());
    out.insert(out.end(), data.begin(), data.end());
    return rdvp::util::EncodeBase64(out);
}

// PKCS#1 DER of a freshly generated RSA key of the given size
std::vector<uint8_t> RsaDer(int bits) {
    EVP_PKEY *pkey = EVP_RSA_gen(static_cast<unsigned int>(bits));
    REQUIRE(pkey != nullptr);
    unsigned char *der = nullptr;
    int len = i2d_PrivateKey(pkey, &der);
    REQUIRE(len > 0);
    std::vector<uint8_t> out(der, der + len);
    OPENSSL_free(der);
    EVP_PKEY_free(pkey);
    return out;
}

} // namespace

TEST_CASE("GenerateKey - RSA default", "[crypto][identity]") {
    PrivateKey key = GenerateKey();
    REQUIRE(key.type() == KeyType::RSA);
    REQUIRE(key.bits() == 2048);

    SECTION("Serialize and load give the same key") {
        std::string encoded = SerializeKey(key);
        PrivateKey loaded = LoadKey(encoded);
        REQUIRE(loaded == key);
        REQUIRE(SerializeKey(loaded) == encoded);
        REQUIRE(PeerId::FromPublicKey(loaded.GetPublic()) ==
                PeerId::FromPublicKey(key.GetPublic()));
    }

    SECTION("RSA peer ids are sha256 multihashes") {
        std::string id = PeerId::FromPublicKey(key.GetPublic()).ToString();
        REQUIRE(id.rfind("Qm", 0) == 0);
        REQUIRE(id.size() == 46);
    }

    SECTION("Two generated keys differ") {
        REQUIRE_FALSE(GenerateKey() == key);
    }
}

TEST_CASE("GenerateKey - Ed25519", "[crypto][identity]") {
    PrivateKey key = GenerateKey(KeyType::Ed25519);
    REQUIRE(key.type() == KeyType::Ed25519);

    PrivateKey loaded = LoadKey(SerializeKey(key));
    REQUIRE(loaded == key);

    // 36-byte public envelope is inlined with the identity hash
    std::string id = PeerId::FromPublicKey(key.GetPublic()).ToString();
    REQUIRE(id.rfind("12D3KooW", 0) == 0);

    auto parsed = PeerId::FromString(id);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->ToString() == id);
}

TEST_CASE("GenerateKey - undersized RSA", "[crypto][identity]") {
    try {
        GenerateKey(KeyType::RSA, 1024);
        FAIL("1024-bit key generated");
    } catch (const Error &e) {
        REQUIRE(e.code() == ErrorCode::KeyGenError);
    }
}

TEST_CASE("LoadKey - rejects malformed input", "[crypto][identity]") {
    SECTION("Not base64") {
        REQUIRE(LoadErrorCode("not base64!") == ErrorCode::DecodeError);
        REQUIRE(LoadErrorCode("CAAS") == ErrorCode::KeyFormatError);
        REQUIRE(LoadErrorCode("CAASA") == ErrorCode::DecodeError);
    }

    SECTION("Empty and truncated envelopes") {
        REQUIRE(LoadErrorCode(rdvp::util::EncodeBase64(std::vector<uint8_t>{0x08})) ==
                ErrorCode::KeyFormatError);
        REQUIRE(LoadErrorCode(rdvp::util::EncodeBase64(std::vector<uint8_t>{0x08, 0x00})) ==
                ErrorCode::KeyFormatError);
        REQUIRE(LoadErrorCode(rdvp::util::EncodeBase64(
                    std::vector<uint8_t>{0x08, 0x01, 0x12, 0x40, 0x00})) ==
                ErrorCode::KeyFormatError);
    }

    SECTION("Unsupported key type") {
        REQUIRE(LoadErrorCode(Envelope(2, std::vector<uint8_t>(32, 1))) ==
                ErrorCode::KeyFormatError);
    }

    SECTION("Garbage RSA DER") {
        REQUIRE(LoadErrorCode(Envelope(0, std::vector<uint8_t>(64, 0x30))) ==
                ErrorCode::KeyFormatError);
    }

    SECTION("RSA key below 2048 bits") {
        REQUIRE(LoadErrorCode(Envelope(0, RsaDer(1024))) == ErrorCode::KeyFormatError);
    }

    SECTION("Trailing data after the DER") {
        std::vector<uint8_t> der = RsaDer(2048);
        der.push_back(0x00);
        REQUIRE(LoadErrorCode(Envelope(0, der)) == ErrorCode::KeyFormatError);
    }

    SECTION("RSA numbers that do not belong together") {
        // Last DER byte sits in the CRT coefficient; the framing stays valid
        std::vector<uint8_t> der = RsaDer(2048);
        der.back() ^= 0x01;
        REQUIRE(LoadErrorCode(Envelope(0, der)) == ErrorCode::KeyFormatError);

        std::vector<uint8_t> envelope = GenerateKey().Marshal();
        envelope.back() ^= 0x01;
        REQUIRE(LoadErrorCode(rdvp::util::EncodeBase64(envelope)) == ErrorCode::KeyFormatError);
    }

    SECTION("Ed25519 public half does not match the seed") {
        std::vector<uint8_t> data(64, 0x11);
        REQUIRE(LoadErrorCode(Envelope(1, data)) == ErrorCode::KeyFormatError);
    }
}

TEST_CASE("AcquireIdentity - load or generate", "[crypto][identity]") {
    SECTION("Empty string generates RSA") {
        PrivateKey key = AcquireIdentity("");
        REQUIRE(key.type() == KeyType::RSA);
        REQUIRE_FALSE(AcquireIdentity("") == key);
    }

    SECTION("Encoded key is loaded") {
        PrivateKey key = GenerateKey(KeyType::Ed25519);
        REQUIRE(AcquireIdentity(SerializeKey(key)) == key);
    }

    SECTION("Decode errors propagate") {
        try {
            AcquireIdentity("%%%");
            FAIL("invalid key accepted");
        } catch (const Error &e) {
            REQUIRE(e.code() == ErrorCode::DecodeError);
        }
    }
}

TEST_CASE("PeerId::FromString - validation", "[crypto][identity]") {
    REQUIRE_FALSE(PeerId::FromString("").has_value());
    REQUIRE_FALSE(PeerId::FromString("not-base58-0OIl").has_value());
    // Valid base58, but the digest length does not match the multihash header
    REQUIRE_FALSE(PeerId::FromString("QmYyQSo1c1Ym7orWxLYvCrM2EmxFTANf8wXmmE7DWjhx").has_value());
    REQUIRE(PeerId::FromString("QmYyQSo1c1Ym7orWxLYvCrM2EmxFTANf8wXmmE7DWjhx5N").has_value());
}
