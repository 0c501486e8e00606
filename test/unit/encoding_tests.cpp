// Unit tests for base64, base58 and uvarint helpers
#include <catch2/catch_test_macros.hpp>
#include "util/encoding.hpp"
#include <string>

using namespace rdvp::util;

namespace {
std::vector<uint8_t> Bytes(const std::string &s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
}

TEST_CASE("Base64 - RFC 4648 vectors", "[util][encoding]") {
    REQUIRE(EncodeBase64(Bytes("")) == "");
    REQUIRE(EncodeBase64(Bytes("f")) == "Zg==");
    REQUIRE(EncodeBase64(Bytes("fo")) == "Zm8=");
    REQUIRE(EncodeBase64(Bytes("foo")) == "Zm9v");
    REQUIRE(EncodeBase64(Bytes("foobar")) == "Zm9vYmFy");

    REQUIRE(DecodeBase64("Zg==") == Bytes("f"));
    REQUIRE(DecodeBase64("Zm8=") == Bytes("fo"));
    REQUIRE(DecodeBase64("Zm9vYmFy") == Bytes("foobar"));
}

TEST_CASE("Base64 - strict decoding", "[util][encoding]") {
    SECTION("Missing padding") {
        REQUIRE_FALSE(DecodeBase64("Zg").has_value());
    }
    SECTION("Padding in the middle") {
        REQUIRE_FALSE(DecodeBase64("Zg==Zm9v").has_value());
    }
    SECTION("Characters outside the alphabet") {
        REQUIRE_FALSE(DecodeBase64("Zm9v!mFy").has_value());
        REQUIRE_FALSE(DecodeBase64("Zm9v YmFy").has_value());
        REQUIRE_FALSE(DecodeBase64("Zm9v-mFy").has_value());
    }
    SECTION("Whitespace is not skipped") {
        REQUIRE_FALSE(DecodeBase64("Zm9v\n").has_value());
    }
}

TEST_CASE("Base58 - bitcoin alphabet", "[util][encoding]") {
    REQUIRE(EncodeBase58(Bytes("hello world")) == "StV1DL6CwTryKyV");
    REQUIRE(DecodeBase58("StV1DL6CwTryKyV") == Bytes("hello world"));

    SECTION("Leading zero bytes map to '1'") {
        std::vector<uint8_t> data = {0, 0, 1};
        REQUIRE(EncodeBase58(data) == "112");
        REQUIRE(DecodeBase58("112") == data);
    }

    SECTION("Invalid characters are rejected") {
        REQUIRE_FALSE(DecodeBase58("0OIl").has_value());
        REQUIRE_FALSE(DecodeBase58("abc+").has_value());
    }
}

TEST_CASE("Uvarint - encoding and limits", "[util][encoding]") {
    std::vector<uint8_t> out;
    WriteUvarint(out, 300);
    REQUIRE(out == std::vector<uint8_t>{0xac, 0x02});

    uint64_t value = 0;
    REQUIRE(ReadUvarint(out, value) == 2);
    REQUIRE(value == 300);

    SECTION("Truncated input") {
        std::vector<uint8_t> partial = {0xac};
        REQUIRE(ReadUvarint(partial, value) == 0);
        REQUIRE(ReadUvarint({}, value) == 0);
    }

    SECTION("Maximum value takes ten bytes") {
        std::vector<uint8_t> max;
        WriteUvarint(max, UINT64_MAX);
        REQUIRE(max.size() == 10);
        REQUIRE(ReadUvarint(max, value) == 10);
        REQUIRE(value == UINT64_MAX);
    }

    SECTION("Overflow is reported") {
        std::vector<uint8_t> overflow(9, 0xff);
        overflow.push_back(0x02);
        REQUIRE(ReadUvarint(overflow, value) < 0);
    }
}
