/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include <crypto.hpp>

#include <vector>

using namespace gamecast::crypto;

TEST_CASE("session keys are random and never empty", "[crypto]") {
    SessionKeys a, b;
    REQUIRE_FALSE(a.valid());
    REQUIRE(generate_session_keys(a));
    REQUIRE(generate_session_keys(b));
    REQUIRE(a.valid());
    REQUIRE(b.valid());
    REQUIRE_FALSE(a == b);
}

TEST_CASE("sealed input opens only under the same keys", "[crypto]") {
    SessionKeys keys;
    REQUIRE(generate_session_keys(keys));
    const std::vector<uint8_t> plain{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17};

    std::vector<uint8_t> sealed;
    REQUIRE(seal(keys, plain.data(), plain.size(), sealed));
    REQUIRE(sealed.size() == plain.size() + SEAL_OVERHEAD);

    std::vector<uint8_t> opened;
    REQUIRE(open(keys, sealed.data(), sealed.size(), opened));
    REQUIRE(opened == plain);

    // fresh IV per seal
    std::vector<uint8_t> again;
    REQUIRE(seal(keys, plain.data(), plain.size(), again));
    REQUIRE(again != sealed);

    SECTION("a flipped ciphertext bit fails") {
        sealed[SEAL_IV_SIZE + 3] ^= 0x01;
        REQUIRE_FALSE(open(keys, sealed.data(), sealed.size(), opened));
    }
    SECTION("a flipped tag bit fails") {
        sealed.back() ^= 0x80;
        REQUIRE_FALSE(open(keys, sealed.data(), sealed.size(), opened));
    }
    SECTION("another key id fails") {
        SessionKeys other = keys;
        other.key_id ^= 1;
        REQUIRE_FALSE(open(other, sealed.data(), sealed.size(), opened));
    }
    SECTION("another key fails") {
        SessionKeys other = keys;
        other.key[0] ^= 0xFF;
        REQUIRE_FALSE(open(other, sealed.data(), sealed.size(), opened));
    }
    SECTION("truncated input fails") {
        REQUIRE_FALSE(open(keys, sealed.data(), SEAL_OVERHEAD - 1, opened));
        REQUIRE_FALSE(open(keys, sealed.data(), sealed.size() - 1, opened));
    }
}

TEST_CASE("an empty body still carries a tag", "[crypto]") {
    SessionKeys keys;
    REQUIRE(generate_session_keys(keys));
    std::vector<uint8_t> sealed;
    REQUIRE(seal(keys, nullptr, 0, sealed));
    REQUIRE(sealed.size() == SEAL_OVERHEAD);
    std::vector<uint8_t> opened{0xAA};
    REQUIRE(open(keys, sealed.data(), sealed.size(), opened));
    REQUIRE(opened.empty());
}
