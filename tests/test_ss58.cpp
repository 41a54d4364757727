#include <catch2/catch_test_macros.hpp>

#include "crypto/ss58.hpp"
#include "helpers.hpp"
#include "test_helpers.hpp"

using keyshield::utils::bytes_to_hex;
using keyshield::utils::hex_to_bytes;
using keyshield::utils::to_bytes;
using test_helpers::Bytes;

TEST_CASE("Base58", "[ss58]") {
    SECTION("Known encoding") {
        REQUIRE(ss58::base58_encode(to_bytes("Hello World!")) == "2NEpo7TZRRrLZSi2U");
        REQUIRE(ss58::base58_decode("2NEpo7TZRRrLZSi2U") == to_bytes("Hello World!"));
    }

    SECTION("Leading zero bytes become leading ones") {
        Bytes data = {0x00, 0x00, 0x01};
        std::string encoded = ss58::base58_encode(data);
        REQUIRE(encoded.substr(0, 2) == "11");
        REQUIRE(ss58::base58_decode(encoded) == data);
    }

    SECTION("Characters outside the alphabet are rejected") {
        REQUIRE_THROWS_AS(ss58::base58_decode("0OIl"), ss58::Ss58Error);
    }
}

TEST_CASE("SS58 addresses", "[ss58]") {
    SECTION("Decodes well-known development account") {
        auto decoded = ss58::decode("5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQY");
        REQUIRE(decoded.prefix == ss58::DEFAULT_PREFIX);
        REQUIRE(bytes_to_hex(decoded.account) ==
                "d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d");
    }

    SECTION("Decodes a signer account used by wallet-signed requests") {
        auto decoded = ss58::decode("5Cf8PBw7QiRFNPBTnUoks9Hvkzn8av1qfcgMtSppJvjYcxp6");
        REQUIRE(bytes_to_hex(decoded.account) ==
                "1a40e806c28a32dbac60f2b088c77a9ac3d3702011ac0e13579402ddcc214308");
    }

    SECTION("Encode reproduces the address") {
        Bytes account = hex_to_bytes("d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d");
        REQUIRE(ss58::encode(account) == "5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQY");
    }

    SECTION("Two-byte network prefixes") {
        Bytes account = test_helpers::random_bytes(32);
        std::string address = ss58::encode(account, 7391);
        auto decoded = ss58::decode(address);
        REQUIRE(decoded.prefix == 7391);
        REQUIRE(decoded.account == account);
    }

    SECTION("Corrupted checksum is rejected") {
        std::string address = "5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQY";
        address[10] = address[10] == 'a' ? 'b' : 'a';
        REQUIRE_THROWS_AS(ss58::decode(address), ss58::Ss58Error);
    }

    SECTION("Garbage input is rejected") {
        REQUIRE_THROWS_AS(ss58::decode(""), ss58::Ss58Error);
        REQUIRE_THROWS_AS(ss58::decode("not-an-address"), ss58::Ss58Error);
        REQUIRE_THROWS_AS(ss58::decode("5Grwva"), ss58::Ss58Error);
    }
}
