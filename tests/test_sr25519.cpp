#include <catch2/catch_test_macros.hpp>

#include "crypto/ristretto.hpp"
#include "crypto/sr25519.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using sr25519::PublicKey;
using sr25519::SignatureError;
using sr25519::SignatureFault;

TEST_CASE("Ristretto group wrapper", "[ristretto]") {
    init_crypto();

    SECTION("Scalar arithmetic") {
        auto a = ristretto::Scalar::get_random();
        auto b = ristretto::Scalar::get_random();
        REQUIRE(a + b == b + a);
        REQUIRE(a * b == b * a);
        REQUIRE((a + a.negate()).is_zero());
    }

    SECTION("Non-canonical scalars are rejected") {
        Bytes all_ones(32, 0xFF);
        REQUIRE_FALSE(ristretto::Scalar::is_canonical(all_ones));
        REQUIRE_THROWS_AS(ristretto::Scalar::from_bytes(all_ones), ristretto::GroupError);
    }

    SECTION("Point multiplication distributes over scalar addition") {
        auto a = ristretto::Scalar::get_random();
        auto b = ristretto::Scalar::get_random();
        auto lhs = ristretto::Point::base_mul(a + b);
        auto rhs = ristretto::Point::base_mul(a).add(ristretto::Point::base_mul(b));
        REQUIRE(lhs == rhs);
    }

    SECTION("Invalid encodings are rejected") {
        Bytes bad(32, 0xFF);
        REQUIRE_FALSE(ristretto::Point::is_valid(bad));
        REQUIRE_THROWS_AS(ristretto::Point::from_bytes(bad), ristretto::GroupError);
    }
}

TEST_CASE("sr25519 signatures", "[sr25519]") {
    init_crypto();

    SECTION("Sign and verify") {
        auto kp = sr25519::keygen();
        auto sig = sr25519::sign(kp, std::string("hello keyshare"));
        REQUIRE(sr25519::verify(sig, std::string("hello keyshare"), kp.public_key));
        REQUIRE((sig.to_bytes()[63] & 0x80) != 0);
    }

    SECTION("Wrong key or message fails") {
        auto kp = sr25519::keygen();
        auto other = sr25519::keygen();
        auto sig = sr25519::sign(kp, std::string("message"));
        REQUIRE_FALSE(sr25519::verify(sig, std::string("message"), other.public_key));
        REQUIRE_FALSE(sr25519::verify(sig, std::string("messagf"), kp.public_key));
    }

    SECTION("Flipping any signature byte fails verification") {
        auto kp = sr25519::keygen();
        std::string msg = "163_1234567890abcdef_1000_10000";
        Bytes sig = sr25519::sign(kp, msg).to_bytes();

        for (size_t i = 0; i < sig.size(); ++i) {
            Bytes tampered = sig;
            tampered[i] ^= 0x01;
            REQUIRE_FALSE(sr25519::verify(sr25519::Signature::from_bytes(tampered), msg, kp.public_key));
        }
    }

    SECTION("Flipping any message byte fails verification") {
        auto kp = sr25519::keygen();
        std::string msg = "163_1000_10";
        auto sig = sr25519::sign(kp, msg);

        for (size_t i = 0; i < msg.size(); ++i) {
            std::string tampered = msg;
            tampered[i] ^= 0x01;
            REQUIRE_FALSE(sr25519::verify(sig, tampered, kp.public_key));
        }
    }

    SECTION("Seeded keys are deterministic") {
        Bytes seed = random_bytes(32);
        auto a = sr25519::from_seed(seed);
        auto b = sr25519::from_seed(seed);
        REQUIRE(a.public_key == b.public_key);

        auto sig = sr25519::sign(a, std::string("x"));
        REQUIRE(sr25519::verify(sig, std::string("x"), b.public_key));
        REQUIRE_THROWS_AS(sr25519::from_seed(random_bytes(31)), std::invalid_argument);
    }

    SECTION("Malformed keys verify false instead of throwing") {
        auto kp = sr25519::keygen();
        auto sig = sr25519::sign(kp, std::string("m"));
        REQUIRE_FALSE(sr25519::verify(sig, std::string("m"), PublicKey::from_bytes(Bytes(32, 0x00))));
        REQUIRE_FALSE(sr25519::verify(sig, std::string("m"), PublicKey::from_bytes(Bytes(32, 0xFF))));
    }

    SECTION("Signatures without the schnorrkel marker are rejected") {
        auto kp = sr25519::keygen();
        Bytes sig = sr25519::sign(kp, std::string("m")).to_bytes();
        sig[63] &= 0x7F;
        REQUIRE_FALSE(sr25519::verify(sr25519::Signature::from_bytes(sig), std::string("m"), kp.public_key));
    }
}

TEST_CASE("sr25519 wallet-produced signatures", "[sr25519]") {
    init_crypto();

    SECTION("Data signed by a delegated signer") {
        auto signer = PublicKey::from_ss58check("5GxffGgHzTFu8mmHCRbw9YZkkcwTZreL2FVLQHVb4FVgEPcE");
        auto sig = sr25519::parse_signature_hex(
            "0x64bc35276740fe6b196c7f18b22be553088555a1a282269d8b85546fcd7e6863"
            "5392b0fc16e535a6e9187d5e6cbc02fd2c3b62546e848754942023176152f488");

        std::string data = "324_thisIsMySecretDataWhichCannotContainAnyUnderScore(:-P)_214188_1000000";
        REQUIRE(sr25519::verify(sig, data, signer));

        std::string altered = "324_thisIsMySecretDataWhichCannotContainAnyUnderScore(:-O)_214188_1000000";
        REQUIRE_FALSE(sr25519::verify(sig, altered, signer));
    }

    SECTION("Signer grant signed by the owner covers the wrapped field") {
        auto owner = PublicKey::from_ss58check("5ChoJxKns4yyHeZg38U2hc8WYQ691oHzPJZtnayZXFyXvXET");
        auto sig = sr25519::parse_signature_hex(
            "0xa4f331ec6c6197a95122f171fbbb561f528085b2ca5176d676596eea03669718"
            "a7047cd29db3da4f5c48d3eb9df5648c8b90851fe9781dfaa11aef0eb1e6b88a");

        const std::string grant = "5GxffGgHzTFu8mmHCRbw9YZkkcwTZreL2FVLQHVb4FVgEPcE_214188_1000000";
        REQUIRE(sr25519::verify(sig, "<Bytes>" + grant + "</Bytes>", owner));
        REQUIRE_FALSE(sr25519::verify(sig, grant, owner));
    }
}

TEST_CASE("Signature hex parsing", "[sr25519]") {
    const std::string body =
        "42bb4b16fb9d6f1a7c902edac7d511679827b262cb1d0e5e5fd5d3af6c3dc715"
        "ef4c5e1810056db80bfa866c207b786d79987242608ca6944e857772cb1b858b";

    SECTION("Prefixed 128-hex signature parses") {
        auto sig = sr25519::parse_signature_hex("0x" + body);
        REQUIRE(sig.to_hex() == "0x" + body);
    }

    SECTION("Missing prefix is a PrefixError") {
        try {
            sr25519::parse_signature_hex(body);
            FAIL("expected SignatureError");
        } catch (const SignatureError& e) {
            REQUIRE(e.fault() == SignatureFault::Prefix);
        }
    }

    SECTION("Truncated by one hex digit is a LengthError") {
        try {
            sr25519::parse_signature_hex("0x" + body.substr(1));
            FAIL("expected SignatureError");
        } catch (const SignatureError& e) {
            REQUIRE(e.fault() == SignatureFault::Length);
        }
    }

    SECTION("Prefix is optional when not required") {
        REQUIRE_NOTHROW(sr25519::parse_signature_hex(body, false));
        REQUIRE_NOTHROW(sr25519::parse_signature_hex("0x" + body, false));
    }

    SECTION("Non-hex characters are rejected") {
        std::string bad = body;
        bad[5] = 'z';
        REQUIRE_THROWS_AS(sr25519::parse_signature_hex("0x" + bad), SignatureError);
    }

    SECTION("Fault names") {
        REQUIRE(std::string(sr25519::to_string(SignatureFault::Prefix)) == "PREFIXERROR");
        REQUIRE(std::string(sr25519::to_string(SignatureFault::Length)) == "LENGTHERROR");
        REQUIRE(std::string(sr25519::to_string(SignatureFault::Type)) == "TYPEERROR");
    }
}
