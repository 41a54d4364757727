#include <catch2/catch_test_macros.hpp>

#include "protocol/verify.hpp"
#include "test_helpers.hpp"

using namespace protocol;
using namespace test_helpers;

template <typename Fn>
static VerificationError expect_failure(Fn&& fn) {
    try {
        fn();
    } catch (const VerificationError& e) {
        return e;
    }
    FAIL("expected VerificationError");
    return VerificationError(VerificationCode::MalformedData);
}

TEST_CASE("Store request delegation chain", "[verify]") {
    const uint32_t B = 1000;
    const uint32_t V = 10;

    auto owner = make_account();
    auto delegate = make_account();
    auto stranger = make_account();

    MockChain chain;
    chain.block = B + 1;
    chain.add_secret_nft(163, owner.id);
    chain.add_capsule(164, owner.id);

    // Signer grant outlives the data token so the data window decides
    auto packet = make_store_packet(owner, delegate, 163, "1234567890abcdef", token(B, 100), token(B, V));

    SECTION("Accepted within both windows") {
        auto data = verify_store_request(packet, NftType::SecretNft, chain);
        REQUIRE(data.nft_id == 163);
        REQUIRE(keyshield::utils::to_string(data.keyshare) == "1234567890abcdef");
        REQUIRE(data.auth_token == token(B, V));
    }

    SECTION("Wrapped fields are accepted") {
        auto wrapped = make_store_packet(owner, delegate, 163, "abc", token(B, 100), token(B, V), true);
        REQUIRE(verify_store_request(wrapped, NftType::SecretNft, chain).nft_id == 163);
    }

    SECTION("Data token expired") {
        chain.block = B + V + 4;
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::ExpiredData);
    }

    SECTION("Signer token expired") {
        chain.block = B + 200;
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::ExpiredSigner);
    }

    SECTION("Signer grant not signed by the owner") {
        auto forged = make_store_packet(stranger, delegate, 163, "abc", token(B, 100), token(B, V));
        forged.owner_address = owner.id;
        auto e = expect_failure([&] { verify_store_request(forged, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::SignerVerificationFailed);
    }

    SECTION("Data not signed by the delegated signer") {
        packet.signature = sr25519::sign(stranger.keypair, packet.data).to_hex();
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::DataVerificationFailed);
    }

    SECTION("Tampered data") {
        packet.data = "163_1234567890abcdeF_1000_10";
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::DataVerificationFailed);
    }

    SECTION("Signature format errors carry their reason") {
        packet.signersig = packet.signersig.substr(2);
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::InvalidSignerSig);
        REQUIRE(e.signature_fault() == sr25519::SignatureFault::Prefix);

        auto other = make_store_packet(owner, delegate, 163, "abc", token(B, 100), token(B, V));
        other.signature = other.signature.substr(0, 129);
        auto e2 = expect_failure([&] { verify_store_request(other, NftType::SecretNft, chain); });
        REQUIRE(e2.code() == VerificationCode::InvalidDataSig);
        REQUIRE(e2.signature_fault() == sr25519::SignatureFault::Length);
    }

    SECTION("Asset must exist and be of the requested kind") {
        auto missing = make_store_packet(owner, delegate, 999, "abc", token(B, 100), token(B, V));
        REQUIRE(expect_failure([&] { verify_store_request(missing, NftType::SecretNft, chain); }).code()
                == VerificationCode::InvalidNftId);

        REQUIRE(expect_failure([&] { verify_store_request(packet, NftType::Capsule, chain); }).code()
                == VerificationCode::IdIsNotCapsule);

        auto capsule = make_store_packet(owner, delegate, 164, "abc", token(B, 100), token(B, V));
        REQUIRE(verify_store_request(capsule, NftType::Capsule, chain).nft_id == 164);
        REQUIRE(expect_failure([&] { verify_store_request(capsule, NftType::SecretNft, chain); }).code()
                == VerificationCode::IdIsNotSecretNft);
    }

    SECTION("Packet owner must be the on-chain owner") {
        chain.add_secret_nft(163, stranger.id);
        auto e = expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); });
        REQUIRE(e.code() == VerificationCode::OwnershipVerificationFailed);
    }

    SECTION("Malformed fields") {
        packet.signer_address = "garbage";
        packet.signersig = sr25519::sign(owner.keypair, packet.signer_address).to_hex();
        REQUIRE(expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); }).code()
                == VerificationCode::MalformedSigner);
    }

    SECTION("Chain failure is not a verification failure") {
        chain.fail = true;
        REQUIRE_THROWS_AS(verify_store_request(packet, NftType::SecretNft, chain), ChainQueryError);
    }

    SECTION("Free variant skips on-chain authorization") {
        chain.add_secret_nft(163, stranger.id);
        REQUIRE(verify_free_store_request(packet, chain).nft_id == 163);

        auto missing = make_store_packet(owner, delegate, 999, "abc", token(B, 100), token(B, V));
        REQUIRE(verify_free_store_request(missing, chain).nft_id == 999);
    }
}

TEST_CASE("Retrieve request", "[verify]") {
    auto owner = make_account();
    auto delegatee = make_account();
    auto rentee = make_account();
    auto stranger = make_account();

    MockChain chain;
    chain.block = 500;
    chain.add_secret_nft(7, owner.id);
    chain.delegatees[7] = delegatee.id;
    chain.rentees[7] = rentee.id;

    SECTION("Owner, delegatee and rentee") {
        auto p1 = make_retrieve_packet(owner, RequesterType::Owner, 7, token(500, 10));
        auto p2 = make_retrieve_packet(delegatee, RequesterType::Delegatee, 7, token(500, 10));
        auto p3 = make_retrieve_packet(rentee, RequesterType::Rentee, 7, token(500, 10));
        REQUIRE(verify_retrieve_request(p1, NftType::SecretNft, chain).nft_id == 7);
        REQUIRE(verify_retrieve_request(p2, NftType::SecretNft, chain).nft_id == 7);
        REQUIRE(verify_retrieve_request(p3, NftType::SecretNft, chain).nft_id == 7);
    }

    SECTION("Claimed role must hold on chain") {
        auto p = make_retrieve_packet(stranger, RequesterType::Delegatee, 7, token(500, 10));
        REQUIRE(expect_failure([&] { verify_retrieve_request(p, NftType::SecretNft, chain); }).code()
                == VerificationCode::RequesterVerificationFailed);

        auto q = make_retrieve_packet(delegatee, RequesterType::Owner, 7, token(500, 10));
        REQUIRE(expect_failure([&] { verify_retrieve_request(q, NftType::SecretNft, chain); }).code()
                == VerificationCode::RequesterVerificationFailed);
    }

    SECTION("Signature must come from the requester") {
        auto p = make_retrieve_packet(owner, RequesterType::Owner, 7, token(500, 10));
        p.signature = sr25519::sign(stranger.keypair, p.data).to_hex();
        REQUIRE(expect_failure([&] { verify_retrieve_request(p, NftType::SecretNft, chain); }).code()
                == VerificationCode::SignerVerificationFailed);
    }

    SECTION("Expired data") {
        auto p = make_retrieve_packet(owner, RequesterType::Owner, 7, token(400, 10));
        REQUIRE(expect_failure([&] { verify_retrieve_request(p, NftType::SecretNft, chain); }).code()
                == VerificationCode::ExpiredData);
        REQUIRE(expect_failure([&] { verify_free_retrieve_request(p, chain); }).code()
                == VerificationCode::ExpiredData);
    }

    SECTION("Kind mismatch") {
        auto p = make_retrieve_packet(owner, RequesterType::Owner, 7, token(500, 10));
        REQUIRE(expect_failure([&] { verify_retrieve_request(p, NftType::Capsule, chain); }).code()
                == VerificationCode::IdIsNotCapsule);
    }

    SECTION("Free variant checks authenticity only") {
        auto p = make_retrieve_packet(stranger, RequesterType::Delegatee, 7, token(500, 10));
        REQUIRE(verify_free_retrieve_request(p, chain).nft_id == 7);
        REQUIRE(chain.state_queries == 0);
    }

    SECTION("Free variant reports a forged signature as a data failure") {
        auto p = make_retrieve_packet(owner, RequesterType::Owner, 7, token(500, 10));
        p.signature = sr25519::sign(stranger.keypair, p.data).to_hex();
        REQUIRE(expect_failure([&] { verify_free_retrieve_request(p, chain); }).code()
                == VerificationCode::DataVerificationFailed);

        p.signature = p.signature.substr(2);
        auto e = expect_failure([&] { verify_free_retrieve_request(p, chain); });
        REQUIRE(e.code() == VerificationCode::InvalidSignerSig);
        REQUIRE(e.signature_fault() == sr25519::SignatureFault::Prefix);
    }
}

TEST_CASE("Store request signed by a browser wallet", "[verify]") {
    init_crypto();

    // Owner 5ChoJx... granted signer 5Gxff... through polkadot.js, which signs
    // the <Bytes>-wrapped field; the signer then signed the bare data field.
    StoreKeysharePacket packet;
    packet.owner_address = AccountId::from_ss58check("5ChoJxKns4yyHeZg38U2hc8WYQ691oHzPJZtnayZXFyXvXET");
    packet.signer_address = "<Bytes>5GxffGgHzTFu8mmHCRbw9YZkkcwTZreL2FVLQHVb4FVgEPcE_214188_1000000</Bytes>";
    packet.signersig =
        "0xa4f331ec6c6197a95122f171fbbb561f528085b2ca5176d676596eea03669718"
        "a7047cd29db3da4f5c48d3eb9df5648c8b90851fe9781dfaa11aef0eb1e6b88a";
    packet.data = "324_thisIsMySecretDataWhichCannotContainAnyUnderScore(:-P)_214188_1000000";
    packet.signature =
        "0x64bc35276740fe6b196c7f18b22be553088555a1a282269d8b85546fcd7e6863"
        "5392b0fc16e535a6e9187d5e6cbc02fd2c3b62546e848754942023176152f488";

    MockChain chain;
    chain.block = 215000;
    chain.add_secret_nft(324, packet.owner_address);

    SECTION("Accepted end to end") {
        StoreKeyshareData data = verify_store_request(packet, NftType::SecretNft, chain);
        REQUIRE(data.nft_id == 324);
        REQUIRE(keyshield::utils::to_string(data.keyshare) ==
                "thisIsMySecretDataWhichCannotContainAnyUnderScore(:-P)");
        REQUIRE(data.auth_token.block_number == 214188);
        REQUIRE(data.auth_token.block_validation == 1000000);
    }

    SECTION("Grant without its wrapper fails the owner signature") {
        packet.signer_address = "5GxffGgHzTFu8mmHCRbw9YZkkcwTZreL2FVLQHVb4FVgEPcE_214188_1000000";
        REQUIRE(expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); }).code()
                == VerificationCode::SignerVerificationFailed);
    }

    SECTION("Altered data fails the signer signature") {
        packet.data = "324_thisIsMySecretDataWhichCannotContainAnyUnderScore(:-O)_214188_1000000";
        REQUIRE(expect_failure([&] { verify_store_request(packet, NftType::SecretNft, chain); }).code()
                == VerificationCode::DataVerificationFailed);
    }
}

TEST_CASE("NFT type names", "[verify]") {
    REQUIRE(nft_type_from_string("secret-nft") == NftType::SecretNft);
    REQUIRE(nft_type_from_string("capsule") == NftType::Capsule);
    REQUIRE(std::string(to_string(NftType::Capsule)) == "capsule");
    REQUIRE_THROWS_AS(nft_type_from_string("nft"), std::invalid_argument);
}
