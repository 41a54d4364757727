#include <catch2/catch_test_macros.hpp>

#include "protocol/admin.hpp"
#include "test_helpers.hpp"

#include <cstdio>
#include <fstream>

using namespace protocol;
using namespace test_helpers;

static AdminError expect_admin_failure(const AdminIdPacket& packet, const AdminConfig& config,
                                       MockChain& chain, MaintenanceState& maintenance) {
    try {
        verify_admin_request(packet, config, chain, maintenance);
    } catch (const AdminError& e) {
        return e;
    }
    FAIL("expected AdminError");
    return AdminError(AdminFailure::NotWhitelisted);
}

TEST_CASE("Admin request verification", "[admin]") {
    auto admin = make_account();
    auto outsider = make_account();
    auto config = make_admin_config({admin.address});

    MockChain chain;
    chain.block = 2000;
    MaintenanceState maintenance;

    const std::string ids = "[1,2,3,4294967295]";

    SECTION("Whitelisted, fresh and hash-bound request is accepted") {
        auto packet = make_admin_packet(admin, ids, 2000, 10);
        auto payload = verify_admin_request(packet, config, chain, maintenance);

        REQUIRE(payload.admin == admin.id);
        REQUIRE(payload.nft_ids == std::vector<uint32_t>{1, 2, 3, 4294967295u});
        REQUIRE(payload.auth_token.data_hash == keyshield::utils::sha256_hex(ids));
        REQUIRE_FALSE(maintenance.active());
    }

    SECTION("Wrapped token and unprefixed signature") {
        auto packet = make_admin_packet(admin, ids, 2000, 10, true);
        packet.signature = packet.signature.substr(2);
        REQUIRE(verify_admin_request(packet, config, chain, maintenance).nft_ids.size() == 4);
    }

    SECTION("Whitelist gate runs before any other work") {
        auto packet = make_admin_packet(outsider, ids, 2000, 10);
        auto e = expect_admin_failure(packet, config, chain, maintenance);
        REQUIRE(e.failure() == AdminFailure::NotWhitelisted);
        REQUIRE(chain.height_queries == 0);

        // Even a garbage token and signature report the whitelist failure
        packet.auth_token = "{";
        packet.signature = "zz";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::NotWhitelisted);
    }

    SECTION("Unparsable token") {
        auto packet = make_admin_packet(admin, ids, 2000, 10);
        packet.auth_token = "not json";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::UnparsableToken);

        packet.auth_token = "<Bytes>{}";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::MalformedToken);
    }

    SECTION("Bad signature is rejected before the window check") {
        auto packet = make_admin_packet(admin, ids, 2000, 10);
        packet.signature = sr25519::sign(outsider.keypair, packet.auth_token).to_hex();
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::InvalidSignature);
        REQUIRE(chain.height_queries == 0);

        packet.signature = "0x1234";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::InvalidSignature);
    }

    SECTION("Stale, future and over-long tokens") {
        auto stale = make_admin_packet(admin, ids, 1900, 10);
        auto e1 = expect_admin_failure(stale, config, chain, maintenance);
        REQUIRE(e1.failure() == AdminFailure::InvalidToken);
        REQUIRE(e1.validation() == ValidationResult::ExpiredBlockNumber);

        auto future = make_admin_packet(admin, ids, 2100, 10);
        REQUIRE(expect_admin_failure(future, config, chain, maintenance).validation()
                == ValidationResult::FutureBlockNumber);

        auto too_long = make_admin_packet(admin, ids, 2000, 21);
        REQUIRE(expect_admin_failure(too_long, config, chain, maintenance).validation()
                == ValidationResult::InvalidPeriod);
    }

    SECTION("Chain failure is reported as ErrorRpcCall") {
        chain.fail = true;
        auto packet = make_admin_packet(admin, ids, 2000, 10);
        auto e = expect_admin_failure(packet, config, chain, maintenance);
        REQUIRE(e.validation() == ValidationResult::ErrorRpcCall);
    }

    SECTION("Payload must match the signed hash") {
        auto packet = make_admin_packet(admin, ids, 2000, 10);
        packet.nftid_vec = "[1,2,3]";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::DataHashMismatch);
    }

    SECTION("Id vector must be an array of u32") {
        auto packet = make_admin_packet(admin, "[1,-2]", 2000, 10);
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::InvalidIdVector);

        auto not_array = make_admin_packet(admin, "{\"a\":1}", 2000, 10);
        REQUIRE(expect_admin_failure(not_array, config, chain, maintenance).failure() == AdminFailure::InvalidIdVector);
    }

    SECTION("Maintenance message is set while the request is verified") {
        bool active_during = false;
        std::string message_during;
        chain.on_height_query = [&] {
            active_during = maintenance.active();
            message_during = maintenance.message();
        };

        auto packet = make_admin_packet(admin, ids, 2000, 10);
        verify_admin_request(packet, config, chain, maintenance);

        REQUIRE(chain.height_queries == 1);
        REQUIRE(active_during);
        REQUIRE(message_during == ADMIN_MAINTENANCE_MESSAGE);
        REQUIRE_FALSE(maintenance.active());
    }

    SECTION("Maintenance message is set during a failing request and cleared after") {
        bool active_during = false;
        chain.on_height_query = [&] { active_during = maintenance.active(); };

        auto packet = make_admin_packet(admin, ids, 2000, 10);
        packet.nftid_vec = "[9]";
        REQUIRE(expect_admin_failure(packet, config, chain, maintenance).failure() == AdminFailure::DataHashMismatch);
        REQUIRE(active_during);
        REQUIRE(maintenance.message().empty());
    }

    SECTION("Maintenance message is cleared on failure") {
        auto packet = make_admin_packet(outsider, ids, 2000, 10);
        expect_admin_failure(packet, config, chain, maintenance);
        REQUIRE_FALSE(maintenance.active());
        REQUIRE(maintenance.message().empty());
    }
}

TEST_CASE("Maintenance guard", "[admin]") {
    MaintenanceState state;
    {
        MaintenanceGuard guard(state, "backup running");
        REQUIRE(state.active());
        REQUIRE(state.message() == "backup running");
    }
    REQUIRE_FALSE(state.active());

    state.set("first");
    state.set("second");
    REQUIRE(state.message() == "second");
    state.clear();
    REQUIRE_FALSE(state.active());
}

TEST_CASE("Admin config", "[admin]") {
    auto a = make_account();
    auto b = make_account();

    SECTION("Env string round trip") {
        AdminConfig config = make_admin_config({a.address, b.address});
        config.limits.max_validation_period = 30;
        config.limits.max_block_variation = 2;

        AdminConfig parsed = AdminConfig::from_env_string(config.to_env_string());
        REQUIRE(parsed.enclave_id == config.enclave_id);
        REQUIRE(parsed.whitelist == config.whitelist);
        REQUIRE(parsed.limits.max_validation_period == 30);
        REQUIRE(parsed.limits.max_block_variation == 2);
        REQUIRE(parsed.is_whitelisted(a.address));
        REQUIRE_FALSE(parsed.is_whitelisted(make_account().address));
    }

    SECTION("Defaults, comments and whitespace") {
        std::string env =
            "# enclave settings\n"
            "ENCLAVE_ID = enclave-7\n"
            "\n"
            "ADMIN_WHITELIST=" + a.address + " , " + b.address + "\n";
        AdminConfig parsed = AdminConfig::from_env_string(env);
        REQUIRE(parsed.enclave_id == "enclave-7");
        REQUIRE(parsed.whitelist.size() == 2);
        REQUIRE(parsed.limits.max_validation_period == DEFAULT_MAX_VALIDATION_PERIOD);
        REQUIRE(parsed.limits.max_block_variation == DEFAULT_MAX_BLOCK_VARIATION);
    }

    SECTION("Errors") {
        REQUIRE_THROWS_AS(AdminConfig::from_env_string("INVALID_CONTENT"), ConfigError);
        REQUIRE_THROWS_AS(AdminConfig::from_env_string("ENCLAVE_ID=x\n"), ConfigError);
        REQUIRE_THROWS_AS(AdminConfig::from_env_string("ENCLAVE_ID=x\nADMIN_WHITELIST=bogus\n"), ConfigError);
        REQUIRE_THROWS_AS(AdminConfig::from_env_string(
            "ENCLAVE_ID=x\nADMIN_WHITELIST=\nMAX_BLOCK_VARIATION=-1\n"), ConfigError);
    }

    SECTION("Load from file") {
        std::string path = "keyshield_admin_config_test.env";
        {
            std::ofstream out(path);
            out << make_admin_config({a.address}).to_env_string();
        }
        AdminConfig loaded = load_admin_config(path);
        REQUIRE(loaded.whitelist == std::vector<std::string>{a.address});
        std::remove(path.c_str());

        REQUIRE_THROWS_AS(load_admin_config("does/not/exist.env"), ConfigError);
    }
}
