#include <iostream>
#include <chrono>
#include <map>
#include <vector>
#include <string>
#include <iomanip>
#include <functional>

#include "crypto/merlin.hpp"
#include "crypto/ristretto.hpp"
#include "crypto/sr25519.hpp"
#include "crypto/ss58.hpp"
#include "protocol/verify.hpp"
#include "helpers.hpp"
#include "logger.hpp"

using keyshield::utils::Bytes;
using keyshield::utils::to_bytes;

/**
 * @brief A simple class to run benchmarks and print formatted results.
 */
class BenchmarkRunner {
public:
    int num_iters;

    explicit BenchmarkRunner(int iterations) : num_iters(iterations) {}

    void run(const std::string& name, const std::function<void()>& func) {
        // Warm-up
        func();

        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_iters; ++i) {
            func();
        }
        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;

        std::cout << std::left << std::setw(34) << name
                  << ": " << std::fixed << std::setprecision(6)
                  << (elapsed.count() / num_iters) << " ms" << std::endl;
    }
};

// Chain with a fixed height and a single secret-NFT
class StaticChain : public protocol::ChainOracle {
public:
    uint32_t block = 1000;
    std::map<uint32_t, protocol::NftRecord> records;
    std::map<uint32_t, protocol::AccountId> delegatees;

    uint32_t current_finalized_block() override { return block; }

    std::optional<protocol::NftRecord> nft_record(uint32_t nft_id) override {
        auto it = records.find(nft_id);
        if (it == records.end()) return std::nullopt;
        return it->second;
    }

    std::optional<protocol::AccountId> delegatee_of(uint32_t nft_id) override {
        auto it = delegatees.find(nft_id);
        if (it == delegatees.end()) return std::nullopt;
        return it->second;
    }

    std::optional<protocol::AccountId> rentee_of(uint32_t) override { return std::nullopt; }
};

int main() {
    ristretto::init();
    keyshield::logging::init_console_logging(keyshield::logging::severity_level::warning);

    BenchmarkRunner primitive_runner(10000); // fast ops
    BenchmarkRunner protocol_runner(1000);   // slower ops

    // =====================================================================
    // SECTION 1: Cryptographic Primitives
    // =====================================================================
    std::cout << "\n--- Cryptographic Primitives (Avg over "
              << primitive_runner.num_iters << " iters) ---" << std::endl;

    primitive_runner.run("Merlin Challenge (64 bytes)", [&]() {
        merlin::Transcript t("bench");
        t.append_message("m", to_bytes("163_1234567890abcdef_1000_10000"));
        auto c = t.challenge_bytes("c", 64);
        (void)c;
    });

    auto kp = sr25519::keygen();
    std::string msg = "163_1234567890abcdef_1000_10000";
    auto sig = sr25519::sign(kp, msg);
    std::string address = kp.public_key.to_ss58check();

    primitive_runner.run("SS58 Decode", [&]() {
        auto d = ss58::decode(address);
        (void)d;
    });

    protocol_runner.run("sr25519 Sign", [&]() {
        auto s = sr25519::sign(kp, msg);
        (void)s;
    });

    protocol_runner.run("sr25519 Verify", [&]() {
        bool ok = sr25519::verify(sig, msg, kp.public_key);
        (void)ok;
    });

    // =====================================================================
    // SECTION 2: Request Verification
    // =====================================================================
    std::cout << "\n--- Request Verification (Avg over "
              << protocol_runner.num_iters << " iters) ---" << std::endl;

    auto owner = sr25519::keygen();
    auto signer = sr25519::keygen();
    auto delegatee = sr25519::keygen();

    StaticChain chain;
    protocol::NftRecord record;
    record.owner = owner.public_key;
    record.is_secret = true;
    chain.records[163] = record;
    chain.delegatees[163] = delegatee.public_key;

    protocol::StoreKeysharePacket store;
    store.owner_address = owner.public_key;
    store.signer_address = signer.public_key.to_ss58check() + "_1000_100";
    store.signersig = sr25519::sign(owner, store.signer_address).to_hex();
    store.data = "163_1234567890abcdef_1000_10";
    store.signature = sr25519::sign(signer, store.data).to_hex();

    protocol_runner.run("Store Request (two-tier)", [&]() {
        auto d = protocol::verify_store_request(store, protocol::NftType::SecretNft, chain);
        (void)d;
    });

    protocol::RetrieveKeysharePacket retrieve;
    retrieve.requester_address = delegatee.public_key;
    retrieve.requester_type = protocol::RequesterType::Delegatee;
    retrieve.data = "163_1000_10";
    retrieve.signature = sr25519::sign(delegatee, retrieve.data).to_hex();

    protocol_runner.run("Retrieve Request (delegatee)", [&]() {
        auto d = protocol::verify_retrieve_request(retrieve, protocol::NftType::SecretNft, chain);
        (void)d;
    });

    return 0;
}
