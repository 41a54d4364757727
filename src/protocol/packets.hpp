#ifndef KEYSHIELD_PROTOCOL_PACKETS_HPP
#define KEYSHIELD_PROTOCOL_PACKETS_HPP

#include "authtoken.hpp"
#include "chain.hpp"
#include "errors.hpp"
#include "../crypto/sr25519.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

using Bytes = std::vector<uint8_t>;

// Field separator of the flat, wallet-signable encodings. Field content
// must not contain it; there is no escaping.
constexpr char FIELD_DELIMITER = '_';

// Marker pair some signing UIs put around the message they sign
extern const char* const WRAPPER_PREFIX;
extern const char* const WRAPPER_SUFFIX;

// Strips exactly one marker pair. Unwrapped input is returned unchanged;
// input carrying only one of the markers yields nullopt.
std::optional<std::string> unwrap_signed_payload(const std::string& raw);

// -----------------------------------------------------------------------------
// Parsed payloads
// -----------------------------------------------------------------------------
struct Signer {
    AccountId           account;
    AuthenticationToken auth_token;

    // "{ss58 account}_{block_number}_{block_validation}"
    std::string serialize() const;

    bool operator==(const Signer& other) const {
        return account == other.account && auth_token == other.auth_token;
    }
};

struct StoreKeyshareData {
    uint32_t            nft_id = 0;
    Bytes               keyshare;
    AuthenticationToken auth_token;

    // "{nft_id}_{keyshare}_{block_number}_{block_validation}"
    std::string serialize() const;

    bool operator==(const StoreKeyshareData& other) const {
        return nft_id == other.nft_id && keyshare == other.keyshare && auth_token == other.auth_token;
    }
};

struct RetrieveKeyshareData {
    uint32_t            nft_id = 0;
    AuthenticationToken auth_token;

    // "{nft_id}_{block_number}_{block_validation}"
    std::string serialize() const;

    bool operator==(const RetrieveKeyshareData& other) const {
        return nft_id == other.nft_id && auth_token == other.auth_token;
    }
};

// All three throw VerificationError
Signer parse_signer(const std::string& field);
StoreKeyshareData parse_store_data(const std::string& field);
RetrieveKeyshareData parse_retrieve_data(const std::string& field);

// -----------------------------------------------------------------------------
// Wire packets (JSON objects)
// -----------------------------------------------------------------------------

// Signature slots of a store packet
extern const char* const SLOT_OWNER;   // "owner": signer's signature over `data`
extern const char* const SLOT_SIGNER;  // "signer": owner's signature over `signer_address`

struct StoreKeysharePacket {
    AccountId   owner_address;

    // Signed by owner
    std::string signer_address;
    std::string signersig;

    // Signed by signer
    std::string data;
    std::string signature;

    Signer get_signer() const;
    StoreKeyshareData get_data() const;
    // Throws SignatureError, including Type for an unknown slot
    sr25519::Signature parse_signature(const std::string& slot) const;

    // Throws VerificationError (MalformedData, InvalidOwnerAddress)
    static StoreKeysharePacket from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct RetrieveKeysharePacket {
    AccountId     requester_address;
    RequesterType requester_type = RequesterType::Owner;
    std::string   data;
    std::string   signature;

    RetrieveKeyshareData get_data() const;
    sr25519::Signature parse_signature() const;

    static RetrieveKeysharePacket from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

// Removal of burnt assets; carries no signature
struct RemoveKeysharePacket {
    AccountId requester_address;
    uint32_t  nft_id = 0;

    static RemoveKeysharePacket from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct AdminIdPacket {
    std::string admin_address;
    std::string nftid_vec;    // JSON array of u32, hashed into the token
    std::string auth_token;   // AdminAuthToken JSON, optionally wrapped
    std::string signature;

    // Throws std::invalid_argument
    static AdminIdPacket from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_PACKETS_HPP
