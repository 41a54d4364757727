#include "packets.hpp"
#include "../crypto/ss58.hpp"
#include "../helpers.hpp"

#include <stdexcept>

namespace protocol {

using keyshield::utils::parse_u32;
using keyshield::utils::split;
using keyshield::utils::to_bytes;
using keyshield::utils::to_string;

const char* const WRAPPER_PREFIX = "<Bytes>";
const char* const WRAPPER_SUFFIX = "</Bytes>";

const char* const SLOT_OWNER = "owner";
const char* const SLOT_SIGNER = "signer";

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> unwrap_signed_payload(const std::string& raw) {
    const std::string prefix(WRAPPER_PREFIX);
    const std::string suffix(WRAPPER_SUFFIX);

    bool has_prefix = starts_with(raw, prefix);
    bool has_suffix = ends_with(raw, suffix);

    if (!has_prefix && !has_suffix) {
        return raw;
    }
    if (has_prefix != has_suffix || raw.size() < prefix.size() + suffix.size()) {
        return std::nullopt;
    }
    return raw.substr(prefix.size(), raw.size() - prefix.size() - suffix.size());
}

// -----------------------------------------------------------------------------
// Serializers
// -----------------------------------------------------------------------------

std::string Signer::serialize() const {
    return account.to_ss58check() + FIELD_DELIMITER + auth_token.serialize();
}

std::string StoreKeyshareData::serialize() const {
    return std::to_string(nft_id) + FIELD_DELIMITER + to_string(keyshare)
        + FIELD_DELIMITER + auth_token.serialize();
}

std::string RetrieveKeyshareData::serialize() const {
    return std::to_string(nft_id) + FIELD_DELIMITER + auth_token.serialize();
}

// -----------------------------------------------------------------------------
// Field parsers
// -----------------------------------------------------------------------------

static AuthenticationToken parse_token(const std::string& block_number, const std::string& block_validation) {
    auto bn = parse_u32(block_number);
    auto bv = parse_u32(block_validation);
    if (!bn || !bv) {
        throw VerificationError(VerificationCode::InvalidAuthToken);
    }
    AuthenticationToken token;
    token.block_number = *bn;
    token.block_validation = *bv;
    return token;
}

static uint32_t parse_nft_id(const std::string& field) {
    auto id = parse_u32(field);
    if (!id) {
        throw VerificationError(VerificationCode::InvalidNftId);
    }
    return *id;
}

Signer parse_signer(const std::string& field) {
    auto body = unwrap_signed_payload(field);
    if (!body) {
        throw VerificationError(VerificationCode::MalformedSigner);
    }

    std::vector<std::string> parts = split(*body, FIELD_DELIMITER);
    if (parts.size() < 3) {
        throw VerificationError(VerificationCode::MalformedSigner);
    }

    Signer signer;
    try {
        signer.account = AccountId::from_ss58check(parts[0]);
    } catch (const ss58::Ss58Error&) {
        throw VerificationError(VerificationCode::InvalidSignerAddress);
    } catch (const std::invalid_argument&) {
        throw VerificationError(VerificationCode::InvalidSignerAddress);
    }
    signer.auth_token = parse_token(parts[1], parts[2]);
    return signer;
}

StoreKeyshareData parse_store_data(const std::string& field) {
    auto body = unwrap_signed_payload(field);
    if (!body) {
        throw VerificationError(VerificationCode::MalformedData);
    }

    std::vector<std::string> parts = split(*body, FIELD_DELIMITER);
    if (parts.size() != 4) {
        throw VerificationError(VerificationCode::MalformedData);
    }

    StoreKeyshareData data;
    data.nft_id = parse_nft_id(parts[0]);
    if (parts[1].empty()) {
        throw VerificationError(VerificationCode::InvalidKeyshare);
    }
    data.keyshare = to_bytes(parts[1]);
    data.auth_token = parse_token(parts[2], parts[3]);
    return data;
}

RetrieveKeyshareData parse_retrieve_data(const std::string& field) {
    auto body = unwrap_signed_payload(field);
    if (!body) {
        throw VerificationError(VerificationCode::MalformedData);
    }

    std::vector<std::string> parts = split(*body, FIELD_DELIMITER);
    if (parts.size() != 3) {
        throw VerificationError(VerificationCode::MalformedData);
    }

    RetrieveKeyshareData data;
    data.nft_id = parse_nft_id(parts[0]);
    data.auth_token = parse_token(parts[1], parts[2]);
    return data;
}

// -----------------------------------------------------------------------------
// JSON helpers
// -----------------------------------------------------------------------------

static std::string read_string(const nlohmann::json& j, const char* key, VerificationCode on_error) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw VerificationError(on_error);
    }
    return it->get<std::string>();
}

static AccountId read_account(const nlohmann::json& j, const char* key) {
    std::string address = read_string(j, key, VerificationCode::InvalidOwnerAddress);
    try {
        return AccountId::from_ss58check(address);
    } catch (const ss58::Ss58Error&) {
        throw VerificationError(VerificationCode::InvalidOwnerAddress);
    } catch (const std::invalid_argument&) {
        throw VerificationError(VerificationCode::InvalidOwnerAddress);
    }
}

static void require_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw VerificationError(VerificationCode::MalformedData);
    }
}

// -----------------------------------------------------------------------------
// StoreKeysharePacket
// -----------------------------------------------------------------------------

Signer StoreKeysharePacket::get_signer() const {
    return parse_signer(signer_address);
}

StoreKeyshareData StoreKeysharePacket::get_data() const {
    return parse_store_data(data);
}

sr25519::Signature StoreKeysharePacket::parse_signature(const std::string& slot) const {
    if (slot == SLOT_OWNER) {
        return sr25519::parse_signature_hex(signature);
    }
    if (slot == SLOT_SIGNER) {
        return sr25519::parse_signature_hex(signersig);
    }
    throw sr25519::SignatureError(sr25519::SignatureFault::Type);
}

StoreKeysharePacket StoreKeysharePacket::from_json(const nlohmann::json& j) {
    require_object(j);

    StoreKeysharePacket packet;
    packet.owner_address = read_account(j, "owner_address");
    packet.signer_address = read_string(j, "signer_address", VerificationCode::MalformedSigner);
    packet.signersig = read_string(j, "signersig", VerificationCode::MalformedSigner);
    packet.data = read_string(j, "data", VerificationCode::MalformedData);
    packet.signature = read_string(j, "signature", VerificationCode::MalformedData);
    return packet;
}

nlohmann::json StoreKeysharePacket::to_json() const {
    return nlohmann::json{
        {"owner_address", owner_address.to_ss58check()},
        {"signer_address", signer_address},
        {"signersig", signersig},
        {"data", data},
        {"signature", signature}
    };
}

// -----------------------------------------------------------------------------
// RetrieveKeysharePacket
// -----------------------------------------------------------------------------

RetrieveKeyshareData RetrieveKeysharePacket::get_data() const {
    return parse_retrieve_data(data);
}

sr25519::Signature RetrieveKeysharePacket::parse_signature() const {
    return sr25519::parse_signature_hex(signature);
}

RetrieveKeysharePacket RetrieveKeysharePacket::from_json(const nlohmann::json& j) {
    require_object(j);

    RetrieveKeysharePacket packet;
    packet.requester_address = read_account(j, "requester_address");
    try {
        packet.requester_type = requester_type_from_string(
            read_string(j, "requester_type", VerificationCode::MalformedData));
    } catch (const std::invalid_argument&) {
        throw VerificationError(VerificationCode::MalformedData);
    }
    packet.data = read_string(j, "data", VerificationCode::MalformedData);
    packet.signature = read_string(j, "signature", VerificationCode::MalformedData);
    return packet;
}

nlohmann::json RetrieveKeysharePacket::to_json() const {
    return nlohmann::json{
        {"requester_address", requester_address.to_ss58check()},
        {"requester_type", to_string(requester_type)},
        {"data", data},
        {"signature", signature}
    };
}

// -----------------------------------------------------------------------------
// RemoveKeysharePacket
// -----------------------------------------------------------------------------

RemoveKeysharePacket RemoveKeysharePacket::from_json(const nlohmann::json& j) {
    require_object(j);

    RemoveKeysharePacket packet;
    packet.requester_address = read_account(j, "requester_address");

    auto id = j.find("nft_id");
    if (id == j.end() || !id->is_number_unsigned() || id->get<uint64_t>() > UINT32_MAX) {
        throw VerificationError(VerificationCode::InvalidNftId);
    }
    packet.nft_id = static_cast<uint32_t>(id->get<uint64_t>());
    return packet;
}

nlohmann::json RemoveKeysharePacket::to_json() const {
    return nlohmann::json{
        {"requester_address", requester_address.to_ss58check()},
        {"nft_id", nft_id}
    };
}

// -----------------------------------------------------------------------------
// AdminIdPacket
// -----------------------------------------------------------------------------

AdminIdPacket AdminIdPacket::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Admin packet is not a JSON object");
    }

    auto field = [&j](const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            throw std::invalid_argument(std::string("Admin packet field missing or not a string: ") + key);
        }
        return it->get<std::string>();
    };

    AdminIdPacket packet;
    packet.admin_address = field("admin_address");
    packet.nftid_vec = field("nftid_vec");
    packet.auth_token = field("auth_token");
    packet.signature = field("signature");
    return packet;
}

nlohmann::json AdminIdPacket::to_json() const {
    return nlohmann::json{
        {"admin_address", admin_address},
        {"nftid_vec", nftid_vec},
        {"auth_token", auth_token},
        {"signature", signature}
    };
}

} // namespace protocol
