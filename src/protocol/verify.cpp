#include "verify.hpp"
#include "../logger.hpp"

#include <stdexcept>

namespace protocol {

const char* to_string(NftType type) {
    switch (type) {
        case NftType::SecretNft: return "secret-nft";
        case NftType::Capsule:   return "capsule";
    }
    return "secret-nft";
}

NftType nft_type_from_string(const std::string& s) {
    if (s == "secret-nft") return NftType::SecretNft;
    if (s == "capsule")    return NftType::Capsule;
    throw std::invalid_argument("Unknown nft type: " + s);
}

// Looks up the asset and checks it carries the requested secret kind
static NftRecord fetch_record(ChainOracle& chain, uint32_t nft_id, NftType nft_type) {
    std::optional<NftRecord> record = chain.nft_record(nft_id);
    if (!record) {
        throw VerificationError(VerificationCode::InvalidNftId);
    }

    switch (nft_type) {
        case NftType::SecretNft:
            if (!record->is_secret) {
                throw VerificationError(VerificationCode::IdIsNotSecretNft);
            }
            break;
        case NftType::Capsule:
            if (!record->is_capsule) {
                throw VerificationError(VerificationCode::IdIsNotCapsule);
            }
            break;
    }
    return *record;
}

// -----------------------------------------------------------------------------
// Store
// -----------------------------------------------------------------------------

Signer verify_signer(const StoreKeysharePacket& packet, ChainOracle& chain) {
    Signer signer = packet.get_signer();

    if (!signer.auth_token.is_valid(chain)) {
        throw VerificationError(VerificationCode::ExpiredSigner);
    }

    sr25519::Signature sig;
    try {
        sig = packet.parse_signature(SLOT_SIGNER);
    } catch (const sr25519::SignatureError& e) {
        throw VerificationError(VerificationCode::InvalidSignerSig, e.fault());
    }

    if (!sr25519::verify(sig, packet.signer_address, packet.owner_address)) {
        throw VerificationError(VerificationCode::SignerVerificationFailed);
    }
    return signer;
}

StoreKeyshareData verify_store_data(const StoreKeysharePacket& packet, const Signer& signer) {
    StoreKeyshareData data = packet.get_data();

    sr25519::Signature sig;
    try {
        sig = packet.parse_signature(SLOT_OWNER);
    } catch (const sr25519::SignatureError& e) {
        throw VerificationError(VerificationCode::InvalidDataSig, e.fault());
    }

    if (!sr25519::verify(sig, packet.data, signer.account)) {
        throw VerificationError(VerificationCode::DataVerificationFailed);
    }
    return data;
}

StoreKeyshareData verify_store_request(
    const StoreKeysharePacket& packet,
    NftType nft_type,
    ChainOracle& chain)
{
    Signer signer = verify_signer(packet, chain);
    StoreKeyshareData data = verify_store_data(packet, signer);

    NftRecord record = fetch_record(chain, data.nft_id, nft_type);

    if (!data.auth_token.is_valid(chain)) {
        throw VerificationError(VerificationCode::ExpiredData);
    }

    if (!authorize_requester(chain, packet.owner_address, RequesterType::Owner, data.nft_id, record.owner)) {
        throw VerificationError(VerificationCode::OwnershipVerificationFailed);
    }

    KEYSHIELD_LOG_DEBUG << "Store request for " << to_string(nft_type) << " " << data.nft_id
                        << " accepted, owner " << packet.owner_address.to_ss58check();
    return data;
}

StoreKeyshareData verify_free_store_request(const StoreKeysharePacket& packet, ChainOracle& chain) {
    Signer signer = verify_signer(packet, chain);
    return verify_store_data(packet, signer);
}

// -----------------------------------------------------------------------------
// Retrieve
// -----------------------------------------------------------------------------

// Requester signature over the raw data field; `mismatch` is raised when it does not verify
static RetrieveKeyshareData check_requester_signature(const RetrieveKeysharePacket& packet, VerificationCode mismatch) {
    RetrieveKeyshareData data = packet.get_data();

    sr25519::Signature sig;
    try {
        sig = packet.parse_signature();
    } catch (const sr25519::SignatureError& e) {
        throw VerificationError(VerificationCode::InvalidSignerSig, e.fault());
    }

    if (!sr25519::verify(sig, packet.data, packet.requester_address)) {
        throw VerificationError(mismatch);
    }
    return data;
}

RetrieveKeyshareData verify_retrieve_data(const RetrieveKeysharePacket& packet) {
    return check_requester_signature(packet, VerificationCode::SignerVerificationFailed);
}

RetrieveKeyshareData verify_retrieve_request(
    const RetrieveKeysharePacket& packet,
    NftType nft_type,
    ChainOracle& chain)
{
    RetrieveKeyshareData data = verify_retrieve_data(packet);

    NftRecord record = fetch_record(chain, data.nft_id, nft_type);

    if (!data.auth_token.is_valid(chain)) {
        throw VerificationError(VerificationCode::ExpiredData);
    }

    if (!authorize_requester(chain, packet.requester_address, packet.requester_type, data.nft_id, record.owner)) {
        throw VerificationError(VerificationCode::RequesterVerificationFailed);
    }

    KEYSHIELD_LOG_DEBUG << "Retrieve request for " << to_string(nft_type) << " " << data.nft_id
                        << " accepted, requester " << packet.requester_address.to_ss58check()
                        << " as " << to_string(packet.requester_type);
    return data;
}

RetrieveKeyshareData verify_free_retrieve_request(const RetrieveKeysharePacket& packet, ChainOracle& chain) {
    RetrieveKeyshareData data = check_requester_signature(packet, VerificationCode::DataVerificationFailed);

    if (!data.auth_token.is_valid(chain)) {
        throw VerificationError(VerificationCode::ExpiredData);
    }
    return data;
}

} // namespace protocol
