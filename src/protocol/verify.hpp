#ifndef KEYSHIELD_PROTOCOL_VERIFY_HPP
#define KEYSHIELD_PROTOCOL_VERIFY_HPP

#include "chain.hpp"
#include "errors.hpp"
#include "packets.hpp"

#include <string>

namespace protocol {

enum class NftType {
    SecretNft,
    Capsule
};

const char* to_string(NftType type);
// "secret-nft" / "capsule"; throws std::invalid_argument
NftType nft_type_from_string(const std::string& s);

// =============================================================================
// Store requests: owner -> signer -> data
//
// Every function below throws VerificationError on the first failing step and
// lets ChainQueryError from the oracle propagate unchanged.
// =============================================================================

// Signer field parsed, its token fresh, and the field signed by the owner
Signer verify_signer(const StoreKeysharePacket& packet, ChainOracle& chain);

// Data field parsed and signed by the delegated signer
StoreKeyshareData verify_store_data(const StoreKeysharePacket& packet, const Signer& signer);

// Full chain: signer, data, on-chain kind, data freshness, ownership
StoreKeyshareData verify_store_request(
    const StoreKeysharePacket& packet,
    NftType nft_type,
    ChainOracle& chain
);

// Authenticity only, no on-chain authorization
StoreKeyshareData verify_free_store_request(const StoreKeysharePacket& packet, ChainOracle& chain);

// =============================================================================
// Retrieve requests: requester -> data
// =============================================================================

// Data field parsed and signed by the requester
RetrieveKeyshareData verify_retrieve_data(const RetrieveKeysharePacket& packet);

RetrieveKeyshareData verify_retrieve_request(
    const RetrieveKeysharePacket& packet,
    NftType nft_type,
    ChainOracle& chain
);

// Signature and freshness only, no on-chain authorization. A signature that does
// not verify is reported as DataVerificationFailed.
RetrieveKeyshareData verify_free_retrieve_request(const RetrieveKeysharePacket& packet, ChainOracle& chain);

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_VERIFY_HPP
