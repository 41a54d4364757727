#ifndef KEYSHIELD_PROTOCOL_CHAIN_HPP
#define KEYSHIELD_PROTOCOL_CHAIN_HPP

#include "errors.hpp"
#include "../crypto/sr25519.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace protocol {

using AccountId = sr25519::PublicKey;

// -----------------------------------------------------------------------------
// NftRecord - on-chain state of a secret-NFT or capsule
// -----------------------------------------------------------------------------
struct NftRecord {
    AccountId owner;
    bool      is_secret  = false;
    bool      is_capsule = false;
};

// -----------------------------------------------------------------------------
// ChainOracle - read-only view of the finalized chain
//
// Implementations must bound every call in time. Unreachable endpoints,
// timeouts and decoding failures are reported by throwing ChainQueryError;
// "not found" is an empty optional, never an exception.
// -----------------------------------------------------------------------------
class ChainOracle {
public:
    virtual ~ChainOracle() = default;

    virtual uint32_t current_finalized_block() = 0;
    virtual std::optional<NftRecord> nft_record(uint32_t nft_id) = 0;
    virtual std::optional<AccountId> delegatee_of(uint32_t nft_id) = 0;
    virtual std::optional<AccountId> rentee_of(uint32_t nft_id) = 0;
};

// -----------------------------------------------------------------------------
// Requester roles
// -----------------------------------------------------------------------------
enum class RequesterType {
    Owner,
    Delegatee,
    Rentee,
    None
};

const char* to_string(RequesterType type);
// "OWNER" / "DELEGATEE" / "RENTEE" / "NONE"; throws std::invalid_argument
RequesterType requester_type_from_string(const std::string& s);

// Who currently holds a role on an NFT
enum class HolderRole {
    Owner,
    Delegatee,
    Rentee,
    NotFound
};

const char* to_string(HolderRole role);

struct KeyshareHolder {
    HolderRole role = HolderRole::NotFound;
    AccountId  account;   // meaningful unless role is NotFound

    bool found() const { return role != HolderRole::NotFound; }
};

KeyshareHolder lookup_owner(ChainOracle& chain, uint32_t nft_id);
KeyshareHolder lookup_delegatee(ChainOracle& chain, uint32_t nft_id);
KeyshareHolder lookup_rentee(ChainOracle& chain, uint32_t nft_id);

// Checks that `requester` holds the claimed role for the NFT. NONE is
// treated as OWNER. Throws ChainQueryError when the oracle fails.
bool authorize_requester(
    ChainOracle& chain,
    const AccountId& requester,
    RequesterType claimed,
    uint32_t nft_id,
    const AccountId& owner
);

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_CHAIN_HPP
