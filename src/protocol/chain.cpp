#include "chain.hpp"
#include "../logger.hpp"

#include <stdexcept>

namespace protocol {

const char* to_string(RequesterType type) {
    switch (type) {
        case RequesterType::Owner:     return "OWNER";
        case RequesterType::Delegatee: return "DELEGATEE";
        case RequesterType::Rentee:    return "RENTEE";
        case RequesterType::None:      return "NONE";
    }
    return "NONE";
}

RequesterType requester_type_from_string(const std::string& s) {
    if (s == "OWNER")     return RequesterType::Owner;
    if (s == "DELEGATEE") return RequesterType::Delegatee;
    if (s == "RENTEE")    return RequesterType::Rentee;
    if (s == "NONE")      return RequesterType::None;
    throw std::invalid_argument("Unknown requester type: " + s);
}

const char* to_string(HolderRole role) {
    switch (role) {
        case HolderRole::Owner:     return "OWNER";
        case HolderRole::Delegatee: return "DELEGATEE";
        case HolderRole::Rentee:    return "RENTEE";
        case HolderRole::NotFound:  return "NOTFOUND";
    }
    return "NOTFOUND";
}

static KeyshareHolder make_holder(HolderRole role, const std::optional<AccountId>& account) {
    KeyshareHolder holder;
    if (account) {
        holder.role = role;
        holder.account = *account;
    }
    return holder;
}

KeyshareHolder lookup_owner(ChainOracle& chain, uint32_t nft_id) {
    std::optional<NftRecord> record = chain.nft_record(nft_id);
    if (!record) return KeyshareHolder{};
    return make_holder(HolderRole::Owner, record->owner);
}

KeyshareHolder lookup_delegatee(ChainOracle& chain, uint32_t nft_id) {
    return make_holder(HolderRole::Delegatee, chain.delegatee_of(nft_id));
}

KeyshareHolder lookup_rentee(ChainOracle& chain, uint32_t nft_id) {
    return make_holder(HolderRole::Rentee, chain.rentee_of(nft_id));
}

static bool holds(const KeyshareHolder& holder, const AccountId& requester, uint32_t nft_id) {
    if (!holder.found()) {
        KEYSHIELD_LOG_DEBUG << "No holder recorded for nft " << nft_id;
        return false;
    }
    return holder.account == requester;
}

bool authorize_requester(
    ChainOracle& chain,
    const AccountId& requester,
    RequesterType claimed,
    uint32_t nft_id,
    const AccountId& owner)
{
    switch (claimed) {
        case RequesterType::Owner:
        case RequesterType::None:
            return holds(make_holder(HolderRole::Owner, owner), requester, nft_id);
        case RequesterType::Delegatee:
            return holds(lookup_delegatee(chain, nft_id), requester, nft_id);
        case RequesterType::Rentee:
            return holds(lookup_rentee(chain, nft_id), requester, nft_id);
    }
    return false;
}

} // namespace protocol
