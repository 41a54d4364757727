#include "errors.hpp"
#include "../logger.hpp"

namespace protocol {

const char* to_string(VerificationCode code) {
    switch (code) {
        case VerificationCode::MalformedData:               return "MALFORMEDDATA";
        case VerificationCode::MalformedSigner:             return "MALFORMEDSIGNER";
        case VerificationCode::InvalidSignerAddress:        return "INVALIDSIGNERADDRESS";
        case VerificationCode::InvalidOwnerAddress:         return "INVALIDOWNERADDRESS";
        case VerificationCode::InvalidNftId:                return "INVALIDNFTID";
        case VerificationCode::InvalidKeyshare:             return "INVALIDKEYSHARE";
        case VerificationCode::InvalidAuthToken:            return "INVALIDAUTHTOKEN";
        case VerificationCode::InvalidSignerSig:            return "INVALIDSIGNERSIG";
        case VerificationCode::InvalidDataSig:              return "INVALIDDATASIG";
        case VerificationCode::SignerVerificationFailed:    return "SIGNERVERIFICATIONFAILED";
        case VerificationCode::DataVerificationFailed:      return "DATAVERIFICATIONFAILED";
        case VerificationCode::OwnershipVerificationFailed: return "OWNERSHIPVERIFICATIONFAILED";
        case VerificationCode::RequesterVerificationFailed: return "REQUESTERVERIFICATIONFAILED";
        case VerificationCode::ExpiredSigner:               return "EXPIREDSIGNER";
        case VerificationCode::ExpiredData:                 return "EXPIREDDATA";
        case VerificationCode::IdIsNotSecretNft:            return "IDISNOTSECRETNFT";
        case VerificationCode::IdIsNotCapsule:              return "IDISNOTCAPSULE";
    }
    return "UNKNOWN";
}

static std::string describe(VerificationCode code, std::optional<SignatureFault> fault) {
    std::string text = to_string(code);
    if (fault) {
        text += "(";
        text += sr25519::to_string(*fault);
        text += ")";
    }
    return text;
}

VerificationError::VerificationError(VerificationCode code)
    : std::runtime_error(describe(code, std::nullopt)), code_(code) {}

VerificationError::VerificationError(VerificationCode code, SignatureFault fault)
    : std::runtime_error(describe(code, fault)), code_(code), fault_(fault) {}

const char* to_string(ReturnStatus status) {
    switch (status) {
        case ReturnStatus::StoreSuccess:                return "STORESUCCESS";
        case ReturnStatus::RetrieveSuccess:             return "RETRIEVESUCCESS";
        case ReturnStatus::RemoveSuccess:               return "REMOVESUCCESS";
        case ReturnStatus::SignerSigVerificationFailed: return "SIGNERSIGVERIFICATIONFAILED";
        case ReturnStatus::DataSigVerificationFailed:   return "DATASIGVERIFICATIONFAILED";
        case ReturnStatus::OwnershipVerificationFailed: return "OWNERSHIPVERIFICATIONFAILED";
        case ReturnStatus::RequesterVerificationFailed: return "REQUESTERVERIFICATIONFAILED";
        case ReturnStatus::InvalidDataFormat:           return "INVALIDDATAFORMAT";
        case ReturnStatus::InvalidSignerFormat:         return "INVALIDSIGNERFORMAT";
        case ReturnStatus::InvalidSignerSignature:      return "INVALIDSIGNERSIGNATURE";
        case ReturnStatus::InvalidDataSignature:        return "INVALIDDATASIGNATURE";
        case ReturnStatus::InvalidOwnerAddress:         return "INVALIDOWNERADDRESS";
        case ReturnStatus::InvalidSignerAddress:        return "INVALIDSIGNERADDRESS";
        case ReturnStatus::InvalidAuthToken:            return "INVALIDAUTHTOKEN";
        case ReturnStatus::InvalidKeyshare:             return "INVALIDKEYSHARE";
        case ReturnStatus::InvalidNftId:                return "INVALIDNFTID";
        case ReturnStatus::ExpiredSigner:               return "EXPIREDSIGNER";
        case ReturnStatus::ExpiredRequest:              return "EXPIREDREQUEST";
        case ReturnStatus::NftIdExists:                 return "NFTIDEXISTS";
        case ReturnStatus::DatabaseFailure:             return "DATABASEFAILURE";
        case ReturnStatus::OracleFailure:               return "ORACLEFAILURE";
        case ReturnStatus::KeyNotExist:                 return "KEYNOTEXIST";
        case ReturnStatus::KeyNotAccessible:            return "KEYNOTACCESSIBLE";
        case ReturnStatus::KeyNotReadable:              return "KEYNOTREADABLE";
        case ReturnStatus::IdIsNotASecretNft:           return "IDISNOTASECRETNFT";
        case ReturnStatus::IdIsNotACapsule:             return "IDISNOTACAPSULE";
        case ReturnStatus::IdIsNotEncrypted:            return "IDISNOTENCRYPTED";
        case ReturnStatus::NotBurnt:                    return "NOTBURNT";
        case ReturnStatus::NotSyncing:                  return "NOTSYNCING";
    }
    return "UNKNOWN";
}

const char* to_string(ApiCall call) {
    switch (call) {
        case ApiCall::NftStore:        return "NFTSTORE";
        case ApiCall::NftRetrieve:     return "NFTRETRIEVE";
        case ApiCall::CapsuleSet:      return "CAPSULESET";
        case ApiCall::CapsuleRetrieve: return "CAPSULERETRIEVE";
    }
    return "UNKNOWN";
}

nlohmann::json StatusReport::to_json() const {
    return nlohmann::json{
        {"status", to_string(status)},
        {"nft_id", nft_id},
        {"enclave_id", enclave_id},
        {"description", description}
    };
}

ReturnStatus status_for(VerificationCode code) {
    switch (code) {
        case VerificationCode::MalformedData:               return ReturnStatus::InvalidDataFormat;
        case VerificationCode::MalformedSigner:             return ReturnStatus::InvalidSignerFormat;
        case VerificationCode::InvalidSignerAddress:        return ReturnStatus::InvalidSignerAddress;
        case VerificationCode::InvalidOwnerAddress:         return ReturnStatus::InvalidOwnerAddress;
        case VerificationCode::InvalidNftId:                return ReturnStatus::InvalidNftId;
        case VerificationCode::InvalidKeyshare:             return ReturnStatus::InvalidKeyshare;
        case VerificationCode::InvalidAuthToken:            return ReturnStatus::InvalidAuthToken;
        case VerificationCode::InvalidSignerSig:            return ReturnStatus::InvalidSignerSignature;
        case VerificationCode::InvalidDataSig:              return ReturnStatus::InvalidDataSignature;
        case VerificationCode::SignerVerificationFailed:    return ReturnStatus::SignerSigVerificationFailed;
        case VerificationCode::DataVerificationFailed:      return ReturnStatus::DataSigVerificationFailed;
        case VerificationCode::OwnershipVerificationFailed: return ReturnStatus::OwnershipVerificationFailed;
        case VerificationCode::RequesterVerificationFailed: return ReturnStatus::RequesterVerificationFailed;
        case VerificationCode::ExpiredSigner:               return ReturnStatus::ExpiredSigner;
        case VerificationCode::ExpiredData:                 return ReturnStatus::ExpiredRequest;
        case VerificationCode::IdIsNotSecretNft:            return ReturnStatus::IdIsNotASecretNft;
        case VerificationCode::IdIsNotCapsule:              return ReturnStatus::IdIsNotACapsule;
    }
    return ReturnStatus::InvalidDataFormat;
}

static std::string description_for(const VerificationError& error, ApiCall call) {
    std::string prefix = std::string("TEE Key-share ") + to_string(call) + ": ";
    std::string fault = error.signature_fault() ? sr25519::to_string(*error.signature_fault()) : "";

    switch (error.code()) {
        case VerificationCode::InvalidSignerSig:
            return prefix + "Invalid request signature format, " + fault;
        case VerificationCode::InvalidDataSig:
            return prefix + "Invalid request data signature format, " + fault;
        case VerificationCode::InvalidOwnerAddress:
            return prefix + "Invalid owner address format";
        case VerificationCode::InvalidSignerAddress:
            return prefix + "Invalid signer address format";
        case VerificationCode::SignerVerificationFailed:
            return prefix + "Signer signature verification failed, Signer is not approved by NFT owner";
        case VerificationCode::DataVerificationFailed:
            return prefix + "Data signature verification failed.";
        case VerificationCode::InvalidAuthToken:
            return prefix + "Invalid authentication-token format.";
        case VerificationCode::InvalidNftId:
            return prefix + "The nft-id is not a valid number or nft does not exist.";
        case VerificationCode::InvalidKeyshare:
            return prefix + "The key-share is empty or not a valid string.";
        case VerificationCode::OwnershipVerificationFailed:
            return prefix + "The nft-id is not owned by this owner.";
        case VerificationCode::RequesterVerificationFailed:
            return prefix + "The requester is not either owner, delegatee or rentee.";
        case VerificationCode::ExpiredSigner:
            return prefix + "The signer account has been expired or is not in valid range.";
        case VerificationCode::ExpiredData:
            return prefix + "The request data field has been expired or is not in valid range.";
        case VerificationCode::IdIsNotSecretNft:
            return prefix + "The nft-id is not a secret-nft.";
        case VerificationCode::IdIsNotCapsule:
            return prefix + "The nft-id is not a capsule.";
        case VerificationCode::MalformedData:
            return prefix + "Failed to parse data field.";
        case VerificationCode::MalformedSigner:
            return prefix + "Failed to parse Signer field.";
    }
    return prefix + "Unknown verification failure.";
}

StatusReport express_verification_error(
    const VerificationError& error,
    ApiCall call,
    const std::string& caller,
    uint32_t nft_id,
    const std::string& enclave_id)
{
    StatusReport report;
    report.status = status_for(error.code());
    report.nft_id = nft_id;
    report.enclave_id = enclave_id;
    report.description = description_for(error, call);

    KEYSHIELD_LOG_INFO << report.description << ", requester : " << caller;
    return report;
}

StatusReport express_chain_error(
    const ChainQueryError& error,
    ApiCall call,
    const std::string& caller,
    uint32_t nft_id,
    const std::string& enclave_id)
{
    StatusReport report;
    report.status = ReturnStatus::OracleFailure;
    report.nft_id = nft_id;
    report.enclave_id = enclave_id;
    report.description = std::string("TEE Key-share ") + to_string(call)
        + ": Chain oracle query failed";

    KEYSHIELD_LOG_ERROR << report.description << " (" << error.what() << "), requester : " << caller;
    return report;
}

} // namespace protocol
