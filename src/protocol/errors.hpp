#ifndef KEYSHIELD_PROTOCOL_ERRORS_HPP
#define KEYSHIELD_PROTOCOL_ERRORS_HPP

#include "../crypto/sr25519.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace protocol {

using sr25519::SignatureFault;

// -----------------------------------------------------------------------------
// VerificationCode - closed set of request verification failures
// -----------------------------------------------------------------------------
enum class VerificationCode {
    // Format
    MalformedData,
    MalformedSigner,
    InvalidSignerAddress,
    InvalidOwnerAddress,
    InvalidNftId,
    InvalidKeyshare,
    InvalidAuthToken,
    InvalidSignerSig,      // carries a SignatureFault
    InvalidDataSig,        // carries a SignatureFault

    // Authenticity
    SignerVerificationFailed,
    DataVerificationFailed,

    // Authorization
    OwnershipVerificationFailed,
    RequesterVerificationFailed,

    // Freshness
    ExpiredSigner,
    ExpiredData,

    // Domain mismatch
    IdIsNotSecretNft,
    IdIsNotCapsule
};

const char* to_string(VerificationCode code);

class VerificationError : public std::runtime_error {
public:
    explicit VerificationError(VerificationCode code);
    VerificationError(VerificationCode code, SignatureFault fault);

    VerificationCode code() const { return code_; }
    std::optional<SignatureFault> signature_fault() const { return fault_; }

private:
    VerificationCode code_;
    std::optional<SignatureFault> fault_;
};

// Chain oracle could not be reached or answered out of time.
class ChainQueryError : public std::runtime_error {
public:
    explicit ChainQueryError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// External status tags. Clients match on these strings; do not rename.
// -----------------------------------------------------------------------------
enum class ReturnStatus {
    StoreSuccess,
    RetrieveSuccess,
    RemoveSuccess,

    SignerSigVerificationFailed,
    DataSigVerificationFailed,

    OwnershipVerificationFailed,
    RequesterVerificationFailed,

    InvalidDataFormat,
    InvalidSignerFormat,

    InvalidSignerSignature,
    InvalidDataSignature,

    InvalidOwnerAddress,
    InvalidSignerAddress,
    InvalidAuthToken,
    InvalidKeyshare,
    InvalidNftId,

    ExpiredSigner,
    ExpiredRequest,

    NftIdExists,

    DatabaseFailure,
    OracleFailure,

    KeyNotExist,
    KeyNotAccessible,
    KeyNotReadable,

    IdIsNotASecretNft,
    IdIsNotACapsule,
    IdIsNotEncrypted,

    NotBurnt,
    NotSyncing
};

const char* to_string(ReturnStatus status);

enum class ApiCall {
    NftStore,
    NftRetrieve,
    CapsuleSet,
    CapsuleRetrieve
};

const char* to_string(ApiCall call);

struct StatusReport {
    ReturnStatus status;
    uint32_t     nft_id = 0;
    std::string  enclave_id;
    std::string  description;

    // {"status", "nft_id", "enclave_id", "description"}
    nlohmann::json to_json() const;
};

// Total mapping from verification codes to external status tags
ReturnStatus status_for(VerificationCode code);

StatusReport express_verification_error(
    const VerificationError& error,
    ApiCall call,
    const std::string& caller,
    uint32_t nft_id,
    const std::string& enclave_id
);

StatusReport express_chain_error(
    const ChainQueryError& error,
    ApiCall call,
    const std::string& caller,
    uint32_t nft_id,
    const std::string& enclave_id
);

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_ERRORS_HPP
