#include "keyshield/keyshield_c.h"
#include "../protocol/admin.hpp"
#include "../protocol/errors.hpp"
#include "../protocol/packets.hpp"
#include "../protocol/verify.hpp"
#include "../crypto/ristretto.hpp"
#include "../crypto/ss58.hpp"
#include "../helpers.hpp"
#include "../logger.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <string>

using namespace protocol;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct keyshield_maintenance_t {
    MaintenanceState state;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

// ChainOracle backed by the caller's callback table
class CallbackChain : public ChainOracle {
public:
    explicit CallbackChain(const keyshield_chain_callbacks_t& cb) : cb_(cb) {}

    uint32_t current_finalized_block() override {
        if (!cb_.current_block) throw ChainQueryError("current_block callback missing");
        uint32_t block = 0;
        check(cb_.current_block(cb_.ctx, &block), "current_block");
        return block;
    }

    std::optional<NftRecord> nft_record(uint32_t nft_id) override {
        if (!cb_.nft_record) throw ChainQueryError("nft_record callback missing");
        int found = 0, is_secret = 0, is_capsule = 0;
        Bytes owner(KEYSHIELD_ACCOUNT_SIZE, 0);
        check(cb_.nft_record(cb_.ctx, nft_id, &found, owner.data(), &is_secret, &is_capsule), "nft_record");
        if (!found) return std::nullopt;

        NftRecord record;
        record.owner = AccountId::from_bytes(owner);
        record.is_secret = is_secret != 0;
        record.is_capsule = is_capsule != 0;
        return record;
    }

    std::optional<AccountId> delegatee_of(uint32_t nft_id) override {
        return account_query(cb_.delegatee_of, nft_id, "delegatee_of");
    }

    std::optional<AccountId> rentee_of(uint32_t nft_id) override {
        return account_query(cb_.rentee_of, nft_id, "rentee_of");
    }

private:
    using AccountFn = int (*)(void*, uint32_t, int*, unsigned char*);

    static void check(int rc, const char* what) {
        if (rc != KEYSHIELD_OK) {
            throw ChainQueryError(std::string(what) + " callback failed with code " + std::to_string(rc));
        }
    }

    std::optional<AccountId> account_query(AccountFn fn, uint32_t nft_id, const char* what) {
        if (!fn) throw ChainQueryError(std::string(what) + " callback missing");
        int found = 0;
        Bytes account(KEYSHIELD_ACCOUNT_SIZE, 0);
        check(fn(cb_.ctx, nft_id, &found, account.data()), what);
        if (!found) return std::nullopt;
        return AccountId::from_bytes(account);
    }

    keyshield_chain_callbacks_t cb_;
};

// Leading numeric field of a data string, 0 when absent
static uint32_t leading_nft_id(const std::string& data) {
    auto body = unwrap_signed_payload(data);
    if (!body) return 0;
    auto parts = keyshield::utils::split(*body, FIELD_DELIMITER);
    auto id = keyshield::utils::parse_u32(parts.front());
    return id ? *id : 0;
}

struct RequestContext {
    ApiCall     call;
    std::string caller;
    uint32_t    nft_id = 0;
    std::string enclave_id;
};

static int report_verification(const VerificationError& e, const RequestContext& ctx, int rc, char** out_json) {
    StatusReport report = express_verification_error(e, ctx.call, ctx.caller, ctx.nft_id, ctx.enclave_id);
    *out_json = copy_to_c_string(report.to_json().dump());
    return rc;
}

static int report_chain(const ChainQueryError& e, const RequestContext& ctx, char** out_json) {
    StatusReport report = express_chain_error(e, ctx.call, ctx.caller, ctx.nft_id, ctx.enclave_id);
    *out_json = copy_to_c_string(report.to_json().dump());
    return KEYSHIELD_ERR_CHAIN;
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

void keyshield_init(void) {
    ristretto::init();
}

void keyshield_free_string(char* str) {
    delete[] str;
}

int keyshield_sr25519_verify(const char* signature_hex,
                             const unsigned char* msg, size_t msg_len,
                             const char* ss58_account) {
    if (!signature_hex || !ss58_account || (!msg && msg_len > 0)) return KEYSHIELD_ERR_INVALID_ARG;

    try {
        sr25519::Signature sig = sr25519::parse_signature_hex(signature_hex);
        AccountId account = AccountId::from_ss58check(ss58_account);
        Bytes message(msg, msg + msg_len);
        return sr25519::verify(sig, message, account) ? KEYSHIELD_OK : KEYSHIELD_ERR_VERIFY_FAIL;
    } catch (const sr25519::SignatureError&) {
        return KEYSHIELD_ERR_PARSE;
    } catch (const ss58::Ss58Error&) {
        return KEYSHIELD_ERR_PARSE;
    } catch (const std::invalid_argument&) {
        return KEYSHIELD_ERR_PARSE;
    }
}

/*==============================================================================
 * Key-share requests
 *============================================================================*/

int keyshield_verify_store_request(const char* packet_json,
                                   const char* nft_type,
                                   const char* enclave_id,
                                   const keyshield_chain_callbacks_t* chain,
                                   char** out_json) {
    if (!packet_json || !nft_type || !enclave_id || !chain || !out_json) return KEYSHIELD_ERR_INVALID_ARG;
    *out_json = nullptr;

    NftType type;
    try {
        type = nft_type_from_string(nft_type);
    } catch (const std::invalid_argument&) {
        return KEYSHIELD_ERR_INVALID_ARG;
    }

    RequestContext ctx;
    ctx.call = type == NftType::Capsule ? ApiCall::CapsuleSet : ApiCall::NftStore;
    ctx.enclave_id = enclave_id;

    nlohmann::json j = nlohmann::json::parse(packet_json, nullptr, false);
    if (j.is_discarded()) {
        return report_verification(VerificationError(VerificationCode::MalformedData), ctx, KEYSHIELD_ERR_PARSE, out_json);
    }

    try {
        StoreKeysharePacket packet = StoreKeysharePacket::from_json(j);
        ctx.caller = packet.owner_address.to_ss58check();
        ctx.nft_id = leading_nft_id(packet.data);

        CallbackChain oracle(*chain);
        StoreKeyshareData data = verify_store_request(packet, type, oracle);

        nlohmann::json result{
            {"nft_id", data.nft_id},
            {"keyshare", keyshield::utils::to_string(data.keyshare)},
            {"block_number", data.auth_token.block_number},
            {"block_validation", data.auth_token.block_validation}
        };
        *out_json = copy_to_c_string(result.dump());
        return KEYSHIELD_OK;
    } catch (const VerificationError& e) {
        return report_verification(e, ctx, KEYSHIELD_ERR_VERIFY_FAIL, out_json);
    } catch (const ChainQueryError& e) {
        return report_chain(e, ctx, out_json);
    } catch (const std::exception& e) {
        KEYSHIELD_LOG_ERROR << "Store request failed unexpectedly: " << e.what();
        return KEYSHIELD_ERR;
    }
}

int keyshield_verify_retrieve_request(const char* packet_json,
                                      const char* nft_type,
                                      const char* enclave_id,
                                      const keyshield_chain_callbacks_t* chain,
                                      char** out_json) {
    if (!packet_json || !nft_type || !enclave_id || !chain || !out_json) return KEYSHIELD_ERR_INVALID_ARG;
    *out_json = nullptr;

    NftType type;
    try {
        type = nft_type_from_string(nft_type);
    } catch (const std::invalid_argument&) {
        return KEYSHIELD_ERR_INVALID_ARG;
    }

    RequestContext ctx;
    ctx.call = type == NftType::Capsule ? ApiCall::CapsuleRetrieve : ApiCall::NftRetrieve;
    ctx.enclave_id = enclave_id;

    nlohmann::json j = nlohmann::json::parse(packet_json, nullptr, false);
    if (j.is_discarded()) {
        return report_verification(VerificationError(VerificationCode::MalformedData), ctx, KEYSHIELD_ERR_PARSE, out_json);
    }

    try {
        RetrieveKeysharePacket packet = RetrieveKeysharePacket::from_json(j);
        ctx.caller = packet.requester_address.to_ss58check();
        ctx.nft_id = leading_nft_id(packet.data);

        CallbackChain oracle(*chain);
        RetrieveKeyshareData data = verify_retrieve_request(packet, type, oracle);

        nlohmann::json result{
            {"nft_id", data.nft_id},
            {"block_number", data.auth_token.block_number},
            {"block_validation", data.auth_token.block_validation}
        };
        *out_json = copy_to_c_string(result.dump());
        return KEYSHIELD_OK;
    } catch (const VerificationError& e) {
        return report_verification(e, ctx, KEYSHIELD_ERR_VERIFY_FAIL, out_json);
    } catch (const ChainQueryError& e) {
        return report_chain(e, ctx, out_json);
    } catch (const std::exception& e) {
        KEYSHIELD_LOG_ERROR << "Retrieve request failed unexpectedly: " << e.what();
        return KEYSHIELD_ERR;
    }
}

/*==============================================================================
 * Admin requests
 *============================================================================*/

int keyshield_maintenance_create(keyshield_maintenance_t** out) {
    if (!out) return KEYSHIELD_ERR_INVALID_ARG;
    *out = new keyshield_maintenance_t();
    return KEYSHIELD_OK;
}

int keyshield_maintenance_message(const keyshield_maintenance_t* m, char** out) {
    if (!m || !out) return KEYSHIELD_ERR_INVALID_ARG;
    *out = copy_to_c_string(m->state.message());
    return KEYSHIELD_OK;
}

void keyshield_maintenance_destroy(keyshield_maintenance_t* m) {
    delete m;
}

int keyshield_verify_admin_request(const char* packet_json,
                                   const char* config_env,
                                   const keyshield_chain_callbacks_t* chain,
                                   keyshield_maintenance_t* maintenance,
                                   char** out_json) {
    if (!packet_json || !config_env || !chain || !maintenance || !out_json) return KEYSHIELD_ERR_INVALID_ARG;
    *out_json = nullptr;

    AdminConfig config;
    AdminIdPacket packet;
    try {
        config = AdminConfig::from_env_string(config_env);
        nlohmann::json j = nlohmann::json::parse(packet_json, nullptr, false);
        if (j.is_discarded()) return KEYSHIELD_ERR_PARSE;
        packet = AdminIdPacket::from_json(j);
    } catch (const ConfigError& e) {
        KEYSHIELD_LOG_ERROR << "Admin config rejected: " << e.what();
        return KEYSHIELD_ERR_PARSE;
    } catch (const std::invalid_argument& e) {
        KEYSHIELD_LOG_ERROR << "Admin packet rejected: " << e.what();
        return KEYSHIELD_ERR_PARSE;
    }

    try {
        CallbackChain oracle(*chain);
        ParsedAdminPayload payload = verify_admin_request(packet, config, oracle, maintenance->state);

        nlohmann::json result{
            {"admin", payload.admin.to_ss58check()},
            {"nft_ids", payload.nft_ids},
            {"auth_token", nlohmann::json::parse(payload.auth_token.to_json())}
        };
        *out_json = copy_to_c_string(result.dump());
        return KEYSHIELD_OK;
    } catch (const AdminError& e) {
        *out_json = copy_to_c_string(nlohmann::json{{"error", e.what()}}.dump());
        if (e.validation() && *e.validation() == ValidationResult::ErrorRpcCall) {
            return KEYSHIELD_ERR_CHAIN;
        }
        return KEYSHIELD_ERR_VERIFY_FAIL;
    } catch (const std::exception& e) {
        KEYSHIELD_LOG_ERROR << "Admin request failed unexpectedly: " << e.what();
        return KEYSHIELD_ERR;
    }
}
