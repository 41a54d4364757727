#include "admin.hpp"
#include "../crypto/ss58.hpp"
#include "../helpers.hpp"
#include "../logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace protocol {

using keyshield::utils::parse_u32;
using keyshield::utils::sha256_hex;
using keyshield::utils::split;

// -----------------------------------------------------------------------------
// AdminConfig
// -----------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool AdminConfig::is_whitelisted(const std::string& account) const {
    return std::find(whitelist.begin(), whitelist.end(), account) != whitelist.end();
}

std::string AdminConfig::to_env_string() const {
    std::ostringstream out;
    out << "ENCLAVE_ID=" << enclave_id << "\n";
    out << "ADMIN_WHITELIST=";
    for (size_t i = 0; i < whitelist.size(); ++i) {
        if (i > 0) out << ",";
        out << whitelist[i];
    }
    out << "\n";
    out << "MAX_VALIDATION_PERIOD=" << limits.max_validation_period << "\n";
    out << "MAX_BLOCK_VARIATION=" << limits.max_block_variation << "\n";
    return out.str();
}

static uint32_t parse_limit(const std::string& key, const std::string& value) {
    auto parsed = parse_u32(value);
    if (!parsed) {
        throw ConfigError("Invalid number for " + key + ": " + value);
    }
    return *parsed;
}

AdminConfig AdminConfig::from_env_string(const std::string& env_content) {
    AdminConfig config;
    bool has_enclave_id = false;
    bool has_whitelist = false;

    std::istringstream in(env_content);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Malformed config line: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "ENCLAVE_ID") {
            config.enclave_id = value;
            has_enclave_id = true;
        } else if (key == "ADMIN_WHITELIST") {
            config.whitelist.clear();
            for (const auto& entry : split(value, ',')) {
                std::string account = trim(entry);
                if (account.empty()) continue;
                try {
                    ss58::decode(account);
                } catch (const ss58::Ss58Error& e) {
                    throw ConfigError("Invalid whitelist account " + account + ": " + e.what());
                }
                config.whitelist.push_back(account);
            }
            has_whitelist = true;
        } else if (key == "MAX_VALIDATION_PERIOD") {
            config.limits.max_validation_period = parse_limit(key, value);
        } else if (key == "MAX_BLOCK_VARIATION") {
            config.limits.max_block_variation = parse_limit(key, value);
        } else {
            KEYSHIELD_LOG_WARN << "Ignoring unknown admin config key " << key;
        }
    }

    if (!has_enclave_id) {
        throw ConfigError("Missing ENCLAVE_ID");
    }
    if (!has_whitelist) {
        throw ConfigError("Missing ADMIN_WHITELIST");
    }
    return config;
}

AdminConfig load_admin_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open admin config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return AdminConfig::from_env_string(buffer.str());
}

// -----------------------------------------------------------------------------
// MaintenanceState
// -----------------------------------------------------------------------------

void MaintenanceState::set(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message_ = message;
}

void MaintenanceState::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    message_.clear();
}

std::string MaintenanceState::message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

bool MaintenanceState::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !message_.empty();
}

MaintenanceGuard::MaintenanceGuard(MaintenanceState& state, const std::string& message)
    : state_(state) {
    state_.set(message);
}

MaintenanceGuard::~MaintenanceGuard() {
    state_.clear();
}

// -----------------------------------------------------------------------------
// AdminError
// -----------------------------------------------------------------------------

const char* to_string(AdminFailure failure) {
    switch (failure) {
        case AdminFailure::NotWhitelisted:      return "requester is not whitelisted";
        case AdminFailure::InvalidAdminAddress: return "invalid admin account address";
        case AdminFailure::MalformedToken:      return "authentication token wrapper is malformed";
        case AdminFailure::UnparsableToken:     return "authentication token is not parsable";
        case AdminFailure::InvalidSignature:    return "invalid signature";
        case AdminFailure::InvalidToken:        return "authentication token is not valid";
        case AdminFailure::DataHashMismatch:    return "mismatch in data hash";
        case AdminFailure::InvalidIdVector:     return "unable to deserialize nft-id vector";
    }
    return "unknown admin failure";
}

AdminError::AdminError(AdminFailure failure)
    : std::runtime_error(to_string(failure)), failure_(failure) {}

AdminError::AdminError(AdminFailure failure, ValidationResult validation)
    : std::runtime_error(std::string(to_string(failure)) + ": " + to_string(validation)),
      failure_(failure), validation_(validation) {}

// -----------------------------------------------------------------------------
// verify_admin_request
// -----------------------------------------------------------------------------

const char* const ADMIN_MAINTENANCE_MESSAGE =
    "Maintenance is in progress, admin bulk operation running";

static std::vector<uint32_t> parse_id_vector(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        throw AdminError(AdminFailure::InvalidIdVector);
    }

    std::vector<uint32_t> ids;
    ids.reserve(j.size());
    for (const auto& v : j) {
        if (!v.is_number_unsigned() || v.get<uint64_t>() > UINT32_MAX) {
            throw AdminError(AdminFailure::InvalidIdVector);
        }
        ids.push_back(static_cast<uint32_t>(v.get<uint64_t>()));
    }
    return ids;
}

static ParsedAdminPayload verify_admin_steps(
    const AdminIdPacket& packet,
    const AdminConfig& config,
    ChainOracle& chain)
{
    if (!config.is_whitelisted(packet.admin_address)) {
        throw AdminError(AdminFailure::NotWhitelisted);
    }

    ParsedAdminPayload payload;
    try {
        payload.admin = AccountId::from_ss58check(packet.admin_address);
    } catch (const ss58::Ss58Error&) {
        throw AdminError(AdminFailure::InvalidAdminAddress);
    } catch (const std::invalid_argument&) {
        throw AdminError(AdminFailure::InvalidAdminAddress);
    }

    auto token_text = unwrap_signed_payload(packet.auth_token);
    if (!token_text) {
        throw AdminError(AdminFailure::MalformedToken);
    }
    try {
        payload.auth_token = AdminAuthToken::from_json(*token_text);
    } catch (const std::invalid_argument&) {
        throw AdminError(AdminFailure::UnparsableToken);
    }

    // The signature covers the token exactly as sent, wrapper included
    sr25519::Signature sig;
    try {
        sig = sr25519::parse_signature_hex(packet.signature, false);
    } catch (const sr25519::SignatureError&) {
        throw AdminError(AdminFailure::InvalidSignature);
    }
    if (!sr25519::verify(sig, packet.auth_token, payload.admin)) {
        throw AdminError(AdminFailure::InvalidSignature);
    }

    ValidationResult validity = payload.auth_token.check(chain, config.limits);
    if (validity != ValidationResult::Success) {
        throw AdminError(AdminFailure::InvalidToken, validity);
    }

    if (sha256_hex(packet.nftid_vec) != payload.auth_token.data_hash) {
        throw AdminError(AdminFailure::DataHashMismatch);
    }

    payload.nft_ids = parse_id_vector(packet.nftid_vec);
    return payload;
}

ParsedAdminPayload verify_admin_request(
    const AdminIdPacket& packet,
    const AdminConfig& config,
    ChainOracle& chain,
    MaintenanceState& maintenance)
{
    MaintenanceGuard guard(maintenance, ADMIN_MAINTENANCE_MESSAGE);

    try {
        ParsedAdminPayload payload = verify_admin_steps(packet, config, chain);
        KEYSHIELD_LOG_INFO << "Admin request from " << packet.admin_address
                           << " accepted for " << payload.nft_ids.size() << " nft-ids";
        return payload;
    } catch (const AdminError& e) {
        KEYSHIELD_LOG_ERROR << "Admin request from " << packet.admin_address << " rejected: " << e.what();
        throw;
    }
}

} // namespace protocol
