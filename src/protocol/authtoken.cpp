#include "authtoken.hpp"
#include "chain.hpp"
#include "errors.hpp"
#include "../logger.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace protocol {

// -----------------------------------------------------------------------------
// AuthenticationToken
// -----------------------------------------------------------------------------

ValidityWindow AuthenticationToken::window() const {
    ValidityWindow w;
    w.window_start = block_number > TOKEN_GRACE_BLOCKS ? uint64_t(block_number) - TOKEN_GRACE_BLOCKS : 0;
    w.window_end = uint64_t(block_number) + block_validation + TOKEN_GRACE_BLOCKS;
    return w;
}

bool AuthenticationToken::is_valid_at(uint32_t current_block) const {
    return window().contains(current_block);
}

bool AuthenticationToken::is_valid(ChainOracle& chain) const {
    uint32_t current = chain.current_finalized_block();
    bool valid = is_valid_at(current);
    if (!valid) {
        KEYSHIELD_LOG_DEBUG << "Token " << serialize() << " is outside its window at block " << current;
    }
    return valid;
}

std::string AuthenticationToken::serialize() const {
    return std::to_string(block_number) + "_" + std::to_string(block_validation);
}

// -----------------------------------------------------------------------------
// AdminAuthToken
// -----------------------------------------------------------------------------

const char* to_string(ValidationResult result) {
    switch (result) {
        case ValidationResult::Success:            return "Success";
        case ValidationResult::ErrorRpcCall:       return "ErrorRpcCall";
        case ValidationResult::ExpiredBlockNumber: return "ExpiredBlockNumber";
        case ValidationResult::FutureBlockNumber:  return "FutureBlockNumber";
        case ValidationResult::InvalidPeriod:      return "InvalidPeriod";
    }
    return "Unknown";
}

ValidityWindow AdminAuthToken::window(const TokenLimits& limits) const {
    uint32_t variation = limits.max_block_variation;
    ValidityWindow w;
    w.window_start = block_number > variation ? uint64_t(block_number) - variation : 0;
    // Inclusive upper bound
    w.window_end = uint64_t(block_number) + block_validation + variation + 1;
    return w;
}

ValidationResult AdminAuthToken::check_at(uint32_t current_block, const TokenLimits& limits) const {
    ValidityWindow w = window(limits);
    if (current_block < w.window_start) {
        return ValidationResult::FutureBlockNumber;
    }
    if (block_validation > limits.max_validation_period) {
        return ValidationResult::InvalidPeriod;
    }
    if (current_block >= w.window_end) {
        return ValidationResult::ExpiredBlockNumber;
    }
    return ValidationResult::Success;
}

ValidationResult AdminAuthToken::check(ChainOracle& chain, const TokenLimits& limits) const {
    uint32_t current = 0;
    try {
        current = chain.current_finalized_block();
    } catch (const ChainQueryError& e) {
        KEYSHIELD_LOG_ERROR << "Admin token check: unable to get current block number: " << e.what();
        return ValidationResult::ErrorRpcCall;
    }
    return check_at(current, limits);
}

static uint32_t read_u32(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) {
        throw std::invalid_argument(std::string("Admin token field missing or not unsigned: ") + key);
    }
    uint64_t value = it->get<uint64_t>();
    if (value > UINT32_MAX) {
        throw std::invalid_argument(std::string("Admin token field out of range: ") + key);
    }
    return static_cast<uint32_t>(value);
}

AdminAuthToken AdminAuthToken::from_json(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::invalid_argument("Admin token is not a JSON object");
    }

    AdminAuthToken token;
    token.block_number = read_u32(j, "block_number");
    token.block_validation = read_u32(j, "block_validation");

    auto hash = j.find("data_hash");
    if (hash == j.end() || !hash->is_string()) {
        throw std::invalid_argument("Admin token field missing or not a string: data_hash");
    }
    token.data_hash = hash->get<std::string>();
    return token;
}

std::string AdminAuthToken::to_json() const {
    nlohmann::json j{
        {"block_number", block_number},
        {"block_validation", block_validation},
        {"data_hash", data_hash}
    };
    return j.dump();
}

} // namespace protocol
