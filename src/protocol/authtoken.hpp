#ifndef KEYSHIELD_PROTOCOL_AUTHTOKEN_HPP
#define KEYSHIELD_PROTOCOL_AUTHTOKEN_HPP

#include <cstdint>
#include <string>

namespace protocol {

class ChainOracle;

// Grace blocks on either side of a per-secret token, absorbing finalization lag
constexpr uint32_t TOKEN_GRACE_BLOCKS = 3;

constexpr uint32_t DEFAULT_MAX_VALIDATION_PERIOD = 20;
constexpr uint32_t DEFAULT_MAX_BLOCK_VARIATION = 5;

// -----------------------------------------------------------------------------
// ValidityWindow - half-open range of block heights [window_start, window_end)
// -----------------------------------------------------------------------------
struct ValidityWindow {
    uint64_t window_start = 0;
    uint64_t window_end   = 0;

    bool contains(uint64_t block) const {
        return block >= window_start && block < window_end;
    }
};

// -----------------------------------------------------------------------------
// AuthenticationToken - per-secret freshness claim
// -----------------------------------------------------------------------------
struct AuthenticationToken {
    uint32_t block_number     = 0;
    uint32_t block_validation = 0;

    // [block_number - 3, block_number + block_validation + 3)
    ValidityWindow window() const;

    bool is_valid_at(uint32_t current_block) const;
    // Throws ChainQueryError when the height cannot be obtained
    bool is_valid(ChainOracle& chain) const;

    // "{block_number}_{block_validation}"
    std::string serialize() const;

    bool operator==(const AuthenticationToken& other) const {
        return block_number == other.block_number && block_validation == other.block_validation;
    }
    bool operator!=(const AuthenticationToken& other) const { return !(*this == other); }
};

// -----------------------------------------------------------------------------
// AdminAuthToken - hash-bound token for bulk administrative requests
// -----------------------------------------------------------------------------
enum class ValidationResult {
    Success,
    ErrorRpcCall,
    ExpiredBlockNumber,
    FutureBlockNumber,
    InvalidPeriod
};

const char* to_string(ValidationResult result);

struct TokenLimits {
    uint32_t max_validation_period = DEFAULT_MAX_VALIDATION_PERIOD;
    uint32_t max_block_variation   = DEFAULT_MAX_BLOCK_VARIATION;
};

struct AdminAuthToken {
    uint32_t    block_number     = 0;
    uint32_t    block_validation = 0;
    std::string data_hash;           // lowercase hex SHA-256 of the bulk payload

    // [block_number - variation, block_number + block_validation + variation]
    ValidityWindow window(const TokenLimits& limits) const;

    ValidationResult check_at(uint32_t current_block, const TokenLimits& limits) const;
    // Never throws for oracle failures; those become ErrorRpcCall
    ValidationResult check(ChainOracle& chain, const TokenLimits& limits) const;

    // {"block_number": u32, "block_validation": u32, "data_hash": "<hex>"}
    // Throws std::invalid_argument on malformed input
    static AdminAuthToken from_json(const std::string& text);
    std::string to_json() const;

    bool operator==(const AdminAuthToken& other) const {
        return block_number == other.block_number
            && block_validation == other.block_validation
            && data_hash == other.data_hash;
    }
};

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_AUTHTOKEN_HPP
