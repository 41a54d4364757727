#ifndef KEYSHIELD_PROTOCOL_ADMIN_HPP
#define KEYSHIELD_PROTOCOL_ADMIN_HPP

#include "authtoken.hpp"
#include "chain.hpp"
#include "packets.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace protocol {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// -----------------------------------------------------------------------------
// AdminConfig - per-deployment settings for privileged bulk requests
//
// Env format, one KEY=value per line, '#' starts a comment:
//   ENCLAVE_ID=...
//   ADMIN_WHITELIST=<ss58>,<ss58>,...
//   MAX_VALIDATION_PERIOD=20      (optional)
//   MAX_BLOCK_VARIATION=5         (optional)
// -----------------------------------------------------------------------------
struct AdminConfig {
    std::string              enclave_id;
    std::vector<std::string> whitelist;   // SS58 accounts, compared verbatim
    TokenLimits              limits;

    bool is_whitelisted(const std::string& account) const;

    std::string to_env_string() const;
    // Throws ConfigError
    static AdminConfig from_env_string(const std::string& env_content);
};

// Throws ConfigError when the file cannot be read or parsed
AdminConfig load_admin_config(const std::string& path);

// -----------------------------------------------------------------------------
// MaintenanceState - shared status message shown while an admin request runs
//
// Last writer wins. Callers serialize admin operations when order matters.
// -----------------------------------------------------------------------------
class MaintenanceState {
public:
    void set(const std::string& message);
    void clear();

    std::string message() const;
    bool active() const;

private:
    mutable std::mutex mutex_;
    std::string message_;
};

// Sets the maintenance message on construction, clears it on destruction
class MaintenanceGuard {
public:
    MaintenanceGuard(MaintenanceState& state, const std::string& message);
    ~MaintenanceGuard();

    MaintenanceGuard(const MaintenanceGuard&) = delete;
    MaintenanceGuard& operator=(const MaintenanceGuard&) = delete;

private:
    MaintenanceState& state_;
};

// -----------------------------------------------------------------------------
// Admin request verification
// -----------------------------------------------------------------------------
enum class AdminFailure {
    NotWhitelisted,
    InvalidAdminAddress,
    MalformedToken,
    UnparsableToken,
    InvalidSignature,
    InvalidToken,
    DataHashMismatch,
    InvalidIdVector
};

const char* to_string(AdminFailure failure);

class AdminError : public std::runtime_error {
public:
    explicit AdminError(AdminFailure failure);
    AdminError(AdminFailure failure, ValidationResult validation);

    AdminFailure failure() const { return failure_; }
    // Set for InvalidToken
    std::optional<ValidationResult> validation() const { return validation_; }

private:
    AdminFailure failure_;
    std::optional<ValidationResult> validation_;
};

struct ParsedAdminPayload {
    AccountId             admin;
    AdminAuthToken        auth_token;
    std::vector<uint32_t> nft_ids;
};

extern const char* const ADMIN_MAINTENANCE_MESSAGE;

// Order: whitelist, token parse, signature, window, data hash, id vector.
// The maintenance message is held for the whole call. Throws AdminError.
ParsedAdminPayload verify_admin_request(
    const AdminIdPacket& packet,
    const AdminConfig& config,
    ChainOracle& chain,
    MaintenanceState& maintenance
);

} // namespace protocol

#endif // KEYSHIELD_PROTOCOL_ADMIN_HPP
