#ifndef KEYSHIELD_CRYPTO_SR25519_HPP
#define KEYSHIELD_CRYPTO_SR25519_HPP

#include "ristretto.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sr25519 {

using Bytes = std::vector<uint8_t>;

constexpr size_t PUBLIC_KEY_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = 64;
constexpr size_t SEED_SIZE = 32;
constexpr size_t NONCE_SIZE = 32;

// Signing context used by Substrate-based chains for account signatures
extern const char* const SIGNING_CONTEXT;

// -----------------------------------------------------------------------------
// Signature parsing errors
// -----------------------------------------------------------------------------
enum class SignatureFault {
    Prefix,   // missing "0x"
    Length,   // not exactly 64 bytes of hex
    Type      // unknown signature slot
};

const char* to_string(SignatureFault fault);

class SignatureError : public std::runtime_error {
public:
    explicit SignatureError(SignatureFault fault)
        : std::runtime_error(std::string("signature parse error: ") + to_string(fault)), fault_(fault) {}

    SignatureFault fault() const { return fault_; }

private:
    SignatureFault fault_;
};

// -----------------------------------------------------------------------------
// PublicKey - 32-byte compressed ristretto255 point, also the chain account id
// -----------------------------------------------------------------------------
class PublicKey {
public:
    PublicKey();

    static PublicKey from_bytes(const Bytes& b);
    // Throws ss58::Ss58Error
    static PublicKey from_ss58check(const std::string& address);

    Bytes to_bytes() const { return value_; }
    std::string to_ss58check() const;
    std::string to_hex() const;

    bool operator==(const PublicKey& other) const { return value_ == other.value_; }
    bool operator!=(const PublicKey& other) const { return value_ != other.value_; }
    bool operator<(const PublicKey& other) const { return value_ < other.value_; }

private:
    Bytes value_;
};

// -----------------------------------------------------------------------------
// Signature - R (32 bytes) || s (32 bytes), high bit of byte 63 set
// -----------------------------------------------------------------------------
class Signature {
public:
    Signature();

    static Signature from_bytes(const Bytes& b);

    Bytes to_bytes() const { return value_; }
    // "0x"-prefixed lowercase hex
    std::string to_hex() const;

    bool operator==(const Signature& other) const { return value_ == other.value_; }

private:
    Bytes value_;
};

// Parse a hex signature. With require_prefix the "0x" prefix is mandatory;
// without it the prefix is optional. Throws SignatureError.
Signature parse_signature_hex(const std::string& hex, bool require_prefix = true);

// -----------------------------------------------------------------------------
// KeyPair
// -----------------------------------------------------------------------------
struct KeyPair {
    ristretto::Scalar secret;
    Bytes             nonce;
    PublicKey         public_key;
};

KeyPair keygen();

// Deterministic key pair from a 32-byte mini secret (Ed25519-style expansion)
KeyPair from_seed(const Bytes& seed);

Signature sign(const KeyPair& keypair, const Bytes& message);
Signature sign(const KeyPair& keypair, const std::string& message);

// Returns false for any malformed key or signature; never throws.
bool verify(const Signature& signature, const Bytes& message, const PublicKey& public_key);
bool verify(const Signature& signature, const std::string& message, const PublicKey& public_key);

} // namespace sr25519

#endif // KEYSHIELD_CRYPTO_SR25519_HPP
