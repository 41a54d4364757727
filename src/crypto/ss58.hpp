#ifndef KEYSHIELD_CRYPTO_SS58_HPP
#define KEYSHIELD_CRYPTO_SS58_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ss58 {

using Bytes = std::vector<uint8_t>;

constexpr uint16_t DEFAULT_PREFIX = 42;   // generic Substrate network
constexpr size_t ACCOUNT_SIZE = 32;
constexpr size_t CHECKSUM_SIZE = 2;

class Ss58Error : public std::runtime_error {
public:
    explicit Ss58Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Bitcoin-alphabet base58
std::string base58_encode(const Bytes& data);
Bytes base58_decode(const std::string& text);

struct Decoded {
    Bytes    account;  // 32-byte account id
    uint16_t prefix;   // network identifier
};

// Encode a 32-byte account id. Prefixes above 16383 are rejected.
std::string encode(const Bytes& account, uint16_t prefix = DEFAULT_PREFIX);

// Decode and check the BLAKE2b "SS58PRE" checksum. Throws Ss58Error.
Decoded decode(const std::string& address);

} // namespace ss58

#endif // KEYSHIELD_CRYPTO_SS58_HPP
