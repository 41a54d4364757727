#ifndef KEYSHIELD_HELPERS_HPP
#define KEYSHIELD_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyshield {
namespace utils {

    using Bytes = std::vector<uint8_t>;

    // Hex helpers (lowercase output, no prefix)
    std::string bytes_to_hex(const Bytes& bytes);
    Bytes hex_to_bytes(const std::string& hex);

    // Strict variant: rejects odd length and non-hex characters
    std::optional<Bytes> try_hex_to_bytes(std::string_view hex);

    Bytes to_bytes(const std::string& s);
    std::string to_string(const Bytes& b);

    // Split on a single delimiter character. Empty fields are kept.
    std::vector<std::string> split(const std::string& s, char delimiter);

    // Decimal u32 parser. Accepts an optional leading '+', rejects
    // whitespace, signs other than '+', empty input and overflow.
    std::optional<uint32_t> parse_u32(std::string_view s);

    // Hash utilities (SHA-256)
    Bytes sha256(const Bytes& data);
    std::string sha256_hex(const std::string& data);

    Bytes concat_bytes(const Bytes& a, const Bytes& b);

    // Constant-time equality for equally sized buffers
    bool equal_ct(const Bytes& a, const Bytes& b);

} // namespace utils
} // namespace keyshield

#endif // KEYSHIELD_HELPERS_HPP
