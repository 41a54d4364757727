#include "helpers.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <sodium.h>

namespace keyshield {
namespace utils {

std::string bytes_to_hex(const Bytes& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (const auto& byte : bytes) ss << std::setw(2) << static_cast<int>(byte);
    return ss.str();
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Bytes> try_hex_to_bytes(std::string_view hex) {
    if (hex.length() % 2 != 0) return std::nullopt;
    Bytes bytes;
    bytes.reserve(hex.length() / 2);
    for (std::size_t i = 0; i < hex.length(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

Bytes hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) throw std::invalid_argument("Hex string length must be even.");
    auto bytes = try_hex_to_bytes(hex);
    if (!bytes) throw std::invalid_argument("Hex string contains non-hex characters.");
    return *bytes;
}

Bytes to_bytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string to_string(const Bytes& b) {
    return std::string(b.begin(), b.end());
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    for (;;) {
        std::size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<uint32_t> parse_u32(std::string_view s) {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

Bytes sha256(const Bytes& data) {
    Bytes result(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

std::string sha256_hex(const std::string& data) {
    return bytes_to_hex(sha256(to_bytes(data)));
}

Bytes concat_bytes(const Bytes& a, const Bytes& b) {
    Bytes result;
    result.reserve(a.size() + b.size());
    result.insert(result.end(), a.begin(), a.end());
    result.insert(result.end(), b.begin(), b.end());
    return result;
}

bool equal_ct(const Bytes& a, const Bytes& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace utils
} // namespace keyshield
