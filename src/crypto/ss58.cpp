#include "ss58.hpp"

#include <algorithm>
#include <sodium.h>

namespace ss58 {

static const char ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int alphabet_index(char c) {
    const char* p = std::find(ALPHABET, ALPHABET + 58, c);
    return p == ALPHABET + 58 ? -1 : static_cast<int>(p - ALPHABET);
}

std::string base58_encode(const Bytes& data) {
    std::size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    // log(256) / log(58) < 1.38
    std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        std::size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) ++it;

    std::string out(zeros, '1');
    for (; it != digits.end(); ++it) out.push_back(ALPHABET[*it]);
    return out;
}

Bytes base58_decode(const std::string& text) {
    std::size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') ++zeros;

    // log(58) / log(256) < 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    std::size_t length = 0;

    for (std::size_t i = zeros; i < text.size(); ++i) {
        int carry = alphabet_index(text[i]);
        if (carry < 0) {
            throw Ss58Error("Invalid base58 character");
        }
        std::size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (it != bytes.end() && *it == 0) ++it;

    Bytes out(zeros, 0x00);
    out.insert(out.end(), it, bytes.end());
    return out;
}

static Bytes checksum(const Bytes& payload) {
    static const char PREFIX[] = "SS58PRE";

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, 64);
    crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(PREFIX), sizeof(PREFIX) - 1);
    crypto_generichash_update(&state, payload.data(), payload.size());

    Bytes hash(64);
    crypto_generichash_final(&state, hash.data(), hash.size());
    return Bytes(hash.begin(), hash.begin() + CHECKSUM_SIZE);
}

static Bytes encode_prefix(uint16_t prefix) {
    if (prefix < 64) {
        return Bytes{static_cast<uint8_t>(prefix)};
    }
    if (prefix > 16383) {
        throw Ss58Error("SS58 prefix out of range");
    }
    uint8_t first = static_cast<uint8_t>((prefix & 0x00FC) >> 2);
    uint8_t second = static_cast<uint8_t>((prefix >> 8) | ((prefix & 0x0003) << 6));
    return Bytes{static_cast<uint8_t>(first | 0x40), second};
}

std::string encode(const Bytes& account, uint16_t prefix) {
    if (account.size() != ACCOUNT_SIZE) {
        throw Ss58Error("Account id must be 32 bytes");
    }

    Bytes payload = encode_prefix(prefix);
    payload.insert(payload.end(), account.begin(), account.end());
    Bytes check = checksum(payload);
    payload.insert(payload.end(), check.begin(), check.end());
    return base58_encode(payload);
}

Decoded decode(const std::string& address) {
    Bytes data = base58_decode(address);
    if (data.size() < 2) {
        throw Ss58Error("SS58 address too short");
    }

    std::size_t prefix_len = 0;
    uint16_t prefix = 0;
    if (data[0] < 64) {
        prefix_len = 1;
        prefix = data[0];
    } else if (data[0] < 128) {
        prefix_len = 2;
        uint8_t lower = static_cast<uint8_t>((data[0] << 2) | (data[1] >> 6));
        uint8_t upper = static_cast<uint8_t>(data[1] & 0x3F);
        prefix = static_cast<uint16_t>(lower | (upper << 8));
    } else {
        throw Ss58Error("Invalid SS58 prefix");
    }

    if (data.size() != prefix_len + ACCOUNT_SIZE + CHECKSUM_SIZE) {
        throw Ss58Error("Invalid SS58 address length");
    }

    Bytes payload(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(prefix_len + ACCOUNT_SIZE));
    Bytes expected = checksum(payload);
    if (!std::equal(expected.begin(), expected.end(), data.end() - CHECKSUM_SIZE)) {
        throw Ss58Error("Invalid SS58 checksum");
    }

    Decoded out;
    out.account = Bytes(payload.begin() + static_cast<std::ptrdiff_t>(prefix_len), payload.end());
    out.prefix = prefix;
    return out;
}

} // namespace ss58
