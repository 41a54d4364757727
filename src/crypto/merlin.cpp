#include "merlin.hpp"

#include <cstring>
#include <stdexcept>

namespace merlin {

// -----------------------------------------------------------------------------
// Keccak-f[1600]
// -----------------------------------------------------------------------------

static const uint64_t ROUND_CONSTANTS[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

static const unsigned ROTATIONS[24] = {
    1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
    27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44
};

static const unsigned PI_LANES[24] = {
    10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1
};

static inline uint64_t rotl64(uint64_t x, unsigned n) {
    return (x << n) | (x >> (64 - n));
}

void keccak_f1600(std::array<uint64_t, 25>& st) {
    uint64_t bc[5];

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho and pi
        uint64_t t = st[1];
        for (int i = 0; i < 24; ++i) {
            unsigned j = PI_LANES[i];
            bc[0] = st[j];
            st[j] = rotl64(t, ROTATIONS[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= ROUND_CONSTANTS[round];
    }
}

static void permute_bytes(std::array<uint8_t, 200>& state) {
    std::array<uint64_t, 25> lanes;
    for (std::size_t i = 0; i < 25; ++i) {
        uint64_t lane = 0;
        for (std::size_t b = 0; b < 8; ++b) {
            lane |= static_cast<uint64_t>(state[i * 8 + b]) << (8 * b);
        }
        lanes[i] = lane;
    }

    keccak_f1600(lanes);

    for (std::size_t i = 0; i < 25; ++i) {
        for (std::size_t b = 0; b < 8; ++b) {
            state[i * 8 + b] = static_cast<uint8_t>(lanes[i] >> (8 * b));
        }
    }
}

// -----------------------------------------------------------------------------
// Strobe128
// -----------------------------------------------------------------------------

static constexpr uint8_t FLAG_I = 1;
static constexpr uint8_t FLAG_A = 1 << 1;
static constexpr uint8_t FLAG_C = 1 << 2;
static constexpr uint8_t FLAG_T = 1 << 3;
static constexpr uint8_t FLAG_M = 1 << 4;
static constexpr uint8_t FLAG_K = 1 << 5;

Strobe128::Strobe128(const Bytes& protocol_label) {
    state_.fill(0);

    const uint8_t header[6] = {1, static_cast<uint8_t>(RATE + 2), 1, 0, 1, 96};
    std::memcpy(state_.data(), header, sizeof(header));
    const char version[] = "STROBEv1.0.2";
    std::memcpy(state_.data() + 6, version, sizeof(version) - 1);
    permute_bytes(state_);

    meta_ad(protocol_label, false);
}

void Strobe128::meta_ad(const Bytes& data, bool more) {
    begin_op(FLAG_M | FLAG_A, more);
    absorb(data);
}

void Strobe128::ad(const Bytes& data, bool more) {
    begin_op(FLAG_A, more);
    absorb(data);
}

void Strobe128::prf(Bytes& out, bool more) {
    begin_op(FLAG_I | FLAG_A | FLAG_C, more);
    squeeze(out);
}

void Strobe128::key(const Bytes& data, bool more) {
    begin_op(FLAG_A | FLAG_C, more);
    overwrite(data);
}

void Strobe128::run_f() {
    state_[pos_] ^= pos_begin_;
    state_[pos_ + 1] ^= 0x04;
    state_[RATE + 1] ^= 0x80;
    permute_bytes(state_);
    pos_ = 0;
    pos_begin_ = 0;
}

void Strobe128::absorb(const Bytes& data) {
    for (uint8_t byte : data) {
        state_[pos_] ^= byte;
        ++pos_;
        if (pos_ == RATE) run_f();
    }
}

void Strobe128::overwrite(const Bytes& data) {
    for (uint8_t byte : data) {
        state_[pos_] = byte;
        ++pos_;
        if (pos_ == RATE) run_f();
    }
}

void Strobe128::squeeze(Bytes& out) {
    for (auto& byte : out) {
        byte = state_[pos_];
        state_[pos_] = 0;
        ++pos_;
        if (pos_ == RATE) run_f();
    }
}

void Strobe128::begin_op(uint8_t flags, bool more) {
    if (more) {
        if (cur_flags_ != flags) {
            throw std::logic_error("strobe: continued operation with different flags");
        }
        return;
    }

    if (flags & FLAG_T) {
        throw std::logic_error("strobe: transport operations are not supported");
    }

    uint8_t old_begin = pos_begin_;
    pos_begin_ = static_cast<uint8_t>(pos_ + 1);
    cur_flags_ = flags;

    absorb(Bytes{old_begin, flags});

    bool force_f = (flags & (FLAG_C | FLAG_K)) != 0;
    if (force_f && pos_ != 0) run_f();
}

// -----------------------------------------------------------------------------
// Transcript
// -----------------------------------------------------------------------------

static Bytes label_bytes(const std::string& label) {
    return Bytes(label.begin(), label.end());
}

static Bytes encode_u32_le(std::size_t n) {
    if (n > 0xFFFFFFFFu) {
        throw std::length_error("merlin: message too long");
    }
    uint32_t v = static_cast<uint32_t>(n);
    return Bytes{
        static_cast<uint8_t>(v),
        static_cast<uint8_t>(v >> 8),
        static_cast<uint8_t>(v >> 16),
        static_cast<uint8_t>(v >> 24)
    };
}

Transcript::Transcript(const std::string& label)
    : strobe_(label_bytes("Merlin v1.0"))
{
    append_message("dom-sep", label_bytes(label));
}

void Transcript::append_message(const std::string& label, const Bytes& message) {
    strobe_.meta_ad(label_bytes(label), false);
    strobe_.meta_ad(encode_u32_le(message.size()), true);
    strobe_.ad(message, false);
}

void Transcript::append_u64(const std::string& label, uint64_t x) {
    Bytes le(8);
    for (std::size_t i = 0; i < 8; ++i) {
        le[i] = static_cast<uint8_t>(x >> (8 * i));
    }
    append_message(label, le);
}

Bytes Transcript::challenge_bytes(const std::string& label, std::size_t length) {
    Bytes out(length);
    strobe_.meta_ad(label_bytes(label), false);
    strobe_.meta_ad(encode_u32_le(length), true);
    strobe_.prf(out, false);
    return out;
}

} // namespace merlin
