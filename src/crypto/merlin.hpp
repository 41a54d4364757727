#ifndef KEYSHIELD_CRYPTO_MERLIN_HPP
#define KEYSHIELD_CRYPTO_MERLIN_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace merlin {

using Bytes = std::vector<uint8_t>;

// Keccak-f[1600] over 25 little-endian lanes
void keccak_f1600(std::array<uint64_t, 25>& lanes);

// -----------------------------------------------------------------------------
// Strobe128 - the subset of STROBE-128/1600 needed by transcripts
// (meta-AD, AD, PRF and KEY; no transport operations).
// -----------------------------------------------------------------------------
class Strobe128 {
public:
    explicit Strobe128(const Bytes& protocol_label);

    void meta_ad(const Bytes& data, bool more);
    void ad(const Bytes& data, bool more);
    void prf(Bytes& out, bool more);
    void key(const Bytes& data, bool more);

private:
    static constexpr std::size_t RATE = 166;

    void run_f();
    void absorb(const Bytes& data);
    void overwrite(const Bytes& data);
    void squeeze(Bytes& out);
    void begin_op(uint8_t flags, bool more);

    std::array<uint8_t, 200> state_;
    uint8_t pos_ = 0;
    uint8_t pos_begin_ = 0;
    uint8_t cur_flags_ = 0;
};

// -----------------------------------------------------------------------------
// Transcript - Merlin v1.0 transcript (Fiat-Shamir over STROBE)
// -----------------------------------------------------------------------------
class Transcript {
public:
    explicit Transcript(const std::string& label);

    void append_message(const std::string& label, const Bytes& message);
    void append_u64(const std::string& label, uint64_t x);

    // Fills `length` bytes of challenge output bound to everything absorbed so far
    Bytes challenge_bytes(const std::string& label, std::size_t length);

private:
    Strobe128 strobe_;
};

} // namespace merlin

#endif // KEYSHIELD_CRYPTO_MERLIN_HPP
