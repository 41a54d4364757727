#include "sr25519.hpp"
#include "merlin.hpp"
#include "ss58.hpp"
#include "../helpers.hpp"

#include <sodium.h>

namespace sr25519 {

using keyshield::utils::bytes_to_hex;
using keyshield::utils::to_bytes;
using ristretto::Point;
using ristretto::Scalar;

const char* const SIGNING_CONTEXT = "substrate";

const char* to_string(SignatureFault fault) {
    switch (fault) {
        case SignatureFault::Prefix: return "PREFIXERROR";
        case SignatureFault::Length: return "LENGTHERROR";
        case SignatureFault::Type:   return "TYPEERROR";
    }
    return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// PublicKey / Signature
// -----------------------------------------------------------------------------

PublicKey::PublicKey() : value_(PUBLIC_KEY_SIZE, 0) {}

PublicKey PublicKey::from_bytes(const Bytes& b) {
    if (b.size() != PUBLIC_KEY_SIZE) {
        throw std::invalid_argument("Public key must be 32 bytes");
    }
    PublicKey pk;
    pk.value_ = b;
    return pk;
}

PublicKey PublicKey::from_ss58check(const std::string& address) {
    return from_bytes(ss58::decode(address).account);
}

std::string PublicKey::to_ss58check() const {
    return ss58::encode(value_);
}

std::string PublicKey::to_hex() const {
    return bytes_to_hex(value_);
}

Signature::Signature() : value_(SIGNATURE_SIZE, 0) {}

Signature Signature::from_bytes(const Bytes& b) {
    if (b.size() != SIGNATURE_SIZE) {
        throw SignatureError(SignatureFault::Length);
    }
    Signature sig;
    sig.value_ = b;
    return sig;
}

std::string Signature::to_hex() const {
    return "0x" + bytes_to_hex(value_);
}

Signature parse_signature_hex(const std::string& hex, bool require_prefix) {
    std::string_view body(hex);
    if (body.substr(0, 2) == "0x") {
        body.remove_prefix(2);
    } else if (require_prefix) {
        throw SignatureError(SignatureFault::Prefix);
    }

    if (body.size() != SIGNATURE_SIZE * 2) {
        throw SignatureError(SignatureFault::Length);
    }
    auto bytes = keyshield::utils::try_hex_to_bytes(body);
    if (!bytes) {
        throw SignatureError(SignatureFault::Length);
    }
    return Signature::from_bytes(*bytes);
}

// -----------------------------------------------------------------------------
// Key generation
// -----------------------------------------------------------------------------

KeyPair keygen() {
    KeyPair kp;
    kp.secret = Scalar::get_random();
    kp.nonce.resize(NONCE_SIZE);
    randombytes_buf(kp.nonce.data(), kp.nonce.size());
    kp.public_key = PublicKey::from_bytes(Point::base_mul(kp.secret).to_bytes());
    return kp;
}

// Divide a little-endian 256-bit integer by the cofactor 8
static void divide_by_cofactor(Bytes& scalar) {
    uint8_t low = 0;
    for (auto it = scalar.rbegin(); it != scalar.rend(); ++it) {
        uint8_t r = *it & 0x07;
        *it = static_cast<uint8_t>((*it >> 3) + low);
        low = static_cast<uint8_t>(r << 5);
    }
}

KeyPair from_seed(const Bytes& seed) {
    if (seed.size() != SEED_SIZE) {
        throw std::invalid_argument("Seed must be 32 bytes");
    }

    Bytes h(crypto_hash_sha512_BYTES);
    crypto_hash_sha512(h.data(), seed.data(), seed.size());

    Bytes key(h.begin(), h.begin() + 32);
    key[0] &= 248;
    key[31] &= 63;
    key[31] |= 64;
    divide_by_cofactor(key);

    KeyPair kp;
    kp.secret = Scalar::from_bits(key);
    kp.nonce = Bytes(h.begin() + 32, h.end());
    kp.public_key = PublicKey::from_bytes(Point::base_mul(kp.secret).to_bytes());
    sodium_memzero(h.data(), h.size());
    sodium_memzero(key.data(), key.size());
    return kp;
}

// -----------------------------------------------------------------------------
// Schnorr signatures over ristretto255 with a Merlin transcript
// -----------------------------------------------------------------------------

static merlin::Transcript signing_transcript(const Bytes& message) {
    merlin::Transcript t("SigningContext");
    t.append_message("", to_bytes(SIGNING_CONTEXT));
    t.append_message("sign-bytes", message);
    return t;
}

static Scalar challenge_scalar(merlin::Transcript& t) {
    return Scalar::from_bytes_mod_order_wide(t.challenge_bytes("sign:c", ristretto::WIDE_SCALAR_SIZE));
}

Signature sign(const KeyPair& keypair, const Bytes& message) {
    merlin::Transcript t = signing_transcript(message);
    t.append_message("proto-name", to_bytes("Schnorr-sig"));
    t.append_message("sign:pk", keypair.public_key.to_bytes());

    // Witness r = H(nonce || fresh randomness || message) mod l
    Bytes entropy(32);
    randombytes_buf(entropy.data(), entropy.size());
    Bytes wide(ristretto::WIDE_SCALAR_SIZE);
    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, wide.size());
    crypto_generichash_update(&state, keypair.nonce.data(), keypair.nonce.size());
    crypto_generichash_update(&state, entropy.data(), entropy.size());
    crypto_generichash_update(&state, message.data(), message.size());
    crypto_generichash_final(&state, wide.data(), wide.size());
    Scalar r = Scalar::from_bytes_mod_order_wide(wide);

    Point R = Point::base_mul(r);
    t.append_message("sign:R", R.to_bytes());

    Scalar k = challenge_scalar(t);
    Scalar s = k * keypair.secret + r;

    Bytes sig = R.to_bytes();
    Bytes s_bytes = s.to_bytes();
    sig.insert(sig.end(), s_bytes.begin(), s_bytes.end());
    sig[63] |= 0x80;
    return Signature::from_bytes(sig);
}

Signature sign(const KeyPair& keypair, const std::string& message) {
    return sign(keypair, to_bytes(message));
}

bool verify(const Signature& signature, const Bytes& message, const PublicKey& public_key) {
    Bytes sig = signature.to_bytes();
    if ((sig[63] & 0x80) == 0) {
        return false;
    }
    sig[63] &= 0x7F;

    Bytes R_bytes(sig.begin(), sig.begin() + 32);
    Bytes s_bytes(sig.begin() + 32, sig.end());
    Bytes pk_bytes = public_key.to_bytes();

    if (!Scalar::is_canonical(s_bytes) || !Point::is_valid(pk_bytes)) {
        return false;
    }
    // Identity public key
    if (sodium_is_zero(pk_bytes.data(), pk_bytes.size()) == 1) {
        return false;
    }

    merlin::Transcript t = signing_transcript(message);
    t.append_message("proto-name", to_bytes("Schnorr-sig"));
    t.append_message("sign:pk", pk_bytes);
    t.append_message("sign:R", R_bytes);
    Scalar k = challenge_scalar(t);

    // R' = s*B - k*A, rejecting degenerate products
    Scalar s = Scalar::from_bytes(s_bytes);
    if (s.is_zero() || k.is_zero()) {
        return false;
    }
    Point A = Point::from_bytes(pk_bytes);
    Point R = Point::base_mul(s).sub(Point::mul(A, k));

    return keyshield::utils::equal_ct(R.to_bytes(), R_bytes);
}

bool verify(const Signature& signature, const std::string& message, const PublicKey& public_key) {
    return verify(signature, to_bytes(message), public_key);
}

} // namespace sr25519
