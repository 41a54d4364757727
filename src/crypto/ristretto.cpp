#include "ristretto.hpp"

#include <cstring>
#include <sodium.h>

namespace ristretto {

    // Group order l = 2^252 + 27742317777372353535851937790883648493, little-endian
    static const uint8_t GROUP_ORDER[SCALAR_SIZE] = {
        0xed, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58,
        0xd6, 0x9c, 0xf7, 0xa2, 0xde, 0xf9, 0xde, 0x14,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10
    };

    void init() {
        if (sodium_init() < 0) {
            throw GroupError("Failed to initialize libsodium");
        }
    }

    // --- Scalar Implementation ---
    Scalar::Scalar() { std::memset(value, 0, sizeof(value)); }

    Scalar Scalar::get_random() {
        Scalar s;
        crypto_core_ristretto255_scalar_random(s.value);
        return s;
    }

    bool Scalar::is_canonical(const Bytes& b) {
        if (b.size() != SCALAR_SIZE) return false;
        return sodium_compare(b.data(), GROUP_ORDER, SCALAR_SIZE) < 0;
    }

    Scalar Scalar::from_bytes(const Bytes& b) {
        if (!is_canonical(b)) {
            throw GroupError("Scalar encoding is not canonical");
        }
        Scalar s;
        std::memcpy(s.value, b.data(), SCALAR_SIZE);
        return s;
    }

    Scalar Scalar::from_bytes_mod_order_wide(const Bytes& b) {
        if (b.size() != WIDE_SCALAR_SIZE) {
            throw GroupError("Wide scalar input must be 64 bytes");
        }
        Scalar s;
        crypto_core_ristretto255_scalar_reduce(s.value, b.data());
        return s;
    }

    Scalar Scalar::from_bits(const Bytes& b) {
        if (b.size() != SCALAR_SIZE) {
            throw GroupError("Scalar input must be 32 bytes");
        }
        Scalar s;
        std::memcpy(s.value, b.data(), SCALAR_SIZE);
        return s;
    }

    Bytes Scalar::to_bytes() const {
        return Bytes(value, value + SCALAR_SIZE);
    }

    Scalar Scalar::negate() const {
        Scalar result;
        crypto_core_ristretto255_scalar_negate(result.value, value);
        return result;
    }

    Scalar Scalar::add(const Scalar& a, const Scalar& b) {
        Scalar result;
        crypto_core_ristretto255_scalar_add(result.value, a.value, b.value);
        return result;
    }

    Scalar Scalar::mul(const Scalar& a, const Scalar& b) {
        Scalar result;
        crypto_core_ristretto255_scalar_mul(result.value, a.value, b.value);
        return result;
    }

    bool Scalar::is_zero() const {
        return sodium_is_zero(value, SCALAR_SIZE) == 1;
    }

    bool Scalar::operator==(const Scalar& other) const {
        return sodium_memcmp(value, other.value, SCALAR_SIZE) == 0;
    }

    Scalar Scalar::operator+(const Scalar& other) const {
        return Scalar::add(*this, other);
    }

    Scalar Scalar::operator*(const Scalar& other) const {
        return Scalar::mul(*this, other);
    }

    // --- Point Implementation ---
    Point::Point() { std::memset(value, 0, sizeof(value)); }

    Point Point::base_mul(const Scalar& s) {
        Point p;
        if (crypto_scalarmult_ristretto255_base(p.value, s.data()) != 0) {
            throw GroupError("Base multiplication produced the identity");
        }
        return p;
    }

    Point Point::mul(const Point& p, const Scalar& s) {
        Point result;
        if (crypto_scalarmult_ristretto255(result.value, s.data(), p.value) != 0) {
            throw GroupError("Scalar multiplication produced the identity");
        }
        return result;
    }

    bool Point::is_valid(const Bytes& b) {
        if (b.size() != POINT_SIZE) return false;
        return crypto_core_ristretto255_is_valid_point(b.data()) == 1;
    }

    Point Point::from_bytes(const Bytes& b) {
        if (!is_valid(b)) {
            throw GroupError("Invalid ristretto255 point encoding");
        }
        Point p;
        std::memcpy(p.value, b.data(), POINT_SIZE);
        return p;
    }

    Bytes Point::to_bytes() const {
        return Bytes(value, value + POINT_SIZE);
    }

    Point Point::add(const Point& other) const {
        Point result;
        if (crypto_core_ristretto255_add(result.value, value, other.value) != 0) {
            throw GroupError("Point addition failed");
        }
        return result;
    }

    Point Point::sub(const Point& other) const {
        Point result;
        if (crypto_core_ristretto255_sub(result.value, value, other.value) != 0) {
            throw GroupError("Point subtraction failed");
        }
        return result;
    }

    bool Point::operator==(const Point& other) const {
        return sodium_memcmp(value, other.value, POINT_SIZE) == 0;
    }

} // namespace ristretto
