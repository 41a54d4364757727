#ifndef KEYSHIELD_CRYPTO_RISTRETTO_HPP
#define KEYSHIELD_CRYPTO_RISTRETTO_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ristretto {

    using Bytes = std::vector<uint8_t>;

    // Sizes match libsodium's crypto_core_ristretto255_* constants
    constexpr size_t SCALAR_SIZE = 32;
    constexpr size_t POINT_SIZE = 32;
    constexpr size_t WIDE_SCALAR_SIZE = 64;

    class GroupError : public std::runtime_error {
    public:
        explicit GroupError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Initializes libsodium. Safe to call more than once.
    void init();

    class Scalar {
    public:
        Scalar();

        static Scalar get_random();

        // Rejects encodings that are not fully reduced modulo the group order
        static Scalar from_bytes(const Bytes& b);
        // Reduces a 64-byte little-endian integer modulo the group order
        static Scalar from_bytes_mod_order_wide(const Bytes& b);
        // Takes 32 bytes verbatim, without reduction (expanded secret keys)
        static Scalar from_bits(const Bytes& b);

        static bool is_canonical(const Bytes& b);

        Bytes to_bytes() const;

        Scalar negate() const;
        static Scalar add(const Scalar& a, const Scalar& b);
        static Scalar mul(const Scalar& a, const Scalar& b);

        bool is_zero() const;

        bool operator==(const Scalar& other) const;
        bool operator!=(const Scalar& other) const { return !(*this == other); }
        Scalar operator+(const Scalar& other) const;
        Scalar operator*(const Scalar& other) const;

        const uint8_t* data() const { return value; }

    private:
        uint8_t value[SCALAR_SIZE];
    };

    class Point {
    public:
        Point();

        // Throws GroupError when the product is the identity
        static Point base_mul(const Scalar& s);
        static Point mul(const Point& p, const Scalar& s);

        // Rejects non-canonical or off-group encodings
        static Point from_bytes(const Bytes& b);
        static bool is_valid(const Bytes& b);

        Bytes to_bytes() const;

        Point add(const Point& other) const;
        Point sub(const Point& other) const;

        bool operator==(const Point& other) const;
        bool operator!=(const Point& other) const { return !(*this == other); }

        const uint8_t* data() const { return value; }

    private:
        uint8_t value[POINT_SIZE];
    };

} // namespace ristretto

#endif // KEYSHIELD_CRYPTO_RISTRETTO_HPP
