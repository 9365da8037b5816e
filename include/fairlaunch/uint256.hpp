#ifndef FAIRLAUNCH_UINT256_HPP
#define FAIRLAUNCH_UINT256_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace fairlaunch {

using U128 = unsigned __int128;

// =============================================================================
// U256 - 256-bit unsigned integer (two U128 limbs)
//
// Plain operators wrap modulo 2^256. Everything that moves value through the
// engine goes through the checked helpers in namespace u256 instead.
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    constexpr U256() : lo(0), hi(0) {}
    constexpr U256(U128 l) : lo(l), hi(0) {}
    constexpr U256(U128 l, U128 h) : lo(l), hi(h) {}

    static constexpr U256 max() { return U256(~U128(0), ~U128(0)); }

    // Parse base-10 text. Rejects empty input, non-digits and overflow.
    static std::optional<U256> from_string(std::string_view text);
    std::string to_string() const;

    constexpr bool is_zero() const { return lo == 0 && hi == 0; }
    constexpr bool fits_u128() const { return hi == 0; }

    // Number of significant bits (0 for zero)
    int bits() const;
    bool bit(int index) const;

    friend constexpr bool operator==(const U256& a, const U256& b) {
        return a.lo == b.lo && a.hi == b.hi;
    }
    friend constexpr bool operator!=(const U256& a, const U256& b) { return !(a == b); }
    friend constexpr bool operator<(const U256& a, const U256& b) {
        return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
    }
    friend constexpr bool operator>(const U256& a, const U256& b) { return b < a; }
    friend constexpr bool operator<=(const U256& a, const U256& b) { return !(b < a); }
    friend constexpr bool operator>=(const U256& a, const U256& b) { return !(a < b); }

    friend U256 operator+(const U256& a, const U256& b);
    friend U256 operator-(const U256& a, const U256& b);
    friend U256 operator*(const U256& a, const U256& b);
    friend U256 operator/(const U256& a, const U256& b);
    friend U256 operator%(const U256& a, const U256& b);
    friend U256 operator<<(const U256& a, unsigned shift);
    friend U256 operator>>(const U256& a, unsigned shift);

    U256& operator+=(const U256& other) { return *this = *this + other; }
    U256& operator-=(const U256& other) { return *this = *this - other; }
    U256& operator*=(const U256& other) { return *this = *this * other; }
    U256& operator/=(const U256& other) { return *this = *this / other; }
};

std::ostream& operator<<(std::ostream& os, const U256& value);

// =============================================================================
// Checked Arithmetic
// =============================================================================

namespace u256 {

// Multiply two U128 values to produce the full U256 product
U256 mul_u128(U128 a, U128 b);

// Return true when the true result does not fit; `out` then holds the
// wrapped value.
bool add_overflow(const U256& a, const U256& b, U256& out);
bool sub_underflow(const U256& a, const U256& b, U256& out);
bool mul_overflow(const U256& a, const U256& b, U256& out);

std::optional<U256> checked_add(const U256& a, const U256& b);
std::optional<U256> checked_sub(const U256& a, const U256& b);
std::optional<U256> checked_mul(const U256& a, const U256& b);

inline U256 saturating_sub(const U256& a, const U256& b) {
    return a > b ? a - b : U256();
}

// Quotient and remainder; a zero divisor yields zero for both.
void divmod(const U256& num, const U256& den, U256& quot, U256& rem);

// floor(a * b / den) when both the product and the quotient fit in 256 bits
std::optional<U256> mul_div(const U256& a, const U256& b, const U256& den);

} // namespace u256

} // namespace fairlaunch

#endif // FAIRLAUNCH_UINT256_HPP
