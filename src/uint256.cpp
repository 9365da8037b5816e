// =============================================================================
// uint256.cpp - 256-bit unsigned arithmetic
// =============================================================================

#include "fairlaunch/uint256.hpp"

#include <algorithm>
#include <ostream>

namespace fairlaunch {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

// 10^19 is the largest power of ten below 2^64
constexpr uint64_t DEC_CHUNK = 10000000000000000000ULL;
constexpr int DEC_CHUNK_DIGITS = 19;

inline int bit_length(U128 v) {
    uint64_t high = static_cast<uint64_t>(v >> 64);
    if (high != 0) return 128 - __builtin_clzll(high);
    uint64_t low = static_cast<uint64_t>(v);
    if (low != 0) return 64 - __builtin_clzll(low);
    return 0;
}

// Divide in place by a 64-bit divisor, returning the remainder
uint64_t div_small(U256& value, uint64_t divisor) {
    uint64_t words[4] = {
        static_cast<uint64_t>(value.hi >> 64),
        static_cast<uint64_t>(value.hi & MASK64),
        static_cast<uint64_t>(value.lo >> 64),
        static_cast<uint64_t>(value.lo & MASK64),
    };
    U128 rem = 0;
    for (auto& word : words) {
        U128 cur = (rem << 64) | word;
        word = static_cast<uint64_t>(cur / divisor);
        rem = cur % divisor;
    }
    value.hi = (U128(words[0]) << 64) | words[1];
    value.lo = (U128(words[2]) << 64) | words[3];
    return static_cast<uint64_t>(rem);
}

} // anonymous namespace

// =============================================================================
// U256 Members
// =============================================================================

int U256::bits() const {
    if (hi != 0) return 128 + bit_length(hi);
    return bit_length(lo);
}

bool U256::bit(int index) const {
    if (index < 0 || index >= 256) return false;
    if (index >= 128) return ((hi >> (index - 128)) & 1) != 0;
    return ((lo >> index) & 1) != 0;
}

std::optional<U256> U256::from_string(std::string_view text) {
    if (text.empty()) return std::nullopt;

    U256 value;
    const U256 ten(10);
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U256 scaled;
        if (u256::mul_overflow(value, ten, scaled)) return std::nullopt;
        if (u256::add_overflow(scaled, U256(static_cast<U128>(c - '0')), value)) {
            return std::nullopt;
        }
    }
    return value;
}

std::string U256::to_string() const {
    if (is_zero()) return "0";

    std::string out;
    U256 rest = *this;
    while (!rest.is_zero()) {
        uint64_t chunk = div_small(rest, DEC_CHUNK);
        for (int i = 0; i < DEC_CHUNK_DIGITS; ++i) {
            out.push_back(static_cast<char>('0' + chunk % 10));
            chunk /= 10;
            if (rest.is_zero() && chunk == 0) break;
        }
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::ostream& operator<<(std::ostream& os, const U256& value) {
    return os << value.to_string();
}

// =============================================================================
// Wrapping Operators
// =============================================================================

U256 operator+(const U256& a, const U256& b) {
    U256 out;
    u256::add_overflow(a, b, out);
    return out;
}

U256 operator-(const U256& a, const U256& b) {
    U256 out;
    u256::sub_underflow(a, b, out);
    return out;
}

U256 operator*(const U256& a, const U256& b) {
    U256 out;
    u256::mul_overflow(a, b, out);
    return out;
}

U256 operator/(const U256& a, const U256& b) {
    U256 quot, rem;
    u256::divmod(a, b, quot, rem);
    return quot;
}

U256 operator%(const U256& a, const U256& b) {
    U256 quot, rem;
    u256::divmod(a, b, quot, rem);
    return rem;
}

U256 operator<<(const U256& a, unsigned shift) {
    if (shift == 0) return a;
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(0, a.lo << (shift - 128));
    return U256(a.lo << shift, (a.hi << shift) | (a.lo >> (128 - shift)));
}

U256 operator>>(const U256& a, unsigned shift) {
    if (shift == 0) return a;
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(a.hi >> (shift - 128), 0);
    return U256((a.lo >> shift) | (a.hi << (128 - shift)), a.hi >> shift);
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

namespace u256 {

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

bool add_overflow(const U256& a, const U256& b, U256& out) {
    U128 lo = a.lo + b.lo;
    U128 carry = lo < a.lo ? 1 : 0;
    U128 hi = a.hi + b.hi;
    bool overflow = hi < a.hi;
    U128 hi_carried = hi + carry;
    overflow = overflow || hi_carried < hi;
    out = U256(lo, hi_carried);
    return overflow;
}

bool sub_underflow(const U256& a, const U256& b, U256& out) {
    U128 borrow = a.lo < b.lo ? 1 : 0;
    out = U256(a.lo - b.lo, a.hi - b.hi - borrow);
    return a < b;
}

bool mul_overflow(const U256& a, const U256& b, U256& out) {
    bool overflow = a.hi != 0 && b.hi != 0;

    U256 product = mul_u128(a.lo, b.lo);

    // At most one cross term is nonzero unless we already overflowed
    U128 cross = 0;
    if (a.hi != 0) {
        U256 c = mul_u128(a.hi, b.lo);
        overflow = overflow || c.hi != 0;
        cross += c.lo;
    }
    if (b.hi != 0) {
        U256 c = mul_u128(a.lo, b.hi);
        overflow = overflow || c.hi != 0;
        cross += c.lo;
    }

    U128 hi = product.hi + cross;
    overflow = overflow || hi < product.hi;
    out = U256(product.lo, hi);
    return overflow;
}

std::optional<U256> checked_add(const U256& a, const U256& b) {
    U256 out;
    if (add_overflow(a, b, out)) return std::nullopt;
    return out;
}

std::optional<U256> checked_sub(const U256& a, const U256& b) {
    U256 out;
    if (sub_underflow(a, b, out)) return std::nullopt;
    return out;
}

std::optional<U256> checked_mul(const U256& a, const U256& b) {
    U256 out;
    if (mul_overflow(a, b, out)) return std::nullopt;
    return out;
}

void divmod(const U256& num, const U256& den, U256& quot, U256& rem) {
    quot = U256();
    rem = U256();
    if (den.is_zero()) return;

    if (num.hi == 0 && den.hi == 0) {
        quot = U256(num.lo / den.lo);
        rem = U256(num.lo % den.lo);
        return;
    }

    if (num < den) {
        rem = num;
        return;
    }

    // Binary long division, one numerator bit at a time
    for (int i = num.bits() - 1; i >= 0; --i) {
        // A set top bit means the shifted remainder is >= 2^256 > den
        bool carry = (rem.hi >> 127) != 0;
        rem = rem << 1;
        if (num.bit(i)) rem.lo |= 1;

        if (carry || rem >= den) {
            rem = rem - den;
            if (i >= 128) {
                quot.hi |= U128(1) << (i - 128);
            } else {
                quot.lo |= U128(1) << i;
            }
        }
    }
}

std::optional<U256> mul_div(const U256& a, const U256& b, const U256& den) {
    if (den.is_zero()) return std::nullopt;
    auto product = checked_mul(a, b);
    if (!product) return std::nullopt;
    return *product / den;
}

} // namespace u256

} // namespace fairlaunch
