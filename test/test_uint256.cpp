// Fair Launch - U256 Tests

#include <catch2/catch.hpp>
#include <fairlaunch/uint256.hpp>

using namespace fairlaunch;

namespace {

U256 pow2(unsigned n) { return U256(1) << n; }

const char* MAX_DECIMAL =
    "115792089237316195423570985008687907853269984665640564039457584007913129639935";

} // namespace

TEST_CASE("U256 decimal text", "[uint256]") {
    SECTION("Small values") {
        REQUIRE(U256().to_string() == "0");
        REQUIRE(U256(42).to_string() == "42");
        REQUIRE(U256(10000000000000000000ULL).to_string() == "10000000000000000000");
    }

    SECTION("Values spanning limbs") {
        REQUIRE(pow2(128).to_string() == "340282366920938463463374607431768211456");
        REQUIRE(U256::max().to_string() == MAX_DECIMAL);
    }

    SECTION("Parsing") {
        REQUIRE(U256::from_string("0") == U256());
        REQUIRE(U256::from_string("340282366920938463463374607431768211456") == pow2(128));
        REQUIRE(U256::from_string(MAX_DECIMAL) == U256::max());
    }

    SECTION("Rejected text") {
        REQUIRE_FALSE(U256::from_string("").has_value());
        REQUIRE_FALSE(U256::from_string("-1").has_value());
        REQUIRE_FALSE(U256::from_string("12a").has_value());
        REQUIRE_FALSE(U256::from_string(" 1").has_value());
        REQUIRE_FALSE(U256::from_string(
            "115792089237316195423570985008687907853269984665640564039457584007913129639936")
            .has_value());
    }
}

TEST_CASE("U256 checked arithmetic", "[uint256]") {
    SECTION("Addition carries into the high limb") {
        U256 low_max(~U128(0));
        auto sum = u256::checked_add(low_max, U256(1));
        REQUIRE(sum.has_value());
        REQUIRE(*sum == pow2(128));
    }

    SECTION("Addition overflow") {
        REQUIRE_FALSE(u256::checked_add(U256::max(), U256(1)).has_value());
        REQUIRE(U256::max() + U256(1) == U256());
    }

    SECTION("Subtraction underflow") {
        REQUIRE_FALSE(u256::checked_sub(U256(1), U256(2)).has_value());
        REQUIRE(u256::saturating_sub(U256(1), U256(2)) == U256());
        REQUIRE(u256::checked_sub(pow2(128), U256(1)) == U256(~U128(0)));
    }

    SECTION("Multiplication") {
        REQUIRE(u256::mul_u128(U128(1) << 64, U128(1) << 64) == pow2(128));
        REQUIRE(u256::checked_mul(pow2(127), U256(2)) == pow2(128));
        REQUIRE(u256::checked_mul(pow2(100), pow2(155)) == pow2(255));
        REQUIRE_FALSE(u256::checked_mul(pow2(128), pow2(128)).has_value());
        REQUIRE_FALSE(u256::checked_mul(pow2(200), pow2(56)).has_value());
        REQUIRE_FALSE(u256::checked_mul(U256::max(), U256(2)).has_value());
    }

    SECTION("Full 128x128 product") {
        U128 a = ~U128(0);
        U256 product = u256::mul_u128(a, a);
        // (2^128 - 1)^2 = 2^256 - 2^129 + 1
        REQUIRE(product == U256::max() - pow2(129) + U256(2));
    }
}

TEST_CASE("U256 division", "[uint256]") {
    SECTION("Wide quotient and remainder") {
        U256 quot, rem;
        u256::divmod(pow2(200) + U256(7), pow2(100), quot, rem);
        REQUIRE(quot == pow2(100));
        REQUIRE(rem == U256(7));
    }

    SECTION("Divisor wider than 128 bits") {
        U256 num = pow2(255) + pow2(130) + U256(5);
        U256 den = pow2(130);
        REQUIRE(num / den == pow2(125) + U256(1));
        REQUIRE(num % den == U256(5));
    }

    SECTION("Top bit set in the remainder") {
        U256 den = pow2(255) + U256(1);
        REQUIRE(U256::max() / den == U256(1));
        REQUIRE(U256::max() % den == pow2(255) - U256(2));
    }

    SECTION("Division by zero yields zero") {
        REQUIRE(U256(10) / U256() == U256());
        REQUIRE(U256(10) % U256() == U256());
    }

    SECTION("mul_div") {
        REQUIRE(u256::mul_div(pow2(100), pow2(100), pow2(50)) == pow2(150));
        REQUIRE(u256::mul_div(U256(7), U256(3), U256(2)) == U256(10));
        REQUIRE_FALSE(u256::mul_div(pow2(200), pow2(100), pow2(150)).has_value());
        REQUIRE_FALSE(u256::mul_div(U256(1), U256(1), U256()).has_value());
    }
}

TEST_CASE("U256 shifts and bits", "[uint256]") {
    REQUIRE((pow2(200) >> 200) == U256(1));
    REQUIRE((pow2(127) << 1) == pow2(128));
    REQUIRE((U256(1) << 256) == U256());
    REQUIRE(U256().bits() == 0);
    REQUIRE(U256(1).bits() == 1);
    REQUIRE(pow2(200).bits() == 201);
    REQUIRE(pow2(200).bit(200));
    REQUIRE_FALSE(pow2(200).bit(199));
}
