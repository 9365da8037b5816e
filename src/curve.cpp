// =============================================================================
// curve.cpp - Bonding curve pricing
// =============================================================================

#include "fairlaunch/curve.hpp"

namespace fairlaunch {
namespace bonding_curve {

std::optional<U256> price(const U256& supply, const U256& k, const U256& scale) {
    if (supply.is_zero() || scale.is_zero()) return U256();

    // ((k * s) / scale) * s / scale
    auto ks = u256::checked_mul(k, supply);
    if (!ks) return std::nullopt;
    auto scaled = u256::checked_mul(*ks / scale, supply);
    if (!scaled) return std::nullopt;
    return *scaled / scale;
}

std::optional<U256> integral(const U256& supply, const U256& k, const U256& scale) {
    if (supply.is_zero() || scale.is_zero()) return U256();

    auto s2 = u256::checked_mul(supply, supply);
    if (!s2) return std::nullopt;
    auto s3 = u256::checked_mul(*s2, supply);
    if (!s3) return std::nullopt;
    auto numerator = u256::checked_mul(k, *s3);
    if (!numerator) return std::nullopt;

    auto scale2 = u256::checked_mul(scale, scale);
    if (!scale2) return std::nullopt;
    auto denominator = u256::checked_mul(U256(3), *scale2);
    if (!denominator) return std::nullopt;

    return *numerator / *denominator;
}

std::optional<U256> buy_cost(const U256& supply, const U256& amount,
                             const U256& k, const U256& scale) {
    auto end = u256::checked_add(supply, amount);
    if (!end) return std::nullopt;

    auto upper = integral(*end, k, scale);
    auto lower = integral(supply, k, scale);
    if (!upper || !lower) return std::nullopt;
    return *upper - *lower;
}

std::optional<U256> sell_return(const U256& supply, const U256& amount,
                                const U256& k, const U256& scale) {
    if (amount > supply) return U256();

    auto upper = integral(supply, k, scale);
    auto lower = integral(supply - amount, k, scale);
    if (!upper || !lower) return std::nullopt;
    return *upper - *lower;
}

U256 creator_fee(const U256& value, uint16_t fee_bps) {
    // Split value so value * bps never leaves 256 bits:
    // value = q * 10000 + r, fee = q * bps + r * bps / 10000
    const U256 denom(BPS_DENOMINATOR);
    U256 quot, rem;
    u256::divmod(value, denom, quot, rem);
    const U256 bps(fee_bps);
    return quot * bps + (rem * bps) / denom;
}

std::optional<U256> max_buy_for_budget(const U256& supply, const U256& budget,
                                       const CurveConfig& config) {
    if (supply >= config.max_supply) return U256();

    U256 low;
    U256 high = config.max_supply - supply;

    // Invariant: buy_cost(low) <= budget
    while (low < high) {
        U256 mid = low + ((high - low) >> 1) + U256(1);
        auto cost = buy_cost(supply, mid, config.k, config.scale);
        if (!cost) return std::nullopt;
        if (*cost <= budget) {
            low = mid;
        } else {
            high = mid - U256(1);
        }
    }
    return low;
}

uint32_t progress_bps(const U256& supply, const U256& max_supply) {
    if (max_supply.is_zero()) return 0;
    if (supply >= max_supply) return BPS_DENOMINATOR;

    // supply < max_supply, so the ratio is below 10000
    auto scaled = u256::mul_div(supply, U256(BPS_DENOMINATOR), max_supply);
    if (!scaled) {
        scaled = supply / (max_supply / U256(BPS_DENOMINATOR));
        if (*scaled > U256(BPS_DENOMINATOR)) return BPS_DENOMINATOR;
    }
    return static_cast<uint32_t>(scaled->lo);
}

int32_t validate(const CurveConfig& config) {
    if (config.k.is_zero() || config.scale.is_zero() ||
        config.target_raise.is_zero() || config.max_supply.is_zero()) {
        return errors::INVALID_CURVE_CONFIG;
    }
    if (config.max_supply <= config.scale) return errors::INVALID_CURVE_CONFIG;
    if (config.creator_fee_bps > BPS_DENOMINATOR) return errors::INVALID_CURVE_CONFIG;

    // The full curve must be computable and its cost must settle in native funds
    auto full_cost = integral(config.max_supply, config.k, config.scale);
    if (!full_cost || full_cost->hi != 0) return errors::INVALID_CURVE_CONFIG;
    return errors::OK;
}

} // namespace bonding_curve
} // namespace fairlaunch
