#ifndef FAIRLAUNCH_CURVE_HPP
#define FAIRLAUNCH_CURVE_HPP

#include <optional>

#include "types.hpp"

namespace fairlaunch {

// =============================================================================
// Bonding Curve Pricing
//
//   price(s)    = k * (s / scale)^2
//   F(s)        = k * s^3 / (3 * scale^2)
//   buy_cost    = F(s + a) - F(s)
//   sell_return = F(s) - F(s - a)
//
// All functions are pure. An empty optional means an intermediate value did
// not fit in 256 bits.
// =============================================================================

namespace bonding_curve {

// Spot price at `supply`; 0 when supply or scale is 0
std::optional<U256> price(const U256& supply, const U256& k, const U256& scale);

// Antiderivative of price, floored
std::optional<U256> integral(const U256& supply, const U256& k, const U256& scale);

std::optional<U256> buy_cost(const U256& supply, const U256& amount,
                             const U256& k, const U256& scale);

// 0 when amount > supply
std::optional<U256> sell_return(const U256& supply, const U256& amount,
                                const U256& k, const U256& scale);

// floor(value * fee_bps / 10000), exact for every value
U256 creator_fee(const U256& value, uint16_t fee_bps);

// Largest amount (capped by remaining supply) whose buy cost fits the budget
std::optional<U256> max_buy_for_budget(const U256& supply, const U256& budget,
                                       const CurveConfig& config);

// supply / max_supply in basis points, capped at 10000
uint32_t progress_bps(const U256& supply, const U256& max_supply);

// OK or INVALID_CURVE_CONFIG. Also rejects caps whose full curve cost
// overflows the antiderivative or does not fit a native Amount.
int32_t validate(const CurveConfig& config);

} // namespace bonding_curve

} // namespace fairlaunch

#endif // FAIRLAUNCH_CURVE_HPP
