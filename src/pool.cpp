// =============================================================================
// pool.cpp - FLPool locked liquidity
// =============================================================================

#include "fairlaunch/pool.hpp"
#include "fairlaunch/ledger.hpp"
#include "fairlaunch/log.hpp"

#include <iterator>

namespace fairlaunch {

namespace {

unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

} // anonymous namespace

std::optional<U256> constant_product_out(const U256& amount_in, const U256& reserve_in,
                                         const U256& reserve_out) {
    auto denominator = u256::checked_add(reserve_in, amount_in);
    if (!denominator || denominator->is_zero()) return std::nullopt;
    return u256::mul_div(amount_in, reserve_out, *denominator);
}

// =============================================================================
// Constructor
// =============================================================================

FLPool::FLPool(Runtime& runtime, ActorId id, ActorId registry)
    : Actor(runtime, id), registry_(registry) {}

// =============================================================================
// Graduation
// =============================================================================

int32_t FLPool::handle_graduation(ActorId ledger, LaunchId launch_id,
                                  const U256& total_supply, const U256& total_raised) {
    if (total_supply.is_zero() || total_raised.is_zero()) {
        log::warn("pool: rejecting graduation of launch %llu with empty reserves (%s)",
                  ull(launch_id), error_name(errors::INVALID_AMOUNT));
        return errors::INVALID_AMOUNT;
    }

    auto existing = launch_to_pool_.find(launch_id);
    if (existing != launch_to_pool_.end()) {
        const LockedPool& pool = pools_.at(existing->second);
        log::debug("pool: launch %llu already has pool %llu, re-acknowledging",
                   ull(launch_id), ull(pool.id));
        acknowledge(ledger, pool);
        return errors::OK;
    }

    auto ratio = u256::mul_div(total_raised, U256(PRECISION), total_supply);
    auto tvl = u256::checked_mul(total_raised, U256(2));
    auto new_total_tvl = tvl ? u256::checked_add(total_tvl_, *tvl) : std::nullopt;
    if (!ratio || !new_total_tvl) {
        log::warn("pool: graduation of launch %llu overflows (%s)", ull(launch_id),
                  error_name(errors::AMOUNT_CONVERSION));
        return errors::AMOUNT_CONVERSION;
    }

    LockedPool pool;
    pool.id = next_pool_id_++;
    pool.launch_id = launch_id;
    pool.ledger = ledger;
    pool.token_reserve = total_supply;
    pool.currency_reserve = total_raised;
    pool.initial_ratio = *ratio;
    pool.locked = true;
    pool.trade_count = 0;
    pool.tvl = *tvl;
    pool.created_at = now();

    total_tvl_ = *new_total_tvl;
    launch_to_pool_[launch_id] = pool.id;
    const LockedPool& stored = pools_.emplace(pool.id, pool).first->second;

    log::info("pool %llu created for launch %llu: tokens=%s currency=%s", ull(stored.id),
              ull(launch_id), total_supply.to_string().c_str(),
              total_raised.to_string().c_str());
    acknowledge(ledger, stored);
    return errors::OK;
}

void FLPool::acknowledge(ActorId ledger, const LockedPool& pool) {
    PoolCreated msg{pool.launch_id, pool.id};
    send(ledger, msg);
    send(registry_, msg);
}

// =============================================================================
// Swaps
// =============================================================================

SwapResult FLPool::swap(PoolId pool_id, SwapDirection direction,
                        const U256& amount_in, const U256& min_amount_out) {
    SwapResult result;
    if (amount_in.is_zero()) {
        result.status = errors::INVALID_AMOUNT;
        return result;
    }

    auto it = pools_.find(pool_id);
    if (it == pools_.end()) {
        result.status = errors::POOL_NOT_FOUND;
        return result;
    }
    LockedPool& pool = it->second;
    result.token_reserve = pool.token_reserve;
    result.currency_reserve = pool.currency_reserve;

    bool token_in = direction == SwapDirection::TOKEN_TO_CURRENCY;
    U256& reserve_in = token_in ? pool.token_reserve : pool.currency_reserve;
    U256& reserve_out = token_in ? pool.currency_reserve : pool.token_reserve;

    auto amount_out = constant_product_out(amount_in, reserve_in, reserve_out);
    if (!amount_out) {
        result.status = errors::AMOUNT_CONVERSION;
        return result;
    }
    if (*amount_out < min_amount_out) {
        result.status = errors::SLIPPAGE_EXCEEDED;
        return result;
    }

    // reserve_in + amount_in was checked by constant_product_out
    U256 new_in = reserve_in + amount_in;
    U256 new_out = reserve_out - *amount_out;
    const U256& new_currency = token_in ? new_out : new_in;
    auto new_tvl = u256::checked_mul(new_currency, U256(2));
    std::optional<U256> new_total;
    if (new_tvl) {
        new_total = u256::checked_add(u256::saturating_sub(total_tvl_, pool.tvl), *new_tvl);
    }
    if (!new_total) {
        result.status = errors::AMOUNT_CONVERSION;
        return result;
    }

    reserve_in = new_in;
    reserve_out = new_out;
    pool.trade_count++;
    total_swaps_++;
    pool.tvl = *new_tvl;
    total_tvl_ = *new_total;

    result.amount_in = amount_in;
    result.amount_out = *amount_out;
    result.token_reserve = pool.token_reserve;
    result.currency_reserve = pool.currency_reserve;

    log::debug("pool %llu swap %s in=%s out=%s", ull(pool_id),
               token_in ? "token->currency" : "currency->token",
               amount_in.to_string().c_str(), amount_out->to_string().c_str());
    return result;
}

int32_t FLPool::add_liquidity(PoolId pool_id, const U256& token_amount,
                              const U256& currency_amount) {
    if (token_amount.is_zero() || currency_amount.is_zero()) {
        return errors::INVALID_AMOUNT;
    }
    if (pools_.find(pool_id) == pools_.end()) {
        return errors::POOL_NOT_FOUND;
    }
    log::debug("pool %llu: add_liquidity rejected, liquidity is locked", ull(pool_id));
    return errors::POOL_LOCKED;
}

// =============================================================================
// Message Handling
// =============================================================================

void FLPool::on_message(ActorId from, const Message& msg) {
    if (auto* graduation = std::get_if<GraduateToken>(&msg)) {
        if (runtime_.find<FLLedger>(from) == nullptr) {
            log::warn("pool: GraduateToken from %llu rejected (%s)", ull(from),
                      error_name(errors::UNAUTHORIZED));
            return;
        }
        handle_graduation(from, graduation->launch_id, graduation->total_supply,
                          graduation->total_raised);
        return;
    }
    log::debug("pool ignoring %s from %llu", message_type(msg), ull(from));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<LockedPool> FLPool::pool(PoolId pool_id) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::optional<LockedPool> FLPool::pool_for_launch(LaunchId launch_id) const {
    auto it = launch_to_pool_.find(launch_id);
    if (it == launch_to_pool_.end()) return std::nullopt;
    return pool(it->second);
}

std::vector<LockedPool> FLPool::pools(size_t offset, size_t limit) const {
    std::vector<LockedPool> result;
    if (offset >= pools_.size()) return result;

    auto it = pools_.begin();
    std::advance(it, offset);
    for (; it != pools_.end() && result.size() < limit; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::optional<U256> FLPool::current_price(PoolId pool_id) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end() || it->second.token_reserve.is_zero()) return std::nullopt;
    return u256::mul_div(it->second.currency_reserve, U256(PRECISION),
                         it->second.token_reserve);
}

std::optional<U256> FLPool::quote(PoolId pool_id, SwapDirection direction,
                                  const U256& amount_in) const {
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) return std::nullopt;

    const LockedPool& pool = it->second;
    if (direction == SwapDirection::TOKEN_TO_CURRENCY) {
        return constant_product_out(amount_in, pool.token_reserve, pool.currency_reserve);
    }
    return constant_product_out(amount_in, pool.currency_reserve, pool.token_reserve);
}

FLPool::Stats FLPool::get_stats() const {
    return Stats{pools_.size(), total_swaps_, total_tvl_};
}

} // namespace fairlaunch
