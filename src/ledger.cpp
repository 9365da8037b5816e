// =============================================================================
// ledger.cpp - FLLedger bonding-curve token ledger
// =============================================================================

#include "fairlaunch/ledger.hpp"
#include "fairlaunch/log.hpp"

#include <iterator>

namespace fairlaunch {

namespace {

unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

} // anonymous namespace

const char* phase_name(LedgerPhase phase) {
    switch (phase) {
        case LedgerPhase::Uninitialized: return "uninitialized";
        case LedgerPhase::Active: return "active";
        case LedgerPhase::Graduated: return "graduated";
    }
    return "?";
}

// =============================================================================
// Constructor
// =============================================================================

FLLedger::FLLedger(Runtime& runtime, ActorId id, ActorId registry, ActorId pool,
                   ICustody& custody)
    : Actor(runtime, id), registry_(registry), pool_(pool), custody_(custody) {}

// =============================================================================
// Lifecycle
// =============================================================================

int32_t FLLedger::initialize(LaunchId launch_id, const Account& creator,
                             const TokenMetadata& metadata, const CurveConfig& curve_config) {
    if (!std::holds_alternative<Uninitialized>(state_)) {
        return errors::ALREADY_INITIALIZED;
    }
    if (bonding_curve::validate(curve_config) != errors::OK) {
        return errors::INVALID_CURVE_CONFIG;
    }

    Launch launch;
    launch.id = launch_id;
    launch.creator = creator;
    launch.metadata = metadata;
    launch.curve_config = curve_config;
    launch.created_at = now();
    state_ = Active{std::move(launch)};

    log::info("ledger %llu initialized launch %llu (%s)", ull(id()), ull(launch_id),
              metadata.symbol.c_str());
    return errors::OK;
}

int32_t FLLedger::graduate() {
    if (auto* active = std::get_if<Active>(&state_)) {
        if (active->launch.current_supply < active->launch.curve_config.max_supply) {
            return errors::CURVE_INCOMPLETE;
        }
        graduate_now();
        return errors::OK;
    }

    if (auto* graduated = std::get_if<Graduated>(&state_)) {
        if (!graduated->launch.pool_id) {
            log::info("ledger %llu re-sending graduation for launch %llu", ull(id()),
                      ull(graduated->launch.id));
            send_graduation(graduated->launch);
        }
        return errors::OK;
    }

    return errors::NOT_INITIALIZED;
}

void FLLedger::graduate_now() {
    auto* active = std::get_if<Active>(&state_);
    if (active == nullptr) return;

    Launch launch = std::move(active->launch);
    launch.graduated = true;
    state_ = Graduated{std::move(launch)};

    const Launch& graduated = std::get<Graduated>(state_).launch;
    log::info("launch %llu graduated: supply=%s raised=%s", ull(graduated.id),
              graduated.current_supply.to_string().c_str(),
              graduated.total_raised.to_string().c_str());
    send_graduation(graduated);
}

void FLLedger::send_graduation(const Launch& launch) {
    send(pool_, GraduateToken{launch.id, launch.current_supply, launch.total_raised});
}

// =============================================================================
// Trading
// =============================================================================

TradeReceipt FLLedger::buy(const Account& caller, const U256& amount, const U256& max_cost) {
    if (std::holds_alternative<Uninitialized>(state_)) {
        return TradeReceipt::failure(errors::NOT_INITIALIZED);
    }
    auto* active = std::get_if<Active>(&state_);
    if (active == nullptr) {
        return TradeReceipt::failure(errors::ALREADY_GRADUATED);
    }
    Launch& launch = active->launch;
    const CurveConfig& curve = launch.curve_config;

    if (amount.is_zero()) {
        return TradeReceipt::failure(errors::INVALID_AMOUNT);
    }

    auto new_supply = u256::checked_add(launch.current_supply, amount);
    if (!new_supply || *new_supply > curve.max_supply) {
        return TradeReceipt::failure(errors::EXCEEDS_MAX_SUPPLY);
    }

    auto cost = bonding_curve::buy_cost(launch.current_supply, amount, curve.k, curve.scale);
    if (!cost) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }
    if (*cost > max_cost) {
        return TradeReceipt::failure(errors::SLIPPAGE_EXCEEDED);
    }

    U256 fee = bonding_curve::creator_fee(*cost, curve.creator_fee_bps);
    U256 net = *cost - fee;

    auto price_after = bonding_curve::price(*new_supply, curve.k, curve.scale);
    auto new_raised = u256::checked_add(launch.total_raised, *cost);
    if (!price_after || !new_raised) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }

    Amount fee_amount = 0;
    Amount net_amount = 0;
    if (to_amount(fee, fee_amount) != errors::OK || to_amount(net, net_amount) != errors::OK) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }

    int32_t paid = custody_.transfer_batch({
        TransferLeg{caller, launch.creator, fee_amount},
        TransferLeg{caller, application_account(), net_amount},
    });
    if (paid != errors::OK) {
        return TradeReceipt::failure(paid);
    }

    // Commit
    credit(caller, amount);
    launch.current_supply = *new_supply;
    launch.total_raised = *new_raised;

    UserPosition& pos = positions_[caller];
    pos.balance += amount;
    pos.total_invested += *cost;
    pos.trades_count++;

    TradeReceipt receipt;
    receipt.trade_id = record_trade(launch, caller, true, amount, *cost, fee, *price_after);
    receipt.token_amount = amount;
    receipt.currency_amount = *cost;
    receipt.fee = fee;
    receipt.price_after = *price_after;

    notify_trade(launch, caller, true, amount, *cost, *price_after);

    log::debug("launch %llu buy %s for %s by %s", ull(launch.id), amount.to_string().c_str(),
               cost->to_string().c_str(), caller.to_string().c_str());

    if (launch.current_supply >= curve.max_supply) {
        graduate_now();
        receipt.graduated = true;
    }
    return receipt;
}

TradeReceipt FLLedger::sell(const Account& caller, const U256& amount, const U256& min_return) {
    if (std::holds_alternative<Uninitialized>(state_)) {
        return TradeReceipt::failure(errors::NOT_INITIALIZED);
    }
    auto* active = std::get_if<Active>(&state_);
    if (active == nullptr) {
        return TradeReceipt::failure(errors::ALREADY_GRADUATED);
    }
    Launch& launch = active->launch;
    const CurveConfig& curve = launch.curve_config;

    if (amount.is_zero()) {
        return TradeReceipt::failure(errors::INVALID_AMOUNT);
    }
    if (balance_of(caller) < amount) {
        return TradeReceipt::failure(errors::INSUFFICIENT_BALANCE);
    }

    auto ret = bonding_curve::sell_return(launch.current_supply, amount, curve.k, curve.scale);
    if (!ret) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }
    if (*ret < min_return) {
        return TradeReceipt::failure(errors::SLIPPAGE_EXCEEDED);
    }

    U256 fee = bonding_curve::creator_fee(*ret, curve.creator_fee_bps);
    U256 payout = *ret - fee;
    U256 new_supply = launch.current_supply - amount;

    auto price_after = bonding_curve::price(new_supply, curve.k, curve.scale);
    if (!price_after) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }

    Amount fee_amount = 0;
    Amount payout_amount = 0;
    if (to_amount(fee, fee_amount) != errors::OK ||
        to_amount(payout, payout_amount) != errors::OK) {
        return TradeReceipt::failure(errors::AMOUNT_CONVERSION);
    }

    int32_t paid = custody_.transfer_batch({
        TransferLeg{application_account(), launch.creator, fee_amount},
        TransferLeg{application_account(), caller, payout_amount},
    });
    if (paid != errors::OK) {
        return TradeReceipt::failure(paid);
    }

    // Commit
    debit(caller, amount);
    launch.current_supply = new_supply;
    launch.total_raised = u256::saturating_sub(launch.total_raised, *ret);

    UserPosition& pos = positions_[caller];
    pos.balance = u256::saturating_sub(pos.balance, amount);
    pos.trades_count++;

    TradeReceipt receipt;
    receipt.trade_id = record_trade(launch, caller, false, amount, *ret, fee, *price_after);
    receipt.token_amount = amount;
    receipt.currency_amount = *ret;
    receipt.fee = fee;
    receipt.price_after = *price_after;

    notify_trade(launch, caller, false, amount, *ret, *price_after);

    log::debug("launch %llu sell %s for %s by %s", ull(launch.id), amount.to_string().c_str(),
               ret->to_string().c_str(), caller.to_string().c_str());
    return receipt;
}

// =============================================================================
// Allowances
// =============================================================================

int32_t FLLedger::approve(const Account& owner, const Account& spender, const U256& amount) {
    if (current_launch() == nullptr) {
        return errors::NOT_INITIALIZED;
    }

    AllowanceKey key{owner, spender};
    if (amount.is_zero()) {
        allowances_.erase(key);
    } else {
        allowances_[key] = amount;
    }
    return errors::OK;
}

int32_t FLLedger::transfer_from(const Account& spender, const Account& from,
                                const Account& to, const U256& amount) {
    if (current_launch() == nullptr) {
        return errors::NOT_INITIALIZED;
    }
    if (amount.is_zero()) {
        return errors::INVALID_AMOUNT;
    }

    AllowanceKey key{from, spender};
    auto it = allowances_.find(key);
    if (it == allowances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_ALLOWANCE;
    }
    if (balance_of(from) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second = u256::saturating_sub(it->second, amount);
    if (it->second.is_zero()) allowances_.erase(it);

    debit(from, amount);
    credit(to, amount);
    return errors::OK;
}

// =============================================================================
// Balance Bookkeeping
// =============================================================================

void FLLedger::credit(const Account& account, const U256& amount) {
    if (amount.is_zero()) return;

    auto it = balances_.find(account);
    if (it == balances_.end()) {
        balances_.emplace(account, amount);
        holder_count_++;
        return;
    }
    it->second += amount;
}

void FLLedger::debit(const Account& account, const U256& amount) {
    auto it = balances_.find(account);
    if (it == balances_.end() || amount.is_zero()) return;

    it->second = u256::saturating_sub(it->second, amount);
    if (it->second.is_zero()) {
        balances_.erase(it);
        holder_count_--;
    }
}

TradeId FLLedger::record_trade(const Launch& launch, const Account& trader, bool is_buy,
                               const U256& tokens, const U256& currency, const U256& fee,
                               const U256& price_after) {
    Timestamp ts = now();
    TradeId trade_id{ts, trade_sequence_++};

    Trade trade;
    trade.id = trade_id;
    trade.launch_id = launch.id;
    trade.trader = trader;
    trade.is_buy = is_buy;
    trade.token_amount = tokens;
    trade.currency_amount = currency;
    trade.fee_amount = fee;
    trade.price_after = price_after;
    trade.timestamp = ts;
    trades_.emplace(trade_id, std::move(trade));
    return trade_id;
}

void FLLedger::notify_trade(const Launch& launch, const Account& trader, bool is_buy,
                            const U256& tokens, const U256& currency, const U256& price_after) {
    send(registry_, TradeExecuted{launch.id, trader, is_buy, tokens, currency, price_after,
                                  launch.current_supply, launch.total_raised});
}

// =============================================================================
// Message Handling
// =============================================================================

void FLLedger::on_message(ActorId from, const Message& msg) {
    if (auto* created = std::get_if<TokenCreated>(&msg)) {
        handle(from, *created);
    } else if (auto* pool_created = std::get_if<PoolCreated>(&msg)) {
        handle(from, *pool_created);
    } else {
        log::debug("ledger %llu ignoring %s", ull(id()), message_type(msg));
    }
}

void FLLedger::handle(ActorId from, const TokenCreated& msg) {
    if (from != registry_) {
        log::warn("ledger %llu: TokenCreated from %llu rejected (%s)", ull(id()), ull(from),
                  error_name(errors::UNAUTHORIZED));
        return;
    }

    if (const Launch* launch = current_launch()) {
        if (launch->id != msg.launch_id) {
            log::warn("ledger %llu already holds launch %llu, ignoring launch %llu", ull(id()),
                      ull(launch->id), ull(msg.launch_id));
        }
        return;
    }

    int32_t status = initialize(msg.launch_id, msg.creator, msg.metadata, msg.curve_config);
    if (status != errors::OK) {
        log::warn("ledger %llu failed to initialize launch %llu: %s", ull(id()),
                  ull(msg.launch_id), error_name(status));
    }
}

void FLLedger::handle(ActorId from, const PoolCreated& msg) {
    if (from != pool_) {
        log::warn("ledger %llu: PoolCreated from %llu rejected (%s)", ull(id()), ull(from),
                  error_name(errors::UNAUTHORIZED));
        return;
    }

    auto* graduated = std::get_if<Graduated>(&state_);
    if (graduated == nullptr || graduated->launch.id != msg.launch_id) {
        log::warn("ledger %llu: unexpected PoolCreated for launch %llu", ull(id()),
                  ull(msg.launch_id));
        return;
    }

    Launch& launch = graduated->launch;
    if (!launch.pool_id) {
        launch.pool_id = msg.pool_id;
        log::info("launch %llu locked into pool %llu", ull(launch.id), ull(msg.pool_id));
    } else if (*launch.pool_id != msg.pool_id) {
        log::warn("launch %llu: conflicting pool %llu ignored (have %llu)", ull(launch.id),
                  ull(msg.pool_id), ull(*launch.pool_id));
    }
}

// =============================================================================
// Queries
// =============================================================================

const Launch* FLLedger::current_launch() const {
    if (auto* active = std::get_if<Active>(&state_)) return &active->launch;
    if (auto* graduated = std::get_if<Graduated>(&state_)) return &graduated->launch;
    return nullptr;
}

LedgerPhase FLLedger::phase() const {
    if (std::holds_alternative<Active>(state_)) return LedgerPhase::Active;
    if (std::holds_alternative<Graduated>(state_)) return LedgerPhase::Graduated;
    return LedgerPhase::Uninitialized;
}

std::optional<Launch> FLLedger::launch() const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return std::nullopt;
    return *launch;
}

U256 FLLedger::balance_of(const Account& account) const {
    auto it = balances_.find(account);
    if (it == balances_.end()) return U256();
    return it->second;
}

U256 FLLedger::allowance(const Account& owner, const Account& spender) const {
    auto it = allowances_.find(AllowanceKey{owner, spender});
    if (it == allowances_.end()) return U256();
    return it->second;
}

std::vector<Trade> FLLedger::trades(size_t offset, size_t limit) const {
    std::vector<Trade> result;
    if (offset >= trades_.size()) return result;

    auto it = trades_.begin();
    std::advance(it, offset);
    for (; it != trades_.end() && result.size() < limit; ++it) {
        result.push_back(it->second);
    }
    return result;
}

std::optional<UserPosition> FLLedger::position(const Account& account) const {
    auto it = positions_.find(account);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::optional<U256> FLLedger::current_price() const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return std::nullopt;
    return bonding_curve::price(launch->current_supply, launch->curve_config.k,
                                launch->curve_config.scale);
}

std::optional<U256> FLLedger::quote_buy(const U256& amount) const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return std::nullopt;
    return bonding_curve::buy_cost(launch->current_supply, amount, launch->curve_config.k,
                                   launch->curve_config.scale);
}

std::optional<U256> FLLedger::quote_sell(const U256& amount) const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return std::nullopt;
    return bonding_curve::sell_return(launch->current_supply, amount, launch->curve_config.k,
                                      launch->curve_config.scale);
}

std::optional<U256> FLLedger::max_buy_for_budget(const U256& budget) const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return std::nullopt;
    return bonding_curve::max_buy_for_budget(launch->current_supply, budget,
                                             launch->curve_config);
}

uint32_t FLLedger::progress_bps() const {
    const Launch* launch = current_launch();
    if (launch == nullptr) return 0;
    return bonding_curve::progress_bps(launch->current_supply, launch->curve_config.max_supply);
}

} // namespace fairlaunch
