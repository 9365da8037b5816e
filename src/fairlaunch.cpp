// =============================================================================
// fairlaunch.cpp - Unified FairLaunch controller
// =============================================================================

#include "fairlaunch/fairlaunch.hpp"

namespace fairlaunch {

// =============================================================================
// Constructor / Destructor
// =============================================================================

FairLaunch::FairLaunch(Config config) : config_(std::move(config)) {
    config_.validate();

    if (auto level = log::parse_level(config_.general.log_level)) {
        log::set_level(*level);
    }
    if (!config_.general.log_file.empty()) {
        log::set_file(config_.general.log_file);
    }

    runtime_ = std::make_unique<Runtime>(config_.runtime_config());

    FLRegistry& registry = runtime_->spawn<FLRegistry>(custody_, config_.curve, config_.registry);
    registry_id_ = registry.id();

    FLPool& pool = runtime_->spawn<FLPool>(registry_id_);
    pool_id_ = pool.id();

    runtime_->with_actor<FLRegistry>(registry_id_, [this](FLRegistry& r) {
        r.set_pool(pool_id_);
    });

    log::info("fair launch ready: registry=%llu pool=%llu",
              static_cast<unsigned long long>(registry_id_),
              static_cast<unsigned long long>(pool_id_));
}

FairLaunch::~FairLaunch() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void FairLaunch::start() {
    runtime_->start();
}

void FairLaunch::stop() {
    runtime_->stop();
}

void FairLaunch::settle() {
    runtime_->wait_idle();
}

// =============================================================================
// Launches
// =============================================================================

CreateTokenResult FairLaunch::create_token(const Account& creator, const TokenMetadata& metadata,
                                           const std::optional<CurveConfig>& curve_config) {
    CreateTokenResult result = with_registry([&](FLRegistry& r) {
        return r.create_token(creator, metadata, curve_config);
    });
    if (result.ok()) settle();
    return result;
}

std::optional<ActorId> FairLaunch::ledger_of(LaunchId launch_id) {
    return with_registry([launch_id](FLRegistry& r) { return r.ledger_of(launch_id); });
}

// =============================================================================
// Ledger Operations
// =============================================================================

TradeReceipt FairLaunch::buy(LaunchId launch_id, const Account& caller,
                             const U256& amount, const U256& max_cost) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return TradeReceipt::failure(errors::LAUNCH_NOT_FOUND);
    return runtime_->with_actor<FLLedger>(*ledger, [&](FLLedger& l) {
        return l.buy(caller, amount, max_cost);
    });
}

TradeReceipt FairLaunch::sell(LaunchId launch_id, const Account& caller,
                              const U256& amount, const U256& min_return) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return TradeReceipt::failure(errors::LAUNCH_NOT_FOUND);
    return runtime_->with_actor<FLLedger>(*ledger, [&](FLLedger& l) {
        return l.sell(caller, amount, min_return);
    });
}

int32_t FairLaunch::approve(LaunchId launch_id, const Account& owner,
                            const Account& spender, const U256& amount) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return errors::LAUNCH_NOT_FOUND;
    return runtime_->with_actor<FLLedger>(*ledger, [&](FLLedger& l) {
        return l.approve(owner, spender, amount);
    });
}

int32_t FairLaunch::transfer_from(LaunchId launch_id, const Account& spender,
                                  const Account& from, const Account& to, const U256& amount) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return errors::LAUNCH_NOT_FOUND;
    return runtime_->with_actor<FLLedger>(*ledger, [&](FLLedger& l) {
        return l.transfer_from(spender, from, to, amount);
    });
}

int32_t FairLaunch::graduate(LaunchId launch_id) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return errors::LAUNCH_NOT_FOUND;
    return runtime_->with_actor<FLLedger>(*ledger, [](FLLedger& l) {
        return l.graduate();
    });
}

// =============================================================================
// Pool Operations
// =============================================================================

SwapResult FairLaunch::swap(PoolId pool_id, SwapDirection direction,
                            const U256& amount_in, const U256& min_amount_out) {
    return with_pool([&](FLPool& p) {
        return p.swap(pool_id, direction, amount_in, min_amount_out);
    });
}

int32_t FairLaunch::add_liquidity(PoolId pool_id, const U256& token_amount,
                                  const U256& currency_amount) {
    return with_pool([&](FLPool& p) {
        return p.add_liquidity(pool_id, token_amount, currency_amount);
    });
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Launch> FairLaunch::launch(LaunchId launch_id) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return std::nullopt;
    return runtime_->with_actor<FLLedger>(*ledger, [](FLLedger& l) { return l.launch(); });
}

U256 FairLaunch::balance_of(LaunchId launch_id, const Account& account) {
    auto ledger = ledger_of(launch_id);
    if (!ledger) return U256();
    return runtime_->with_actor<FLLedger>(*ledger, [&](FLLedger& l) {
        return l.balance_of(account);
    });
}

std::optional<LockedPool> FairLaunch::pool_for_launch(LaunchId launch_id) {
    return with_pool([launch_id](FLPool& p) { return p.pool_for_launch(launch_id); });
}

FairLaunch::Stats FairLaunch::get_stats() {
    Stats stats;
    stats.runtime = runtime_->get_stats();
    stats.registry = with_registry([](FLRegistry& r) { return r.get_stats(); });
    stats.pool = with_pool([](FLPool& p) { return p.get_stats(); });
    stats.custody = custody_.get_stats();
    return stats;
}

} // namespace fairlaunch
