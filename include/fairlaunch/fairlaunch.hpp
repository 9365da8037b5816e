#ifndef FAIRLAUNCH_FAIRLAUNCH_HPP
#define FAIRLAUNCH_FAIRLAUNCH_HPP

// =============================================================================
// Fair Launch - bonding-curve token launches with locked-liquidity graduation
//
// Actors:
//   FLRegistry  launch factory and index (one)
//   FLLedger    per-launch token ledger and bonding curve (one per launch)
//   FLPool      locked constant-product pools (one)
//
// =============================================================================

#include <memory>
#include <optional>

#include "types.hpp"
#include "uint256.hpp"
#include "curve.hpp"
#include "messages.hpp"
#include "runtime.hpp"
#include "custody.hpp"
#include "ledger.hpp"
#include "pool.hpp"
#include "registry.hpp"
#include "config.hpp"
#include "log.hpp"

namespace fairlaunch {

// =============================================================================
// FairLaunch - Unified controller
// =============================================================================

class FairLaunch {
public:
    explicit FairLaunch(Config config = {});
    ~FairLaunch();

    // Non-copyable
    FairLaunch(const FairLaunch&) = delete;
    FairLaunch& operator=(const FairLaunch&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Runtime& runtime() { return *runtime_; }
    FLCustody& custody() { return custody_; }
    const FLCustody& custody() const { return custody_; }
    const Config& config() const { return config_; }

    ActorId registry_id() const { return registry_id_; }
    ActorId pool_id() const { return pool_id_; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void start();
    void stop();
    bool is_running() const { return runtime_->is_running(); }

    // Deliver until every mailbox is empty
    void settle();

    // =========================================================================
    // Launches
    // =========================================================================

    // Creates the launch and settles so the new ledger is initialized
    CreateTokenResult create_token(const Account& creator, const TokenMetadata& metadata,
                                   const std::optional<CurveConfig>& curve_config = std::nullopt);

    // =========================================================================
    // Ledger Operations
    // =========================================================================

    TradeReceipt buy(LaunchId launch_id, const Account& caller,
                     const U256& amount, const U256& max_cost);
    TradeReceipt sell(LaunchId launch_id, const Account& caller,
                      const U256& amount, const U256& min_return);
    int32_t approve(LaunchId launch_id, const Account& owner,
                    const Account& spender, const U256& amount);
    int32_t transfer_from(LaunchId launch_id, const Account& spender,
                          const Account& from, const Account& to, const U256& amount);
    int32_t graduate(LaunchId launch_id);

    // =========================================================================
    // Pool Operations
    // =========================================================================

    SwapResult swap(PoolId pool_id, SwapDirection direction,
                    const U256& amount_in, const U256& min_amount_out);
    int32_t add_liquidity(PoolId pool_id, const U256& token_amount,
                          const U256& currency_amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Launch> launch(LaunchId launch_id);
    U256 balance_of(LaunchId launch_id, const Account& account);
    std::optional<LockedPool> pool_for_launch(LaunchId launch_id);

    // Run fn under the actor's execution lock
    template <class Fn>
    auto with_registry(Fn&& fn) {
        return runtime_->with_actor<FLRegistry>(registry_id_, std::forward<Fn>(fn));
    }

    template <class Fn>
    auto with_pool(Fn&& fn) {
        return runtime_->with_actor<FLPool>(pool_id_, std::forward<Fn>(fn));
    }

    // Throws std::out_of_range for an unknown launch
    template <class Fn>
    auto with_ledger(LaunchId launch_id, Fn&& fn) {
        auto ledger = ledger_of(launch_id);
        if (!ledger) {
            throw std::out_of_range("unknown launch: " + std::to_string(launch_id));
        }
        return runtime_->with_actor<FLLedger>(*ledger, std::forward<Fn>(fn));
    }

    std::optional<ActorId> ledger_of(LaunchId launch_id);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        Runtime::Stats runtime;
        FLRegistry::Stats registry;
        FLPool::Stats pool;
        FLCustody::Stats custody;
    };
    Stats get_stats();

private:
    Config config_;
    FLCustody custody_;
    std::unique_ptr<Runtime> runtime_;  // Destroyed before custody_

    ActorId registry_id_{0};
    ActorId pool_id_{0};
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_FAIRLAUNCH_HPP
