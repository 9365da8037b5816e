#ifndef FAIRLAUNCH_POOL_HPP
#define FAIRLAUNCH_POOL_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"
#include "runtime.hpp"

namespace fairlaunch {

// =============================================================================
// Locked Pool State
// =============================================================================

struct LockedPool {
    PoolId id;
    LaunchId launch_id;
    ActorId ledger;           // Ledger actor that graduated into this pool
    U256 token_reserve;
    U256 currency_reserve;
    U256 initial_ratio;       // currency * PRECISION / token at creation
    bool locked;              // Always true
    uint64_t trade_count;
    U256 tvl;                 // 2 * currency_reserve
    Timestamp created_at;
};

enum class SwapDirection {
    TOKEN_TO_CURRENCY,
    CURRENCY_TO_TOKEN
};

struct SwapResult {
    int32_t status = errors::OK;
    U256 amount_in;
    U256 amount_out;
    U256 token_reserve;
    U256 currency_reserve;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// FLPool - Permanently locked constant-product pools
//
// One pool per graduated launch, created on the first GraduateToken and
// acknowledged with PoolCreated on every delivery. Liquidity can never be
// added or removed.
// =============================================================================

class FLPool : public Actor {
public:
    static constexpr uint64_t PRECISION = 1000000;

    FLPool(Runtime& runtime, ActorId id, ActorId registry);
    ~FLPool() override = default;

    const char* kind() const override { return "pool"; }
    void on_message(ActorId from, const Message& msg) override;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Idempotent per launch id; re-acknowledges an existing pool
    int32_t handle_graduation(ActorId ledger, LaunchId launch_id,
                              const U256& total_supply, const U256& total_raised);

    SwapResult swap(PoolId pool_id, SwapDirection direction,
                    const U256& amount_in, const U256& min_amount_out);

    // Always rejected
    int32_t add_liquidity(PoolId pool_id, const U256& token_amount,
                          const U256& currency_amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<LockedPool> pool(PoolId pool_id) const;
    std::optional<LockedPool> pool_for_launch(LaunchId launch_id) const;
    std::vector<LockedPool> pools(size_t offset, size_t limit) const;

    // currency per token, scaled by PRECISION
    std::optional<U256> current_price(PoolId pool_id) const;

    // Output for amount_in at current reserves (no state change)
    std::optional<U256> quote(PoolId pool_id, SwapDirection direction,
                              const U256& amount_in) const;

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        U256 total_tvl;
    };
    Stats get_stats() const;

private:
    ActorId registry_;

    std::map<PoolId, LockedPool> pools_;
    std::map<LaunchId, PoolId> launch_to_pool_;
    PoolId next_pool_id_{1};

    uint64_t total_swaps_{0};
    U256 total_tvl_;

    void acknowledge(ActorId ledger, const LockedPool& pool);
};

// amount_in * reserve_out / (reserve_in + amount_in), floored
std::optional<U256> constant_product_out(const U256& amount_in, const U256& reserve_in,
                                         const U256& reserve_out);

} // namespace fairlaunch

#endif // FAIRLAUNCH_POOL_HPP
