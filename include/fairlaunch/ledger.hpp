#ifndef FAIRLAUNCH_LEDGER_HPP
#define FAIRLAUNCH_LEDGER_HPP

#include <map>
#include <optional>
#include <variant>
#include <vector>

#include "types.hpp"
#include "curve.hpp"
#include "custody.hpp"
#include "runtime.hpp"

namespace fairlaunch {

// =============================================================================
// Ledger Phase
// =============================================================================

enum class LedgerPhase {
    Uninitialized,
    Active,
    Graduated
};

const char* phase_name(LedgerPhase phase);

// =============================================================================
// Trade Receipt
// =============================================================================

struct TradeReceipt {
    int32_t status = errors::OK;
    std::optional<TradeId> trade_id;
    U256 token_amount;
    U256 currency_amount;  // Gross cost (buy) or gross return (sell)
    U256 fee;
    U256 price_after;
    bool graduated = false;

    bool ok() const { return status == errors::OK; }

    static TradeReceipt failure(int32_t code) {
        TradeReceipt r;
        r.status = code;
        return r;
    }
};

// =============================================================================
// FLLedger - Per-launch bonding-curve token ledger
//
// Uninitialized -> Active -> Graduated. Buys and sells run only while Active;
// the buy that fills the supply cap graduates the launch and hands the
// reserves to the pool actor with GraduateToken.
// =============================================================================

class FLLedger : public Actor {
public:
    FLLedger(Runtime& runtime, ActorId id, ActorId registry, ActorId pool, ICustody& custody);
    ~FLLedger() override = default;

    const char* kind() const override { return "ledger"; }
    void on_message(ActorId from, const Message& msg) override;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    int32_t initialize(LaunchId launch_id, const Account& creator,
                       const TokenMetadata& metadata, const CurveConfig& curve_config);

    // Manual graduation; also retries the pool hand-off while unacknowledged
    int32_t graduate();

    // =========================================================================
    // Trading
    // =========================================================================

    TradeReceipt buy(const Account& caller, const U256& amount, const U256& max_cost);
    TradeReceipt sell(const Account& caller, const U256& amount, const U256& min_return);

    // =========================================================================
    // Allowances
    // =========================================================================

    int32_t approve(const Account& owner, const Account& spender, const U256& amount);
    int32_t transfer_from(const Account& spender, const Account& from,
                          const Account& to, const U256& amount);

    // =========================================================================
    // Queries
    // =========================================================================

    LedgerPhase phase() const;
    std::optional<Launch> launch() const;

    U256 balance_of(const Account& account) const;
    U256 allowance(const Account& owner, const Account& spender) const;
    uint64_t holder_count() const { return holder_count_; }
    uint64_t trade_count() const { return trades_.size(); }

    // Trades in id order
    std::vector<Trade> trades(size_t offset, size_t limit) const;
    std::optional<UserPosition> position(const Account& account) const;

    std::optional<U256> current_price() const;
    std::optional<U256> quote_buy(const U256& amount) const;
    std::optional<U256> quote_sell(const U256& amount) const;
    std::optional<U256> max_buy_for_budget(const U256& budget) const;
    uint32_t progress_bps() const;

    ActorId registry() const { return registry_; }
    ActorId pool() const { return pool_; }

private:
    struct Uninitialized {};
    struct Active { Launch launch; };
    struct Graduated { Launch launch; };
    using State = std::variant<Uninitialized, Active, Graduated>;

    struct AllowanceKey {
        Account owner;
        Account spender;

        bool operator<(const AllowanceKey& other) const {
            if (owner != other.owner) return owner < other.owner;
            return spender < other.spender;
        }
    };

    ActorId registry_;
    ActorId pool_;
    ICustody& custody_;

    State state_;
    std::map<Account, U256> balances_;
    std::map<AllowanceKey, U256> allowances_;
    std::map<TradeId, Trade> trades_;
    std::map<Account, UserPosition> positions_;
    uint64_t holder_count_{0};
    uint64_t trade_sequence_{0};

    const Launch* current_launch() const;
    void credit(const Account& account, const U256& amount);
    void debit(const Account& account, const U256& amount);
    TradeId record_trade(const Launch& launch, const Account& trader, bool is_buy,
                         const U256& tokens, const U256& currency, const U256& fee,
                         const U256& price_after);
    void notify_trade(const Launch& launch, const Account& trader, bool is_buy,
                      const U256& tokens, const U256& currency, const U256& price_after);
    void send_graduation(const Launch& launch);
    void graduate_now();

    void handle(ActorId from, const TokenCreated& msg);
    void handle(ActorId from, const PoolCreated& msg);
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_LEDGER_HPP
