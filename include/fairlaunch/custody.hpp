#ifndef FAIRLAUNCH_CUSTODY_HPP
#define FAIRLAUNCH_CUSTODY_HPP

#include <map>
#include <shared_mutex>
#include <vector>
#include <atomic>

#include "types.hpp"

namespace fairlaunch {

// =============================================================================
// Native Currency Custody
// =============================================================================

struct TransferLeg {
    Account from;
    Account to;
    Amount amount;
};

// Narrow a curve amount to the native unit; AMOUNT_CONVERSION above 2^128-1
int32_t to_amount(const U256& value, Amount& out);

// Custody seen by ledgers: balances plus atomic multi-leg transfers
class ICustody {
public:
    virtual ~ICustody() = default;

    virtual Amount balance(const Account& account) const = 0;

    // All legs apply or none do. Zero legs are skipped.
    virtual int32_t transfer_batch(const std::vector<TransferLeg>& legs) = 0;
};

// =============================================================================
// FLCustody - In-memory custody
// =============================================================================

class FLCustody : public ICustody {
public:
    FLCustody() = default;
    ~FLCustody() override = default;

    // Non-copyable
    FLCustody(const FLCustody&) = delete;
    FLCustody& operator=(const FLCustody&) = delete;

    int32_t deposit(const Account& account, Amount amount);
    int32_t withdraw(const Account& account, Amount amount);
    int32_t transfer(const Account& from, const Account& to, Amount amount);

    Amount balance(const Account& account) const override;
    int32_t transfer_batch(const std::vector<TransferLeg>& legs) override;

    size_t account_count() const;

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_withdrawals;
        uint64_t total_transfers;
    };
    Stats get_stats() const;

private:
    std::map<Account, Amount> balances_;
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> total_deposits_{0};
    std::atomic<uint64_t> total_withdrawals_{0};
    std::atomic<uint64_t> total_transfers_{0};

    // Caller holds mutex_ exclusively
    int32_t apply_batch_locked(const std::vector<TransferLeg>& legs);
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_CUSTODY_HPP
