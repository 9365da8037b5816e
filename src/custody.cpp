// =============================================================================
// custody.cpp - Native currency custody
// =============================================================================

#include "fairlaunch/custody.hpp"

#include <mutex>

namespace fairlaunch {

int32_t to_amount(const U256& value, Amount& out) {
    if (!value.fits_u128()) return errors::AMOUNT_CONVERSION;
    out = value.lo;
    return errors::OK;
}

// =============================================================================
// Deposit/Withdraw
// =============================================================================

int32_t FLCustody::deposit(const Account& account, Amount amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    Amount& bal = balances_[account];
    if (bal + amount < bal) {
        return errors::AMOUNT_CONVERSION;
    }
    bal += amount;
    total_deposits_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t FLCustody::withdraw(const Account& account, Amount amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_FUNDS;
    }

    it->second -= amount;
    if (it->second == 0) balances_.erase(it);
    total_withdrawals_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t FLCustody::transfer(const Account& from, const Account& to, Amount amount) {
    if (amount == 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    return apply_batch_locked({TransferLeg{from, to, amount}});
}

Amount FLCustody::balance(const Account& account) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(account);
    if (it == balances_.end()) return 0;
    return it->second;
}

// =============================================================================
// Batch Transfers
// =============================================================================

int32_t FLCustody::transfer_batch(const std::vector<TransferLeg>& legs) {
    std::unique_lock lock(mutex_);
    return apply_batch_locked(legs);
}

int32_t FLCustody::apply_batch_locked(const std::vector<TransferLeg>& legs) {
    // Project every touched balance first so a failing leg changes nothing
    std::map<Account, Amount> projected;
    auto current = [&](const Account& account) -> Amount& {
        auto pit = projected.find(account);
        if (pit != projected.end()) return pit->second;
        auto bit = balances_.find(account);
        return projected[account] = (bit == balances_.end() ? 0 : bit->second);
    };

    size_t applied = 0;
    for (const auto& leg : legs) {
        if (leg.amount == 0) continue;

        Amount& from_bal = current(leg.from);
        if (from_bal < leg.amount) {
            return errors::INSUFFICIENT_FUNDS;
        }
        from_bal -= leg.amount;

        Amount& to_bal = current(leg.to);
        if (to_bal + leg.amount < to_bal) {
            return errors::AMOUNT_CONVERSION;
        }
        to_bal += leg.amount;
        ++applied;
    }

    for (const auto& [account, amount] : projected) {
        if (amount == 0) {
            balances_.erase(account);
        } else {
            balances_[account] = amount;
        }
    }
    total_transfers_.fetch_add(applied, std::memory_order_relaxed);
    return errors::OK;
}

size_t FLCustody::account_count() const {
    std::shared_lock lock(mutex_);
    return balances_.size();
}

FLCustody::Stats FLCustody::get_stats() const {
    return Stats{
        total_deposits_.load(),
        total_withdrawals_.load(),
        total_transfers_.load()
    };
}

} // namespace fairlaunch
