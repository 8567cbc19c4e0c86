// VALSET - Staking Asset Adapters
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// How stake is held and rewards are paid. The staking manager is written
// against IStakingAsset; the concrete adapter decides whether rewards are
// minted (native coin) or drawn from a funded reserve (token).

#ifndef VALSET_STAKING_ASSET_H
#define VALSET_STAKING_ASSET_H

#include <valset/core/types.h>
#include <valset/validator/errors.h>

#include <map>
#include <mutex>
#include <string>

namespace valset {
namespace staking {

using validator::ManagerState;

class IStakingAsset {
public:
    virtual ~IStakingAsset() = default;

    /// Move `value` from `owner` into escrow. Fails with InsufficientBalance.
    virtual bool Lock(const Address& owner, Amount value, ManagerState& state) = 0;

    /// Release `value` from escrow to `to`. Throws std::logic_error when more
    /// than the escrowed total is released.
    virtual void Unlock(const Address& to, Amount value) = 0;

    /// Whether Reward(value) would succeed
    virtual bool CanReward(Amount value) const = 0;

    /// Pay a reward of `value` to `to`. Callers check CanReward first;
    /// throws std::logic_error otherwise.
    virtual void Reward(const Address& to, Amount value) = 0;

    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount TotalLocked() const = 0;
    virtual std::string GetName() const = 0;
};

/**
 * Account ledger shared by both adapters: spendable balances plus an escrow
 * total.
 */
class LedgerAsset : public IStakingAsset {
public:
    /// Credit spendable balance (genesis allocation, faucet, deposit)
    void Credit(const Address& account, Amount value);

    bool Lock(const Address& owner, Amount value, ManagerState& state) override;
    void Unlock(const Address& to, Amount value) override;
    Amount BalanceOf(const Address& account) const override;
    Amount TotalLocked() const override;

    /// Total paid out through Reward
    Amount TotalRewarded() const;

protected:
    /// Caller holds mutex_
    void CreditLocked(const Address& account, Amount value);

    std::map<Address, Amount> balances_;
    Amount locked_{0};
    Amount rewarded_{0};
    mutable std::mutex mutex_;
};

/// Native coin: rewards are newly minted, so they never run out
class NativeAsset : public LedgerAsset {
public:
    bool CanReward(Amount value) const override;
    void Reward(const Address& to, Amount value) override;
    std::string GetName() const override { return "native"; }
};

/// Token: rewards come out of a reserve that must be funded in advance
class TokenAsset : public LedgerAsset {
public:
    explicit TokenAsset(std::string symbol);

    /// Add to the reward reserve
    void FundRewards(Amount value);
    Amount RewardReserve() const;

    bool CanReward(Amount value) const override;
    void Reward(const Address& to, Amount value) override;
    std::string GetName() const override { return symbol_; }

private:
    const std::string symbol_;
    Amount reserve_{0};
};

} // namespace staking
} // namespace valset

#endif // VALSET_STAKING_ASSET_H
