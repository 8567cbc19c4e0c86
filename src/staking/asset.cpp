// VALSET - Staking Asset Adapters Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/staking/asset.h>
#include <valset/util/logging.h>

#include <limits>
#include <stdexcept>

namespace valset {
namespace staking {

namespace LogCategory = util::LogCategory;
using validator::ErrorCode;

// ============================================================================
// LedgerAsset
// ============================================================================

void LedgerAsset::CreditLocked(const Address& account, Amount value) {
    Amount& balance = balances_[account];
    if (value > std::numeric_limits<Amount>::max() - balance) {
        throw std::overflow_error("balance overflow for " + account.ToHex());
    }
    balance += value;
}

void LedgerAsset::Credit(const Address& account, Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    CreditLocked(account, value);
}

bool LedgerAsset::Lock(const Address& owner, Amount value, ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(owner);
    Amount balance = it == balances_.end() ? 0 : it->second;
    if (balance < value) {
        return state.Invalid(ErrorCode::InsufficientBalance, balance,
                             "cannot lock " + std::to_string(value));
    }
    if (value > std::numeric_limits<Amount>::max() - locked_) {
        return state.Invalid(ErrorCode::InvalidStakeAmount, value, "escrow overflow");
    }
    if (value > 0) {
        it->second -= value;
    }
    locked_ += value;
    LOG_TRACE(LogCategory::STAKING) << GetName() << ": locked " << value << " from "
                                    << owner.ToShortHex();
    return true;
}

void LedgerAsset::Unlock(const Address& to, Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value > locked_) {
        throw std::logic_error("unlock of " + std::to_string(value) + " exceeds escrow " +
                               std::to_string(locked_));
    }
    locked_ -= value;
    CreditLocked(to, value);
    LOG_TRACE(LogCategory::STAKING) << GetName() << ": unlocked " << value << " to "
                                    << to.ToShortHex();
}

Amount LedgerAsset::BalanceOf(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount LedgerAsset::TotalLocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

Amount LedgerAsset::TotalRewarded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rewarded_;
}

// ============================================================================
// NativeAsset
// ============================================================================

bool NativeAsset::CanReward(Amount) const {
    return true;
}

void NativeAsset::Reward(const Address& to, Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    CreditLocked(to, value);
    rewarded_ += value;
    LOG_DEBUG(LogCategory::STAKING) << "native: minted " << value << " to " << to.ToShortHex();
}

// ============================================================================
// TokenAsset
// ============================================================================

TokenAsset::TokenAsset(std::string symbol) : symbol_(std::move(symbol)) {}

void TokenAsset::FundRewards(Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value > std::numeric_limits<Amount>::max() - reserve_) {
        throw std::overflow_error("reward reserve overflow");
    }
    reserve_ += value;
}

Amount TokenAsset::RewardReserve() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserve_;
}

bool TokenAsset::CanReward(Amount value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value <= reserve_;
}

void TokenAsset::Reward(const Address& to, Amount value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (value > reserve_) {
        throw std::logic_error(symbol_ + ": reward " + std::to_string(value) +
                               " exceeds reserve " + std::to_string(reserve_));
    }
    reserve_ -= value;
    CreditLocked(to, value);
    rewarded_ += value;
    LOG_DEBUG(LogCategory::STAKING) << symbol_ << ": paid " << value << " to " << to.ToShortHex();
}

} // namespace staking
} // namespace valset
