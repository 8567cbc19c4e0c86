// VALSET - Churn Tracker
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Sliding-window limiter on how much total validator weight may change
// within one churn period. Every weight-changing operation of the validator
// manager passes through ChurnTracker::CheckAndUpdate.

#ifndef VALSET_VALIDATOR_CHURN_H
#define VALSET_VALIDATOR_CHURN_H

#include <valset/core/types.h>
#include <valset/validator/errors.h>

#include <cstdint>
#include <mutex>

namespace valset {
namespace validator {

/// Upper bound on the configurable churn percentage
constexpr uint8_t MAXIMUM_CHURN_PERCENTAGE_LIMIT = 20;

struct ChurnSettings {
    uint64_t churnPeriodSeconds{0};
    uint8_t maximumChurnPercentage{0};
};

/// Accounting for the current churn window
struct ChurnPeriod {
    Timestamp startTime{0};
    Weight initialWeight{0};
    Weight totalWeight{0};
    Weight churnAmount{0};

    bool operator==(const ChurnPeriod& o) const {
        return startTime == o.startTime && initialWeight == o.initialWeight &&
               totalWeight == o.totalWeight && churnAmount == o.churnAmount;
    }
};

/// Reject a maximum churn percentage of zero or above the limit
bool CheckChurnSettings(const ChurnSettings& settings, ManagerState& state);

class ChurnTracker {
public:
    explicit ChurnTracker(const ChurnSettings& settings);

    /// Account for a validator weight change from oldWeight to newWeight.
    ///
    /// The absolute delta counts toward churn in both directions. Fails with
    /// MaxChurnRateExceeded (value: window churn) or InvalidTotalWeight
    /// (value: resulting total); on failure the window is unchanged.
    bool CheckAndUpdate(Weight newWeight, Weight oldWeight, Timestamp now,
                        ManagerState& state);

    /// Same evaluation as CheckAndUpdate without committing
    bool Check(Weight newWeight, Weight oldWeight, Timestamp now,
               ManagerState& state) const;

    /// Seed the total weight of the initial validator set
    void SetTotalWeight(Weight totalWeight);

    /// Drop weight from the total without counting it as churn. Used when a
    /// registration the P-Chain never accepted is invalidated.
    void RemoveWeight(Weight weight);

    Weight GetTotalWeight() const;
    ChurnPeriod GetPeriod() const;
    const ChurnSettings& GetSettings() const { return settings_; }

    /// Replace the window, e.g. when loading persisted state
    void Restore(const ChurnPeriod& period);

private:
    bool Evaluate(ChurnPeriod& period, Weight newWeight, Weight oldWeight,
                  Timestamp now, ManagerState& state) const;

    const ChurnSettings settings_;
    ChurnPeriod period_;
    mutable std::mutex mutex_;
};

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_CHURN_H
