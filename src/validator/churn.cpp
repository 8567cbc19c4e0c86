// VALSET - Churn Tracker Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/churn.h>
#include <valset/util/logging.h>

#include <limits>
#include <sstream>

namespace valset {
namespace validator {

namespace LogCategory = util::LogCategory;

bool CheckChurnSettings(const ChurnSettings& settings, ManagerState& state) {
    if (settings.maximumChurnPercentage == 0 ||
        settings.maximumChurnPercentage > MAXIMUM_CHURN_PERCENTAGE_LIMIT) {
        return state.Invalid(ErrorCode::InvalidMaximumChurnPercentage,
                             settings.maximumChurnPercentage,
                             "maximum churn percentage must be in [1, 20]");
    }
    return true;
}

ChurnTracker::ChurnTracker(const ChurnSettings& settings) : settings_(settings) {}

bool ChurnTracker::Evaluate(ChurnPeriod& period, Weight newWeight, Weight oldWeight,
                            Timestamp now, ManagerState& state) const {
    const Weight delta = newWeight > oldWeight ? newWeight - oldWeight
                                               : oldWeight - newWeight;

    if (period.startTime == 0 || now >= period.startTime + settings_.churnPeriodSeconds) {
        period.churnAmount = delta;
        period.startTime = now;
        period.initialWeight = period.totalWeight;
    } else {
        if (delta > std::numeric_limits<Weight>::max() - period.churnAmount) {
            return state.Invalid(ErrorCode::MaxChurnRateExceeded,
                                 std::numeric_limits<Weight>::max(),
                                 "churn amount overflow");
        }
        period.churnAmount += delta;
    }

    // churnAmount / initialWeight must stay within the configured percentage
    const unsigned __int128 allowed =
        static_cast<unsigned __int128>(settings_.maximumChurnPercentage) * period.initialWeight;
    const unsigned __int128 used = static_cast<unsigned __int128>(period.churnAmount) * 100;
    if (allowed < used) {
        std::ostringstream oss;
        oss << "churn " << period.churnAmount << " exceeds " 
            << static_cast<int>(settings_.maximumChurnPercentage) << "% of "
            << period.initialWeight;
        return state.Invalid(ErrorCode::MaxChurnRateExceeded, period.churnAmount, oss.str());
    }

    if (newWeight >= oldWeight) {
        if (delta > std::numeric_limits<Weight>::max() - period.totalWeight) {
            return state.Invalid(ErrorCode::InvalidTotalWeight,
                                 std::numeric_limits<Weight>::max(),
                                 "total weight overflow");
        }
        period.totalWeight += delta;
    } else {
        if (delta > period.totalWeight) {
            return state.Invalid(ErrorCode::InvalidTotalWeight, period.totalWeight,
                                 "weight removal exceeds total weight");
        }
        period.totalWeight -= delta;
    }

    // Below this total even a single unit of churn would always be rejected
    if (static_cast<unsigned __int128>(period.totalWeight) * settings_.maximumChurnPercentage < 100) {
        return state.Invalid(ErrorCode::InvalidTotalWeight, period.totalWeight,
                             "total weight too low for the churn percentage");
    }
    return true;
}

bool ChurnTracker::CheckAndUpdate(Weight newWeight, Weight oldWeight, Timestamp now,
                                  ManagerState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChurnPeriod next = period_;
    if (!Evaluate(next, newWeight, oldWeight, now, state)) {
        LOG_DEBUG(LogCategory::CHURN) << "Rejected weight change " << oldWeight
                                      << " -> " << newWeight << ": " << state.ToString();
        return false;
    }
    period_ = next;
    LOG_TRACE(LogCategory::CHURN) << "Churn " << period_.churnAmount << "/"
                                  << period_.initialWeight << ", total "
                                  << period_.totalWeight;
    return true;
}

bool ChurnTracker::Check(Weight newWeight, Weight oldWeight, Timestamp now,
                         ManagerState& state) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ChurnPeriod next = period_;
    return Evaluate(next, newWeight, oldWeight, now, state);
}

void ChurnTracker::SetTotalWeight(Weight totalWeight) {
    std::lock_guard<std::mutex> lock(mutex_);
    period_.totalWeight = totalWeight;
}

void ChurnTracker::RemoveWeight(Weight weight) {
    std::lock_guard<std::mutex> lock(mutex_);
    period_.totalWeight = weight > period_.totalWeight ? 0 : period_.totalWeight - weight;
}

Weight ChurnTracker::GetTotalWeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return period_.totalWeight;
}

ChurnPeriod ChurnTracker::GetPeriod() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return period_;
}

void ChurnTracker::Restore(const ChurnPeriod& period) {
    std::lock_guard<std::mutex> lock(mutex_);
    period_ = period;
}

} // namespace validator
} // namespace valset
