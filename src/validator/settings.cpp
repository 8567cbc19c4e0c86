// VALSET - Validator Manager Settings Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/validator/settings.h>
#include <valset/util/logging.h>

#include <limits>
#include <stdexcept>

namespace valset {
namespace validator {

using util::ConfigKeys::MANAGER_SECTION;
namespace LogCategory = util::LogCategory;

namespace {

template<typename H>
std::optional<H> ReadHex(const util::ConfigManager& config, const std::string& key,
                         const std::string& section, std::string& error) {
    auto str = config.TryGetString(key, section);
    if (!str) {
        error = section + "." + key + ": missing";
        return std::nullopt;
    }
    try {
        return H::FromHex(*str);
    } catch (const std::invalid_argument& e) {
        error = section + "." + key + ": " + e.what();
        return std::nullopt;
    }
}

} // namespace

std::optional<Hash256> ReadHash256(const util::ConfigManager& config, const std::string& key,
                                   const std::string& section, std::string& error) {
    return ReadHex<Hash256>(config, key, section, error);
}

std::optional<Address> ReadAddress(const util::ConfigManager& config, const std::string& key,
                                   const std::string& section, std::string& error) {
    return ReadHex<Address>(config, key, section, error);
}

std::optional<ValidatorManagerSettings> LoadValidatorManagerSettings(
    const util::ConfigManager& config, std::string& error) {
    namespace keys = util::ConfigKeys;
    ValidatorManagerSettings settings;

    auto admin = ReadAddress(config, keys::ADMIN, MANAGER_SECTION, error);
    if (!admin) return std::nullopt;
    settings.admin = *admin;

    auto subnetID = ReadHash256(config, keys::SUBNET_ID, MANAGER_SECTION, error);
    if (!subnetID) return std::nullopt;
    settings.subnetID = *subnetID;

    auto address = ReadAddress(config, keys::ADDRESS, MANAGER_SECTION, error);
    if (!address) return std::nullopt;
    settings.managerAddress = *address;

    auto period = config.TryGetUInt(keys::CHURN_PERIOD_SECONDS, MANAGER_SECTION);
    if (!period) {
        error = std::string(MANAGER_SECTION) + "." + keys::CHURN_PERIOD_SECONDS +
                ": missing or not an unsigned integer";
        return std::nullopt;
    }
    settings.churnPeriodSeconds = *period;

    auto percentage = config.TryGetUInt(keys::MAXIMUM_CHURN_PERCENTAGE, MANAGER_SECTION);
    if (!percentage || *percentage > std::numeric_limits<uint8_t>::max()) {
        error = std::string(MANAGER_SECTION) + "." + keys::MAXIMUM_CHURN_PERCENTAGE +
                ": missing or out of range";
        return std::nullopt;
    }
    settings.maximumChurnPercentage = static_cast<uint8_t>(*percentage);

    ManagerState state;
    if (!ValidatorManager::CheckSettings(settings, state)) {
        error = std::string(MANAGER_SECTION) + ": " + state.ToString();
        return std::nullopt;
    }

    LOG_DEBUG(LogCategory::CONFIG) << "Manager settings: subnet " << settings.subnetID.ToShortHex()
                                   << ", churn " << static_cast<int>(settings.maximumChurnPercentage)
                                   << "% / " << settings.churnPeriodSeconds << "s";
    return settings;
}

} // namespace validator
} // namespace valset
