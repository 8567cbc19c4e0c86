// VALSET - Validator Manager Settings
// Copyright (c) 2024 VALSET Developers
// MIT License

#ifndef VALSET_VALIDATOR_SETTINGS_H
#define VALSET_VALIDATOR_SETTINGS_H

#include <valset/util/config.h>
#include <valset/validator/validator_manager.h>

#include <optional>
#include <string>

namespace valset {
namespace validator {

/// Read the [manager] section. On failure returns nullopt and sets `error`
/// to a message naming the offending key.
std::optional<ValidatorManagerSettings> LoadValidatorManagerSettings(
    const util::ConfigManager& config, std::string& error);

/// Parse a hex identifier from `section`.`key`
std::optional<Hash256> ReadHash256(const util::ConfigManager& config, const std::string& key,
                                   const std::string& section, std::string& error);
std::optional<Address> ReadAddress(const util::ConfigManager& config, const std::string& key,
                                   const std::string& section, std::string& error);

} // namespace validator
} // namespace valset

#endif // VALSET_VALIDATOR_SETTINGS_H
