// VALSET - Configuration File Parser
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Parses INI-style configuration for the validator and staking managers.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef VALSET_UTIL_CONFIG_H
#define VALSET_UTIL_CONFIG_H

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace valset {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "valset.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};

    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Key/value configuration grouped by section.
 *
 * Later definitions of a key overwrite earlier ones; defaults never
 * overwrite values read from a file.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file (~ and ${VAR} are expanded)
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    /// Check if a key exists
    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (returns nullopt if key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    /// Get string value with default
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (returns nullopt if key doesn't exist or is invalid)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    /// Get integer value with default
    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get unsigned integer value over the full uint64 range
    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;

    /// Get unsigned integer value with default
    uint64_t GetUInt(const std::string& key,
                     uint64_t defaultValue,
                     const std::string& section = "") const;

    /// Get boolean value (returns nullopt if key doesn't exist or is invalid)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    /// Get boolean value with default
    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Set a default value (lower priority than config files)
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// Get all section names
    std::vector<std::string> GetSections() const;

    /// Get all keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    /// Register a required key
    void RequireKey(const std::string& key, const std::string& section = "");

    /// Check required keys; returns one message per missing key
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    /// Clear all configuration
    void Clear();

    /// Get number of entries
    size_t Size() const;

    /// Expand environment variables in a string
    static std::string ExpandEnvVars(const std::string& value);

    /// Expand ~ to home directory
    static std::string ExpandTilde(const std::string& path);

private:
    /// Internal key for section:key combination
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    /// Parse a single line
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    /// Trim whitespace
    static std::string Trim(const std::string& str);

    /// Unquote a value
    static std::string Unquote(const std::string& str);

    /// Parse boolean string
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Sections
    constexpr const char* MANAGER_SECTION = "manager";
    constexpr const char* STAKING_SECTION = "staking";

    // [manager]
    constexpr const char* ADMIN = "admin";
    constexpr const char* SUBNET_ID = "subnet_id";
    constexpr const char* CHURN_PERIOD_SECONDS = "churn_period_seconds";
    constexpr const char* MAXIMUM_CHURN_PERCENTAGE = "maximum_churn_percentage";
    constexpr const char* ADDRESS = "address";

    // [staking]
    constexpr const char* MINIMUM_STAKE_AMOUNT = "minimum_stake_amount";
    constexpr const char* MAXIMUM_STAKE_AMOUNT = "maximum_stake_amount";
    constexpr const char* MINIMUM_STAKE_DURATION = "minimum_stake_duration";
    constexpr const char* MINIMUM_DELEGATION_FEE_BIPS = "minimum_delegation_fee_bips";
    constexpr const char* MAXIMUM_STAKE_MULTIPLIER = "maximum_stake_multiplier";
    constexpr const char* WEIGHT_TO_VALUE_FACTOR = "weight_to_value_factor";
    constexpr const char* UPTIME_BLOCKCHAIN_ID = "uptime_blockchain_id";
    constexpr const char* REWARD_BASIS_POINTS = "reward_basis_points";
}

} // namespace util
} // namespace valset

#endif // VALSET_UTIL_CONFIG_H
