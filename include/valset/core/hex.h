// VALSET - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 VALSET Developers
// MIT License

#ifndef VALSET_CORE_HEX_H
#define VALSET_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace valset {

/// Convert bytes to lowercase hex
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex to bytes; throws std::invalid_argument on odd length or bad digits
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace valset

#endif // VALSET_CORE_HEX_H
