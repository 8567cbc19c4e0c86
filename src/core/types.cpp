// VALSET - Core Types Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/core/types.h>
#include <valset/core/hex.h>

#include <stdexcept>

namespace valset {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for identifier");
    }
    std::vector<Byte> raw = HexToBytes(digits);
    return BaseHash(raw.data(), raw.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace valset
