// VALSET - Core Types Header
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Fixed-size identifiers and scalar types shared by every module.

#ifndef VALSET_CORE_TYPES_H
#define VALSET_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace valset {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Raw byte buffer (wire messages, BLS keys)
using Bytes = std::vector<Byte>;

/// Staked or rewarded value in the asset's smallest unit
using Amount = uint64_t;

/// Unix epoch seconds
using Timestamp = uint64_t;

/// Validator voting power
using Weight = uint64_t;

// ============================================================================
// Fixed-size Identifiers
// ============================================================================

/// Fixed-width identifier stored in wire order.
///
/// Unlike a block hash there is no byte reversal: ToHex() prints bytes in
/// storage order and operator< compares lexicographically, which is the
/// ordering used for sorted owner address lists.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Copies min(len, SIZE) bytes; the remainder is zero-filled.
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex in storage order
    std::string ToHex() const;

    /// Parse hex in storage order; throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

    /// Short form for log lines
    std::string ToShortHex() const { return ToHex().substr(0, 12); }

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit identifier (validationID, delegationID, chain IDs, message IDs)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& b) : BaseHash<256>(b) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit identifier (node IDs and account addresses)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& b) : BaseHash<160>(b) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account or contract address on the local chain
using Address = Hash160;

/// Hasher for unordered containers keyed by identifiers
template<typename H>
struct IdHasher {
    size_t operator()(const H& h) const noexcept {
        size_t out = 0;
        std::memcpy(&out, h.data(), sizeof(out) < H::SIZE ? sizeof(out) : H::SIZE);
        return out;
    }
};

} // namespace valset

#endif // VALSET_CORE_TYPES_H
