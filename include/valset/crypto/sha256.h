// VALSET - SHA256 Hash Function
// Copyright (c) 2024 VALSET Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef VALSET_CRYPTO_SHA256_H
#define VALSET_CRYPTO_SHA256_H

#include <valset/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace valset {
namespace crypto {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Throws std::runtime_error if the digest context cannot be created
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) {
        return Write(data.data(), data.size());
    }

    /// Finalize the hash into a 32-byte buffer. The hasher must be Reset()
    /// before reuse.
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Finalize and wrap the digest in a Hash256
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace crypto
} // namespace valset

#endif // VALSET_CRYPTO_SHA256_H
