// VALSET - SHA256 Implementation
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <valset/crypto/sha256.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace valset {
namespace crypto {

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() {
        ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
        }
        Init();
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
}

Hash256 SHA256::Finalize() {
    Hash256 out;
    Finalize(out.data());
    return out;
}

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

} // namespace crypto
} // namespace valset
