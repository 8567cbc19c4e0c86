// VALSET - SHA256 Tests
// Copyright (c) 2024 VALSET Developers
// MIT License

#include <gtest/gtest.h>

#include <valset/core/hex.h>
#include <valset/crypto/sha256.h>

#include <string>
#include <vector>

namespace valset {
namespace crypto {
namespace test {

namespace {

std::vector<Byte> Ascii(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

} // namespace

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256Hash(std::vector<Byte>{}).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(Ascii("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash(Ascii("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::vector<Byte> data = Ascii("The quick brown fox jumps over the lazy dog");
    SHA256 hasher;
    hasher.Write(data.data(), 10).Write(data.data() + 10, data.size() - 10);
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(data));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write(Ascii("garbage"));
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);

    hasher.Reset().Write(Ascii("abc"));
    EXPECT_EQ(BytesToHex(hasher.Finalize().data(), SHA256::OUTPUT_SIZE),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, MillionAs) {
    SHA256 hasher;
    std::vector<Byte> chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(chunk);
    }
    EXPECT_EQ(hasher.Finalize().ToHex(),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

} // namespace test
} // namespace crypto
} // namespace valset
