#include "../src/crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace docsync_cpp::crypto;

// Helper: convert a digest to a hex string
static auto to_hex(const Sha256::Digest& digest) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    for (auto b : digest) {
        result += hex_chars[b >> 4];
        result += hex_chars[b & 0x0F];
    }
    return result;
}

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(to_hex(sha256("")), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(to_hex(sha256("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(to_hex(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    EXPECT_EQ(to_hex(sha256("abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
                            "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu")),
              "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_zero_byte) {
    EXPECT_EQ(to_hex(sha256(std::string(1, '\0'))),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, incremental_updates_match_one_shot) {
    auto hasher = Sha256{};
    hasher.update("abcdbcdecdefdefgefgh");
    hasher.update("fghighijhijkijkljklmklmnlmnomnopnopq");
    EXPECT_EQ(hasher.finish(), sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));
}

TEST(Sha256, exact_block_boundary) {
    // 64 bytes: padding spills into a second block
    auto digest = sha256(std::string(64, 'A'));
    auto hasher = Sha256{};
    hasher.update(std::string(32, 'A'));
    hasher.update(std::string(32, 'A'));
    EXPECT_EQ(hasher.finish(), digest);
}
