#include "../src/crypto/sha256.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace diff_server::crypto;

// Helper: convert bytes to hex string
static auto bytes_to_hex(std::span<const std::byte> bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    for (auto b : bytes) {
        auto val = static_cast<std::uint8_t>(b);
        result += hex_chars[val >> 4];
        result += hex_chars[val & 0x0F];
    }
    return result;
}

static auto sha256_hex(std::string_view s) -> std::string {
    return bytes_to_hex(sha256(s));
}

// NIST test vectors

TEST(Sha256, empty_string) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, abc) {
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256, two_block_message) {
    EXPECT_EQ(sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, long_message) {
    EXPECT_EQ(sha256_hex(
        "abcdefghbcdefghicdefghijdefghijkefghijklfghijklmghijklmn"
        "hijklmnoijklmnopjklmnopqklmnopqrlmnopqrsmnopqrstnopqrstu"),
        "cf5b16a778af8380036ce59e7b0492370b249b11e8f07a51afac45037afee9d1");
}

TEST(Sha256, single_zero_byte) {
    auto input = std::vector<std::byte>{std::byte{0x00}};
    EXPECT_EQ(bytes_to_hex(sha256(input)),
              "6e340b9cffb37a989ca544e6bb780a2c78901d3fb33738768511a30617afa01d");
}

TEST(Sha256, million_a) {
    auto hasher = Sha256{};
    auto chunk = std::string(1000, 'a');
    for (int i = 0; i < 1000; ++i) hasher.update(chunk);
    EXPECT_EQ(bytes_to_hex(hasher.finish()),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// Streaming

TEST(Sha256, streaming_matches_one_shot_across_chunk_sizes) {
    auto message = std::string{};
    for (int i = 0; i < 300; ++i) message += static_cast<char>('a' + i % 26);
    const auto expected = sha256(message);

    for (std::size_t chunk : {1u, 3u, 55u, 63u, 64u, 65u, 128u}) {
        auto hasher = Sha256{};
        for (std::size_t pos = 0; pos < message.size(); pos += chunk) {
            hasher.update(std::string_view{message}.substr(pos, chunk));
        }
        EXPECT_EQ(hasher.finish(), expected) << "chunk size " << chunk;
    }
}

TEST(Sha256, span_overload_matches_string_overload) {
    auto text = std::string{"Hello"};
    auto bytes = std::vector<std::byte>{std::byte{0x48}, std::byte{0x65},
                                        std::byte{0x6c}, std::byte{0x6c}, std::byte{0x6f}};
    EXPECT_EQ(sha256(text), sha256(std::span<const std::byte>{bytes}));
}

TEST(Sha256, length_prefix_separates_ambiguous_concatenations) {
    auto a = Sha256{};
    a.update_length(2);
    a.update("ab");
    a.update("c");

    auto b = Sha256{};
    b.update_length(1);
    b.update("a");
    b.update("bc");

    EXPECT_NE(a.finish(), b.finish());
}

TEST(Sha256, length_prefix_is_eight_big_endian_bytes) {
    auto prefixed = Sha256{};
    prefixed.update_length(0x0102);
    auto expected_input = std::vector<std::byte>{
        std::byte{0}, std::byte{0}, std::byte{0}, std::byte{0},
        std::byte{0}, std::byte{0}, std::byte{1}, std::byte{2}};
    EXPECT_EQ(prefixed.finish(), sha256(expected_input));
}
