#include <diff-server/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <unordered_set>
#include <vector>

using namespace diff_server;

// -- Hash ---------------------------------------------------------------------

TEST(Hash, default_constructed_is_all_zeros) {
    const auto h = Hash{};
    EXPECT_TRUE(h.is_zero());
    EXPECT_EQ(h.to_string(), std::string(32, '0'));
}

TEST(Hash, of_is_deterministic_and_content_sensitive) {
    EXPECT_EQ(Hash::of("foo"), Hash::of("foo"));
    EXPECT_NE(Hash::of("foo"), Hash::of("fop"));
    EXPECT_FALSE(Hash::of("").is_zero());
}

TEST(Hash, text_form_is_32_base32hex_characters) {
    const auto text = Hash::of("some commit").to_string();
    ASSERT_EQ(text.size(), Hash::string_size);
    EXPECT_TRUE(std::ranges::all_of(text, [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'v');
    }));
}

TEST(Hash, parse_inverts_to_string) {
    const auto h = Hash::of("state");
    auto parsed = Hash::parse(h.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, h);
}

TEST(Hash, parse_accepts_zero_state) {
    auto parsed = Hash::parse("00000000000000000000000000000000");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed->is_zero());
}

TEST(Hash, parse_rejects_malformed_text) {
    EXPECT_FALSE(Hash::parse("").has_value());
    EXPECT_FALSE(Hash::parse("beep").has_value());
    EXPECT_FALSE(Hash::parse(std::string(31, '0')).has_value());
    EXPECT_FALSE(Hash::parse(std::string(33, '0')).has_value());
    EXPECT_FALSE(Hash::parse(std::string(31, '0') + "w").has_value());
    EXPECT_FALSE(Hash::parse(std::string(31, '0') + "A").has_value());
}

TEST(Hash, hashable_and_usable_in_unordered_set) {
    auto set = std::unordered_set<Hash>{};
    set.insert(Hash::of("a"));
    set.insert(Hash::of("b"));
    set.insert(Hash::of("a"));
    EXPECT_EQ(set.size(), 2u);
}

TEST(Hash, sortable) {
    auto ids = std::vector{Hash::of("x"), Hash::of("y"), Hash::of("z")};
    std::ranges::sort(ids);
    EXPECT_TRUE(std::ranges::is_sorted(ids));
}

// -- Checksum -----------------------------------------------------------------

static auto checksum_of(std::initializer_list<int> tail) -> Checksum {
    auto c = Checksum{};
    auto i = Checksum::size - tail.size();
    for (auto v : tail) c.bytes[i++] = static_cast<std::byte>(v);
    return c;
}

TEST(Checksum, default_is_zero) {
    const auto c = Checksum{};
    EXPECT_TRUE(c.is_zero());
    EXPECT_EQ(c.to_string(), std::string(64, '0'));
}

TEST(Checksum, addition_carries_across_bytes) {
    const auto sum = checksum_of({0x00, 0xff}) + checksum_of({0x00, 0x01});
    EXPECT_EQ(sum, checksum_of({0x01, 0x00}));
}

TEST(Checksum, addition_wraps_modulo_2_256) {
    auto all_ones = Checksum{};
    all_ones.bytes.fill(std::byte{0xff});
    EXPECT_TRUE((all_ones + checksum_of({0x01})).is_zero());
}

TEST(Checksum, subtraction_borrows_and_inverts_addition) {
    const auto a = checksum_of({0x12, 0x34, 0x56});
    const auto b = checksum_of({0x00, 0xff, 0xff});
    EXPECT_EQ((a + b) - b, a);
    EXPECT_EQ(checksum_of({0x01, 0x00}) - checksum_of({0x01}), checksum_of({0x00, 0xff}));
}

TEST(Checksum, subtraction_below_zero_wraps) {
    auto all_ones = Checksum{};
    all_ones.bytes.fill(std::byte{0xff});
    EXPECT_EQ(Checksum{} - checksum_of({0x01}), all_ones);
}

TEST(Checksum, addition_is_commutative) {
    const auto a = checksum_of({0xde, 0xad});
    const auto b = checksum_of({0xbe, 0xef});
    const auto c = checksum_of({0x01, 0x02, 0x03});
    EXPECT_EQ(a + b + c, c + a + b);
}

TEST(Checksum, parse_accepts_either_case_and_renders_lowercase) {
    const auto text = std::string{"00000000000000000000000000000000"
                                  "000000000000000000000000DEADbeef"};
    auto parsed = Checksum::parse(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, checksum_of({0xde, 0xad, 0xbe, 0xef}));
    EXPECT_EQ(parsed->to_string(), std::string(56, '0') + "deadbeef");
}

TEST(Checksum, parse_rejects_malformed_text) {
    EXPECT_FALSE(Checksum::parse("").has_value());
    EXPECT_FALSE(Checksum::parse("not").has_value());
    EXPECT_FALSE(Checksum::parse("00000000").has_value());
    EXPECT_FALSE(Checksum::parse(std::string(63, '0') + "g").has_value());
    EXPECT_FALSE(Checksum::parse(std::string(65, '0')).has_value());
}
