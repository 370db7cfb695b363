#pragma once

// base32hex (RFC 4648, lowercase, no padding) and hex text codecs for the
// fixed-size identifiers.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace diff_server::encoding {

inline constexpr std::string_view base32_alphabet = "0123456789abcdefghijklmnopqrstuv";

inline auto base32_value(char c) -> std::optional<unsigned> {
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'v') return static_cast<unsigned>(c - 'a' + 10);
    return std::nullopt;
}

// Input size must be a multiple of 5 bytes.
inline auto base32_encode(std::span<const std::byte> data) -> std::string {
    auto result = std::string{};
    result.reserve(data.size() * 8 / 5);
    auto buffer = std::uint64_t{0};
    auto bits = 0;
    for (auto b : data) {
        buffer = (buffer << 8) | static_cast<std::uint8_t>(b);
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            result.push_back(base32_alphabet[(buffer >> bits) & 0x1f]);
        }
    }
    return result;
}

// Decodes exactly out.size() bytes; the text length must be out.size() * 8 / 5.
inline auto base32_decode(std::string_view text, std::span<std::byte> out) -> bool {
    if (text.size() * 5 != out.size() * 8) return false;
    auto buffer = std::uint64_t{0};
    auto bits = 0;
    auto pos = std::size_t{0};
    for (auto c : text) {
        auto v = base32_value(c);
        if (!v) return false;
        buffer = (buffer << 5) | *v;
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out[pos++] = static_cast<std::byte>((buffer >> bits) & 0xff);
        }
    }
    return pos == out.size();
}

inline auto hex_encode(std::span<const std::byte> data) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(data.size() * 2);
    for (auto byte : data) {
        auto b = static_cast<unsigned char>(byte);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

inline auto hex_nibble(char c) -> std::optional<unsigned> {
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<unsigned>(c - 'A' + 10);
    return std::nullopt;
}

inline auto hex_decode(std::string_view hex, std::span<std::byte> out) -> bool {
    if (hex.size() != out.size() * 2) return false;
    for (std::size_t i = 0; i < out.size(); ++i) {
        auto hi = hex_nibble(hex[i * 2]);
        auto lo = hex_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return false;
        out[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return true;
}

}  // namespace diff_server::encoding
