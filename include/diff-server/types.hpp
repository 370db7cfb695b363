/// @file types.hpp
/// @brief Identity types: Hash (content address / stateID) and Checksum.

#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace diff_server {

/// A 20-byte content address.
///
/// Every object in a ContentStore is named by the truncated SHA-256 of its
/// bytes. A commit's Hash is the stateID handed to clients. The text form is
/// 32 characters of base32hex (`0-9a-v`). Comparable for equality only in
/// the protocol; the ordering exists for use as a container key.
struct Hash {
    static constexpr std::size_t size = 20;         ///< Fixed size in bytes.
    static constexpr std::size_t string_size = 32;  ///< Length of the text form.
    std::array<std::byte, size> bytes{};            ///< Raw hash bytes.

    constexpr Hash() = default;

    /// Construct from a byte array.
    explicit constexpr Hash(std::array<std::byte, size> b) : bytes{b} {}

    auto operator<=>(const Hash&) const = default;
    auto operator==(const Hash&) const -> bool = default;

    /// Check if all bytes are zero (the empty sentinel).
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    /// Content address of a byte range.
    static auto of(std::span<const std::byte> data) -> Hash;

    /// Content address of a string.
    static auto of(std::string_view data) -> Hash;

    /// Parse the 32-character text form. Returns nullopt on wrong length or
    /// a character outside `0-9a-v`.
    static auto parse(std::string_view text) -> std::optional<Hash>;

    /// Render as 32 characters of base32hex.
    auto to_string() const -> std::string;
};

/// A 32-byte order-independent digest of a snapshot's contents.
///
/// The checksum is the sum, modulo 2^256, of the SHA-256 digest of every
/// (key, value) entry. Addition is commutative, so the result depends only
/// on the set of entries; subtraction removes an entry's contribution,
/// which lets a snapshot edit update its checksum without rehashing.
struct Checksum {
    static constexpr std::size_t size = 32;         ///< Fixed size in bytes.
    static constexpr std::size_t string_size = 64;  ///< Length of the hex form.
    std::array<std::byte, size> bytes{};            ///< Big-endian 256-bit value.

    constexpr Checksum() = default;

    /// Construct from a byte array.
    explicit constexpr Checksum(std::array<std::byte, size> b) : bytes{b} {}

    auto operator<=>(const Checksum&) const = default;
    auto operator==(const Checksum&) const -> bool = default;

    /// Add another digest (mod 2^256).
    auto operator+=(const Checksum& other) -> Checksum&;

    /// Subtract another digest (mod 2^256).
    auto operator-=(const Checksum& other) -> Checksum&;

    friend auto operator+(Checksum a, const Checksum& b) -> Checksum { return a += b; }
    friend auto operator-(Checksum a, const Checksum& b) -> Checksum { return a -= b; }

    /// Check if all bytes are zero (the checksum of an empty snapshot).
    auto is_zero() const -> bool {
        return std::ranges::all_of(bytes, [](std::byte b) {
            return b == std::byte{0};
        });
    }

    /// Parse 64 hex characters (either case). Returns nullopt otherwise.
    static auto parse(std::string_view text) -> std::optional<Checksum>;

    /// Render as 64 lowercase hex characters.
    auto to_string() const -> std::string;
};

}  // namespace diff_server

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<diff_server::Hash> {
    auto operator()(const diff_server::Hash& h) const noexcept -> std::size_t {
        // Leading bytes of a SHA-256 prefix are already well-distributed
        auto result = std::size_t{0};
        const auto* p = reinterpret_cast<const unsigned char*>(h.bytes.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
