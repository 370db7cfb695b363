#include <diff-server/types.hpp>

#include "crypto/sha256.hpp"
#include "encoding/base32.hpp"

namespace diff_server {

// -- Hash ---------------------------------------------------------------------

auto Hash::of(std::span<const std::byte> data) -> Hash {
    auto digest = crypto::sha256(data);
    auto h = Hash{};
    std::copy_n(digest.begin(), size, h.bytes.begin());
    return h;
}

auto Hash::of(std::string_view data) -> Hash {
    return of(std::as_bytes(std::span{data.data(), data.size()}));
}

auto Hash::parse(std::string_view text) -> std::optional<Hash> {
    auto h = Hash{};
    if (!encoding::base32_decode(text, h.bytes)) return std::nullopt;
    return h;
}

auto Hash::to_string() const -> std::string {
    return encoding::base32_encode(bytes);
}

// -- Checksum -----------------------------------------------------------------

auto Checksum::operator+=(const Checksum& other) -> Checksum& {
    auto carry = 0u;
    for (auto i = size; i-- > 0;) {
        auto sum = static_cast<unsigned>(bytes[i]) +
                   static_cast<unsigned>(other.bytes[i]) + carry;
        bytes[i] = static_cast<std::byte>(sum & 0xff);
        carry = sum >> 8;
    }
    return *this;
}

auto Checksum::operator-=(const Checksum& other) -> Checksum& {
    auto borrow = 0;
    for (auto i = size; i-- > 0;) {
        auto diff = static_cast<int>(bytes[i]) -
                    static_cast<int>(other.bytes[i]) - borrow;
        borrow = diff < 0 ? 1 : 0;
        bytes[i] = static_cast<std::byte>((diff + 256) & 0xff);
    }
    return *this;
}

auto Checksum::parse(std::string_view text) -> std::optional<Checksum> {
    auto c = Checksum{};
    if (!encoding::hex_decode(text, c.bytes)) return std::nullopt;
    return c;
}

auto Checksum::to_string() const -> std::string {
    return encoding::hex_encode(bytes);
}

}  // namespace diff_server
