/// @file snapshot.hpp
/// @brief Snapshot -- an immutable, checksummed key-value map.

#pragma once

#include <diff-server/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace diff_server {

/// A value stored under a snapshot key. Any JSON value.
using Value = nlohmann::json;

/// Digest of a single (key, value) entry. Snapshot checksums are sums of
/// these. The value is hashed in its canonical JSON encoding (object keys
/// sorted, no whitespace).
auto entry_digest(std::string_view key, const Value& value) -> Checksum;

/// An immutable mapping from string keys to JSON values.
///
/// Keys are kept in lexical order, which is the canonical order for
/// diffing and for any serialized form. The checksum is computed eagerly
/// on construction and depends only on the set of entries, never on how
/// the map was built. Copies share the underlying map.
///
/// @code
/// auto s = Snapshot{{{"foo", "bar"}, {"n", 1}}};
/// auto t = s.with("baz", "qux");
/// @endcode
class Snapshot {
public:
    using Map = std::map<std::string, Value, std::less<>>;
    using const_iterator = Map::const_iterator;

    /// Entry count at or above which the checksum is computed in parallel.
    static constexpr std::size_t parallel_threshold = 4096;

    /// The empty snapshot. Its checksum is zero.
    Snapshot();

    /// Build from a map, computing the checksum.
    explicit Snapshot(Map entries);

    /// Build from literal pairs (convenience for tests).
    Snapshot(std::initializer_list<Map::value_type> entries);

    /// Build from a JSON object. Throws Exception{bad_request} if the value
    /// is not an object or contains the empty key, which no patch path can
    /// address.
    static auto from_json(const nlohmann::json& object) -> Snapshot;

    /// The JSON object form of this snapshot.
    auto to_json() const -> nlohmann::json;

    auto checksum() const -> const Checksum& { return checksum_; }

    auto size() const -> std::size_t { return entries_->size(); }
    auto empty() const -> bool { return entries_->empty(); }

    auto contains(std::string_view key) const -> bool;

    /// Value at key, or nullptr if absent. The pointer stays valid as long
    /// as any copy of this snapshot is alive.
    auto find(std::string_view key) const -> const Value*;

    /// Value at key, or nullopt if absent.
    auto get(std::string_view key) const -> std::optional<Value>;

    auto entries() const -> const Map& { return *entries_; }
    auto begin() const -> const_iterator { return entries_->begin(); }
    auto end() const -> const_iterator { return entries_->end(); }

    /// A copy with key set to value. The checksum is adjusted by the
    /// entry digests instead of being recomputed.
    auto with(std::string key, Value value) const -> Snapshot;

    /// A copy without key. Returns *this unchanged if key is absent.
    auto without(std::string_view key) const -> Snapshot;

    /// Content equality.
    auto operator==(const Snapshot& other) const -> bool {
        return checksum_ == other.checksum_ && *entries_ == *other.entries_;
    }

private:
    Snapshot(std::shared_ptr<const Map> entries, Checksum checksum)
        : entries_{std::move(entries)}, checksum_{checksum} {}

    std::shared_ptr<const Map> entries_;
    Checksum checksum_;
};

}  // namespace diff_server
