/// @file patch.hpp
/// @brief Patch operations, the diff engine and patch application.

#pragma once

#include <diff-server/snapshot.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diff_server {

/// The kinds of patch operation.
///
/// The diff engine only emits add and remove. replace is accepted by
/// apply() so patches produced by other tools can be applied too.
enum class PatchOp : std::uint8_t {
    add,
    remove,
    replace,
};

/// Convert a PatchOp to its wire name.
constexpr auto to_string_view(PatchOp op) noexcept -> std::string_view {
    switch (op) {
        case PatchOp::add:     return "add";
        case PatchOp::remove:  return "remove";
        case PatchOp::replace: return "replace";
    }
    return "unknown";
}

/// The root path. Addresses the whole snapshot.
inline constexpr std::string_view root_path = "/";

/// A single patch operation.
///
/// `path` is a JSON Pointer. "/" is the whole snapshot; "/<key>" is one
/// key, with '~' escaped as "~0" and '/' as "~1".
struct Operation {
    PatchOp op{PatchOp::add};
    std::string path;
    std::optional<Value> value;  ///< Present for add and replace.

    auto operator==(const Operation&) const -> bool = default;
};

/// An ordered sequence of operations. Later operations may depend on
/// earlier ones.
using Patch = std::vector<Operation>;

void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

/// The path addressing a key.
auto key_path(std::string_view key) -> std::string;

/// The key addressed by a path, or nullopt for the root path or for a path
/// that is not a single escaped segment.
auto path_key(std::string_view path) -> std::optional<std::string>;

/// Compute the patch that turns base into target.
///
/// With no base the patch is a full bootstrap: `remove "/"` then one add
/// per target key. Otherwise removals (of deleted and changed keys) come
/// first, then additions (of new and changed keys), each group in key
/// order. A changed value is always emitted as a remove/add pair. Equal
/// checksums give an empty patch. Deterministic, and linear in the number
/// of distinct keys.
auto diff(const Snapshot* base, const Snapshot& target) -> Patch;

/// Convenience overload for a base known to exist.
inline auto diff(const Snapshot& base, const Snapshot& target) -> Patch {
    return diff(&base, target);
}

/// Apply a patch to a snapshot.
///
/// Supports add, remove and replace at the root and at single keys.
/// Throws Exception{invalid_patch} if an operation lacks a value, removes or
/// replaces a missing key, or uses a nested path.
auto apply(const Snapshot& base, const Patch& patch) -> Snapshot;

}  // namespace diff_server
