/// @file commit.hpp
/// @brief Commit -- one immutable point in a client's history.

#pragma once

#include <diff-server/snapshot.hpp>
#include <diff-server/types.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace diff_server {

/// One point in a per-client history.
///
/// Commits form a linear chain through `parent`. A commit's `id` is the
/// content address of its encoded form, so it covers the parent, the
/// snapshot, the checksum and the mutation ID. The default-constructed
/// commit is the empty sentinel returned for a client that has never
/// synced: zero id, no parent, empty snapshot, mutation ID 0.
struct Commit {
    Hash id{};                         ///< The stateID.
    std::optional<Hash> parent;        ///< Previous commit; nullopt for the first.
    Snapshot data;                     ///< The client view at this point.
    std::uint64_t last_mutation_id{0}; ///< Last client mutation reflected in data.

    auto checksum() const -> const Checksum& { return data.checksum(); }

    /// True for the "never synced" sentinel.
    auto is_empty() const -> bool { return id.is_zero(); }

    /// The stateID as handed to clients; empty for the sentinel.
    auto state_id() const -> std::string {
        return is_empty() ? std::string{} : id.to_string();
    }
};

}  // namespace diff_server
