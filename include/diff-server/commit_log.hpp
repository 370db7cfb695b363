/// @file commit_log.hpp
/// @brief CommitLog -- the append-only history of one client.

#pragma once

#include <diff-server/commit.hpp>
#include <diff-server/store.hpp>

#include <cstddef>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace diff_server {

/// The append-only commit chain of one (account, client).
///
/// The chain lives in a ContentStore; the dataset `client/<clientID>`
/// points at its head. append() is serialized against every other append
/// and read on this log. head() and lookup() may run concurrently with
/// each other. Logs of different clients share nothing.
///
/// @code
/// auto log = CommitLog{store, "client-1"};
/// auto c1 = log.append(Snapshot{{"foo", "bar"}}, 1);
/// auto same = log.lookup(c1.id);
/// @endcode
class CommitLog {
public:
    CommitLog(std::shared_ptr<ContentStore> store, std::string client_id);

    CommitLog(const CommitLog&) = delete;
    auto operator=(const CommitLog&) -> CommitLog& = delete;

    /// Dataset name holding the head of a client's chain.
    static auto dataset_name(std::string_view client_id) -> std::string;

    auto client_id() const -> const std::string& { return client_id_; }

    /// The latest commit, or the empty sentinel if none was ever appended.
    /// Throws Exception{storage_failure} if the head cannot be read.
    auto head() const -> Commit;

    /// Append a commit on top of the head and advance the head to it.
    ///
    /// Throws Exception{invalid_operation} if last_mutation_id is lower than
    /// the head's, and Exception{storage_failure} if the store cannot record
    /// the commit. On any failure the head is unchanged.
    auto append(Snapshot data, std::uint64_t last_mutation_id) -> Commit;

    /// The commit with this stateID, if it is part of this client's history.
    auto find(const Hash& id) const -> std::optional<Commit>;

    /// The commit with this stateID. Throws Exception{unknown_state} if it is
    /// not part of this client's history.
    auto lookup(const Hash& id) const -> Commit;

    /// Commits from the head back towards the first, at most limit of them.
    auto history(std::size_t limit = std::numeric_limits<std::size_t>::max()) const
        -> std::vector<Commit>;

    /// Lock held by a pull across its fetch-and-append sequence, so that
    /// commits of one client land in the order their fetches ran.
    auto sync_lock() -> std::unique_lock<std::mutex> {
        return std::unique_lock{sync_mutex_};
    }

private:
    struct Header {
        std::optional<Hash> parent;
        Hash data;
        Checksum checksum;
        std::uint64_t last_mutation_id{0};
    };

    auto load_header(const Hash& id) const -> Header;
    auto load(const Hash& id) const -> Commit;
    void ensure_index() const;

    std::shared_ptr<ContentStore> store_;
    std::string client_id_;
    std::string dataset_;

    mutable std::shared_mutex mutex_;
    mutable std::optional<Commit> head_;           // cached, guarded by mutex_
    mutable std::unordered_set<Hash> members_;     // ids in this chain, guarded by mutex_
    mutable bool indexed_{false};                 // guarded by mutex_
    std::mutex sync_mutex_;
};

/// Process-wide cache of open commit logs.
///
/// open() lazily creates one CommitLog per (account, client) and one store
/// per account, and returns the same handle to every caller. The cache
/// lock is held only for the map lookups, never across store creation or
/// storage I/O on a log.
class CommitLogCache {
public:
    explicit CommitLogCache(StoreFactory factory);

    /// The log of (account_id, client_id). Creates the account's store on
    /// first use; store creation failures propagate.
    auto open(std::string_view account_id, std::string_view client_id)
        -> std::shared_ptr<CommitLog>;

    /// The store of an account, created on first use.
    auto store(std::string_view account_id) -> std::shared_ptr<ContentStore>;

    /// Number of open logs.
    auto size() const -> std::size_t;

private:
    StoreFactory factory_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ContentStore>, std::less<>> stores_;
    std::map<std::pair<std::string, std::string>, std::shared_ptr<CommitLog>> logs_;
};

}  // namespace diff_server
