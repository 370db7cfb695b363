/// @file store.hpp
/// @brief Content-addressed object store with named dataset references.

#pragma once

#include <diff-server/types.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diff_server {

/// Raw object bytes.
using Bytes = std::vector<std::byte>;

/// A persistent, content-addressed object store.
///
/// Objects are immutable and named by Hash::of(bytes). A dataset is a named,
/// mutable reference to one object; it only moves through advance(), which
/// is a compare-and-swap so that a writer never overwrites a head it did
/// not read. Implementations must be safe for concurrent use.
///
/// Failures to read or record data throw Exception{storage_failure}.
class ContentStore {
public:
    virtual ~ContentStore() = default;

    /// Store bytes and return their content address. Idempotent.
    virtual auto put(std::span<const std::byte> bytes) -> Hash = 0;

    /// Bytes stored under id, or nullopt if no such object exists.
    virtual auto get(const Hash& id) const -> std::optional<Bytes> = 0;

    /// The object a dataset points at, or nullopt if it was never set.
    virtual auto head(std::string_view dataset) const -> std::optional<Hash> = 0;

    /// Point dataset at next if it currently points at expected (nullopt
    /// meaning "never set"). Returns false, changing nothing, otherwise.
    virtual auto advance(std::string_view dataset,
                         const std::optional<Hash>& expected,
                         const Hash& next) -> bool = 0;

    /// Store a string's bytes.
    auto put(std::string_view text) -> Hash {
        return put(std::as_bytes(std::span{text.data(), text.size()}));
    }
};

/// A store held entirely in memory. Contents are lost with the object.
class MemoryStore final : public ContentStore {
public:
    MemoryStore() = default;

    auto put(std::span<const std::byte> bytes) -> Hash override;
    auto get(const Hash& id) const -> std::optional<Bytes> override;
    auto head(std::string_view dataset) const -> std::optional<Hash> override;
    auto advance(std::string_view dataset,
                 const std::optional<Hash>& expected,
                 const Hash& next) -> bool override;

    using ContentStore::put;

    /// Number of stored objects.
    auto object_count() const -> std::size_t;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Hash, Bytes> objects_;
    std::map<std::string, Hash, std::less<>> datasets_;
};

/// A store kept in a directory.
///
/// Layout: `objects/<hash>` holds DEFLATE-compressed object bytes,
/// `datasets/<hash-of-name>` holds the text form of a dataset's head.
/// Files are written to a temporary name and renamed into place, so a
/// reader sees either the old or the new content.
class FileStore final : public ContentStore {
public:
    /// Open (creating if needed) a store rooted at dir.
    /// Throws Exception{storage_failure} if the directories cannot be created.
    explicit FileStore(std::filesystem::path dir);

    auto put(std::span<const std::byte> bytes) -> Hash override;
    auto get(const Hash& id) const -> std::optional<Bytes> override;
    auto head(std::string_view dataset) const -> std::optional<Hash> override;
    auto advance(std::string_view dataset,
                 const std::optional<Hash>& expected,
                 const Hash& next) -> bool override;

    using ContentStore::put;

    auto directory() const -> const std::filesystem::path& { return dir_; }

private:
    auto object_path(const Hash& id) const -> std::filesystem::path;
    auto dataset_path(std::string_view dataset) const -> std::filesystem::path;
    void write_file(const std::filesystem::path& path, std::span<const std::byte> data) const;

    std::filesystem::path dir_;
    // Serializes advance() within this process. Cross-process writers to
    // the same directory are not supported.
    std::mutex datasets_mutex_;
};

/// Produces the store holding one account's data.
using StoreFactory = std::function<std::shared_ptr<ContentStore>(std::string_view account_id)>;

/// A factory creating a fresh MemoryStore per account.
auto memory_store_factory() -> StoreFactory;

/// A factory creating a FileStore at `root/<account_id>` per account.
auto file_store_factory(std::filesystem::path root) -> StoreFactory;

}  // namespace diff_server
