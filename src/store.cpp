#include <diff-server/store.hpp>
#include <diff-server/error.hpp>

#include "storage/compression.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <system_error>

namespace diff_server {

// =============================================================================
// MemoryStore
// =============================================================================

auto MemoryStore::put(std::span<const std::byte> bytes) -> Hash {
    auto id = Hash::of(bytes);
    auto lock = std::unique_lock{mutex_};
    objects_.try_emplace(id, bytes.begin(), bytes.end());
    return id;
}

auto MemoryStore::get(const Hash& id) const -> std::optional<Bytes> {
    auto lock = std::shared_lock{mutex_};
    auto it = objects_.find(id);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

auto MemoryStore::head(std::string_view dataset) const -> std::optional<Hash> {
    auto lock = std::shared_lock{mutex_};
    auto it = datasets_.find(dataset);
    if (it == datasets_.end()) return std::nullopt;
    return it->second;
}

auto MemoryStore::advance(std::string_view dataset,
                          const std::optional<Hash>& expected,
                          const Hash& next) -> bool {
    auto lock = std::unique_lock{mutex_};
    if (!objects_.contains(next)) {
        throw Exception{ErrorKind::storage_failure,
                        "dataset target " + next.to_string() + " is not stored"};
    }
    auto it = datasets_.find(dataset);
    auto current = it == datasets_.end() ? std::nullopt : std::optional<Hash>{it->second};
    if (current != expected) return false;
    if (it == datasets_.end()) {
        datasets_.emplace(std::string{dataset}, next);
    } else {
        it->second = next;
    }
    return true;
}

auto MemoryStore::object_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return objects_.size();
}

// =============================================================================
// FileStore
// =============================================================================

namespace {

auto read_file(const std::filesystem::path& path) -> std::optional<Bytes> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        // Only absence means "not stored"; any other open failure is an error.
        auto ec = std::error_code{};
        auto exists = std::filesystem::exists(path, ec);
        if (!ec && !exists) return std::nullopt;
        throw Exception{ErrorKind::storage_failure, "cannot open " + path.string()};
    }
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw Exception{ErrorKind::storage_failure, "cannot read " + path.string()};
    }
    auto bytes = Bytes(chars.size());
    std::transform(chars.begin(), chars.end(), bytes.begin(),
        [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

}  // anonymous namespace

FileStore::FileStore(std::filesystem::path dir) : dir_{std::move(dir)} {
    auto ec = std::error_code{};
    std::filesystem::create_directories(dir_ / "objects", ec);
    if (!ec) std::filesystem::create_directories(dir_ / "datasets", ec);
    if (ec) {
        throw Exception{ErrorKind::storage_failure,
                        "cannot create store at " + dir_.string() + ": " + ec.message()};
    }
}

auto FileStore::object_path(const Hash& id) const -> std::filesystem::path {
    return dir_ / "objects" / id.to_string();
}

auto FileStore::dataset_path(std::string_view dataset) const -> std::filesystem::path {
    // Dataset names may contain '/' and arbitrary client-chosen text.
    return dir_ / "datasets" / Hash::of(dataset).to_string();
}

void FileStore::write_file(const std::filesystem::path& path,
                           std::span<const std::byte> data) const {
    static auto counter = std::atomic<unsigned long>{0};
    auto tmp = path;
    tmp += ".tmp" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
    {
        auto out = std::ofstream{tmp, std::ios::binary | std::ios::trunc};
        out.write(reinterpret_cast<const char*>(data.data()),
                  static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw Exception{ErrorKind::storage_failure, "cannot write " + tmp.string()};
        }
    }
    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw Exception{ErrorKind::storage_failure, "cannot rename into " + path.string()};
    }
}

auto FileStore::put(std::span<const std::byte> bytes) -> Hash {
    auto id = Hash::of(bytes);
    auto path = object_path(id);
    if (std::filesystem::exists(path)) return id;

    auto compressed = storage::deflate_compress(bytes);
    if (!compressed) {
        throw Exception{ErrorKind::storage_failure, "cannot compress object " + id.to_string()};
    }
    // Concurrent writers of the same object write identical bytes.
    write_file(path, *compressed);
    return id;
}

auto FileStore::get(const Hash& id) const -> std::optional<Bytes> {
    auto compressed = read_file(object_path(id));
    if (!compressed) return std::nullopt;
    auto bytes = storage::deflate_decompress(*compressed);
    if (!bytes || Hash::of(*bytes) != id) {
        throw Exception{ErrorKind::storage_failure, "corrupt object " + id.to_string()};
    }
    return bytes;
}

auto FileStore::head(std::string_view dataset) const -> std::optional<Hash> {
    auto raw = read_file(dataset_path(dataset));
    if (!raw) return std::nullopt;
    auto text = std::string{reinterpret_cast<const char*>(raw->data()), raw->size()};
    auto id = Hash::parse(text);
    if (!id) {
        throw Exception{ErrorKind::storage_failure,
                        "corrupt head for dataset " + std::string{dataset}};
    }
    return id;
}

auto FileStore::advance(std::string_view dataset,
                        const std::optional<Hash>& expected,
                        const Hash& next) -> bool {
    auto lock = std::scoped_lock{datasets_mutex_};
    if (!std::filesystem::exists(object_path(next))) {
        throw Exception{ErrorKind::storage_failure,
                        "dataset target " + next.to_string() + " is not stored"};
    }
    if (head(dataset) != expected) return false;
    auto text = next.to_string();
    write_file(dataset_path(dataset), std::as_bytes(std::span{text.data(), text.size()}));
    return true;
}

// =============================================================================
// Factories
// =============================================================================

auto memory_store_factory() -> StoreFactory {
    return [](std::string_view) -> std::shared_ptr<ContentStore> {
        return std::make_shared<MemoryStore>();
    };
}

auto file_store_factory(std::filesystem::path root) -> StoreFactory {
    return [root = std::move(root)](std::string_view account_id) -> std::shared_ptr<ContentStore> {
        // Account IDs come from configuration, but keep them out of path syntax.
        return std::make_shared<FileStore>(root / Hash::of(account_id).to_string());
    };
}

}  // namespace diff_server
