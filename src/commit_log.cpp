#include <diff-server/commit_log.hpp>
#include <diff-server/error.hpp>
#include <diff-server/log.hpp>

#include <nlohmann/json.hpp>

namespace diff_server {

// =============================================================================
// Encoding
// =============================================================================
//
// A commit is two objects. The data object is the snapshot as a canonical
// JSON object. The commit object is
//   {"checksum": <hex>, "data": <hash>, "lastMutationID": <n>, "parent": <hash>|null}
// dumped with sorted keys, so equal commits always encode to equal bytes.

namespace {

auto parse_object(const Bytes& bytes, const Hash& id) -> nlohmann::json {
    auto text = std::string_view{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::storage_failure, "object " + id.to_string() + " is not valid JSON"};
    }
    return j;
}

auto require_hash(const nlohmann::json& j, const char* field, const Hash& id) -> Hash {
    auto it = j.find(field);
    if (it != j.end() && it->is_string()) {
        if (auto h = Hash::parse(it->get_ref<const std::string&>())) return *h;
    }
    throw Exception{ErrorKind::storage_failure,
                    "commit " + id.to_string() + " has a bad '" + field + "' field"};
}

}  // anonymous namespace

// =============================================================================
// CommitLog
// =============================================================================

CommitLog::CommitLog(std::shared_ptr<ContentStore> store, std::string client_id)
    : store_{std::move(store)},
      client_id_{std::move(client_id)},
      dataset_{dataset_name(client_id_)} {}

auto CommitLog::dataset_name(std::string_view client_id) -> std::string {
    return "client/" + std::string{client_id};
}

auto CommitLog::load_header(const Hash& id) const -> Header {
    auto bytes = store_->get(id);
    if (!bytes) {
        throw Exception{ErrorKind::storage_failure, "missing commit " + id.to_string()};
    }
    auto j = parse_object(*bytes, id);
    if (!j.is_object()) {
        throw Exception{ErrorKind::storage_failure, "commit " + id.to_string() + " is not an object"};
    }

    auto header = Header{};
    if (auto it = j.find("parent"); it != j.end() && !it->is_null()) {
        header.parent = require_hash(j, "parent", id);
    }
    header.data = require_hash(j, "data", id);

    auto checksum_it = j.find("checksum");
    auto checksum = checksum_it != j.end() && checksum_it->is_string()
        ? Checksum::parse(checksum_it->get_ref<const std::string&>())
        : std::nullopt;
    auto lmid_it = j.find("lastMutationID");
    if (!checksum || lmid_it == j.end() || !lmid_it->is_number_unsigned()) {
        throw Exception{ErrorKind::storage_failure, "commit " + id.to_string() + " is malformed"};
    }
    header.checksum = *checksum;
    header.last_mutation_id = lmid_it->get<std::uint64_t>();
    return header;
}

auto CommitLog::load(const Hash& id) const -> Commit {
    auto header = load_header(id);

    auto bytes = store_->get(header.data);
    if (!bytes) {
        throw Exception{ErrorKind::storage_failure,
                        "missing data " + header.data.to_string() + " of commit " + id.to_string()};
    }
    auto j = parse_object(*bytes, header.data);
    if (!j.is_object()) {
        throw Exception{ErrorKind::storage_failure, "data of commit " + id.to_string() + " is not an object"};
    }
    auto entries = Snapshot::Map{};
    for (auto& [key, value] : j.items()) {
        entries.emplace(key, std::move(value));
    }
    auto data = Snapshot{std::move(entries)};

    // The recorded checksum is independent of the content address; a
    // disagreement means the stored data or the checksum code changed.
    if (data.checksum() != header.checksum) {
        throw Exception{ErrorKind::storage_failure,
                        "checksum mismatch in commit " + id.to_string() + ": recorded " +
                        header.checksum.to_string() + ", computed " + data.checksum().to_string()};
    }
    return Commit{id, header.parent, std::move(data), header.last_mutation_id};
}

void CommitLog::ensure_index() const {
    {
        auto lock = std::shared_lock{mutex_};
        if (indexed_) return;
    }
    auto lock = std::unique_lock{mutex_};
    if (indexed_) return;

    // A failed walk leaves the log unindexed so the next call retries.
    auto walked = std::unordered_set<Hash>{};
    auto cursor = store_->head(dataset_);
    while (cursor) {
        walked.insert(*cursor);
        cursor = load_header(*cursor).parent;
    }
    logger().debug("indexed {} commits of {}", walked.size(), dataset_);
    members_.merge(walked);
    indexed_ = true;
}

auto CommitLog::head() const -> Commit {
    {
        auto lock = std::shared_lock{mutex_};
        if (head_) return *head_;
    }
    auto lock = std::unique_lock{mutex_};
    if (!head_) {
        auto id = store_->head(dataset_);
        head_ = id ? load(*id) : Commit{};
    }
    return *head_;
}

auto CommitLog::append(Snapshot data, std::uint64_t last_mutation_id) -> Commit {
    ensure_index();
    auto lock = std::unique_lock{mutex_};

    if (!head_) {
        auto id = store_->head(dataset_);
        head_ = id ? load(*id) : Commit{};
    }
    const auto& current = *head_;
    if (last_mutation_id < current.last_mutation_id) {
        throw Exception{ErrorKind::invalid_operation,
                        "lastMutationID " + std::to_string(last_mutation_id) +
                        " is lower than the head's " + std::to_string(current.last_mutation_id)};
    }

    auto parent = current.is_empty() ? std::nullopt : std::optional<Hash>{current.id};
    auto data_id = store_->put(data.to_json().dump());
    auto encoded = nlohmann::json{
        {"checksum", data.checksum().to_string()},
        {"data", data_id.to_string()},
        {"lastMutationID", last_mutation_id},
        {"parent", parent ? nlohmann::json(parent->to_string()) : nlohmann::json(nullptr)},
    };
    auto id = store_->put(encoded.dump());

    if (!store_->advance(dataset_, parent, id)) {
        // Our cached head is stale: another writer moved the dataset.
        head_.reset();
        throw Exception{ErrorKind::storage_failure,
                        "head of " + dataset_ + " moved during append"};
    }

    // Durable from here on; nothing below may fail the append.
    auto commit = Commit{id, parent, std::move(data), last_mutation_id};
    members_.insert(id);
    head_ = commit;
    return commit;
}

auto CommitLog::find(const Hash& id) const -> std::optional<Commit> {
    ensure_index();
    auto lock = std::shared_lock{mutex_};
    if (!members_.contains(id)) return std::nullopt;
    if (head_ && head_->id == id) return *head_;
    return load(id);
}

auto CommitLog::lookup(const Hash& id) const -> Commit {
    if (auto commit = find(id)) return *std::move(commit);
    throw Exception{ErrorKind::unknown_state,
                    "state " + id.to_string() + " is not in the history of " + client_id_};
}

auto CommitLog::history(std::size_t limit) const -> std::vector<Commit> {
    auto result = std::vector<Commit>{};
    auto current = head();
    if (current.is_empty()) return result;

    auto lock = std::shared_lock{mutex_};
    auto cursor = std::optional<Hash>{current.id};
    while (cursor && result.size() < limit) {
        result.push_back(result.empty() ? current : load(*cursor));
        cursor = result.back().parent;
    }
    return result;
}

// =============================================================================
// CommitLogCache
// =============================================================================

CommitLogCache::CommitLogCache(StoreFactory factory)
    : factory_{std::move(factory)} {}

auto CommitLogCache::store(std::string_view account_id) -> std::shared_ptr<ContentStore> {
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = stores_.find(account_id);
        if (it != stores_.end()) return it->second;
    }
    // Store creation may touch the disk; build it unlocked. If two threads
    // race, the first one registered wins and the other is discarded.
    auto created = factory_(account_id);
    auto lock = std::scoped_lock{mutex_};
    return stores_.try_emplace(std::string{account_id}, std::move(created)).first->second;
}

auto CommitLogCache::open(std::string_view account_id, std::string_view client_id)
    -> std::shared_ptr<CommitLog> {
    auto account_store = store(account_id);

    auto lock = std::scoped_lock{mutex_};
    auto key = std::pair{std::string{account_id}, std::string{client_id}};
    auto it = logs_.find(key);
    if (it != logs_.end()) return it->second;
    auto log = std::make_shared<CommitLog>(std::move(account_store), std::string{client_id});
    logs_.emplace(std::move(key), log);
    return log;
}

auto CommitLogCache::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return logs_.size();
}

}  // namespace diff_server
