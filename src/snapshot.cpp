#include <diff-server/snapshot.hpp>
#include <diff-server/error.hpp>

#include "crypto/sha256.hpp"
#include "executor.hpp"

#include <vector>

namespace diff_server {

auto entry_digest(std::string_view key, const Value& value) -> Checksum {
    auto hasher = crypto::Sha256{};
    hasher.update_length(key.size());
    hasher.update(key);
    hasher.update(value.dump());
    return Checksum{hasher.finish()};
}

namespace {

auto sequential_checksum(const Snapshot::Map& entries) -> Checksum {
    auto sum = Checksum{};
    for (const auto& [key, value] : entries) {
        sum += entry_digest(key, value);
    }
    return sum;
}

// Digests are independent per entry; only the final sum is sequential.
auto parallel_checksum(const Snapshot::Map& entries) -> Checksum {
    auto items = std::vector<const Snapshot::Map::value_type*>{};
    items.reserve(entries.size());
    for (const auto& entry : entries) items.push_back(&entry);

    auto digests = std::vector<Checksum>(items.size());
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, items.size(), std::size_t{1},
        [&](std::size_t i) {
            digests[i] = entry_digest(items[i]->first, items[i]->second);
        });
    detail::global_executor().run(taskflow).wait();

    auto sum = Checksum{};
    for (const auto& d : digests) sum += d;
    return sum;
}

auto compute_checksum(const Snapshot::Map& entries) -> Checksum {
    if (entries.size() >= Snapshot::parallel_threshold) {
        return parallel_checksum(entries);
    }
    return sequential_checksum(entries);
}

}  // anonymous namespace

Snapshot::Snapshot()
    : entries_{std::make_shared<const Map>()} {}

Snapshot::Snapshot(Map entries)
    : entries_{std::make_shared<const Map>(std::move(entries))},
      checksum_{compute_checksum(*entries_)} {}

Snapshot::Snapshot(std::initializer_list<Map::value_type> entries)
    : Snapshot{Map{entries}} {}

auto Snapshot::from_json(const nlohmann::json& object) -> Snapshot {
    if (!object.is_object()) {
        throw Exception{ErrorKind::bad_request, "client view must be a JSON object"};
    }
    auto entries = Map{};
    for (const auto& [key, value] : object.items()) {
        if (key.empty()) {
            throw Exception{ErrorKind::bad_request, "client view contains an empty key"};
        }
        entries.emplace(key, value);
    }
    return Snapshot{std::move(entries)};
}

auto Snapshot::to_json() const -> nlohmann::json {
    auto result = nlohmann::json::object();
    for (const auto& [key, value] : *entries_) {
        result[key] = value;
    }
    return result;
}

auto Snapshot::contains(std::string_view key) const -> bool {
    return entries_->find(key) != entries_->end();
}

auto Snapshot::find(std::string_view key) const -> const Value* {
    auto it = entries_->find(key);
    return it == entries_->end() ? nullptr : &it->second;
}

auto Snapshot::get(std::string_view key) const -> std::optional<Value> {
    if (const auto* v = find(key)) return *v;
    return std::nullopt;
}

auto Snapshot::with(std::string key, Value value) const -> Snapshot {
    auto sum = checksum_;
    auto copy = Map{*entries_};
    if (auto it = copy.find(key); it != copy.end()) {
        sum -= entry_digest(it->first, it->second);
        sum += entry_digest(key, value);
        it->second = std::move(value);
    } else {
        sum += entry_digest(key, value);
        copy.emplace(std::move(key), std::move(value));
    }
    return Snapshot{std::make_shared<const Map>(std::move(copy)), sum};
}

auto Snapshot::without(std::string_view key) const -> Snapshot {
    auto it = entries_->find(key);
    if (it == entries_->end()) return *this;

    auto sum = checksum_ - entry_digest(it->first, it->second);
    auto copy = Map{*entries_};
    copy.erase(copy.find(key));
    return Snapshot{std::make_shared<const Map>(std::move(copy)), sum};
}

}  // namespace diff_server
