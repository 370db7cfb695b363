#include <diff-server/patch.hpp>
#include <diff-server/error.hpp>

#include <utility>

namespace diff_server {

// -- Wire form ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{
        {"op", std::string{to_string_view(op.op)}},
        {"path", op.path},
    };
    if (op.value) {
        j["value"] = *op.value;
    }
}

void from_json(const nlohmann::json& j, Operation& op) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::invalid_patch, "patch operation must be an object"};
    }
    auto op_it = j.find("op");
    auto path_it = j.find("path");
    if (op_it == j.end() || !op_it->is_string()) {
        throw Exception{ErrorKind::invalid_patch, "patch operation is missing 'op'"};
    }
    if (path_it == j.end() || !path_it->is_string()) {
        throw Exception{ErrorKind::invalid_patch, "patch operation is missing 'path'"};
    }
    const auto& name = op_it->get_ref<const std::string&>();
    if (name == "add") {
        op.op = PatchOp::add;
    } else if (name == "remove") {
        op.op = PatchOp::remove;
    } else if (name == "replace") {
        op.op = PatchOp::replace;
    } else {
        throw Exception{ErrorKind::invalid_patch, "unsupported patch operation: " + name};
    }
    op.path = path_it->get<std::string>();
    if (auto value_it = j.find("value"); value_it != j.end()) {
        op.value = *value_it;
    } else {
        op.value.reset();
    }
}

// -- Paths --------------------------------------------------------------------

auto key_path(std::string_view key) -> std::string {
    auto result = std::string{"/"};
    result.reserve(key.size() + 1);
    for (char c : key) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto path_key(std::string_view path) -> std::optional<std::string> {
    if (path.size() < 2 || path[0] != '/') return std::nullopt;
    auto key = std::string{};
    key.reserve(path.size() - 1);
    for (std::size_t i = 1; i < path.size(); ++i) {
        auto c = path[i];
        if (c == '/') return std::nullopt;
        if (c == '~') {
            if (i + 1 >= path.size()) return std::nullopt;
            auto next = path[++i];
            if (next == '0') { key += '~'; }
            else if (next == '1') { key += '/'; }
            else { return std::nullopt; }
        } else {
            key += c;
        }
    }
    return key;
}

// -- Diff ---------------------------------------------------------------------

namespace {

// Equality that agrees with the canonical encoding used for checksums:
// nlohmann::json treats 1 and 1.0 as equal, their dumps differ.
auto same_value(const Value& a, const Value& b) -> bool {
    if (a.is_number_integer() && b.is_number_integer()) return a == b;
    if (a.type() != b.type()) return false;
    if (a.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto ai = a.begin(), bi = b.begin(); ai != a.end(); ++ai, ++bi) {
            if (ai.key() != bi.key() || !same_value(*ai, *bi)) return false;
        }
        return true;
    }
    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!same_value(a[i], b[i])) return false;
        }
        return true;
    }
    return a == b;
}

auto bootstrap(const Snapshot& target) -> Patch {
    auto patch = Patch{};
    patch.reserve(target.size() + 1);
    patch.push_back(Operation{PatchOp::remove, std::string{root_path}, std::nullopt});
    for (const auto& [key, value] : target) {
        patch.push_back(Operation{PatchOp::add, key_path(key), value});
    }
    return patch;
}

}  // anonymous namespace

auto diff(const Snapshot* base, const Snapshot& target) -> Patch {
    if (base == nullptr) return bootstrap(target);
    if (base->checksum() == target.checksum() && base->size() == target.size()) {
        return {};
    }

    auto removals = Patch{};
    auto additions = Patch{};

    // Merge walk over both key-ordered maps.
    auto b = base->begin();
    auto t = target.begin();
    while (b != base->end() || t != target.end()) {
        if (t == target.end() || (b != base->end() && b->first < t->first)) {
            removals.push_back(Operation{PatchOp::remove, key_path(b->first), std::nullopt});
            ++b;
        } else if (b == base->end() || t->first < b->first) {
            additions.push_back(Operation{PatchOp::add, key_path(t->first), t->second});
            ++t;
        } else {
            if (!same_value(b->second, t->second)) {
                auto path = key_path(t->first);
                removals.push_back(Operation{PatchOp::remove, path, std::nullopt});
                additions.push_back(Operation{PatchOp::add, std::move(path), t->second});
            }
            ++b;
            ++t;
        }
    }

    removals.reserve(removals.size() + additions.size());
    for (auto& op : additions) removals.push_back(std::move(op));
    return removals;
}

// -- Apply --------------------------------------------------------------------

auto apply(const Snapshot& base, const Patch& patch) -> Snapshot {
    if (patch.empty()) return base;

    // Edit one private copy; the checksum is computed once at the end.
    auto entries = base.entries();
    for (const auto& op : patch) {
        if (op.op != PatchOp::remove && !op.value) {
            throw Exception{ErrorKind::invalid_patch,
                            std::string{to_string_view(op.op)} + " requires a value: " + op.path};
        }

        if (op.path == root_path) {
            if (op.op == PatchOp::remove) {
                entries.clear();
                continue;
            }
            try {
                entries = Snapshot::from_json(*op.value).entries();
            } catch (const Exception& e) {
                throw Exception{ErrorKind::invalid_patch, e.what()};
            }
            continue;
        }

        auto key = path_key(op.path);
        if (!key) {
            throw Exception{ErrorKind::invalid_patch, "unsupported patch path: " + op.path};
        }
        auto it = entries.find(*key);
        switch (op.op) {
            case PatchOp::remove:
                if (it == entries.end()) {
                    throw Exception{ErrorKind::invalid_patch, "remove of missing path: " + op.path};
                }
                entries.erase(it);
                break;
            case PatchOp::replace:
                if (it == entries.end()) {
                    throw Exception{ErrorKind::invalid_patch, "replace of missing path: " + op.path};
                }
                it->second = *op.value;
                break;
            case PatchOp::add:
                entries.insert_or_assign(std::move(*key), *op.value);
                break;
        }
    }
    return Snapshot{std::move(entries)};
}

}  // namespace diff_server
