// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <diff-server/diff_server.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace ds = diff_server;
using json = nlohmann::json;

static void write_seed(const std::filesystem::path& path, const std::string& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << data;
}

int main() {
    namespace fs = std::filesystem;
    const auto root = fs::path{"fuzz/corpus"};
    for (auto target : {"pull_request", "apply_patch", "client_view"}) {
        fs::create_directories(root / target);
    }

    const auto state = ds::Hash::of("seed").to_string();
    const auto checksum = ds::Snapshot{{{"foo", "bar"}}}.checksum().to_string();

    // Pull requests: minimal, full, empty-but-present fields.
    write_seed(root / "pull_request" / "minimal.json",
               json{{"accountID", "a"}, {"clientID", "c"}}.dump());
    write_seed(root / "pull_request" / "full.json",
               json{{"accountID", "a"}, {"clientID", "c"},
                    {"baseStateID", state}, {"checksum", checksum}}.dump());
    write_seed(root / "pull_request" / "empty_fields.json",
               json{{"accountID", "a"}, {"clientID", "c"},
                    {"baseStateID", ""}, {"checksum", ""}}.dump());

    // Patches: a real diff, a bootstrap, and one with escapes and replace.
    const auto base = ds::Snapshot{{"a", 1}, {"b", json{{"x", {1, 2}}}}, {"c", "three"}};
    const auto target = ds::Snapshot{{"b", json{{"x", {1, 3}}}}, {"c", "three"}, {"d", nullptr}};
    write_seed(root / "apply_patch" / "diff.json",
               json{{"base", base.to_json()}, {"patch", ds::diff(base, target)}}.dump());
    write_seed(root / "apply_patch" / "bootstrap.json",
               json{{"base", base.to_json()}, {"patch", ds::diff(nullptr, target)}}.dump());
    write_seed(root / "apply_patch" / "escapes.json", R"({"base": {"a/b": 1, "c~d": 2},
        "patch": [{"op": "replace", "path": "/a~1b", "value": 3},
                  {"op": "remove", "path": "/c~0d"},
                  {"op": "add", "path": "/", "value": {"z": true}}]})");

    // Client view responses.
    write_seed(root / "client_view" / "simple.json",
               R"({"clientView": {"foo": "bar"}, "lastMutationID": 1})");
    write_seed(root / "client_view" / "nested.json",
               json{{"clientView", target.to_json()}, {"lastMutationID", 42}}.dump());

    return 0;
}
