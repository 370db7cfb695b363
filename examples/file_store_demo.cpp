// file_store_demo — history that survives a restart
//
// Demonstrates: a Service configured from JSON with a file-backed store.
// After the service is destroyed and rebuilt from the same directory, a
// client presenting its last stateID gets an empty patch.
//
// Build: cmake --build build
// Run:   ./build/file_store_demo [directory]

#include <diff-server/diff_server.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

namespace ds = diff_server;
using json = nlohmann::json;

namespace {

// Serves a fixed view; stands in for a backend that has not changed.
class FixedBackend final : public ds::ClientViewGetter {
public:
    explicit FixedBackend(ds::Snapshot view) : view_{std::move(view)} {}

    auto get(const ds::Account&, const ds::ClientViewRequest&, std::string_view)
        -> ds::ClientViewResponse override {
        return ds::ClientViewResponse{view_, 7};
    }

private:
    ds::Snapshot view_;
};

}  // anonymous namespace

int main(int argc, char** argv) {
    namespace fs = std::filesystem;
    auto dir = argc > 1 ? fs::path{argv[1]} : fs::temp_directory_path() / "diff-server-demo";

    auto config = ds::ServerConfig::from_json(json{
        {"accounts", json::array({json{{"id", "demo"}, {"name", "Demo account"}}})},
        {"store", {{"type", "file"}, {"path", dir.string()}}},
        {"logLevel", "warn"},
    });
    auto backend = std::make_shared<FixedBackend>(
        ds::Snapshot{{"greeting", "hello"}, {"count", 3}});

    auto first = ds::PullResponse{};
    try {
        std::printf("=== First run: store at %s ===\n", dir.string().c_str());
        auto service = ds::Service{config, backend};
        first = service.pull(ds::PullRequest{"demo", "client-1", std::nullopt, std::nullopt});
        std::printf("  state %s, %zu patch operations\n", first.state_id.c_str(), first.patch.size());
    } catch (const ds::Exception& e) {
        std::fprintf(stderr, "first run failed (%s): %s\n",
                     std::string{ds::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }

    try {
        std::printf("\n=== Second run: same directory, new service ===\n");
        auto service = ds::Service{config, backend};
        auto log = service.commit_log("demo", "client-1");
        std::printf("  head before pull: %s\n", log->head().state_id().c_str());

        auto second = service.pull(ds::PullRequest{
            "demo", "client-1", first.state_id, first.checksum.to_string()});
        std::printf("  patch: %s\n", json(second.patch).dump().c_str());
        std::printf("  history length: %zu\n", log->history().size());
    } catch (const ds::Exception& e) {
        std::fprintf(stderr, "second run failed (%s): %s\n",
                     std::string{ds::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
    return 0;
}
