// concurrent_clients_demo — many clients pulling at once
//
// Demonstrates: Service::submit() runs requests on the service's worker
// pool. Clients share nothing, so their pulls proceed in parallel; pulls
// of one client are serialized and build a single linear history.
//
// Build: cmake --build build
// Run:   ./build/concurrent_clients_demo

#include <diff-server/diff_server.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace ds = diff_server;
using json = nlohmann::json;

namespace {

// A backend that takes a little time and gives every client its own view.
class SlowBackend final : public ds::ClientViewGetter {
public:
    auto get(const ds::Account&, const ds::ClientViewRequest& request, std::string_view)
        -> ds::ClientViewResponse override {
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
        auto n = ++counter_;
        auto view = ds::Snapshot{{"owner", request.client_id}, {"fetch", n}};
        return ds::ClientViewResponse{std::move(view), n};
    }

private:
    std::atomic<std::uint64_t> counter_{0};
};

auto pull(std::string_view client_id) -> ds::HttpRequest {
    auto request = ds::HttpRequest{};
    request.path = "/pull";
    request.body = json{{"accountID", "demo"}, {"clientID", client_id}}.dump();
    return request;
}

}  // anonymous namespace

int main() {
    auto account = ds::Account{};
    account.id = "demo";
    account.name = "Demo account";

    auto options = ds::ServiceOptions{};
    options.worker_threads = std::thread::hardware_concurrency();
    auto service = ds::Service{ds::AccountRegistry{std::vector<ds::Account>{account}},
                               ds::memory_store_factory(),
                               std::make_shared<SlowBackend>(), options};
    ds::set_log_level(spdlog::level::warn);

    constexpr int clients = 64;
    constexpr int pulls_per_client = 4;

    std::printf("=== %d clients x %d pulls on %u workers ===\n",
                clients, pulls_per_client, options.worker_threads);

    auto start = std::chrono::steady_clock::now();
    auto futures = std::vector<std::future<ds::HttpResponse>>{};
    for (int round = 0; round < pulls_per_client; ++round) {
        for (int c = 0; c < clients; ++c) {
            futures.push_back(service.submit(pull("client-" + std::to_string(c))));
        }
    }
    auto failures = 0;
    for (auto& f : futures) {
        if (f.get().status != 200) ++failures;
    }
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();

    std::printf("%zu pulls in %.1f ms, %d failures\n", futures.size(), elapsed, failures);

    auto linear = true;
    for (int c = 0; c < clients; ++c) {
        auto history = service.commit_log("demo", "client-" + std::to_string(c))->history();
        if (history.size() != static_cast<std::size_t>(pulls_per_client)) linear = false;
        for (std::size_t i = 0; i + 1 < history.size(); ++i) {
            if (history[i].parent != history[i + 1].id) linear = false;
            if (history[i].last_mutation_id < history[i + 1].last_mutation_id) linear = false;
        }
    }
    std::printf("every client has a linear history of %d commits: %s\n",
                pulls_per_client, linear ? "yes" : "NO");
    return linear && failures == 0 ? 0 : 1;
}
