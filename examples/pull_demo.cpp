// pull_demo — one client syncing against an in-process backend
//
// Demonstrates: a Service wired to an HttpClientViewGetter whose transport
// is a plain function standing in for the account's backend. The client
// keeps a local Snapshot, applies each patch it receives and checks the
// result against the server's checksum.
//
// Build: cmake --build build
// Run:   ./build/pull_demo

#include <diff-server/diff_server.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace ds = diff_server;
using json = nlohmann::json;

namespace {

// The backend's authoritative data for every client, by mutation count.
struct Backend {
    json view = json::object();
    std::uint64_t last_mutation_id = 0;

    auto serve(const ds::HttpRequest& request, std::chrono::milliseconds) -> ds::HttpResponse {
        auto response = ds::HttpResponse{};
        if (request.header("Authorization").value_or("") != "secret") {
            response.status = 401;
            return response;
        }
        response.content_type = "application/json";
        response.body = json{{"clientView", view}, {"lastMutationID", last_mutation_id}}.dump();
        return response;
    }
};

struct Client {
    std::string id;
    ds::Snapshot local;
    std::string state_id;
    std::string checksum;

    auto pull_request() const -> std::string {
        auto request = json{{"accountID", "demo"}, {"clientID", id}};
        if (!state_id.empty()) {
            request["baseStateID"] = state_id;
            request["checksum"] = checksum;
        }
        return request.dump();
    }

    void sync(ds::Service& service, std::string_view token) {
        auto request = ds::HttpRequest{};
        request.path = "/pull";
        request.headers.emplace("Authorization", std::string{token});
        request.body = pull_request();

        auto response = service.handle(request);
        if (response.status != 200) {
            std::printf("  pull failed: %d %s\n", response.status, response.body.c_str());
            return;
        }
        auto pulled = json::parse(response.body).get<ds::PullResponse>();
        local = ds::apply(local, pulled.patch);
        state_id = pulled.state_id;
        checksum = pulled.checksum.to_string();

        std::printf("  patch: %s\n", json(pulled.patch).dump().c_str());
        std::printf("  state %s, lastMutationID %llu, checksum %s\n",
                    state_id.c_str(),
                    static_cast<unsigned long long>(pulled.last_mutation_id),
                    local.checksum() == pulled.checksum ? "verified" : "MISMATCH");
    }
};

}  // anonymous namespace

int main() {
    auto backend = Backend{};
    auto account = ds::Account{};
    account.id = "demo";
    account.name = "Demo account";
    account.client_view_url = "http://backend.local/replicache-client-view";

    auto getter = std::make_shared<ds::HttpClientViewGetter>(
        [&backend](const ds::HttpRequest& request, std::chrono::milliseconds timeout) {
            return backend.serve(request, timeout);
        });
    auto service = ds::Service{ds::AccountRegistry{std::vector<ds::Account>{account}},
                               ds::memory_store_factory(), getter};
    ds::set_log_level(spdlog::level::warn);

    auto client = Client{"client-1", {}, {}, {}};

    std::printf("=== First sync: no base, full snapshot ===\n");
    backend.view = {{"todo/1", {{"title", "buy milk"}, {"done", false}}}};
    backend.last_mutation_id = 1;
    client.sync(service, "secret");

    std::printf("\n=== Second sync: one key added ===\n");
    backend.view["todo/2"] = {{"title", "walk dog"}, {"done", false}};
    backend.last_mutation_id = 2;
    client.sync(service, "secret");

    std::printf("\n=== Third sync: one key changed, one removed ===\n");
    backend.view["todo/1"]["done"] = true;
    backend.view.erase("todo/2");
    backend.last_mutation_id = 4;
    client.sync(service, "secret");

    std::printf("\n=== Fourth sync: backend rejects the token, nothing changes ===\n");
    client.sync(service, "wrong");

    std::printf("\n=== Stale checksum: server sends a full snapshot ===\n");
    client.checksum = ds::Checksum{}.to_string();
    client.sync(service, "secret");

    std::printf("\nClient view: %s\n", client.local.to_json().dump(2).c_str());
    return 0;
}
