#include <diff-server/error.hpp>
#include <diff-server/patch.hpp>
#include <diff-server/service.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <future>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <vector>

using namespace diff_server;
using json = nlohmann::json;
using diff_server::test_support::TempDir;

namespace {

constexpr auto account_id = "accountID";

// Serves a canned client view, or fails, and records what it was asked.
class FakeClientViewGetter final : public ClientViewGetter {
public:
    auto get(const Account& account, const ClientViewRequest& request,
             std::string_view auth_token) -> ClientViewResponse override {
        auto lock = std::scoped_lock{mutex_};
        ++calls;
        seen_account = account.id;
        seen_request = request;
        seen_auth = std::string{auth_token};
        if (fail) throw Exception{ErrorKind::upstream_fetch_failure, "boom"};
        return response;
    }

    void serve(Snapshot view, std::uint64_t last_mutation_id) {
        auto lock = std::scoped_lock{mutex_};
        response = ClientViewResponse{std::move(view), last_mutation_id};
        fail = false;
    }

    ClientViewResponse response;
    bool fail{false};
    int calls{0};
    std::string seen_account;
    ClientViewRequest seen_request;
    std::string seen_auth;

private:
    std::mutex mutex_;
};

// Fails every write once armed.
class BrokenStore final : public ContentStore {
public:
    auto put(std::span<const std::byte>) -> Hash override {
        throw Exception{ErrorKind::storage_failure, "disk full"};
    }
    auto get(const Hash&) const -> std::optional<Bytes> override { return std::nullopt; }
    auto head(std::string_view) const -> std::optional<Hash> override { return std::nullopt; }
    auto advance(std::string_view, const std::optional<Hash>&, const Hash&) -> bool override {
        throw Exception{ErrorKind::storage_failure, "disk full"};
    }
};

auto test_accounts() -> AccountRegistry {
    auto account = Account{};
    account.id = account_id;
    account.name = "Test account";
    account.client_view_url = "http://backend.test/view";
    return AccountRegistry{std::vector<Account>{account}};
}

auto pull_body(std::string_view client_id,
               std::optional<std::string> base_state_id = std::nullopt,
               std::optional<std::string> checksum = std::nullopt) -> std::string {
    auto request = PullRequest{account_id, std::string{client_id},
                               std::move(base_state_id), std::move(checksum)};
    return json(request).dump();
}

auto post(std::string path, std::string body, std::string auth = {}) -> HttpRequest {
    auto request = HttpRequest{};
    request.method = "POST";
    request.path = std::move(path);
    request.headers.emplace("Content-Type", "application/json");
    if (!auth.empty()) request.headers.emplace("Authorization", std::move(auth));
    request.body = std::move(body);
    return request;
}

auto patch_of(std::string_view text) -> Patch {
    return json::parse(text).get<Patch>();
}

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest()
        : getter_{std::make_shared<FakeClientViewGetter>()},
          service_{test_accounts(), memory_store_factory(), getter_, ServiceOptions{false, 2}} {}

    auto pull(std::string_view client_id,
              std::optional<std::string> base_state_id = std::nullopt,
              std::optional<std::string> checksum = std::nullopt) -> PullResponse {
        auto response = service_.handle(post("/pull", pull_body(client_id, base_state_id, checksum)));
        EXPECT_EQ(response.status, 200) << response.body;
        EXPECT_EQ(response.content_type, "application/json");
        return json::parse(response.body).get<PullResponse>();
    }

    std::shared_ptr<FakeClientViewGetter> getter_;
    Service service_;
};

}  // anonymous namespace

// =============================================================================
// End-to-end sync
// =============================================================================

TEST_F(ServiceTest, first_sync_without_base_bootstraps) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);

    const auto response = pull("c1");

    EXPECT_EQ(response.patch, patch_of(R"([{"op":"remove","path":"/"},
                                           {"op":"add","path":"/foo","value":"bar"}])"));
    EXPECT_EQ(response.last_mutation_id, 1u);
    EXPECT_EQ(response.state_id.size(), Hash::string_size);
    EXPECT_EQ(response.checksum, (Snapshot{{"foo", "bar"}}).checksum());
    EXPECT_FALSE(response.checksum.is_zero());
}

TEST_F(ServiceTest, second_sync_sends_only_the_delta) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto first = pull("c1");

    getter_->serve(Snapshot{{"foo", "bar"}, {"baz", "qux"}}, 2);
    const auto second = pull("c1", first.state_id, first.checksum.to_string());

    EXPECT_EQ(second.patch, patch_of(R"([{"op":"add","path":"/baz","value":"qux"}])"));
    EXPECT_EQ(second.last_mutation_id, 2u);
    EXPECT_NE(second.state_id, first.state_id);

    // Applying the patch on the client's copy reproduces the server checksum.
    const auto client_copy = diff_server::apply(diff_server::apply(Snapshot{}, first.patch), second.patch);
    EXPECT_EQ(client_copy.checksum(), second.checksum);
}

TEST_F(ServiceTest, invalid_checksum_is_rejected) {
    const auto response = service_.handle(
        post("/pull", pull_body("c1", std::string(32, '0'), std::string{"not"})));
    EXPECT_EQ(response.status, 400);
    EXPECT_NE(response.body.find("Invalid checksum"), std::string::npos);
    EXPECT_EQ(getter_->calls, 0);
}

TEST_F(ServiceTest, unknown_account_is_rejected) {
    const auto response = service_.handle(post("/pull", R"({"accountID": "bonk", "clientID": "c1"})"));
    EXPECT_EQ(response.status, 400);
    EXPECT_NE(response.body.find("Unknown accountID"), std::string::npos);
}

TEST_F(ServiceTest, fetch_failure_resyncs_current_head) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto first = pull("c1");

    getter_->fail = true;
    const auto second = pull("c1", first.state_id, first.checksum.to_string());

    EXPECT_TRUE(second.patch.empty());
    EXPECT_EQ(second.state_id, first.state_id);
    EXPECT_EQ(second.checksum, first.checksum);
    EXPECT_EQ(second.last_mutation_id, first.last_mutation_id);
}

// =============================================================================
// Base resolution
// =============================================================================

TEST_F(ServiceTest, unknown_base_gets_full_snapshot) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto response = pull("c1", Hash::of("never issued").to_string());
    ASSERT_FALSE(response.patch.empty());
    EXPECT_EQ(response.patch.front(), (Operation{PatchOp::remove, "/", std::nullopt}));
    EXPECT_EQ(response.patch.size(), 2u);
}

TEST_F(ServiceTest, base_from_another_client_gets_full_snapshot) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto other = pull("other-client");
    const auto mine = pull("c1", other.state_id);
    EXPECT_EQ(mine.patch.size(), 2u);
    EXPECT_EQ(mine.patch.front().path, "/");
}

TEST_F(ServiceTest, checksum_mismatch_rejects_base) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto first = pull("c1");

    getter_->serve(Snapshot{{"foo", "bar"}, {"baz", "qux"}}, 2);
    const auto wrong = Checksum{}.to_string();
    const auto second = pull("c1", first.state_id, wrong);

    EXPECT_EQ(second.patch, patch_of(R"([{"op":"remove","path":"/"},
                                         {"op":"add","path":"/baz","value":"qux"},
                                         {"op":"add","path":"/foo","value":"bar"}])"));
}

TEST_F(ServiceTest, absent_checksum_asserts_nothing) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto first = pull("c1");
    getter_->serve(Snapshot{{"foo", "baz"}}, 2);
    const auto second = pull("c1", first.state_id, std::nullopt);
    EXPECT_EQ(second.patch, patch_of(R"([{"op":"remove","path":"/foo"},
                                         {"op":"add","path":"/foo","value":"baz"}])"));
}

TEST_F(ServiceTest, empty_base_state_id_means_bootstrap) {
    getter_->serve(Snapshot{{"new", "value"}}, 2);
    const auto response = pull("c1", std::string{}, std::string(64, '0'));
    EXPECT_EQ(response.patch, patch_of(R"([{"op":"remove","path":"/"},
                                           {"op":"add","path":"/new","value":"value"}])"));
}

// =============================================================================
// Fetching
// =============================================================================

TEST_F(ServiceTest, fetch_receives_client_and_auth_token) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 1);
    const auto response = service_.handle(post("/pull", pull_body("clientid"), "authtoken"));
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(getter_->calls, 1);
    EXPECT_EQ(getter_->seen_account, account_id);
    EXPECT_EQ(getter_->seen_request, ClientViewRequest{"clientid"});
    EXPECT_EQ(getter_->seen_auth, "authtoken");
}

TEST_F(ServiceTest, regressing_last_mutation_id_keeps_head) {
    getter_->serve(Snapshot{{"foo", "bar"}}, 5);
    const auto first = pull("c1");

    getter_->serve(Snapshot{{"foo", "stale"}}, 4);
    const auto second = pull("c1", first.state_id);

    EXPECT_TRUE(second.patch.empty());
    EXPECT_EQ(second.state_id, first.state_id);
    EXPECT_EQ(second.last_mutation_id, 5u);
}

TEST(Service, without_getter_serves_stored_head) {
    auto service = Service{test_accounts(), memory_store_factory(), nullptr};
    service.commit_log(account_id, "clientid")->append(Snapshot{{"foo", "bar"}}, 1);

    const auto response = service.handle(post("/pull", pull_body("clientid", std::string(32, '0'))));
    ASSERT_EQ(response.status, 200) << response.body;
    const auto body = json::parse(response.body).get<PullResponse>();
    EXPECT_EQ(body.last_mutation_id, 1u);
    EXPECT_EQ(body.patch, patch_of(R"([{"op":"remove","path":"/"},
                                       {"op":"add","path":"/foo","value":"bar"}])"));
}

TEST(Service, client_that_never_synced_gets_empty_state) {
    auto service = Service{test_accounts(), memory_store_factory(), nullptr};
    const auto response = service.pull(PullRequest{account_id, "fresh", std::nullopt, std::nullopt});
    EXPECT_EQ(response.state_id, "");
    EXPECT_EQ(response.last_mutation_id, 0u);
    EXPECT_TRUE(response.checksum.is_zero());
    EXPECT_EQ(response.patch, (Patch{Operation{PatchOp::remove, "/", std::nullopt}}));
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ServiceTest, validation_messages_in_order) {
    const auto cases = std::vector<std::pair<std::string, std::string>>{
        {R"({"baseStateID": "00000000000000000000000000000000", "checksum": "00000000"})",
         "Missing accountID"},
        {R"({"accountID": "bonk", "baseStateID": "00000000000000000000000000000000"})",
         "Unknown accountID"},
        {R"({"accountID": "accountID", "baseStateID": "00000000000000000000000000000000"})",
         "Missing clientID"},
        {R"({"accountID": "accountID", "clientID": "c", "baseStateID": "beep", "checksum": "not"})",
         "Invalid baseStateID"},
        {R"({"accountID": "accountID", "clientID": "c", "checksum": "00000000"})",
         "Invalid checksum"},
        {R"({"accountID": "accountID", "clientID": "c", "checksum": ""})",
         "Invalid checksum"},
        {R"({"accountID": )", "Bad request payload"},
    };
    for (const auto& [body, message] : cases) {
        const auto response = service_.handle(post("/pull", body));
        EXPECT_EQ(response.status, 400) << body;
        EXPECT_EQ(response.body.substr(0, message.size()), message) << body;
    }
    EXPECT_EQ(getter_->calls, 0);
    EXPECT_TRUE(service_.commit_log(account_id, "c")->head().is_empty());
}

TEST_F(ServiceTest, pull_throws_bad_request_directly) {
    try {
        service_.pull(PullRequest{account_id, "", std::nullopt, std::nullopt});
        FAIL() << "expected bad_request";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::bad_request);
        EXPECT_STREQ(e.what(), "Missing clientID");
    }
}

// =============================================================================
// HTTP mapping
// =============================================================================

TEST_F(ServiceTest, unsupported_method) {
    auto request = post("/pull", pull_body("c1"));
    request.method = "GET";
    const auto response = service_.handle(request);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(response.body, "Unsupported method: GET");
}

TEST_F(ServiceTest, unknown_path_is_404) {
    EXPECT_EQ(service_.handle(post("/sync", pull_body("c1"))).status, 404);
}

TEST_F(ServiceTest, inject_is_404_when_disabled) {
    const auto body = R"({"accountID": "accountID", "clientID": "c1",
                          "clientViewResponse": {"clientView": {"a": 1}, "lastMutationID": 1}})";
    EXPECT_EQ(service_.handle(post("/inject", body)).status, 404);
    EXPECT_TRUE(service_.commit_log(account_id, "c1")->head().is_empty());
}

TEST(Service, inject_stores_client_view_when_enabled) {
    auto getter = std::make_shared<FakeClientViewGetter>();
    getter->fail = true;
    auto service = Service{test_accounts(), memory_store_factory(), getter, ServiceOptions{true, 1}};

    const auto injected = service.handle(post("/inject", R"({
        "accountID": "accountID", "clientID": "c1",
        "clientViewResponse": {"clientView": {"a": 1}, "lastMutationID": 3}})"));
    ASSERT_EQ(injected.status, 200) << injected.body;

    // The fetch fails, so the pull serves the injected view.
    const auto pulled = service.handle(post("/pull", pull_body("c1")));
    ASSERT_EQ(pulled.status, 200) << pulled.body;
    const auto response = json::parse(pulled.body).get<PullResponse>();
    EXPECT_EQ(response.last_mutation_id, 3u);
    EXPECT_EQ(response.checksum, (Snapshot{{"a", 1}}).checksum());
}

TEST(Service, inject_validates_like_pull) {
    auto service = Service{test_accounts(), memory_store_factory(), nullptr, ServiceOptions{true, 1}};
    const auto cv = R"("clientViewResponse": {"clientView": {}, "lastMutationID": 1})";

    auto response = service.handle(post("/inject", std::string{"{"} + cv + "}"));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(response.body, "Missing accountID");

    response = service.handle(post("/inject", std::string{R"({"accountID": "bonk", )"} + cv + "}"));
    EXPECT_EQ(response.body, "Unknown accountID");

    response = service.handle(post("/inject", std::string{R"({"accountID": "accountID", )"} + cv + "}"));
    EXPECT_EQ(response.body, "Missing clientID");

    auto get = post("/inject", "{}");
    get.method = "GET";
    EXPECT_EQ(service.handle(get).status, 405);
}

TEST(Service, inject_with_lower_last_mutation_id_is_400) {
    auto service = Service{test_accounts(), memory_store_factory(), nullptr, ServiceOptions{true, 1}};
    const auto inject = [&](int last_mutation_id) {
        return service.handle(post("/inject", R"({"accountID": "accountID", "clientID": "c1",
            "clientViewResponse": {"clientView": {"a": 1}, "lastMutationID": )" +
            std::to_string(last_mutation_id) + "}}"));
    };

    ASSERT_EQ(inject(5).status, 200);
    const auto rejected = inject(4);
    EXPECT_EQ(rejected.status, 400);
    EXPECT_EQ(rejected.body, "lastMutationID 4 is lower than the head's 5");
    EXPECT_EQ(service.commit_log("accountID", "c1")->head().last_mutation_id, 5u);
}

TEST(Service, storage_failure_is_500) {
    auto getter = std::make_shared<FakeClientViewGetter>();
    getter->serve(Snapshot{{"foo", "bar"}}, 1);
    auto service = Service{test_accounts(),
                           [](std::string_view) -> std::shared_ptr<ContentStore> {
                               return std::make_shared<BrokenStore>();
                           },
                           getter};
    const auto response = service.handle(post("/pull", pull_body("c1")));
    EXPECT_EQ(response.status, 500);
    EXPECT_NE(response.body.find("disk full"), std::string::npos);
}

TEST(Service, unexpected_exception_is_500) {
    auto service = Service{test_accounts(),
                           [](std::string_view) -> std::shared_ptr<ContentStore> {
                               throw std::bad_alloc{};
                           },
                           nullptr};
    const auto response = service.handle(post("/pull", pull_body("c1")));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.body, "Internal server error");
}

// =============================================================================
// Configuration and persistence
// =============================================================================

TEST(Service, built_from_config_with_file_store_keeps_history) {
    auto dir = TempDir{};
    auto config = ServerConfig::from_json(json{
        {"accounts", json::array({json{{"id", account_id}}})},
        {"store", {{"type", "file"}, {"path", dir.path().string()}}},
        {"workerThreads", 1},
        {"logLevel", "warn"},
    });

    auto getter = std::make_shared<FakeClientViewGetter>();
    getter->serve(Snapshot{{"foo", "bar"}}, 1);
    auto first = PullResponse{};
    {
        auto service = Service{config, getter};
        first = service.pull(PullRequest{account_id, "c1", std::nullopt, std::nullopt});
    }

    getter->fail = true;
    auto restarted = Service{config, getter};
    const auto again = restarted.pull(
        PullRequest{account_id, "c1", first.state_id, first.checksum.to_string()});
    EXPECT_TRUE(again.patch.empty());
    EXPECT_EQ(again.state_id, first.state_id);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(Service, concurrent_clients_converge_independently) {
    auto getter = std::make_shared<FakeClientViewGetter>();
    getter->serve(Snapshot{{"shared", "view"}}, 1);
    auto service = Service{test_accounts(), memory_store_factory(), getter, ServiceOptions{false, 4}};

    constexpr int clients = 16;
    auto futures = std::vector<std::future<HttpResponse>>{};
    for (int i = 0; i < clients; ++i) {
        futures.push_back(service.submit(post("/pull", pull_body("client-" + std::to_string(i)))));
    }

    auto state_ids = std::vector<std::string>{};
    for (auto& f : futures) {
        const auto response = f.get();
        ASSERT_EQ(response.status, 200) << response.body;
        const auto body = json::parse(response.body).get<PullResponse>();
        EXPECT_EQ(body.checksum, (Snapshot{{"shared", "view"}}).checksum());
        state_ids.push_back(body.state_id);
    }
    // Same content, same position in an empty history: same stateID.
    for (const auto& id : state_ids) EXPECT_EQ(id, state_ids.front());
}

TEST(Service, concurrent_pulls_of_one_client_form_a_linear_history) {
    auto getter = std::make_shared<FakeClientViewGetter>();
    getter->serve(Snapshot{{"k", "v"}}, 1);
    auto service = Service{test_accounts(), memory_store_factory(), getter, ServiceOptions{false, 4}};

    constexpr int pulls = 20;
    auto futures = std::vector<std::future<HttpResponse>>{};
    for (int i = 0; i < pulls; ++i) {
        futures.push_back(service.submit(post("/pull", pull_body("same"))));
    }
    for (auto& f : futures) EXPECT_EQ(f.get().status, 200);

    const auto history = service.commit_log(account_id, "same")->history();
    ASSERT_EQ(history.size(), static_cast<std::size_t>(pulls));
    for (std::size_t i = 0; i + 1 < history.size(); ++i) {
        EXPECT_EQ(history[i].parent, history[i + 1].id);
    }
}

TEST(Service, submitted_requests_finish_before_destruction) {
    auto futures = std::vector<std::future<HttpResponse>>{};
    {
        auto service = Service{test_accounts(), memory_store_factory(), nullptr, ServiceOptions{false, 1}};
        for (int i = 0; i < 8; ++i) {
            futures.push_back(service.submit(post("/pull", pull_body("client-" + std::to_string(i)))));
        }
    }
    for (auto& f : futures) EXPECT_EQ(f.get().status, 200);
}
