/// @file service.hpp
/// @brief Service -- the pull protocol and its HTTP mapping.

#pragma once

#include <diff-server/account.hpp>
#include <diff-server/client_view.hpp>
#include <diff-server/commit_log.hpp>
#include <diff-server/config.hpp>
#include <diff-server/http.hpp>
#include <diff-server/pull.hpp>
#include <diff-server/store.hpp>

#include <BS_thread_pool.hpp>

#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace diff_server {

/// Construction options not tied to accounts or storage.
struct ServiceOptions {
    bool enable_inject{false};       ///< Serve /inject; 404 otherwise.
    unsigned int worker_threads{0};  ///< Threads behind submit(); 0 means hardware concurrency.
};

/// The sync service.
///
/// pull() validates a client's request, fetches the account's current
/// client view, records it as a new commit of that client and answers with
/// the patch from the client's base state to the new head. handle() maps
/// HTTP-shaped requests onto pull() and inject() and errors onto status
/// codes; submit() runs handle() on the service's worker pool.
///
/// All member functions are safe to call concurrently. Requests of
/// different clients never wait for each other; requests of one client
/// are serialized across their fetch and commit.
///
/// @code
/// auto getter = std::make_shared<HttpClientViewGetter>(my_transport);
/// auto service = Service{ServerConfig::load("diff-server.json"), getter};
/// auto response = service.handle(HttpRequest{"POST", "/pull", {}, body});
/// @endcode
class Service {
public:
    /// A null getter disables fetching: pulls then answer from the stored head.
    Service(AccountRegistry accounts,
            StoreFactory stores,
            std::shared_ptr<ClientViewGetter> getter,
            ServiceOptions options = {});

    /// Build from configuration. Also applies the configured log level.
    Service(const ServerConfig& config, std::shared_ptr<ClientViewGetter> getter);

    ~Service();

    Service(const Service&) = delete;
    auto operator=(const Service&) -> Service& = delete;

    /// Route one request: `/pull` and `/inject` are served, anything else
    /// is 404. Never throws; every failure becomes a response.
    auto handle(const HttpRequest& request) -> HttpResponse;

    /// handle() on a worker thread.
    auto submit(HttpRequest request) -> std::future<HttpResponse>;

    /// Run the pull protocol.
    ///
    /// Throws Exception{bad_request} for a malformed or unknown request and
    /// Exception{storage_failure} if the commit cannot be recorded. A failed
    /// fetch, an unknown base and a base whose checksum disagrees with the
    /// asserted one are not errors: they are logged and degrade to a resync
    /// of the stored head or to a full snapshot.
    auto pull(const PullRequest& request, std::string_view auth_token = {}) -> PullResponse;

    /// Record a client view as a new commit without fetching it.
    /// Throws Exception{not_found} unless inject is enabled, and
    /// Exception{bad_request} if its lastMutationID is below the head's.
    auto inject(const InjectRequest& request) -> Commit;

    /// The commit log of a client, opened on first use.
    auto commit_log(std::string_view account_id, std::string_view client_id)
        -> std::shared_ptr<CommitLog>;

    auto accounts() const -> const AccountRegistry& { return accounts_; }
    auto options() const -> const ServiceOptions& { return options_; }

private:
    auto resolve_account(std::string_view account_id, std::string_view client_id) const
        -> const Account&;
    auto handle_pull(const HttpRequest& request) -> HttpResponse;
    auto handle_inject(const HttpRequest& request) -> HttpResponse;

    AccountRegistry accounts_;
    std::shared_ptr<ClientViewGetter> getter_;
    ServiceOptions options_;
    CommitLogCache logs_;
    BS::thread_pool workers_;  // last: drains before the members its tasks use
};

}  // namespace diff_server
