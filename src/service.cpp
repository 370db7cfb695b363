#include <diff-server/service.hpp>
#include <diff-server/error.hpp>
#include <diff-server/log.hpp>
#include <diff-server/patch.hpp>

#include <nlohmann/json.hpp>

namespace diff_server {

namespace {

constexpr auto json_content_type = "application/json";

auto error_response(int status, std::string message) -> HttpResponse {
    auto response = HttpResponse{};
    response.status = status;
    response.body = std::move(message);
    return response;
}

auto unsupported_method(std::string_view method) -> HttpResponse {
    return error_response(405, "Unsupported method: " + std::string{method});
}

}  // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Service::Service(AccountRegistry accounts,
                 StoreFactory stores,
                 std::shared_ptr<ClientViewGetter> getter,
                 ServiceOptions options)
    : accounts_{std::move(accounts)},
      getter_{std::move(getter)},
      options_{options},
      logs_{std::move(stores)},
      workers_{options.worker_threads} {
    logger().info("serving {} accounts with {} workers{}{}",
                  accounts_.size(), workers_.get_thread_count(),
                  getter_ ? "" : ", client view fetch disabled",
                  options_.enable_inject ? ", inject enabled" : "");
}

Service::Service(const ServerConfig& config, std::shared_ptr<ClientViewGetter> getter)
    : Service{AccountRegistry{config.accounts},
              make_store_factory(config.store),
              std::move(getter),
              ServiceOptions{config.enable_inject, config.worker_threads}} {
    set_log_level(config.log_level);
}

Service::~Service() = default;

auto Service::commit_log(std::string_view account_id, std::string_view client_id)
    -> std::shared_ptr<CommitLog> {
    return logs_.open(account_id, client_id);
}

// =============================================================================
// Protocol
// =============================================================================

auto Service::resolve_account(std::string_view account_id, std::string_view client_id) const
    -> const Account& {
    if (account_id.empty()) {
        throw Exception{ErrorKind::bad_request, "Missing accountID"};
    }
    const auto* account = accounts_.find(account_id);
    if (account == nullptr) {
        throw Exception{ErrorKind::bad_request, "Unknown accountID"};
    }
    if (client_id.empty()) {
        throw Exception{ErrorKind::bad_request, "Missing clientID"};
    }
    return *account;
}

auto Service::pull(const PullRequest& request, std::string_view auth_token) -> PullResponse {
    // -- Validate (no I/O before this point) ----------------------------------
    const auto& account = resolve_account(request.account_id, request.client_id);
    auto base_id = validate_base_state_id(request.base_state_id);
    auto asserted_checksum = validate_checksum(request.checksum);

    auto log = logs_.open(account.id, request.client_id);

    // -- Fetch and commit -----------------------------------------------------
    auto head = Commit{};
    {
        auto sync = log->sync_lock();
        head = log->head();

        auto fetched = std::optional<ClientViewResponse>{};
        if (getter_) {
            try {
                fetched = getter_->get(account, ClientViewRequest{request.client_id}, auth_token);
            } catch (const std::exception& e) {
                logger().warn("client view fetch for {}/{} failed, serving stored head: {}",
                              account.id, request.client_id, e.what());
            }
        }

        if (fetched) {
            try {
                head = log->append(std::move(fetched->client_view), fetched->last_mutation_id);
                logger().info("committed {} for {}/{} at lastMutationID {}",
                              head.state_id(), account.id, request.client_id,
                              head.last_mutation_id);
            } catch (const Exception& e) {
                if (e.kind() != ErrorKind::invalid_operation) throw;
                logger().warn("rejected client view for {}/{}: {}",
                              account.id, request.client_id, e.what());
            }
        }
    }

    // -- Resolve base ---------------------------------------------------------
    auto base = std::optional<Commit>{};
    if (base_id) {
        base = log->find(*base_id);
        if (!base) {
            logger().warn("unknown baseStateID {} for {}/{}, sending full snapshot",
                          base_id->to_string(), account.id, request.client_id);
        } else if (asserted_checksum && *asserted_checksum != base->checksum()) {
            logger().warn("checksum mismatch for {}/{} at {}: client {}, server {}; sending full snapshot",
                          account.id, request.client_id, base_id->to_string(),
                          asserted_checksum->to_string(), base->checksum().to_string());
            base.reset();
        }
    }

    // -- Diff -----------------------------------------------------------------
    auto response = PullResponse{};
    response.state_id = head.state_id();
    response.last_mutation_id = head.last_mutation_id;
    response.patch = diff(base ? &base->data : nullptr, head.data);
    response.checksum = head.checksum();
    return response;
}

auto Service::inject(const InjectRequest& request) -> Commit {
    if (!options_.enable_inject) {
        throw Exception{ErrorKind::not_found, "Not found"};
    }
    const auto& account = resolve_account(request.account_id, request.client_id);

    auto log = logs_.open(account.id, request.client_id);
    auto sync = log->sync_lock();
    const auto& view = request.client_view_response;
    auto commit = Commit{};
    try {
        commit = log->append(view.client_view, view.last_mutation_id);
    } catch (const Exception& e) {
        // The caller chose the lastMutationID; a regression is its mistake.
        if (e.kind() != ErrorKind::invalid_operation) throw;
        throw Exception{ErrorKind::bad_request, e.what()};
    }
    logger().info("injected {} for {}/{} at lastMutationID {}",
                  commit.state_id(), account.id, request.client_id, commit.last_mutation_id);
    return commit;
}

// =============================================================================
// HTTP mapping
// =============================================================================

auto Service::handle_pull(const HttpRequest& request) -> HttpResponse {
    if (request.method != "POST") return unsupported_method(request.method);

    auto pull_request = parse_pull_request(request.body);
    auto result = pull(pull_request, request.header("Authorization").value_or(""));

    auto response = HttpResponse{};
    response.content_type = json_content_type;
    response.body = nlohmann::json(result).dump();
    return response;
}

auto Service::handle_inject(const HttpRequest& request) -> HttpResponse {
    if (!options_.enable_inject) return error_response(404, "Not found");
    if (request.method != "POST") return unsupported_method(request.method);

    inject(parse_inject_request(request.body));
    return HttpResponse{};
}

auto Service::handle(const HttpRequest& request) -> HttpResponse {
    logger().debug("{} {}", request.method, request.path);
    try {
        if (request.path == "/pull") return handle_pull(request);
        if (request.path == "/inject") return handle_inject(request);
        return error_response(404, "Not found");
    } catch (const Exception& e) {
        auto status = http_status(e.kind());
        if (status >= 500) {
            logger().error("{} {} failed ({}): {}", request.method, request.path,
                           to_string_view(e.kind()), e.what());
        } else {
            logger().info("{} {} rejected: {}", request.method, request.path, e.what());
        }
        return error_response(status, e.what());
    } catch (const std::exception& e) {
        logger().error("{} {} failed unexpectedly: {}", request.method, request.path, e.what());
        return error_response(500, "Internal server error");
    }
}

auto Service::submit(HttpRequest request) -> std::future<HttpResponse> {
    return workers_.submit([this, request = std::move(request)]() { return handle(request); });
}

}  // namespace diff_server
