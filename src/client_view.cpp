#include <diff-server/client_view.hpp>
#include <diff-server/error.hpp>
#include <diff-server/log.hpp>

#include <nlohmann/json.hpp>

namespace diff_server {

auto to_json_body(const ClientViewRequest& request) -> std::string {
    return nlohmann::json{{"clientID", request.client_id}}.dump();
}

auto client_view_response_from_json(const nlohmann::json& j) -> ClientViewResponse {
    if (!j.is_object()) {
        throw Exception{ErrorKind::upstream_fetch_failure, "client view response must be a JSON object"};
    }
    auto lmid = j.find("lastMutationID");
    if (lmid == j.end()) {
        throw Exception{ErrorKind::upstream_fetch_failure, "client view response is missing lastMutationID"};
    }
    if (!lmid->is_number_unsigned()) {
        throw Exception{ErrorKind::upstream_fetch_failure,
                        "client view response has a non-integer lastMutationID"};
    }
    auto view = j.find("clientView");
    if (view == j.end()) {
        throw Exception{ErrorKind::upstream_fetch_failure, "client view response is missing clientView"};
    }

    auto response = ClientViewResponse{};
    try {
        response.client_view = Snapshot::from_json(*view);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::upstream_fetch_failure, e.what()};
    }
    response.last_mutation_id = lmid->get<std::uint64_t>();
    return response;
}

auto parse_client_view_response(std::string_view body) -> ClientViewResponse {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::upstream_fetch_failure, "client view response is not valid JSON"};
    }
    return client_view_response_from_json(j);
}

HttpClientViewGetter::HttpClientViewGetter(Transport transport)
    : transport_{std::move(transport)} {}

auto HttpClientViewGetter::get(const Account& account,
                               const ClientViewRequest& request,
                               std::string_view auth_token) -> ClientViewResponse {
    if (account.client_view_url.empty()) {
        throw Exception{ErrorKind::upstream_fetch_failure,
                        "account " + account.id + " has no client view URL"};
    }

    auto outgoing = HttpRequest{};
    outgoing.method = "POST";
    outgoing.path = account.client_view_url;
    outgoing.headers.emplace("Content-Type", "application/json");
    if (!auth_token.empty()) {
        outgoing.headers.emplace("Authorization", std::string{auth_token});
    }
    outgoing.body = to_json_body(request);

    logger().debug("fetching client view of {} from {}", request.client_id, account.client_view_url);

    auto response = HttpResponse{};
    try {
        response = transport_(outgoing, account.client_view_timeout);
    } catch (const std::exception& e) {
        throw Exception{ErrorKind::upstream_fetch_failure,
                        "client view fetch from " + account.client_view_url + " failed: " + e.what()};
    }
    if (response.status != 200) {
        throw Exception{ErrorKind::upstream_fetch_failure,
                        "client view fetch from " + account.client_view_url +
                        " returned status " + std::to_string(response.status)};
    }
    return parse_client_view_response(response.body);
}

}  // namespace diff_server
