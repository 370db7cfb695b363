/// @file client_view.hpp
/// @brief Fetching client views from an account's backend.

#pragma once

#include <diff-server/account.hpp>
#include <diff-server/http.hpp>
#include <diff-server/snapshot.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace diff_server {

/// What the server asks the account backend for.
struct ClientViewRequest {
    std::string client_id;

    auto operator==(const ClientViewRequest&) const -> bool = default;
};

/// The backend's answer: the authoritative view and the last mutation of
/// the client it reflects.
struct ClientViewResponse {
    Snapshot client_view;
    std::uint64_t last_mutation_id{0};
};

/// Encode a ClientViewRequest as the JSON body sent to the backend.
auto to_json_body(const ClientViewRequest& request) -> std::string;

/// Decode a backend response body.
///
/// The body must be a JSON object with an object `clientView` and an
/// unsigned integer `lastMutationID`. Throws
/// Exception{upstream_fetch_failure} otherwise.
auto parse_client_view_response(std::string_view body) -> ClientViewResponse;

/// Parse `clientViewResponse` as used by the inject endpoint.
auto client_view_response_from_json(const nlohmann::json& j) -> ClientViewResponse;

/// Source of client views.
///
/// get() throws Exception{upstream_fetch_failure} when no view could be
/// obtained. Implementations must be safe to call from several threads.
class ClientViewGetter {
public:
    virtual ~ClientViewGetter() = default;

    virtual auto get(const Account& account,
                     const ClientViewRequest& request,
                     std::string_view auth_token) -> ClientViewResponse = 0;
};

/// Fetches client views by POSTing to the account's client view URL.
///
/// The auth token, if any, is forwarded verbatim as the Authorization
/// header. The account's timeout is passed to the transport. Transport
/// errors, non-200 statuses and malformed bodies are all fetch failures.
class HttpClientViewGetter final : public ClientViewGetter {
public:
    explicit HttpClientViewGetter(Transport transport);

    auto get(const Account& account,
             const ClientViewRequest& request,
             std::string_view auth_token) -> ClientViewResponse override;

private:
    Transport transport_;
};

}  // namespace diff_server
