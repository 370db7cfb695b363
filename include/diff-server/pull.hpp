/// @file pull.hpp
/// @brief Wire types of the pull and inject endpoints.

#pragma once

#include <diff-server/client_view.hpp>
#include <diff-server/patch.hpp>
#include <diff-server/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace diff_server {

/// A client's sync request.
///
/// Optional fields keep the difference between "absent" and "present but
/// empty". An absent or empty base_state_id both mean "no prior state". An
/// absent checksum means the client asserts nothing; a present one must be
/// a well-formed checksum, even when empty.
struct PullRequest {
    std::string account_id;
    std::string client_id;
    std::optional<std::string> base_state_id;
    std::optional<std::string> checksum;

    auto operator==(const PullRequest&) const -> bool = default;
};

/// The answer to a pull.
struct PullResponse {
    std::string state_id;  ///< Empty only if the client has no commit at all.
    std::uint64_t last_mutation_id{0};
    Patch patch;
    Checksum checksum;
};

/// A test-fixture request storing a client view directly.
struct InjectRequest {
    std::string account_id;
    std::string client_id;
    ClientViewResponse client_view_response;
};

/// Decode a pull request body. Only the JSON shape is checked here; field
/// contents are checked by validate_base_state_id() and validate_checksum().
/// Throws Exception{bad_request} with "Bad request payload: ..." on
/// malformed JSON or wrongly typed fields.
auto parse_pull_request(std::string_view body) -> PullRequest;

/// Decode an inject request body. Throws Exception{bad_request}.
auto parse_inject_request(std::string_view body) -> InjectRequest;

/// The validated form of a base_state_id: nullopt for absent or empty.
/// Throws Exception{bad_request} "Invalid baseStateID" if malformed.
auto validate_base_state_id(const std::optional<std::string>& value) -> std::optional<Hash>;

/// The validated form of a checksum: nullopt for absent. Throws
/// Exception{bad_request} "Invalid checksum" if present and malformed.
auto validate_checksum(const std::optional<std::string>& value) -> std::optional<Checksum>;

void to_json(nlohmann::json& j, const PullRequest& request);
void to_json(nlohmann::json& j, const PullResponse& response);
void from_json(const nlohmann::json& j, PullResponse& response);

}  // namespace diff_server
