#include <diff-server/pull.hpp>
#include <diff-server/error.hpp>

namespace diff_server {

namespace {

auto parse_body(std::string_view body) -> nlohmann::json {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw Exception{ErrorKind::bad_request, "Bad request payload: malformed JSON"};
    }
    if (!j.is_object()) {
        throw Exception{ErrorKind::bad_request, "Bad request payload: expected a JSON object"};
    }
    return j;
}

// Missing and null both read as absent.
auto optional_string(const nlohmann::json& j, const char* field) -> std::optional<std::string> {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw Exception{ErrorKind::bad_request,
                        std::string{"Bad request payload: "} + field + " must be a string"};
    }
    return it->get<std::string>();
}

}  // anonymous namespace

auto parse_pull_request(std::string_view body) -> PullRequest {
    auto j = parse_body(body);
    auto request = PullRequest{};
    request.account_id = optional_string(j, "accountID").value_or("");
    request.client_id = optional_string(j, "clientID").value_or("");
    request.base_state_id = optional_string(j, "baseStateID");
    request.checksum = optional_string(j, "checksum");
    return request;
}

auto parse_inject_request(std::string_view body) -> InjectRequest {
    auto j = parse_body(body);
    auto request = InjectRequest{};
    request.account_id = optional_string(j, "accountID").value_or("");
    request.client_id = optional_string(j, "clientID").value_or("");

    auto cvr = j.find("clientViewResponse");
    if (cvr == j.end()) {
        throw Exception{ErrorKind::bad_request, "Bad request payload: missing clientViewResponse"};
    }
    try {
        request.client_view_response = client_view_response_from_json(*cvr);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::bad_request, std::string{"Bad request payload: "} + e.what()};
    }
    return request;
}

auto validate_base_state_id(const std::optional<std::string>& value) -> std::optional<Hash> {
    if (!value || value->empty()) return std::nullopt;
    auto id = Hash::parse(*value);
    if (!id) {
        throw Exception{ErrorKind::bad_request, "Invalid baseStateID: " + *value};
    }
    return id;
}

auto validate_checksum(const std::optional<std::string>& value) -> std::optional<Checksum> {
    if (!value) return std::nullopt;
    auto checksum = Checksum::parse(*value);
    if (!checksum) {
        throw Exception{ErrorKind::bad_request, "Invalid checksum: " + *value};
    }
    return checksum;
}

void to_json(nlohmann::json& j, const PullRequest& request) {
    j = nlohmann::json{
        {"accountID", request.account_id},
        {"clientID", request.client_id},
    };
    if (request.base_state_id) j["baseStateID"] = *request.base_state_id;
    if (request.checksum) j["checksum"] = *request.checksum;
}

void to_json(nlohmann::json& j, const PullResponse& response) {
    j = nlohmann::json{
        {"stateID", response.state_id},
        {"lastMutationID", response.last_mutation_id},
        {"patch", response.patch},
        {"checksum", response.checksum.to_string()},
    };
}

void from_json(const nlohmann::json& j, PullResponse& response) {
    response.state_id = j.at("stateID").get<std::string>();
    response.last_mutation_id = j.at("lastMutationID").get<std::uint64_t>();
    response.patch = j.at("patch").get<Patch>();
    auto checksum = Checksum::parse(j.at("checksum").get<std::string>());
    if (!checksum) {
        throw Exception{ErrorKind::bad_request, "pull response has a malformed checksum"};
    }
    response.checksum = *checksum;
}

}  // namespace diff_server
