#include <diff-server/config.hpp>
#include <diff-server/error.hpp>
#include <diff-server/log.hpp>

#include <fstream>
#include <optional>
#include <sstream>

namespace diff_server {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw Exception{ErrorKind::bad_config, message};
}

// Accepts integers of either signedness; values built in code are signed.
auto non_negative(const nlohmann::json& j) -> std::optional<std::uint64_t> {
    if (j.is_number_unsigned()) return j.get<std::uint64_t>();
    if (j.is_number_integer() && j.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(j.get<std::int64_t>());
    }
    return std::nullopt;
}

auto string_field(const nlohmann::json& j, const char* field, const std::string& context)
    -> std::string {
    auto it = j.find(field);
    if (it == j.end()) fail(context + ": missing " + field);
    if (!it->is_string()) fail(context + ": " + field + " must be a string");
    return it->get<std::string>();
}

auto parse_account(const nlohmann::json& j, std::size_t index) -> Account {
    auto context = "accounts[" + std::to_string(index) + "]";
    if (!j.is_object()) fail(context + " must be an object");

    auto account = Account{};
    account.id = string_field(j, "id", context);
    if (account.id.empty()) fail(context + ": id must not be empty");
    account.name = j.contains("name") ? string_field(j, "name", context) : account.id;
    if (j.contains("clientViewURL")) {
        account.client_view_url = string_field(j, "clientViewURL", context);
    }
    if (auto it = j.find("clientViewTimeoutMs"); it != j.end()) {
        auto ms = non_negative(*it);
        if (!ms || *ms == 0) fail(context + ": clientViewTimeoutMs must be a positive integer");
        account.client_view_timeout = std::chrono::milliseconds{*ms};
    }
    return account;
}

auto parse_store(const nlohmann::json& j) -> StoreConfig {
    if (!j.is_object()) fail("store must be an object");
    auto config = StoreConfig{};
    if (j.contains("type")) {
        auto type = string_field(j, "type", "store");
        if (type == "memory") {
            config.type = StoreType::memory;
        } else if (type == "file") {
            config.type = StoreType::file;
        } else {
            fail("store: unknown type " + type);
        }
    }
    if (j.contains("path")) {
        config.path = string_field(j, "path", "store");
    }
    if (config.type == StoreType::file && config.path.empty()) {
        fail("store: type file requires a path");
    }
    return config;
}

}  // anonymous namespace

auto ServerConfig::from_json(const nlohmann::json& j) -> ServerConfig {
    if (!j.is_object()) fail("configuration must be a JSON object");

    auto config = ServerConfig{};
    if (auto it = j.find("accounts"); it != j.end()) {
        if (!it->is_array()) fail("accounts must be an array");
        for (std::size_t i = 0; i < it->size(); ++i) {
            config.accounts.push_back(parse_account((*it)[i], i));
        }
    }
    if (auto it = j.find("store"); it != j.end()) {
        config.store = parse_store(*it);
    }
    if (auto it = j.find("enableInject"); it != j.end()) {
        if (!it->is_boolean()) fail("enableInject must be a boolean");
        config.enable_inject = it->get<bool>();
    }
    if (auto it = j.find("workerThreads"); it != j.end()) {
        auto threads = non_negative(*it);
        if (!threads || *threads > 1024) fail("workerThreads must be an integer from 0 to 1024");
        config.worker_threads = static_cast<unsigned int>(*threads);
    }
    if (j.contains("logLevel")) {
        auto name = string_field(j, "logLevel", "configuration");
        auto level = parse_log_level(name);
        if (!level) fail("unknown logLevel " + name);
        config.log_level = *level;
    }
    return config;
}

auto ServerConfig::load(const std::filesystem::path& path) -> ServerConfig {
    auto in = std::ifstream{path};
    if (!in) fail("cannot open " + path.string());
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();

    auto j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) fail(path.string() + " is not valid JSON");
    return from_json(j);
}

auto make_store_factory(const StoreConfig& config) -> StoreFactory {
    switch (config.type) {
        case StoreType::memory: return memory_store_factory();
        case StoreType::file:   return file_store_factory(config.path);
    }
    fail("unknown store type");
}

}  // namespace diff_server
