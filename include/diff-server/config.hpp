/// @file config.hpp
/// @brief Server configuration loaded from JSON.

#pragma once

#include <diff-server/account.hpp>
#include <diff-server/store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace diff_server {

/// Where commit data is kept.
enum class StoreType : std::uint8_t {
    memory,  ///< In process memory; lost on exit.
    file,    ///< Under a directory; one subdirectory per account.
};

struct StoreConfig {
    StoreType type{StoreType::memory};
    std::filesystem::path path;  ///< Root directory, required for StoreType::file.

    auto operator==(const StoreConfig&) const -> bool = default;
};

/// Everything needed to construct a Service.
///
/// @code
/// {
///   "accounts": [{"id": "1", "name": "demo", "clientViewURL": "http://backend/view",
///                 "clientViewTimeoutMs": 5000}],
///   "store": {"type": "file", "path": "/var/lib/diff-server"},
///   "enableInject": false,
///   "workerThreads": 4,
///   "logLevel": "info"
/// }
/// @endcode
struct ServerConfig {
    std::vector<Account> accounts;
    StoreConfig store;
    bool enable_inject{false};
    unsigned int worker_threads{0};  ///< 0 means one per hardware thread.
    spdlog::level::level_enum log_level{spdlog::level::info};

    /// Parse a configuration value. Missing optional fields keep their
    /// defaults. Throws Exception{bad_config} on malformed input.
    static auto from_json(const nlohmann::json& j) -> ServerConfig;

    /// Read and parse a configuration file. Throws Exception{bad_config}.
    static auto load(const std::filesystem::path& path) -> ServerConfig;
};

/// The store factory a StoreConfig describes.
auto make_store_factory(const StoreConfig& config) -> StoreFactory;

}  // namespace diff_server
