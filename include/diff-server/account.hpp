/// @file account.hpp
/// @brief Accounts and the registry that resolves account IDs.

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace diff_server {

/// An account whose clients sync through this server.
struct Account {
    std::string id;               ///< The accountID clients send.
    std::string name;             ///< Human-readable name, for logs.
    std::string client_view_url;  ///< Where the account's backend serves client views.
    std::chrono::milliseconds client_view_timeout{5000};  ///< Bound on a client view fetch.

    auto operator==(const Account&) const -> bool = default;
};

/// Immutable lookup from account ID to Account.
class AccountRegistry {
public:
    AccountRegistry() = default;

    /// Build from a list. A later duplicate ID replaces an earlier one.
    explicit AccountRegistry(std::vector<Account> accounts);

    /// The account with this ID, or nullptr.
    auto find(std::string_view id) const -> const Account*;

    auto size() const -> std::size_t { return accounts_.size(); }

private:
    std::map<std::string, Account, std::less<>> accounts_;
};

}  // namespace diff_server
