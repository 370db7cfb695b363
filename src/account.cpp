#include <diff-server/account.hpp>

namespace diff_server {

AccountRegistry::AccountRegistry(std::vector<Account> accounts) {
    for (auto& account : accounts) {
        auto id = account.id;
        accounts_.insert_or_assign(std::move(id), std::move(account));
    }
}

auto AccountRegistry::find(std::string_view id) const -> const Account* {
    auto it = accounts_.find(id);
    return it == accounts_.end() ? nullptr : &it->second;
}

}  // namespace diff_server
