#include "access/role_table.hpp"

#include "address.hpp"

#include <algorithm>
#include <cctype>

namespace access {

std::string toString(Role role) {
    switch (role) {
    case Role::Admin:
        return "ADMIN";
    case Role::Manager:
        return "MANAGER";
    }

    return "UNKNOWN";
}

std::optional<Role> roleFromString(const std::string& value) {
    std::string upper = value;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "ADMIN") {
        return Role::Admin;
    }
    if (upper == "MANAGER") {
        return Role::Manager;
    }
    return std::nullopt;
}

bool RoleTable::grant(Role role, const std::string& account) {
    return holders(role).insert(address::normalize(account)).second;
}

bool RoleTable::hasRole(Role role, const std::string& account) const {
    const auto& set = holders(role);
    return set.find(address::normalize(account)) != set.end();
}

std::vector<std::string> RoleTable::members(Role role) const {
    const auto& set = holders(role);
    std::vector<std::string> values(set.begin(), set.end());
    std::sort(values.begin(), values.end());
    return values;
}

std::size_t RoleTable::memberCount(Role role) const {
    return holders(role).size();
}

std::unordered_set<std::string>& RoleTable::holders(Role role) {
    return role == Role::Admin ? admins_ : managers_;
}

const std::unordered_set<std::string>& RoleTable::holders(Role role) const {
    return role == Role::Admin ? admins_ : managers_;
}

} // namespace access
