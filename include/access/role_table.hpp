#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace access {

enum class Role {
    Admin,
    Manager
};

[[nodiscard]] std::string toString(Role role);
[[nodiscard]] std::optional<Role> roleFromString(const std::string& value);

// Grants are keyed by normalized address. There is no revoke.
class RoleTable {
public:
    [[nodiscard]] bool grant(Role role, const std::string& account);
    [[nodiscard]] bool hasRole(Role role, const std::string& account) const;

    [[nodiscard]] std::vector<std::string> members(Role role) const;
    [[nodiscard]] std::size_t memberCount(Role role) const;

private:
    std::unordered_set<std::string> admins_;
    std::unordered_set<std::string> managers_;

    [[nodiscard]] std::unordered_set<std::string>& holders(Role role);
    [[nodiscard]] const std::unordered_set<std::string>& holders(Role role) const;
};

} // namespace access
