#pragma once

#include "core/error.hpp"
#include "model/role_types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace mongoacl {

/**
 * @brief Host-facing state of one role resource
 *
 * Declared fields going in, observed fields coming back out of read().
 * `id` is the opaque token the host persists; empty before create.
 */
struct RoleState {
    std::string database = kDefaultRoleDatabase;
    std::string name;
    std::vector<Privilege> privileges;
    std::vector<InheritedRole> inherited_roles;
    std::string id;

    [[nodiscard]] RoleDefinition definition() const {
        return {name, database, privileges, inherited_roles};
    }

    [[nodiscard]] static RoleState from_definition(const RoleDefinition& def) {
        return {def.database, def.name, def.privileges, def.inherited_roles, {}};
    }
};

/**
 * @brief Check declared state against the limits the host accepts
 *
 * name required; at most kMaxPrivileges privileges and kMaxInheritedRoles
 * inherited roles; database defaults to "admin" and must not contain '.';
 * every inherited role names a role.
 */
[[nodiscard]] Status validate_role_definition(const RoleDefinition& def);

[[nodiscard]] nlohmann::json to_json(const RoleState& state);

} // namespace mongoacl
