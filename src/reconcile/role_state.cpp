#include "reconcile/role_state.hpp"

#include <format>

namespace mongoacl {

Status validate_role_definition(const RoleDefinition& def) {
    if (def.name.empty()) {
        return Status::error(ErrorCategory::CONFIG_ERROR, "name: required");
    }
    if (def.database.empty()) {
        return Status::error(ErrorCategory::CONFIG_ERROR,
            std::format("role '{}': database must not be empty", def.name));
    }
    if (def.database.find('.') != std::string::npos) {
        return Status::error(ErrorCategory::CONFIG_ERROR,
            std::format("role '{}': database '{}' must not contain '.'", def.name, def.database));
    }
    if (def.privileges.size() > kMaxPrivileges) {
        return Status::error(ErrorCategory::CONFIG_ERROR,
            std::format("role '{}': privilege allows at most {} entries, got {}",
                def.name, kMaxPrivileges, def.privileges.size()));
    }
    if (def.inherited_roles.size() > kMaxInheritedRoles) {
        return Status::error(ErrorCategory::CONFIG_ERROR,
            std::format("role '{}': inherited_role allows at most {} entries, got {}",
                def.name, kMaxInheritedRoles, def.inherited_roles.size()));
    }
    for (const auto& parent : def.inherited_roles) {
        if (parent.role.empty()) {
            return Status::error(ErrorCategory::CONFIG_ERROR,
                std::format("role '{}': inherited_role.role is required", def.name));
        }
    }
    return Status::ok();
}

nlohmann::json to_json(const RoleState& state) {
    nlohmann::json privileges = nlohmann::json::array();
    for (const auto& p : state.privileges) {
        privileges.push_back({
            {"db", p.resource.db},
            {"collection", p.resource.collection},
            {"actions", p.actions},
        });
    }

    nlohmann::json inherited = nlohmann::json::array();
    for (const auto& r : state.inherited_roles) {
        inherited.push_back({{"db", r.db}, {"role", r.role}});
    }

    return {
        {"id", state.id},
        {"database", state.database},
        {"name", state.name},
        {"privilege", std::move(privileges)},
        {"inherited_role", std::move(inherited)},
    };
}

} // namespace mongoacl
