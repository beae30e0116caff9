#pragma once

#include <string>
#include <vector>

namespace mongoacl {

inline constexpr const char* kDefaultRoleDatabase = "admin";

// Declared-state limits accepted by the host
inline constexpr size_t kMaxPrivileges = 10;
inline constexpr size_t kMaxInheritedRoles = 2;

struct Resource {
    std::string db;
    std::string collection;

    bool operator==(const Resource&) const = default;
};

/**
 * @brief Grant of a set of actions over a resource (database + collection)
 */
struct Privilege {
    Resource resource;
    std::vector<std::string> actions;

    bool operator==(const Privilege&) const = default;
};

/**
 * @brief Reference to another role whose privileges are granted transitively
 */
struct InheritedRole {
    std::string role;
    std::string db;

    bool operator==(const InheritedRole&) const = default;
};

/**
 * @brief Desired role: consumed once per reconcile cycle
 */
struct RoleDefinition {
    std::string name;
    std::string database = kDefaultRoleDatabase;
    std::vector<Privilege> privileges;
    std::vector<InheritedRole> inherited_roles;

    bool operator==(const RoleDefinition&) const = default;
};

/**
 * @brief A role as reported back by the server (rolesInfo)
 */
struct ServerRoleView {
    std::string role;
    std::string db;
    std::vector<Privilege> privileges;
    std::vector<InheritedRole> inherited_roles;
};

struct DbUser {
    std::string name;
    std::string password;
};

} // namespace mongoacl
