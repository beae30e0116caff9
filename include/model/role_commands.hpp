#pragma once

#include "core/error.hpp"
#include "core/operation_context.hpp"
#include "db/imongo_client.hpp"
#include "model/role_types.hpp"

#include <string>
#include <vector>

namespace mongoacl {

// Server-side role storage
inline constexpr const char* kAdminDatabase = "admin";
inline constexpr const char* kSystemRolesCollection = "system.roles";

// ============================================================================
// Wire encoding
// ============================================================================

[[nodiscard]] Document to_document(const Privilege& privilege);
[[nodiscard]] Document to_document(const InheritedRole& role);

// ============================================================================
// Command construction
// ============================================================================

/**
 * @brief {createUser, pwd, roles}; roles is always an explicit array
 */
[[nodiscard]] Document make_create_user_command(const DbUser& user,
                                                const std::vector<InheritedRole>& roles);

/**
 * @brief {createRole, privileges, roles}
 *
 * The server requires both arrays. Each of the four combinations of
 * (roles empty/non-empty) x (privileges empty/non-empty) emits an explicit,
 * possibly empty, array for both fields.
 */
[[nodiscard]] Document make_create_role_command(const std::string& role,
                                                const std::vector<InheritedRole>& roles,
                                                const std::vector<Privilege>& privileges);

/**
 * @brief {rolesInfo: {role, db}, showPrivileges: true}
 */
[[nodiscard]] Document make_roles_info_command(const std::string& role, const std::string& database);

// ============================================================================
// Command execution (server errors are returned unchanged)
// ============================================================================

[[nodiscard]] Status create_user(IMongoClient& client, const OperationContext& ctx,
                                 const DbUser& user, const std::vector<InheritedRole>& roles,
                                 const std::string& database);

[[nodiscard]] Status create_role(IMongoClient& client, const OperationContext& ctx,
                                 const std::string& role,
                                 const std::vector<InheritedRole>& roles,
                                 const std::vector<Privilege>& privileges,
                                 const std::string& database);

/**
 * @brief Roles matching (role, database) as reported by rolesInfo
 *
 * An empty vector means the role does not exist; callers decide whether
 * that is an error.
 */
[[nodiscard]] Result<std::vector<ServerRoleView>> get_role(IMongoClient& client,
                                                           const OperationContext& ctx,
                                                           const std::string& role,
                                                           const std::string& database);

/**
 * @brief Remove a role document from admin.system.roles by its _id
 * @param role_id Raw server identity, "<database>.<role>"
 * @return Number of documents deleted
 */
[[nodiscard]] Result<int64_t> delete_role_document(IMongoClient& client,
                                                   const OperationContext& ctx,
                                                   const std::string& role_id);

/**
 * @brief Parse one entry of a rolesInfo reply
 */
[[nodiscard]] Result<ServerRoleView> parse_role_view(const Document& entry);

} // namespace mongoacl
