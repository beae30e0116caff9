#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace mongoacl {

/**
 * @brief A role's identity, decoded from its persisted token
 */
struct RoleIdentity {
    std::string role;
    std::string database;

    /// Server-side _id in admin.system.roles: "<database>.<role>"
    [[nodiscard]] std::string server_id() const { return database + "." + role; }

    bool operator==(const RoleIdentity&) const = default;
};

/**
 * @brief Opaque, URL-safe token for a (database, role) pair
 *
 * Token = lowercase hex of "<database>.<role>". Decoding splits on the first
 * dot, so a database name containing a dot cannot round-trip and is rejected
 * with FORMAT_ERROR. Role names may contain dots. Empty names are rejected.
 *
 * Note the argument order: (database, role).
 */
[[nodiscard]] Result<std::string> encode_role_id(std::string_view database, std::string_view role);

/**
 * @brief Reverse of encode_role_id()
 *
 * FORMAT_ERROR when the token is not valid hex, the decoded text has no
 * dot, or either half is empty.
 */
[[nodiscard]] Result<RoleIdentity> decode_role_id(std::string_view token);

} // namespace mongoacl
