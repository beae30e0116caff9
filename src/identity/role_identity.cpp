#include "identity/role_identity.hpp"
#include "core/utils.hpp"

#include <format>

namespace mongoacl {

Result<std::string> encode_role_id(std::string_view database, std::string_view role) {
    using R = Result<std::string>;
    if (database.empty() || role.empty()) {
        return R::error(ErrorCategory::FORMAT_ERROR, "role id: database and role must be non-empty");
    }
    if (database.find('.') != std::string_view::npos) {
        return R::error(ErrorCategory::FORMAT_ERROR,
            std::format("role id: database '{}' must not contain '.'", database));
    }

    std::string raw;
    raw.reserve(database.size() + 1 + role.size());
    raw.append(database);
    raw += '.';
    raw.append(role);
    return R::ok(utils::bytes_to_hex(raw));
}

Result<RoleIdentity> decode_role_id(std::string_view token) {
    using R = Result<RoleIdentity>;

    const auto raw = utils::hex_to_bytes(token);
    if (!raw) {
        return R::error(ErrorCategory::FORMAT_ERROR,
            std::format("unexpected format of ID ({}): not a hex string", token));
    }
    if (!utils::is_valid_utf8(*raw)) {
        return R::error(ErrorCategory::FORMAT_ERROR,
            std::format("unexpected format of ID ({}): not valid UTF-8", token));
    }

    const auto dot = raw->find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == raw->size()) {
        return R::error(ErrorCategory::FORMAT_ERROR,
            std::format("unexpected format of ID ({}), expected database.roleName", token));
    }

    RoleIdentity identity;
    identity.database = raw->substr(0, dot);
    identity.role = raw->substr(dot + 1);
    return R::ok(std::move(identity));
}

} // namespace mongoacl
