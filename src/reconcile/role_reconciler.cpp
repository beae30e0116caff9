#include "reconcile/role_reconciler.hpp"
#include "identity/role_identity.hpp"
#include "model/role_commands.hpp"
#include "core/utils.hpp"

#include <format>

namespace mongoacl {

namespace {

Status with_prefix(const Status& status, std::string_view prefix) {
    return Status::error(status.error_category(),
        std::format("{}: {}", prefix, status.error_message()));
}

} // anonymous namespace

Status RoleReconciler::create(const OperationContext& ctx, RoleState& state) {
    const RoleDefinition def = state.definition();
    auto valid = validate_role_definition(def);
    if (valid.is_error()) return valid;

    // Encode first: a name that cannot round-trip must not reach the server
    auto token = encode_role_id(def.database, def.name);
    if (token.is_error()) return Status::error_from(token);

    utils::log::info(std::format("Role {}.{}: create ({} privileges, {} inherited roles)",
        def.database, def.name, def.privileges.size(), def.inherited_roles.size()));

    auto created = create_role(client_, ctx, def.name, def.inherited_roles,
                               def.privileges, def.database);
    if (created.is_error()) {
        utils::log::error(std::format("Role {}.{}: create failed: {}",
            def.database, def.name, created.error_message()));
        return with_prefix(created, "Could not create the role");
    }

    state.id = std::move(token.value());
    return read(ctx, state);
}

Status RoleReconciler::read(const OperationContext& ctx, RoleState& state) {
    auto identity = decode_role_id(state.id);
    if (identity.is_error()) return Status::error_from(identity);
    const auto& id = identity.value();

    auto roles = get_role(client_, ctx, id.role, id.database);
    if (roles.is_error()) {
        return with_prefix(Status::error_from(roles), "Error reading role");
    }
    if (roles.value().empty()) {
        return Status::error(ErrorCategory::NOT_FOUND,
            std::format("Role does not exist: {}.{}", id.database, id.role));
    }

    auto& view = roles.value().front();
    state.inherited_roles = std::move(view.inherited_roles);
    state.privileges = std::move(view.privileges);
    state.database = id.database;
    state.name = id.role;
    return Status::ok();
}

Status RoleReconciler::update(const OperationContext& ctx, RoleState& state) {
    auto valid = validate_role_definition(state.definition());
    if (valid.is_error()) return valid;
    auto token = encode_role_id(state.database, state.name);
    if (token.is_error()) return Status::error_from(token);

    auto deleted = delete_phase(ctx, state);
    if (deleted.is_error()) return deleted;

    auto created = create(ctx, state);
    if (created.is_error()) {
        utils::log::warn(std::format(
            "Role {}.{}: update deleted the old role but create failed; role is absent until retried",
            state.database, state.name));
    }
    return created;
}

Status RoleReconciler::delete_phase(const OperationContext& ctx, const RoleState& state) {
    auto identity = decode_role_id(state.id);
    if (identity.is_error()) return Status::error_from(identity);
    const std::string server_id = identity.value().server_id();

    utils::log::info(std::format("Role {}: delete", server_id));

    auto deleted = delete_role_document(client_, ctx, server_id);
    if (deleted.is_error()) {
        utils::log::error(std::format("Role {}: delete failed: {}",
            server_id, deleted.error_message()));
        return with_prefix(Status::error_from(deleted), "Could not delete the role");
    }
    if (deleted.value() == 0) {
        utils::log::warn(std::format("Role {}: no role document to delete", server_id));
    }
    return Status::ok();
}

Status RoleReconciler::remove(const OperationContext& ctx, RoleState& state) {
    auto deleted = delete_phase(ctx, state);
    if (deleted.is_error()) return deleted;

    auto after = read(ctx, state);
    if (after.is_ok()) {
        return Status::error(ErrorCategory::SERVER_ERROR,
            std::format("Role {}.{} still exists after delete", state.database, state.name));
    }
    if (after.error_category() != ErrorCategory::NOT_FOUND) {
        return after;
    }
    state.id.clear();
    return Status::ok();
}

} // namespace mongoacl
