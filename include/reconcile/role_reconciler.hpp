#pragma once

#include "core/error.hpp"
#include "core/operation_context.hpp"
#include "db/imongo_client.hpp"
#include "reconcile/role_state.hpp"

namespace mongoacl {

/**
 * @brief Drives the server toward a declared role definition
 *
 * The server has no partial "update role" command, so update is modelled as
 * two explicit phases: delete_phase() removes the role document, then
 * create() recreates it from the new definition. The pair is NOT atomic: if
 * the delete succeeds and the create fails the role is absent until the
 * caller retries the whole update. Concurrent reconciles of one identity
 * must be serialized by the caller.
 *
 * Nothing is retried here. Identity decode failures are FORMAT_ERROR (the
 * persisted token is corrupt); server failures keep their category and gain
 * a short prefix.
 *
 * The client is borrowed for the reconciler's lifetime; the caller owns it.
 */
class RoleReconciler {
public:
    explicit RoleReconciler(IMongoClient& client) : client_(client) {}

    /**
     * @brief createRole, assign the identity token, then read back
     */
    [[nodiscard]] Status create(const OperationContext& ctx, RoleState& state);

    /**
     * @brief Refresh observed fields from the server
     *
     * NOT_FOUND ("Role does not exist") when the server reports zero roles;
     * a vanished role is never recreated here. state.id is left unchanged.
     */
    [[nodiscard]] Status read(const OperationContext& ctx, RoleState& state);

    /**
     * @brief delete_phase() followed by create()
     *
     * The declared definition is validated before anything is deleted. The
     * resulting token equals the old one when database and name are unchanged.
     */
    [[nodiscard]] Status update(const OperationContext& ctx, RoleState& state);

    /**
     * @brief Delete the role document, then confirm it is gone
     *
     * NOT_FOUND on read-back is the expected outcome and clears state.id.
     */
    [[nodiscard]] Status remove(const OperationContext& ctx, RoleState& state);

    /**
     * @brief First half of update(): delete the role named by state.id
     */
    [[nodiscard]] Status delete_phase(const OperationContext& ctx, const RoleState& state);

private:
    IMongoClient& client_;
};

} // namespace mongoacl
