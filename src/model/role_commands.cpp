#include "model/role_commands.hpp"

#include <format>

namespace mongoacl {

namespace {

// Replies with ok:0 that slipped through as success
Status check_reply(const Document& reply) {
    const auto ok = reply.find("ok");
    if (ok != reply.end() && ok->is_number() && ok->get<double>() == 0.0) {
        return Status::error(ErrorCategory::SERVER_ERROR,
            reply.value("errmsg", std::string("command failed")));
    }
    return Status::ok();
}

Document privileges_array(const std::vector<Privilege>& privileges) {
    Document arr = Document::array();
    for (const auto& p : privileges) {
        arr.push_back(to_document(p));
    }
    return arr;
}

Document roles_array(const std::vector<InheritedRole>& roles) {
    Document arr = Document::array();
    for (const auto& r : roles) {
        arr.push_back(to_document(r));
    }
    return arr;
}

std::string string_field(const Document& doc, const char* key) {
    const auto it = doc.find(key);
    return (it != doc.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

} // anonymous namespace

// ============================================================================
// Wire encoding
// ============================================================================

Document to_document(const Privilege& privilege) {
    Document resource = Document::object();
    resource["db"] = privilege.resource.db;
    resource["collection"] = privilege.resource.collection;

    Document doc = Document::object();
    doc["resource"] = std::move(resource);
    doc["actions"] = privilege.actions;
    return doc;
}

Document to_document(const InheritedRole& role) {
    Document doc = Document::object();
    doc["role"] = role.role;
    doc["db"] = role.db;
    return doc;
}

// ============================================================================
// Command construction
// ============================================================================

Document make_create_user_command(const DbUser& user, const std::vector<InheritedRole>& roles) {
    Document cmd = Document::object();
    cmd["createUser"] = user.name;
    cmd["pwd"] = user.password;
    if (!roles.empty()) {
        cmd["roles"] = roles_array(roles);
    } else {
        // "no roles" must be sent explicitly; omitting the field is not equivalent
        cmd["roles"] = Document::array();
    }
    return cmd;
}

Document make_create_role_command(const std::string& role,
                                  const std::vector<InheritedRole>& roles,
                                  const std::vector<Privilege>& privileges) {
    Document cmd = Document::object();
    cmd["createRole"] = role;

    if (!roles.empty() && !privileges.empty()) {
        cmd["privileges"] = privileges_array(privileges);
        cmd["roles"] = roles_array(roles);
    } else if (roles.empty() && !privileges.empty()) {
        cmd["privileges"] = privileges_array(privileges);
        cmd["roles"] = Document::array();
    } else if (!roles.empty() && privileges.empty()) {
        cmd["privileges"] = Document::array();
        cmd["roles"] = roles_array(roles);
    } else {
        cmd["privileges"] = Document::array();
        cmd["roles"] = Document::array();
    }
    return cmd;
}

Document make_roles_info_command(const std::string& role, const std::string& database) {
    Document target = Document::object();
    target["role"] = role;
    target["db"] = database;

    Document cmd = Document::object();
    cmd["rolesInfo"] = std::move(target);
    cmd["showPrivileges"] = true;
    return cmd;
}

// ============================================================================
// Command execution
// ============================================================================

Status create_user(IMongoClient& client, const OperationContext& ctx,
                   const DbUser& user, const std::vector<InheritedRole>& roles,
                   const std::string& database) {
    auto reply = client.run_command(database, make_create_user_command(user, roles), ctx);
    if (reply.is_error()) return Status::error_from(reply);
    return check_reply(reply.value());
}

Status create_role(IMongoClient& client, const OperationContext& ctx,
                   const std::string& role,
                   const std::vector<InheritedRole>& roles,
                   const std::vector<Privilege>& privileges,
                   const std::string& database) {
    auto reply = client.run_command(database, make_create_role_command(role, roles, privileges), ctx);
    if (reply.is_error()) return Status::error_from(reply);
    return check_reply(reply.value());
}

Result<ServerRoleView> parse_role_view(const Document& entry) {
    using R = Result<ServerRoleView>;
    if (!entry.is_object()) {
        return R::error(ErrorCategory::SERVER_ERROR, "rolesInfo: role entry is not a document");
    }

    ServerRoleView view;
    view.role = string_field(entry, "role");
    view.db = string_field(entry, "db");

    if (const auto privs = entry.find("privileges"); privs != entry.end() && privs->is_array()) {
        for (const auto& p : *privs) {
            Privilege privilege;
            if (const auto res = p.find("resource"); res != p.end() && res->is_object()) {
                privilege.resource.db = string_field(*res, "db");
                privilege.resource.collection = string_field(*res, "collection");
            }
            if (const auto actions = p.find("actions"); actions != p.end() && actions->is_array()) {
                for (const auto& a : *actions) {
                    if (a.is_string()) privilege.actions.push_back(a.get<std::string>());
                }
            }
            view.privileges.push_back(std::move(privilege));
        }
    }

    // Direct parents only ("roles"); "inheritedRoles" is the transitive closure
    if (const auto roles = entry.find("roles"); roles != entry.end() && roles->is_array()) {
        for (const auto& r : *roles) {
            view.inherited_roles.push_back({string_field(r, "role"), string_field(r, "db")});
        }
    }

    return R::ok(std::move(view));
}

Result<std::vector<ServerRoleView>> get_role(IMongoClient& client, const OperationContext& ctx,
                                             const std::string& role, const std::string& database) {
    using R = Result<std::vector<ServerRoleView>>;

    auto reply = client.run_command(database, make_roles_info_command(role, database), ctx);
    if (reply.is_error()) return R::error_from(reply);
    auto status = check_reply(reply.value());
    if (status.is_error()) return R::error_from(status);

    std::vector<ServerRoleView> views;
    const auto& doc = reply.value();
    const auto roles = doc.find("roles");
    if (roles == doc.end() || !roles->is_array()) {
        return R::error(ErrorCategory::SERVER_ERROR, "rolesInfo: reply has no roles array");
    }
    for (const auto& entry : *roles) {
        auto view = parse_role_view(entry);
        if (view.is_error()) return R::error_from(view);
        views.push_back(std::move(view.value()));
    }
    return R::ok(std::move(views));
}

Result<int64_t> delete_role_document(IMongoClient& client, const OperationContext& ctx,
                                     const std::string& role_id) {
    Document filter = Document::object();
    filter["_id"] = role_id;
    return client.delete_one(kAdminDatabase, kSystemRolesCollection, filter, ctx);
}

} // namespace mongoacl
