#pragma once

#include "db/imongo_client.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mongoacl::testing {

/**
 * @brief In-memory IMongoClient: records every call and keeps a role store
 *
 * Understands createRole, createUser and rolesInfo, plus delete_one on
 * admin.system.roles. Role documents are keyed by "<db>.<role>" like the
 * server's _id.
 */
class MockMongoClient : public IMongoClient {
public:
    struct Call {
        std::string kind;       // "command" or "delete"
        std::string database;
        std::string collection; // delete only
        Document document;      // command or filter
    };

    Result<Document> run_command(const std::string& database, const Document& command,
                                 const OperationContext& ctx) override {
        auto guard = ctx.check("command");
        if (guard.is_error()) return Result<Document>::error_from(guard);

        calls_.push_back({"command", database, {}, command});
        const std::string name = command.begin().key();

        if (const auto it = failures_.find(name); it != failures_.end()) {
            const std::string message = it->second;
            failures_.erase(it);
            return Result<Document>::error(ErrorCategory::SERVER_ERROR, message);
        }

        if (name == "createRole") {
            const std::string id = database + "." + command["createRole"].get<std::string>();
            if (roles_.contains(id)) {
                return Result<Document>::error(ErrorCategory::SERVER_ERROR,
                    "Role \"" + id + "\" already exists");
            }
            Document doc = Document::object();
            doc["_id"] = id;
            doc["role"] = command["createRole"];
            doc["db"] = database;
            doc["privileges"] = command["privileges"];
            doc["roles"] = command["roles"];
            roles_[id] = std::move(doc);
            return Result<Document>::ok({{"ok", 1}});
        }

        if (name == "rolesInfo") {
            const auto& target = command["rolesInfo"];
            const std::string id = target["db"].get<std::string>() + "." +
                                   target["role"].get<std::string>();
            Document reply = Document::object();
            reply["roles"] = Document::array();
            if (const auto it = roles_.find(id); it != roles_.end()) {
                reply["roles"].push_back(it->second);
            }
            reply["ok"] = 1;
            return Result<Document>::ok(std::move(reply));
        }

        return Result<Document>::ok({{"ok", 1}});
    }

    Result<int64_t> delete_one(const std::string& database, const std::string& collection,
                               const Document& filter, const OperationContext& ctx) override {
        auto guard = ctx.check("delete");
        if (guard.is_error()) return Result<int64_t>::error_from(guard);

        calls_.push_back({"delete", database, collection, filter});

        if (delete_failure_) {
            const std::string message = *delete_failure_;
            delete_failure_.reset();
            return Result<int64_t>::error(ErrorCategory::SERVER_ERROR, message);
        }
        if (database != "admin" || collection != "system.roles") {
            return Result<int64_t>::ok(0);
        }
        return Result<int64_t>::ok(
            static_cast<int64_t>(roles_.erase(filter["_id"].get<std::string>())));
    }

    // ---- Test controls ------------------------------------------------------

    /// Next command named `command` fails with `message`
    void fail_next(const std::string& command, const std::string& message) {
        failures_[command] = message;
    }

    void fail_next_delete(const std::string& message) { delete_failure_ = message; }

    /// Remove a role behind the reconciler's back
    void drop_role(const std::string& id) { roles_.erase(id); }

    [[nodiscard]] bool has_role(const std::string& id) const { return roles_.contains(id); }

    [[nodiscard]] const std::vector<Call>& calls() const { return calls_; }

    [[nodiscard]] std::vector<Call> calls_named(const std::string& command) const {
        std::vector<Call> out;
        for (const auto& c : calls_) {
            if (c.kind == "command" && c.document.begin().key() == command) out.push_back(c);
        }
        return out;
    }

    [[nodiscard]] std::vector<Call> deletes() const {
        std::vector<Call> out;
        for (const auto& c : calls_) {
            if (c.kind == "delete") out.push_back(c);
        }
        return out;
    }

    void clear_calls() { calls_.clear(); }

private:
    std::map<std::string, Document> roles_;
    std::map<std::string, std::string> failures_;
    std::optional<std::string> delete_failure_;
    std::vector<Call> calls_;
};

} // namespace mongoacl::testing
