#include "config/config_loader.hpp"
#include "core/operation_context.hpp"
#include "core/utils.hpp"
#include "db/client_factory.hpp"
#include "identity/role_identity.hpp"
#include "reconcile/role_reconciler.hpp"
#include "reconcile/role_state.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <string>

using namespace mongoacl;

// Context of the in-flight operation, cancelled on SIGINT/SIGTERM
std::atomic<OperationContext*> g_operation{nullptr};

void signal_handler(int /*signal*/) {
    if (auto* ctx = g_operation.load()) {
        ctx->cancel();
    }
}

namespace {

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <config.toml> <create|read|update|delete> <role-name> [id-token]\n"
        "\n"
        "  role-name  name of a [[roles]] entry in the config\n"
        "  id-token   persisted identity (defaults to the one derived from the role)\n",
        argv0);
}

const RoleDefinition* find_role(const AppConfig& config, const std::string& name) {
    for (const auto& role : config.roles) {
        if (role.name == name) return &role;
    }
    return nullptr;
}

Status run_operation(RoleReconciler& reconciler, const OperationContext& ctx,
                     const std::string& operation, RoleState& state) {
    if (operation == "create") return reconciler.create(ctx, state);
    if (operation == "read") return reconciler.read(ctx, state);
    if (operation == "update") return reconciler.update(ctx, state);
    if (operation == "delete") return reconciler.remove(ctx, state);
    return Status::error(ErrorCategory::CONFIG_ERROR,
        std::format("unknown operation '{}'", operation));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || argc > 5) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string config_file = argv[1];
    const std::string operation = argv[2];
    const std::string role_name = argv[3];

    const auto loaded = ConfigLoader::load_from_file(config_file);
    if (!loaded.success) {
        utils::log::error(loaded.error_message);
        return 1;
    }
    const AppConfig& config = loaded.config;

    if (const auto level = utils::log::parse_level(config.logging.level)) {
        utils::log::set_level(*level);
    }

    const RoleDefinition* declared = find_role(config, role_name);
    if (!declared) {
        utils::log::error(std::format("Role '{}' is not declared in {}", role_name, config_file));
        return 1;
    }

    RoleState state = RoleState::from_definition(*declared);
    if (operation != "create") {
        if (argc == 5) {
            state.id = argv[4];
        } else {
            auto token = encode_role_id(declared->database, declared->name);
            if (token.is_error()) {
                utils::log::error(token.error_message());
                return 1;
            }
            state.id = std::move(token.value());
        }
    }

    auto client = build_client(config.connection);
    if (client.is_error()) {
        utils::log::error(std::format("Cannot build client: {}", client.error_message()));
        return 1;
    }

    OperationContext ctx(config.operation.timeout);
    g_operation.store(&ctx);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    RoleReconciler reconciler(*client.value());
    const auto status = run_operation(reconciler, ctx, operation, state);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_operation.store(nullptr);

    if (status.is_error()) {
        utils::log::error(std::format("{} {}: [{}] {}", operation, role_name,
            category_name(status.error_category()), status.error_message()));
        return 1;
    }

    std::cout << to_json(state).dump(2) << std::endl;
    return 0;
}
