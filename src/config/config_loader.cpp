#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "tls/credential_source.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace mongoacl {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Port may be written as "27017" or 27017
std::string toml_port(const toml::table& tbl, const std::string_view key, std::string fallback) {
    const auto node = tbl[key];
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* i = node.as_integer()) return std::to_string(i->get());
    return fallback;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ConnectionSettings ConfigLoader::extract_connection(const toml::table& root) {
    ConnectionSettings cfg;
    const auto* conn = root["connection"].as_table();
    if (!conn) return cfg;
    const auto& c = *conn;

    cfg.host = c["host"].value_or(cfg.host);
    cfg.port = toml_port(c, "port", cfg.port);
    cfg.database = c["database"].value_or(cfg.database);
    cfg.username = c["username"].value_or(""s);
    cfg.password = c["password"].value_or(""s);
    cfg.ssl = c["ssl"].value_or(false);
    cfg.insecure_skip_verify = c["insecure_skip_verify"].value_or(false);
    cfg.replica_set = c["replica_set"].value_or(""s);
    if (const auto* retry = c["retry_writes"].as_boolean()) {
        cfg.retry_writes = retry->get();
    }

    cfg.ca_material = c["ca_material"].value_or(""s);
    cfg.cert_material = c["cert_material"].value_or(""s);
    cfg.key_material = c["key_material"].value_or(""s);
    cfg.cert_path = c["cert_path"].value_or(""s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or(cfg.level);
    }
    return cfg;
}

OperationConfig ConfigLoader::extract_operation(const toml::table& root) {
    OperationConfig cfg;
    if (const auto* op = root["operation"].as_table()) {
        cfg.timeout = std::chrono::milliseconds(
            (*op)["timeout_ms"].value_or(static_cast<int64_t>(cfg.timeout.count())));
    }
    return cfg;
}

std::vector<RoleDefinition> ConfigLoader::extract_roles(const toml::table& root) {
    std::vector<RoleDefinition> roles;
    const auto* arr = root["roles"].as_array();
    if (!arr) return roles;

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& r = *tbl;

        RoleDefinition def;
        def.name = r["name"].value_or(""s);
        def.database = r["database"].value_or(std::string(kDefaultRoleDatabase));

        if (const auto* privs = r["privileges"].as_array()) {
            for (const auto& p : *privs) {
                const auto* pt = p.as_table();
                if (!pt) continue;
                Privilege privilege;
                privilege.resource.db = (*pt)["db"].value_or(""s);
                privilege.resource.collection = (*pt)["collection"].value_or(""s);
                privilege.actions = toml_string_array(*pt, "actions");
                def.privileges.push_back(std::move(privilege));
            }
        }

        if (const auto* parents = r["inherited_roles"].as_array()) {
            for (const auto& p : *parents) {
                const auto* pt = p.as_table();
                if (!pt) continue;
                def.inherited_roles.push_back({
                    (*pt)["role"].value_or(""s),
                    (*pt)["db"].value_or(""s)});
            }
        }

        roles.push_back(std::move(def));
    }
    return roles;
}

// ---- Shared extraction + validation ----------------------------------------

AppConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AppConfig config;
    config.connection = extract_connection(tbl);
    config.logging = extract_logging(tbl);
    config.operation = extract_operation(tbl);
    config.roles = extract_roles(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;
    const auto& conn = config.connection;

    if (conn.host.empty()) {
        errors.push_back("connection.host must not be empty");
    }
    const auto port = utils::try_parse_int<int>(conn.port);
    if (!port || *port < 1 || *port > 65535) {
        errors.push_back(std::format("connection.port must be 1-65535, got '{}'", conn.port));
    }

    if (const auto source = resolve_credential_source(conn); source.is_error()) {
        errors.push_back("connection." + source.error_message());
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'",
            config.logging.level));
    }

    if (config.operation.timeout.count() <= 0) {
        errors.push_back("operation.timeout_ms must be > 0");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.roles.size(); ++i) {
        const auto& role = config.roles[i];
        if (role.name.empty()) {
            errors.push_back(std::format("roles[{}].name must not be empty", i));
            continue;
        }
        if (!seen.insert(role.database + "." + role.name).second) {
            errors.push_back(std::format("roles[{}].name '{}' is declared twice in database '{}'",
                i, role.name, role.database));
        }
        if (role.database.find('.') != std::string::npos) {
            errors.push_back(std::format("roles[{}].database '{}' must not contain '.'",
                i, role.database));
        }
        if (role.privileges.size() > kMaxPrivileges) {
            errors.push_back(std::format("roles[{}].privileges allows at most {} entries",
                i, kMaxPrivileges));
        }
        if (role.inherited_roles.size() > kMaxInheritedRoles) {
            errors.push_back(std::format("roles[{}].inherited_roles allows at most {} entries",
                i, kMaxInheritedRoles));
        }
        for (const auto& parent : role.inherited_roles) {
            if (parent.role.empty()) {
                errors.push_back(std::format("roles[{}].inherited_roles.role must not be empty", i));
            }
        }
    }

    return errors;
}

} // namespace mongoacl
