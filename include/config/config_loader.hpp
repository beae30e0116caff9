#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace mongoacl {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * Layout:
 *   [connection]   host, port, database, username, password, ssl,
 *                  insecure_skip_verify, replica_set, retry_writes,
 *                  ca_material, cert_material, key_material, cert_path
 *   [logging]      level
 *   [operation]    timeout_ms
 *   [[roles]]      name, database, [[roles.privileges]], [[roles.inherited_roles]]
 *
 * Every string value may reference ${ENV_VAR}; unset variables expand to "".
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief All validation errors for a config (empty if valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const AppConfig& config);

private:
    static ConnectionSettings extract_connection(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static OperationConfig extract_operation(const toml::table& root);
    static std::vector<RoleDefinition> extract_roles(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AppConfig config);
};

} // namespace mongoacl
