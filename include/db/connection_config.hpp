#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "tls/credential_source.hpp"

#include <optional>
#include <string>

namespace mongoacl {

/**
 * @brief Validated connection configuration
 *
 * Same scalars as ConnectionSettings, with the credential fields collapsed
 * into exactly one CredentialSource.
 */
struct ConnectionConfig {
    std::string host;
    std::string port;
    std::string database;
    std::string username;
    std::string password;
    bool ssl = false;
    bool insecure_skip_verify = false;
    std::string replica_set;
    std::optional<bool> retry_writes;
    CredentialSource credentials;
};

/**
 * @brief Validate settings and resolve the credential source
 */
[[nodiscard]] Result<ConnectionConfig> make_connection_config(const ConnectionSettings& settings);

} // namespace mongoacl
