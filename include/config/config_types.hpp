#pragma once

#include "model/role_types.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace mongoacl {

// ============================================================================
// Configuration Types
// ============================================================================

/**
 * @brief Connection settings exactly as declared
 *
 * Credential fields are flat here; resolve_credential_source() turns them
 * into a single CredentialSource and rejects conflicting combinations.
 */
struct ConnectionSettings {
    std::string host = "127.0.0.1";
    std::string port = "27017";
    std::string database = "admin";     // Authentication source
    std::string username;
    std::string password;
    bool ssl = false;
    bool insecure_skip_verify = false;
    std::string replica_set;
    std::optional<bool> retry_writes;   // unset / false / true

    // TLS material: inline PEM blobs or a directory with ca.pem/cert.pem/key.pem
    std::string ca_material;
    std::string cert_material;
    std::string key_material;
    std::string cert_path;
};

struct LoggingConfig {
    std::string level = "info";
};

struct OperationConfig {
    std::chrono::milliseconds timeout{30000};
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    ConnectionSettings connection;
    LoggingConfig logging;
    OperationConfig operation;
    std::vector<RoleDefinition> roles;
};

} // namespace mongoacl
