#pragma once

#include "core/error.hpp"
#include "db/connection_config.hpp"
#include "db/imongo_client.hpp"
#include "db/mongoc_client.hpp"
#include "tls/tls_policy.hpp"

#include <memory>
#include <optional>
#include <string>

namespace mongoacl {

/**
 * @brief Which credential branch produced a client (first match wins)
 */
enum class ClientBranch {
    INLINE_CREDENTIALS,     // cert/key PEM blobs in config
    CERTIFICATE_DIRECTORY,  // ca.pem/cert.pem/key.pem from cert_path
    CA_ONLY,                // no client certificate, CA pool only
    PLAIN                   // no TLS policy at all
};

[[nodiscard]] const char* client_branch_name(ClientBranch branch);

/**
 * @brief Everything needed to construct a client, derived without I/O
 * except reading the certificate directory
 */
struct ClientPlan {
    ClientBranch branch = ClientBranch::PLAIN;
    std::string uri;
    ClientCredentials credentials;
    std::optional<TlsPolicy> tls;
};

/**
 * @brief Select the branch and build the TLS policy for a config
 *
 * Fails with CONFIG_ERROR on unreadable or malformed PEM material.
 */
[[nodiscard]] Result<ClientPlan> plan_client(const ConnectionConfig& config);

/**
 * @brief Single entry point for obtaining a client handle
 *
 * No network round trip happens here; errors are limited to local
 * configuration and PEM parsing.
 */
[[nodiscard]] Result<std::unique_ptr<IMongoClient>> build_client(const ConnectionConfig& config);

/**
 * @brief Validate raw settings, then build_client()
 */
[[nodiscard]] Result<std::unique_ptr<IMongoClient>> build_client(const ConnectionSettings& settings);

} // namespace mongoacl
