#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"

#include <string>
#include <variant>

namespace mongoacl {

// ============================================================================
// Credential Sources (exactly one applies per connection)
// ============================================================================

/// No client certificate. A CA bundle may still be configured.
struct NoClientCertificate {
    std::string ca_pem;
};

/// Inline PEM blobs; cert and key are always both present.
struct InlineCredentials {
    std::string ca_pem;
    std::string cert_pem;
    std::string key_pem;
};

/// Directory holding ca.pem, cert.pem and key.pem (any may be missing).
struct CertificateDirectory {
    std::string path;
};

using CredentialSource = std::variant<NoClientCertificate, InlineCredentials, CertificateDirectory>;

/**
 * @brief Raw PEM buffers handed to the TLS policy builder (each possibly empty)
 */
struct CredentialMaterial {
    std::string ca_pem;
    std::string cert_pem;
    std::string key_pem;

    [[nodiscard]] bool has_client_certificate() const {
        return !cert_pem.empty() && !key_pem.empty();
    }
};

inline constexpr const char* kCaFileName = "ca.pem";
inline constexpr const char* kCertFileName = "cert.pem";
inline constexpr const char* kKeyFileName = "key.pem";

/**
 * @brief Pick the single credential source described by flat settings
 *
 * Fails with CONFIG_ERROR when only one of cert/key is given inline, or when
 * inline material and cert_path are both set.
 */
[[nodiscard]] Result<CredentialSource> resolve_credential_source(const ConnectionSettings& settings);

/**
 * @brief Load PEM buffers for a source
 *
 * Directory sources read ca.pem, cert.pem and key.pem; missing files are
 * tolerated and yield empty buffers. A file that exists but cannot be read
 * is a CONFIG_ERROR naming it.
 */
[[nodiscard]] Result<CredentialMaterial> load_credential_material(const CredentialSource& source);

[[nodiscard]] const char* credential_source_name(const CredentialSource& source);

} // namespace mongoacl
