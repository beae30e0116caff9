#pragma once

#include "core/error.hpp"
#include "tls/credential_source.hpp"

#include <openssl/evp.h>
#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

namespace mongoacl {

struct X509Deleter { void operator()(X509* p) const { if (p) X509_free(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); } };

using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;

/**
 * @brief How a credential branch derives server verification
 */
struct TlsPolicyOptions {
    // Directory branch: no client certificate disables verification
    bool skip_verify_without_client_cert = false;
    // Explicit insecure_skip_verify from configuration
    bool insecure_skip_verify = false;
};

/**
 * @brief Resolved trust/identity material for one connection attempt
 *
 * Root CA pool (empty means server verification is disabled) and at most one
 * client certificate/key pair. Built fresh per connection, never persisted.
 * Move-only: owns the parsed OpenSSL objects.
 */
class TlsPolicy {
public:
    /**
     * @brief Parse PEM material into a policy
     *
     * Non-empty CA bytes must contain at least one certificate. A supplied
     * cert/key pair must parse and the key must match the certificate.
     * Any parse failure is a CONFIG_ERROR.
     */
    [[nodiscard]] static Result<TlsPolicy> build(const CredentialMaterial& material,
                                                 const TlsPolicyOptions& options);

    TlsPolicy(TlsPolicy&&) noexcept = default;
    TlsPolicy& operator=(TlsPolicy&&) noexcept = default;
    TlsPolicy(const TlsPolicy&) = delete;
    TlsPolicy& operator=(const TlsPolicy&) = delete;

    [[nodiscard]] size_t root_ca_count() const { return root_cas_.size(); }
    [[nodiscard]] bool has_client_certificate() const { return client_cert_ != nullptr; }
    [[nodiscard]] bool verify_server_certificate() const { return verify_server_; }

    /// Re-encoded PEM of every parsed root CA (empty if none)
    [[nodiscard]] std::string ca_bundle_pem() const;

    /// Re-encoded PEM of client certificate, chain and private key
    [[nodiscard]] std::string client_pem() const;

private:
    TlsPolicy() = default;

    std::vector<X509Ptr> root_cas_;
    X509Ptr client_cert_;
    std::vector<X509Ptr> client_chain_;
    EvpPkeyPtr client_key_;
    bool verify_server_ = true;
};

} // namespace mongoacl
