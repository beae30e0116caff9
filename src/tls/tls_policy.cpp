#include "tls/tls_policy.hpp"
#include "core/utils.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>

#include <format>

namespace mongoacl {

namespace {

struct BioDeleter { void operator()(BIO* p) const { if (p) BIO_free(p); } };
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string openssl_error_string() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown OpenSSL error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

BioPtr memory_bio(const std::string& pem) {
    return BioPtr(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
}

// Every certificate in a PEM buffer; non-certificate blocks are skipped
std::vector<X509Ptr> read_all_certificates(const std::string& pem) {
    std::vector<X509Ptr> certs;
    auto bio = memory_bio(pem);
    if (!bio) return certs;

    while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)) {
        certs.emplace_back(cert);
    }
    // Reading stops on PEM_R_NO_START_LINE at end of buffer
    ERR_clear_error();
    return certs;
}

void write_certificates(const std::vector<X509Ptr>& certs, BIO* out) {
    for (const auto& cert : certs) {
        PEM_write_bio_X509(out, cert.get());
    }
}

std::string drain_bio(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    return (len > 0 && data) ? std::string(data, static_cast<size_t>(len)) : std::string();
}

} // anonymous namespace

Result<TlsPolicy> TlsPolicy::build(const CredentialMaterial& material,
                                   const TlsPolicyOptions& options) {
    using R = Result<TlsPolicy>;
    TlsPolicy policy;

    if (material.has_client_certificate()) {
        auto certs = read_all_certificates(material.cert_pem);
        if (certs.empty()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                "cert_material: no PEM certificate found");
        }

        auto key_bio = memory_bio(material.key_pem);
        EvpPkeyPtr key(key_bio
            ? PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr)
            : nullptr);
        if (!key) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("key_material: cannot parse private key: {}", openssl_error_string()));
        }

        if (X509_check_private_key(certs.front().get(), key.get()) != 1) {
            ERR_clear_error();
            return R::error(ErrorCategory::CONFIG_ERROR,
                "key_material: private key does not match certificate");
        }

        policy.client_cert_ = std::move(certs.front());
        for (size_t i = 1; i < certs.size(); ++i) {
            policy.client_chain_.push_back(std::move(certs[i]));
        }
        policy.client_key_ = std::move(key);
    } else if (options.skip_verify_without_client_cert) {
        policy.verify_server_ = false;
    }

    if (material.ca_pem.empty()) {
        policy.verify_server_ = false;
    } else {
        policy.root_cas_ = read_all_certificates(material.ca_pem);
        if (policy.root_cas_.empty()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                "ca_material: Could not add RootCA pem");
        }
    }

    if (options.insecure_skip_verify) {
        policy.verify_server_ = false;
    }

    return R::ok(std::move(policy));
}

std::string TlsPolicy::ca_bundle_pem() const {
    if (root_cas_.empty()) return {};
    BioPtr out(BIO_new(BIO_s_mem()));
    if (!out) return {};
    write_certificates(root_cas_, out.get());
    return drain_bio(out.get());
}

std::string TlsPolicy::client_pem() const {
    if (!client_cert_) return {};
    BioPtr out(BIO_new(BIO_s_mem()));
    if (!out) return {};
    PEM_write_bio_X509(out.get(), client_cert_.get());
    write_certificates(client_chain_, out.get());
    PEM_write_bio_PrivateKey(out.get(), client_key_.get(), nullptr, nullptr, 0, nullptr, nullptr);
    return drain_bio(out.get());
}

} // namespace mongoacl
