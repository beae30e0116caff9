#include "tls/credential_source.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace mongoacl {

namespace {

// Read a PEM file; absent file → empty buffer
Result<std::string> read_optional_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Result<std::string>::ok({});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::CONFIG_ERROR,
            std::format("cert_path: cannot read {}", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::CONFIG_ERROR,
            std::format("cert_path: error reading {}", path.string()));
    }
    return Result<std::string>::ok(ss.str());
}

} // anonymous namespace

Result<CredentialSource> resolve_credential_source(const ConnectionSettings& settings) {
    using R = Result<CredentialSource>;

    if (!settings.cert_material.empty() || !settings.key_material.empty()) {
        if (settings.cert_material.empty() || settings.key_material.empty()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                "cert_material and key_material must be specified together");
        }
        if (!settings.cert_path.empty()) {
            return R::error(ErrorCategory::CONFIG_ERROR,
                "cert_path must not be specified together with cert_material/key_material");
        }
        return R::ok(InlineCredentials{
            settings.ca_material, settings.cert_material, settings.key_material});
    }

    if (!settings.cert_path.empty()) {
        return R::ok(CertificateDirectory{settings.cert_path});
    }

    return R::ok(NoClientCertificate{settings.ca_material});
}

Result<CredentialMaterial> load_credential_material(const CredentialSource& source) {
    using R = Result<CredentialMaterial>;

    if (const auto* inline_src = std::get_if<InlineCredentials>(&source)) {
        return R::ok({inline_src->ca_pem, inline_src->cert_pem, inline_src->key_pem});
    }

    if (const auto* dir = std::get_if<CertificateDirectory>(&source)) {
        const std::filesystem::path base(dir->path);
        CredentialMaterial material;

        auto ca = read_optional_file(base / kCaFileName);
        if (ca.is_error()) return R::error_from(ca);
        auto cert = read_optional_file(base / kCertFileName);
        if (cert.is_error()) return R::error_from(cert);
        auto key = read_optional_file(base / kKeyFileName);
        if (key.is_error()) return R::error_from(key);

        material.ca_pem = std::move(ca.value());
        material.cert_pem = std::move(cert.value());
        material.key_pem = std::move(key.value());
        return R::ok(std::move(material));
    }

    const auto& none = std::get<NoClientCertificate>(source);
    return R::ok({none.ca_pem, {}, {}});
}

const char* credential_source_name(const CredentialSource& source) {
    switch (source.index()) {
        case 0: return "none";
        case 1: return "inline";
        case 2: return "directory";
    }
    return "unknown";
}

} // namespace mongoacl
