#include "db/client_factory.hpp"
#include "db/connection_uri.hpp"
#include "core/utils.hpp"

#include <format>

namespace mongoacl {

const char* client_branch_name(ClientBranch branch) {
    switch (branch) {
        case ClientBranch::INLINE_CREDENTIALS:    return "inline_credentials";
        case ClientBranch::CERTIFICATE_DIRECTORY: return "certificate_directory";
        case ClientBranch::CA_ONLY:               return "ca_only";
        case ClientBranch::PLAIN:                 return "plain";
    }
    return "unknown";
}

Result<ClientPlan> plan_client(const ConnectionConfig& config) {
    using R = Result<ClientPlan>;

    ClientPlan plan;
    plan.uri = build_connection_uri(config);
    plan.credentials = {config.username, config.password, config.database};

    TlsPolicyOptions options;
    options.insecure_skip_verify = config.insecure_skip_verify;

    if (std::holds_alternative<InlineCredentials>(config.credentials)) {
        plan.branch = ClientBranch::INLINE_CREDENTIALS;
    } else if (std::holds_alternative<CertificateDirectory>(config.credentials)) {
        plan.branch = ClientBranch::CERTIFICATE_DIRECTORY;
        options.skip_verify_without_client_cert = true;
    } else if (!std::get<NoClientCertificate>(config.credentials).ca_pem.empty()) {
        plan.branch = ClientBranch::CA_ONLY;
    } else {
        plan.branch = ClientBranch::PLAIN;
        return R::ok(std::move(plan));
    }

    auto material = load_credential_material(config.credentials);
    if (material.is_error()) return R::error_from(material);

    auto policy = TlsPolicy::build(material.value(), options);
    if (policy.is_error()) return R::error_from(policy);

    plan.tls = std::move(policy.value());
    return R::ok(std::move(plan));
}

Result<std::unique_ptr<IMongoClient>> build_client(const ConnectionConfig& config) {
    using R = Result<std::unique_ptr<IMongoClient>>;

    auto plan = plan_client(config);
    if (plan.is_error()) return R::error_from(plan);
    const auto& p = plan.value();

    if (p.tls) {
        if (!p.tls->verify_server_certificate()) {
            utils::log::warn(std::format(
                "Client {}: server certificate verification disabled", p.uri));
        }
        utils::log::info(std::format("Client {}: branch={}, root_cas={}, client_cert={}",
            p.uri, client_branch_name(p.branch), p.tls->root_ca_count(),
            utils::booltostr(p.tls->has_client_certificate())));
    } else {
        utils::log::info(std::format("Client {}: branch={}", p.uri, client_branch_name(p.branch)));
    }

    auto client = MongocClient::create(p.uri, p.credentials, p.tls);
    if (client.is_error()) return R::error_from(client);
    return R::ok(std::move(client.value()));
}

Result<std::unique_ptr<IMongoClient>> build_client(const ConnectionSettings& settings) {
    auto config = make_connection_config(settings);
    if (config.is_error()) return Result<std::unique_ptr<IMongoClient>>::error_from(config);
    return build_client(config.value());
}

} // namespace mongoacl
