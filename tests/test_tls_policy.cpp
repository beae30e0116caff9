#include <catch2/catch_test_macros.hpp>
#include "tls/tls_policy.hpp"
#include "test_certs.hpp"

using namespace mongoacl;
using namespace mongoacl::testing;

TEST_CASE("TlsPolicy: every certificate in the CA bundle is trusted", "[tls][policy]") {
    const auto ca1 = make_self_signed("ca-one");
    const auto ca2 = make_self_signed("ca-two");

    CredentialMaterial material;
    material.ca_pem = ca1.cert_pem + ca2.cert_pem;

    auto policy = TlsPolicy::build(material, {});
    REQUIRE(policy.is_ok());
    CHECK(policy.value().root_ca_count() == 2);
    CHECK(policy.value().verify_server_certificate());
    CHECK_FALSE(policy.value().has_client_certificate());
    CHECK(policy.value().client_pem().empty());
    CHECK(policy.value().ca_bundle_pem().find("BEGIN CERTIFICATE") != std::string::npos);
}

TEST_CASE("TlsPolicy: CA bytes without any certificate fail to parse", "[tls][policy]") {
    CredentialMaterial material;
    material.ca_pem = "this is not a certificate";

    auto policy = TlsPolicy::build(material, {});
    REQUIRE(policy.is_error());
    CHECK(policy.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(policy.error_message().find("RootCA") != std::string::npos);
}

TEST_CASE("TlsPolicy: empty CA disables server verification", "[tls][policy]") {
    const auto client = make_self_signed("client");
    CredentialMaterial material;
    material.cert_pem = client.cert_pem;
    material.key_pem = client.key_pem;

    auto policy = TlsPolicy::build(material, {});
    REQUIRE(policy.is_ok());
    CHECK(policy.value().root_ca_count() == 0);
    CHECK_FALSE(policy.value().verify_server_certificate());
    CHECK(policy.value().has_client_certificate());

    const auto pem = policy.value().client_pem();
    CHECK(pem.find("BEGIN CERTIFICATE") != std::string::npos);
    CHECK(pem.find("PRIVATE KEY") != std::string::npos);
}

TEST_CASE("TlsPolicy: key that does not match the certificate is rejected", "[tls][policy]") {
    const auto a = make_self_signed("a");
    const auto b = make_self_signed("b");
    CredentialMaterial material;
    material.cert_pem = a.cert_pem;
    material.key_pem = b.key_pem;

    auto policy = TlsPolicy::build(material, {});
    REQUIRE(policy.is_error());
    CHECK(policy.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(policy.error_message().find("does not match") != std::string::npos);
}

TEST_CASE("TlsPolicy: unparsable key is a config error", "[tls][policy]") {
    const auto a = make_self_signed("a");
    CredentialMaterial material;
    material.cert_pem = a.cert_pem;
    material.key_pem = "garbage";

    auto policy = TlsPolicy::build(material, {});
    REQUIRE(policy.is_error());
    CHECK(policy.error_message().find("key_material") != std::string::npos);
}

TEST_CASE("TlsPolicy: directory fallback skips verification without client cert", "[tls][policy]") {
    const auto ca = make_self_signed("ca");
    CredentialMaterial material;
    material.ca_pem = ca.cert_pem;

    TlsPolicyOptions options;
    options.skip_verify_without_client_cert = true;

    auto policy = TlsPolicy::build(material, options);
    REQUIRE(policy.is_ok());
    // CA is loaded but verification is still off
    CHECK(policy.value().root_ca_count() == 1);
    CHECK_FALSE(policy.value().verify_server_certificate());
}

TEST_CASE("TlsPolicy: explicit insecure_skip_verify overrides a valid CA", "[tls][policy]") {
    const auto ca = make_self_signed("ca");
    CredentialMaterial material;
    material.ca_pem = ca.cert_pem;

    TlsPolicyOptions options;
    options.insecure_skip_verify = true;

    auto policy = TlsPolicy::build(material, options);
    REQUIRE(policy.is_ok());
    CHECK_FALSE(policy.value().verify_server_certificate());
}
