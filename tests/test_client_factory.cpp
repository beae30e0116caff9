#include <catch2/catch_test_macros.hpp>
#include "db/client_factory.hpp"
#include "db/connection_uri.hpp"
#include "test_certs.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace mongoacl;
using namespace mongoacl::testing;

namespace {

ConnectionSettings base_settings() {
    ConnectionSettings s;
    s.host = "localhost";
    s.port = "27017";
    s.database = "admin";
    s.username = "root";
    s.password = "pw";
    return s;
}

Result<ClientPlan> plan_for(const ConnectionSettings& settings) {
    auto config = make_connection_config(settings);
    if (config.is_error()) return Result<ClientPlan>::error_from(config);
    return plan_client(config.value());
}

std::filesystem::path make_cert_dir(const std::string& tag, bool with_client_cert) {
    auto dir = std::filesystem::temp_directory_path() /
               ("mongo_acl_factory_" + tag + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const auto ca = make_self_signed("ca");
    std::ofstream(dir / "ca.pem") << ca.cert_pem;
    if (with_client_cert) {
        const auto client = make_self_signed("client");
        std::ofstream(dir / "cert.pem") << client.cert_pem;
        std::ofstream(dir / "key.pem") << client.key_pem;
    }
    return dir;
}

} // anonymous namespace

TEST_CASE("ClientFactory: inline cert and key select the inline branch", "[factory]") {
    const auto client = make_self_signed("client");
    const auto ca = make_self_signed("ca");
    auto s = base_settings();
    s.ca_material = ca.cert_pem;
    s.cert_material = client.cert_pem;
    s.key_material = client.key_pem;

    auto plan = plan_for(s);
    REQUIRE(plan.is_ok());
    CHECK(plan.value().branch == ClientBranch::INLINE_CREDENTIALS);
    REQUIRE(plan.value().tls.has_value());
    CHECK(plan.value().tls->has_client_certificate());
    CHECK(plan.value().tls->root_ca_count() == 1);
    CHECK(plan.value().tls->verify_server_certificate());
}

TEST_CASE("ClientFactory: cert_path selects the directory branch", "[factory]") {
    const auto dir = make_cert_dir("full", true);
    auto s = base_settings();
    s.cert_path = dir.string();

    auto plan = plan_for(s);
    REQUIRE(plan.is_ok());
    CHECK(plan.value().branch == ClientBranch::CERTIFICATE_DIRECTORY);
    REQUIRE(plan.value().tls.has_value());
    CHECK(plan.value().tls->has_client_certificate());
    CHECK(plan.value().tls->verify_server_certificate());

    std::filesystem::remove_all(dir);
}

TEST_CASE("ClientFactory: directory without client cert falls back to skip-verify", "[factory]") {
    const auto dir = make_cert_dir("ca_only", false);
    auto s = base_settings();
    s.cert_path = dir.string();

    auto plan = plan_for(s);
    REQUIRE(plan.is_ok());
    CHECK(plan.value().branch == ClientBranch::CERTIFICATE_DIRECTORY);
    REQUIRE(plan.value().tls.has_value());
    CHECK_FALSE(plan.value().tls->has_client_certificate());
    CHECK_FALSE(plan.value().tls->verify_server_certificate());

    std::filesystem::remove_all(dir);
}

TEST_CASE("ClientFactory: CA without client cert selects the CA-only branch", "[factory]") {
    const auto ca = make_self_signed("ca");
    auto s = base_settings();
    s.ca_material = ca.cert_pem;

    auto plan = plan_for(s);
    REQUIRE(plan.is_ok());
    CHECK(plan.value().branch == ClientBranch::CA_ONLY);
    REQUIRE(plan.value().tls.has_value());
    CHECK_FALSE(plan.value().tls->has_client_certificate());
    CHECK(plan.value().tls->verify_server_certificate());
}

TEST_CASE("ClientFactory: nothing configured selects the plain branch", "[factory]") {
    auto plan = plan_for(base_settings());
    REQUIRE(plan.is_ok());
    CHECK(plan.value().branch == ClientBranch::PLAIN);
    CHECK_FALSE(plan.value().tls.has_value());
    CHECK(plan.value().credentials.username == "root");
    CHECK(plan.value().credentials.auth_source == "admin");
}

TEST_CASE("ClientFactory: CA-only branch rejects unparsable CA", "[factory]") {
    auto s = base_settings();
    s.ca_material = "not pem";

    auto plan = plan_for(s);
    REQUIRE(plan.is_error());
    CHECK(plan.error_category() == ErrorCategory::CONFIG_ERROR);
}

TEST_CASE("ClientFactory: inline material plus cert_path fails before any client exists", "[factory]") {
    const auto client = make_self_signed("client");
    auto s = base_settings();
    s.cert_material = client.cert_pem;
    s.key_material = client.key_pem;
    s.cert_path = "/nonexistent/certs";

    auto built = build_client(s);
    REQUIRE(built.is_error());
    CHECK(built.error_category() == ErrorCategory::CONFIG_ERROR);
    CHECK(built.error_message().find("cert_path") != std::string::npos);
}

TEST_CASE("ClientFactory: plan URI carries the assembled options", "[factory]") {
    auto s = base_settings();
    s.ssl = true;
    s.replica_set = "rs0";

    auto plan = plan_for(s);
    REQUIRE(plan.is_ok());
    const auto options = parse_uri_options(plan.value().uri);
    CHECK(options.at("ssl") == "true");
    CHECK(options.at("replicaSet") == "rs0");
}

TEST_CASE("ClientFactory: plain client is built without contacting the server", "[factory]") {
    auto s = base_settings();
    s.port = "1";  // nothing listens here; construction must stay lazy

    auto built = build_client(s);
    REQUIRE(built.is_ok());
    CHECK(built.value() != nullptr);
}

TEST_CASE("ClientFactory: invalid port is a config error", "[factory]") {
    auto s = base_settings();
    s.port = "not-a-port";

    auto built = build_client(s);
    REQUIRE(built.is_error());
    CHECK(built.error_message().find("connection.port") != std::string::npos);
}
