#include <catch2/catch_test_macros.hpp>
#include "identity/role_identity.hpp"

using namespace mongoacl;

TEST_CASE("RoleIdentity: token format is hex of database.role", "[identity]") {
    auto token = encode_role_id("admin", "readOnlyApp");
    REQUIRE(token.is_ok());
    CHECK(token.value() == "61646d696e2e726561644f6e6c79417070");
}

TEST_CASE("RoleIdentity: decode returns role and database by name", "[identity]") {
    // encode takes (database, role); decoded fields are named, not positional
    auto identity = decode_role_id("61646d696e2e726561644f6e6c79417070");
    REQUIRE(identity.is_ok());
    CHECK(identity.value().role == "readOnlyApp");
    CHECK(identity.value().database == "admin");
    CHECK(identity.value().server_id() == "admin.readOnlyApp");
}

TEST_CASE("RoleIdentity: round trip recovers both names", "[identity]") {
    const std::pair<std::string, std::string> cases[] = {
        {"admin", "readOnlyApp"},
        {"sales", "app.v2"},
        {"x", "y"},
        {"reporting", "role with spaces"},
    };
    for (const auto& [database, role] : cases) {
        auto token = encode_role_id(database, role);
        REQUIRE(token.is_ok());
        auto identity = decode_role_id(token.value());
        REQUIRE(identity.is_ok());
        CHECK(identity.value() == (RoleIdentity{role, database}));
    }
}

TEST_CASE("RoleIdentity: role names may contain dots", "[identity]") {
    auto identity = decode_role_id("73616c65732e6170702e7632");
    REQUIRE(identity.is_ok());
    CHECK(identity.value().database == "sales");
    CHECK(identity.value().role == "app.v2");
}

TEST_CASE("RoleIdentity: database names with dots are rejected", "[identity]") {
    auto token = encode_role_id("my.db", "app");
    REQUIRE(token.is_error());
    CHECK(token.error_category() == ErrorCategory::FORMAT_ERROR);
}

TEST_CASE("RoleIdentity: empty names are rejected on encode", "[identity]") {
    CHECK(encode_role_id("", "app").is_error());
    CHECK(encode_role_id("admin", "").is_error());
}

TEST_CASE("RoleIdentity: malformed tokens fail with format error", "[identity]") {
    const char* bad_tokens[] = {
        "",                 // nothing to decode
        "zz",               // not hex
        "61646d696e2",      // odd length
        "61646d696e",       // "admin": no separator
        "2e78",             // ".x": empty database
        "61646d696e2e",     // "admin.": empty role
    };
    for (const char* token : bad_tokens) {
        auto identity = decode_role_id(token);
        CHECK(identity.is_error());
        CHECK(identity.error_category() == ErrorCategory::FORMAT_ERROR);
    }
}

TEST_CASE("RoleIdentity: token decoding to invalid UTF-8 is a format error", "[identity]") {
    const char* bad_tokens[] = {
        "ff2e61",           // "\xff.a"
        "612e80",           // "a.\x80": stray continuation byte
        "c0ae2e61",         // overlong encoding in the database
        "612eeda080",       // "a." + UTF-16 surrogate
    };
    for (const char* token : bad_tokens) {
        auto identity = decode_role_id(token);
        REQUIRE(identity.is_error());
        CHECK(identity.error_category() == ErrorCategory::FORMAT_ERROR);
        CHECK(identity.error_message().find("UTF-8") != std::string::npos);
    }
}

TEST_CASE("RoleIdentity: multi-byte UTF-8 names round trip", "[identity]") {
    auto token = encode_role_id("admin", "r\xc3\xb4le");
    REQUIRE(token.is_ok());
    auto identity = decode_role_id(token.value());
    REQUIRE(identity.is_ok());
    CHECK(identity.value().role == "r\xc3\xb4le");
}
