#include <catch2/catch_test_macros.hpp>
#include "core/operation_context.hpp"

#include <thread>

using namespace mongoacl;

TEST_CASE("OperationContext: default context never expires", "[context]") {
    OperationContext ctx;
    CHECK_FALSE(ctx.is_cancelled());
    CHECK_FALSE(ctx.is_expired());
    CHECK_FALSE(ctx.remaining_ms().has_value());
    CHECK(ctx.check("createRole").is_ok());
}

TEST_CASE("OperationContext: cancel is observed by check", "[context]") {
    OperationContext ctx;
    ctx.cancel();

    auto status = ctx.check("createRole");
    REQUIRE(status.is_error());
    CHECK(status.error_category() == ErrorCategory::CANCELLED);
    CHECK(status.error_message() == "operation cancelled before createRole");
}

TEST_CASE("OperationContext: cancel from another thread", "[context]") {
    OperationContext ctx;
    std::thread canceller([&] { ctx.cancel(); });
    canceller.join();
    CHECK(ctx.is_cancelled());
}

TEST_CASE("OperationContext: zero timeout is already expired", "[context]") {
    OperationContext ctx(std::chrono::milliseconds(0));
    CHECK(ctx.is_expired());
    REQUIRE(ctx.remaining_ms().has_value());
    CHECK(*ctx.remaining_ms() == 0);

    auto status = ctx.check("rolesInfo");
    REQUIRE(status.is_error());
    CHECK(status.error_message() == "deadline exceeded before rolesInfo");
}

TEST_CASE("OperationContext: remaining time is bounded by timeout", "[context]") {
    OperationContext ctx(std::chrono::milliseconds(60000));
    CHECK_FALSE(ctx.is_expired());
    REQUIRE(ctx.remaining_ms().has_value());
    CHECK(*ctx.remaining_ms() > 0);
    CHECK(*ctx.remaining_ms() <= 60000);
}
