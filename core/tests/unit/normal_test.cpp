// Core Tests - Normal and NormalParam

#include <catch2/catch_test_macros.hpp>

#include <vernier/core/normal.h>

using namespace Vernier::Core;

TEST_CASE("Normal clips into [0, 1]", "[core][normal]") {
    REQUIRE(Normal(-0.5f).value() == 0.0f);
    REQUIRE(Normal(1.5f).value() == 1.0f);
    REQUIRE(Normal(0.3f).value() == 0.3f);
}

TEST_CASE("Normal named positions", "[core][normal]") {
    STATIC_REQUIRE(Normal::min().value() == 0.0f);
    STATIC_REQUIRE(Normal::center().value() == 0.5f);
    STATIC_REQUIRE(Normal::max().value() == 1.0f);
    STATIC_REQUIRE(Normal().value() == 0.0f);
}

TEST_CASE("NormalParam update and reset", "[core][normal]") {
    NormalParam param{Normal(0.2f), Normal(0.7f)};

    SECTION("update replaces only the value") {
        param.update(Normal(0.9f));
        REQUIRE(param.value == Normal(0.9f));
        REQUIRE(param.defaultValue == Normal(0.7f));
    }

    SECTION("reset restores the default") {
        param.update(Normal(0.9f));
        param.reset();
        REQUIRE(param.value == Normal(0.7f));
    }
}
