// ==============================================================================
// Color Utility Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "ui/color_utils.h"

using namespace Vernier::UI;
using namespace VSTGUI;

TEST_CASE("darkenColor scales RGB and keeps alpha", "[color_utils]") {
    CColor c{200, 100, 50, 128};

    CColor half = darkenColor(c, 0.5f);
    REQUIRE(half.red == 100);
    REQUIRE(half.green == 50);
    REQUIRE(half.blue == 25);
    REQUIRE(half.alpha == 128);

    CColor black = darkenColor(c, 0.0f);
    REQUIRE(black.red == 0);
    REQUIRE(black.alpha == 128);
}

TEST_CASE("brightenColor clamps to 255", "[color_utils]") {
    CColor c{200, 40, 30, 42};
    CColor result = brightenColor(c, 2.0f);

    REQUIRE(result.red == 255);
    REQUIRE(result.green == 80);
    REQUIRE(result.blue == 60);
    REQUIRE(result.alpha == 42);
}

TEST_CASE("darken and brighten only move in their own direction", "[color_utils]") {
    CColor c{120, 60, 30, 200};

    CColor notDarker = darkenColor(c, 1.5f);
    REQUIRE(notDarker.red == 120);
    REQUIRE(notDarker.green == 60);

    CColor notBrighter = brightenColor(c, 0.5f);
    REQUIRE(notBrighter.red == 120);
    REQUIRE(notBrighter.blue == 30);
    REQUIRE(notBrighter.alpha == 200);
}
