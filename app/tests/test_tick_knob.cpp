// ==============================================================================
// TickKnob Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "ui/tick_knob.h"

#include <string>

using namespace Vernier::UI;
using namespace VSTGUI;
using Catch::Approx;
using Vernier::Core::TickMarks::Tier;

TEST_CASE("TickKnob falls back to a percentage", "[tick_knob][readout]") {
    TickKnob knob(CRect(0, 0, 60, 60), nullptr, -1);
    knob.setValueNormalized(0.25f);

    REQUIRE(knob.getFormattedValue() == "25%");
}

TEST_CASE("TickKnob uses the value formatter", "[tick_knob][readout]") {
    TickKnob knob(CRect(0, 0, 60, 60), nullptr, -1);
    knob.setValueFormatter([](float normalized) {
        return std::to_string(static_cast<int>(normalized * 10.0f)) + " units";
    });
    knob.setValueNormalized(0.5f);

    REQUIRE(knob.getFormattedValue() == "5 units");
}

TEST_CASE("TickKnob ignores an empty formatter result", "[tick_knob][readout]") {
    TickKnob knob(CRect(0, 0, 60, 60), nullptr, -1);
    knob.setValueFormatter([](float) { return std::string(); });
    knob.setValueNormalized(1.0f);

    REQUIRE(knob.getFormattedValue() == "100%");
}

TEST_CASE("TickKnob angles span the configured range", "[tick_knob][geometry]") {
    TickKnob knob(CRect(0, 0, 60, 60), nullptr, -1);
    knob.setStartAngle(static_cast<float>(135.0 / 180.0 * Constants::pi));
    knob.setRangeAngle(static_cast<float>(270.0 / 180.0 * Constants::pi));

    REQUIRE(knob.valueToAngleDeg(0.0f) == Approx(135.0).margin(1e-3));
    REQUIRE(knob.valueToAngleDeg(0.5f) == Approx(270.0).margin(1e-3));
    REQUIRE(knob.valueToAngleDeg(1.0f) == Approx(405.0).margin(1e-3));
}

TEST_CASE("TickKnob tick length shrinks with tier", "[tick_knob][geometry]") {
    REQUIRE(TickKnob::tickLength(Tier::One) > TickKnob::tickLength(Tier::Two));
    REQUIRE(TickKnob::tickLength(Tier::Two) > TickKnob::tickLength(Tier::Three));
}

TEST_CASE("TickKnob drag covers the range in kDragPixels", "[tick_knob][drag]") {
    REQUIRE(TickKnob::dragValue(0.0f, TickKnob::kDragPixels, false) == Approx(1.0f));
    REQUIRE(TickKnob::dragValue(0.5f, TickKnob::kDragPixels / 4.0, false) == Approx(0.75f));
    REQUIRE(TickKnob::dragValue(0.5f, -TickKnob::kDragPixels / 4.0, false) == Approx(0.25f));
}

TEST_CASE("TickKnob fine drag moves a tenth as far", "[tick_knob][drag]") {
    REQUIRE(TickKnob::dragValue(0.5f, 100.0, true) == Approx(0.55f));
    REQUIRE(TickKnob::dragValue(0.5f, -100.0, true) == Approx(0.45f));
}

TEST_CASE("TickKnob drag clamps to the range", "[tick_knob][drag]") {
    REQUIRE(TickKnob::dragValue(0.9f, 1000.0, false) == 1.0f);
    REQUIRE(TickKnob::dragValue(0.1f, -1000.0, false) == 0.0f);
}

TEST_CASE("TickKnob is idle until pressed", "[tick_knob][drag]") {
    TickKnob knob(CRect(0, 0, 80, 80), nullptr, -1);
    REQUIRE_FALSE(knob.isDragging());
}
