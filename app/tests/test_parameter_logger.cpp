// ==============================================================================
// Parameter Logger Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "parameter_logger.h"

#include <vernier/core/control_tags.h>
#include <vernier/core/panel_message.h>
#include <vernier/core/parameter_panel.h>

#include <string>

using namespace Vernier;
using namespace VSTGUI;

TEST_CASE("controlName names every panel control", "[logger]") {
    REQUIRE(std::string(App::controlName(Core::kSliderTag)) == "Slider");
    REQUIRE(std::string(App::controlName(Core::kButtonTag)) == "Button");
    REQUIRE(std::string(App::controlName(Core::kHSliderIntTag)) == "HSliderInt");
    REQUIRE(std::string(App::controlName(Core::kVSliderDbTag)) == "VSliderDB");
    REQUIRE(std::string(App::controlName(Core::kKnobFreqTag)) == "KnobFreq");
    REQUIRE(std::string(App::controlName(Core::kXYPadFloatTag)) == "XYPadFloat");
    REQUIRE(std::string(App::controlName(Core::kInvalidTag)) == "Panel");
    REQUIRE(std::string(App::controlName(42)) == "Unknown");
}

TEST_CASE("ParameterLogView keeps the newest entries first", "[logger]") {
    App::ParameterLogView view(CRect(0, 0, 300, 300));

    view.logParameter(Core::kSliderTag, 0.1f, "Slider", "Slider Changed: 0.1");
    view.logParameter(Core::kKnobFreqTag, 0.2f, "KnobFreq", "KnobFreq: 50.00");

    REQUIRE(view.entries().size() == 2);
    REQUIRE(view.entries().front().tag == Core::kKnobFreqTag);
    REQUIRE(view.entries().front().text == "KnobFreq: 50.00");
    REQUIRE(view.entries().back().tag == Core::kSliderTag);
}

TEST_CASE("ParameterLogView caps the entry count", "[logger]") {
    App::ParameterLogView view(CRect(0, 0, 300, 300));

    for (int i = 0; i < 30; ++i)
        view.logParameter(Core::kSliderTag, static_cast<float>(i), "Slider", std::to_string(i));

    REQUIRE(view.entries().size() == App::kMaxLogEntries);
    REQUIRE(view.entries().front().text == "29");
    REQUIRE(view.entries().back().text == "10");

    view.clear();
    REQUIRE(view.entries().empty());
}

TEST_CASE("logParameterChange writes to the global logger", "[logger]") {
    App::ParameterLogView view(CRect(0, 0, 300, 300));

    App::logParameterChange(Core::kButtonTag, 1.0f, "dropped");
    REQUIRE(view.entries().empty());

    App::setGlobalLogger(&view);
    App::logParameterChange(Core::kButtonTag, 1.0f, "Button Clicked: 3");
    App::setGlobalLogger(nullptr);

    REQUIRE(view.entries().size() == 1);
    REQUIRE(view.entries().front().name == "Button");
    REQUIRE(view.entries().front().text == "Button Clicked: 3");
}

TEST_CASE("controlTagFor maps every message type", "[logger]") {
    REQUIRE(App::controlTagFor(Core::MessageType::SliderChanged) == Core::kSliderTag);
    REQUIRE(App::controlTagFor(Core::MessageType::ButtonClicked) == Core::kButtonTag);
    REQUIRE(App::controlTagFor(Core::MessageType::HSliderInt) == Core::kHSliderIntTag);
    REQUIRE(App::controlTagFor(Core::MessageType::VSliderDB) == Core::kVSliderDbTag);
    REQUIRE(App::controlTagFor(Core::MessageType::KnobFreq) == Core::kKnobFreqTag);
    REQUIRE(App::controlTagFor(Core::MessageType::XYPadFloat) == Core::kXYPadFloatTag);
}

TEST_CASE("logPanelMessage logs the message payload", "[logger]") {
    App::ParameterLogView view(CRect(0, 0, 300, 300));
    App::setGlobalLogger(&view);

    App::logPanelMessage(Core::Message::buttonClicked(7), "Button Clicked: 7");
    App::logPanelMessage(Core::Message::sliderChanged(0.25f), "Slider Changed: 0.25");
    App::logPanelMessage(Core::Message::knobFreq(Core::Normal(0.5f)), "KnobFreq: 640.00");

    App::setGlobalLogger(nullptr);

    REQUIRE(view.entries().size() == 3);
    REQUIRE(view.entries()[0].name == "KnobFreq");
    REQUIRE(view.entries()[0].value == 0.5f);
    REQUIRE(view.entries()[1].name == "Slider");
    REQUIRE(view.entries()[1].value == 0.25f);
    REQUIRE(view.entries()[2].name == "Button");
    REQUIRE(view.entries()[2].value == 7.0f);
}

TEST_CASE("Panel change listener feeds the log", "[logger]") {
    App::ParameterLogView view(CRect(0, 0, 300, 300));
    App::setGlobalLogger(&view);

    Core::ParameterPanel panel;
    panel.setChangeListener(&App::logPanelMessage);
    panel.handleEvent(Core::Message::hSliderInt(Core::Normal(0.47f)));

    App::setGlobalLogger(nullptr);

    REQUIRE(view.entries().size() == 1);
    REQUIRE(view.entries().front().tag == Core::kHSliderIntTag);
    REQUIRE(view.entries().front().text == "HSliderInt: 5");
}
