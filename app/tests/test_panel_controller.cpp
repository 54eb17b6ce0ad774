// ==============================================================================
// PanelController Tests
// ==============================================================================
// Control tag to Message translation and the controller round trip through a
// live ParameterPanel, using unattached controls.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "panel_controller.h"
#include "parameter_logger.h"
#include "ui/tick_knob.h"
#include "ui/tick_slider.h"
#include "ui/xy_pad.h"

#include "vstgui/lib/controls/cbuttons.h"

#include <vernier/core/control_tags.h>

#include <memory>
#include <string>

using namespace Vernier;
using namespace VSTGUI;
using Catch::Approx;

namespace {

// Root of the controller chain; the delegation controller forwards here
struct RootController : public IController {
    void valueChanged(CControl*) override {}
};

} // namespace

// ==============================================================================
// messageForControl
// ==============================================================================

TEST_CASE("messageForControl maps each control tag", "[controller][message]") {
    Core::Message message;

    REQUIRE(App::messageForControl(Core::kSliderTag, 0.25f, 0.0f, 0, message));
    REQUIRE(message.type == Core::MessageType::SliderChanged);
    REQUIRE(message.scalar == 0.25f);

    REQUIRE(App::messageForControl(Core::kHSliderIntTag, 0.3f, 0.0f, 0, message));
    REQUIRE(message.type == Core::MessageType::HSliderInt);
    REQUIRE(message.x.value() == 0.3f);

    REQUIRE(App::messageForControl(Core::kVSliderDbTag, 0.6f, 0.0f, 0, message));
    REQUIRE(message.type == Core::MessageType::VSliderDB);

    REQUIRE(App::messageForControl(Core::kKnobFreqTag, 0.1f, 0.0f, 0, message));
    REQUIRE(message.type == Core::MessageType::KnobFreq);
}

TEST_CASE("messageForControl carries both pad axes", "[controller][message]") {
    Core::Message message;

    REQUIRE(App::messageForControl(Core::kXYPadFloatTag, 0.2f, 0.8f, 0, message));
    REQUIRE(message.type == Core::MessageType::XYPadFloat);
    REQUIRE(message.x.value() == 0.2f);
    REQUIRE(message.y.value() == 0.8f);
}

TEST_CASE("messageForControl fires the button on press only", "[controller][message]") {
    Core::Message message;

    REQUIRE(App::messageForControl(Core::kButtonTag, 1.0f, 0.0f, 7, message));
    REQUIRE(message.type == Core::MessageType::ButtonClicked);
    REQUIRE(message.buttonId == 7);

    REQUIRE_FALSE(App::messageForControl(Core::kButtonTag, 0.0f, 0.0f, 7, message));
}

TEST_CASE("messageForControl ignores unknown tags", "[controller][message]") {
    Core::Message message;
    REQUIRE_FALSE(App::messageForControl(999, 0.5f, 0.0f, 0, message));
    REQUIRE_FALSE(App::messageForControl(Core::kInvalidTag, 0.5f, 0.0f, 0, message));
}

// ==============================================================================
// Controller round trip
// ==============================================================================

TEST_CASE("PanelController configures controls from the panel", "[controller]") {
    auto panel = std::make_shared<Core::ParameterPanel>();
    RootController root;
    App::PanelController controller(panel, &root);
    UIAttributes attributes;

    SECTION("stepped slider gets its value and tick marks") {
        auto slider = owned(new UI::TickSlider(CRect(0, 0, 260, 30), &controller,
                                               Core::kHSliderIntTag));
        controller.verifyView(slider, attributes, nullptr);

        REQUIRE(slider->getValueNormalized() == Approx(0.5f));
        REQUIRE(slider->getOrientation() == UI::TickSlider::Orientation::Horizontal);
        REQUIRE_FALSE(slider->getTickMarks().empty());
    }

    SECTION("plain slider gets its step") {
        auto slider = owned(new UI::TickSlider(CRect(0, 0, 260, 24), &controller,
                                               Core::kSliderTag));
        controller.verifyView(slider, attributes, nullptr);

        REQUIRE(slider->getStep() == Approx(0.025f));
    }

    SECTION("knob readout describes the frequency") {
        auto knob = owned(new UI::TickKnob(CRect(0, 0, 60, 60), &controller,
                                           Core::kKnobFreqTag));
        controller.verifyView(knob, attributes, nullptr);

        REQUIRE(knob->getFormattedValue() ==
                panel->describe(Core::kKnobFreqTag, Core::Normal(knob->getValueNormalized())));
    }

    SECTION("pad gets both axes") {
        auto pad = owned(new UI::XYPad(CRect(0, 0, 100, 100), &controller,
                                       Core::kXYPadFloatTag));
        controller.verifyView(pad, attributes, nullptr);

        REQUIRE(pad->getX() == Approx(0.5f));
        REQUIRE(pad->getY() == Approx(0.5f));
        REQUIRE(pad->getDefaultY() == Approx(0.5f));
    }
}

TEST_CASE("PanelController routes control changes into the panel", "[controller]") {
    auto panel = std::make_shared<Core::ParameterPanel>();
    RootController root;
    App::PanelController controller(panel, &root);
    UIAttributes attributes;

    SECTION("stepped slider snaps back to the integer position") {
        auto slider = owned(new UI::TickSlider(CRect(0, 0, 260, 30), &controller,
                                               Core::kHSliderIntTag));
        controller.verifyView(slider, attributes, nullptr);

        slider->setValueNormalized(0.47f);
        controller.valueChanged(slider);

        REQUIRE(panel->outputText() == "HSliderInt: 5");
        REQUIRE(slider->getValueNormalized() == Approx(0.5f));
    }

    SECTION("button press and release") {
        auto button = owned(new CTextButton(CRect(0, 0, 100, 24), &controller,
                                            Core::kButtonTag, "Click here"));
        controller.verifyView(button, attributes, nullptr);

        button->setValueNormalized(1.0f);
        controller.valueChanged(button);
        REQUIRE(panel->outputText() == "Button Clicked: " +
                                       std::to_string(panel->buttonId()));

        panel->resetToDefaults();
        button->setValueNormalized(0.0f);
        controller.valueChanged(button);
        REQUIRE(panel->outputText() == "Parameters Reset");
    }

    SECTION("pad moves both axes in one message") {
        auto pad = owned(new UI::XYPad(CRect(0, 0, 100, 100), &controller,
                                       Core::kXYPadFloatTag));
        controller.verifyView(pad, attributes, nullptr);

        pad->setPosition(0.25f, 0.75f);
        controller.valueChanged(pad);

        REQUIRE(panel->outputText() == "XYPadFloat: x: -0.50, y: 0.50");
    }

    SECTION("unknown controls leave the panel alone") {
        auto slider = owned(new UI::TickSlider(CRect(0, 0, 260, 24), &controller, 999));
        slider->setValueNormalized(0.8f);
        controller.valueChanged(slider);

        REQUIRE(panel->outputText() == "try anything");
    }
}

TEST_CASE("PanelController logs only through the panel listener", "[controller]") {
    auto panel = std::make_shared<Core::ParameterPanel>();
    RootController root;
    App::PanelController controller(panel, &root);
    App::ParameterLogView log(CRect(0, 0, 300, 300));
    App::setGlobalLogger(&log);

    auto knob = owned(new UI::TickKnob(CRect(0, 0, 60, 60), &controller,
                                       Core::kKnobFreqTag));
    controller.verifyView(knob, UIAttributes(), nullptr);

    SECTION("no listener, no log entry") {
        knob->setValueNormalized(0.2f);
        controller.valueChanged(knob);
        REQUIRE(log.entries().empty());
    }

    SECTION("one entry per handled change") {
        int calls = 0;
        panel->setChangeListener([&calls](const Core::Message& message, const std::string& text) {
            ++calls;
            App::logPanelMessage(message, text);
        });

        knob->setValueNormalized(0.2f);
        controller.valueChanged(knob);

        REQUIRE(calls == 1);
        REQUIRE(log.entries().size() == 1);
        REQUIRE(log.entries().front().name == "KnobFreq");
        REQUIRE(log.entries().front().text == panel->outputText());
    }

    App::setGlobalLogger(nullptr);
}
