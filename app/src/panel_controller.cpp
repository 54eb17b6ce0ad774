// =============================================================================
// Panel Controller Implementation
// =============================================================================

#include "panel_controller.h"
#include "parameter_logger.h"

// Custom controls - include triggers static ViewCreator registration
#include "ui/tick_knob.h"
#include "ui/tick_slider.h"
#include "ui/xy_pad.h"

#include <vernier/core/control_tags.h>

#include <string>

namespace Vernier::App {

using namespace VSTGUI;

// =============================================================================
// messageForControl
// =============================================================================

bool messageForControl(int32_t tag, float value, float valueY,
                       uint8_t buttonId, Core::Message& message) noexcept {
    switch (tag) {
        case Core::kSliderTag:
            message = Core::Message::sliderChanged(value);
            return true;
        case Core::kButtonTag:
            // Kick buttons report 1 on press and 0 on release
            if (value < 0.5f)
                return false;
            message = Core::Message::buttonClicked(buttonId);
            return true;
        case Core::kHSliderIntTag:
            message = Core::Message::hSliderInt(Core::Normal(value));
            return true;
        case Core::kVSliderDbTag:
            message = Core::Message::vSliderDb(Core::Normal(value));
            return true;
        case Core::kKnobFreqTag:
            message = Core::Message::knobFreq(Core::Normal(value));
            return true;
        case Core::kXYPadFloatTag:
            message = Core::Message::xyPadFloat(Core::Normal(value), Core::Normal(valueY));
            return true;
        default:
            break;
    }
    return false;
}

// =============================================================================
// PanelController Implementation
// =============================================================================

PanelController::PanelController(std::shared_ptr<Core::ParameterPanel> panel,
                                 IController* parent)
    : DelegationController(parent)
    , panel_(std::move(panel))
{
}

PanelController::~PanelController() {
    // The log view goes away with the same view hierarchy
    setGlobalLogger(nullptr);
}

CView* PanelController::createView(const UIAttributes& attributes,
                                   const IUIDescription* description)
{
    if (auto customViewName = attributes.getAttributeValue(IUIDescription::kCustomViewName)) {
        if (*customViewName == "ParameterLog") {
            CRect size(0, 0, 300, 300);
            auto* logger = new ParameterLogView(size);
            setGlobalLogger(logger);
            return logger;
        }
        if (*customViewName == "OutputText") {
            CRect size(0, 0, 260, 20);
            outputLabel_ = new CTextLabel(size, panel_->outputText().c_str());
            outputLabel_->setHoriAlign(kCenterText);
            return outputLabel_;
        }
    }
    return DelegationController::createView(attributes, description);
}

CView* PanelController::verifyView(CView* view,
                                   const UIAttributes& attributes,
                                   const IUIDescription* description)
{
    if (auto* control = dynamic_cast<CControl*>(view)) {
        const auto state = panel_->render();
        if (const auto* widget = state.find(static_cast<Core::ControlTag>(control->getTag())))
            applyWidget(control, *widget);
    }
    return DelegationController::verifyView(view, attributes, description);
}

void PanelController::applyWidget(CControl* control, const Core::WidgetView& widget) {
    const float value = widget.x.value.value();
    const float defaultValue = widget.x.defaultValue.value();

    switch (widget.kind) {
        case Core::WidgetKind::Slider:
            if (auto* slider = dynamic_cast<UI::TickSlider*>(control)) {
                slider->setStep(widget.step);
                slider_ = slider;
            }
            break;

        case Core::WidgetKind::HSlider:
        case Core::WidgetKind::VSlider:
            if (auto* slider = dynamic_cast<UI::TickSlider*>(control)) {
                slider->setOrientation(widget.kind == Core::WidgetKind::HSlider
                    ? UI::TickSlider::Orientation::Horizontal
                    : UI::TickSlider::Orientation::Vertical);
                if (!widget.tickMarks.empty())
                    slider->setTickMarks(widget.tickMarks);
                if (widget.kind == Core::WidgetKind::HSlider)
                    hSlider_ = slider;
                else
                    vSlider_ = slider;
            }
            break;

        case Core::WidgetKind::Knob:
            if (auto* knob = dynamic_cast<UI::TickKnob*>(control)) {
                if (!widget.tickMarks.empty())
                    knob->setTickMarks(widget.tickMarks);
                std::weak_ptr<Core::ParameterPanel> weakPanel = panel_;
                const auto tag = widget.tag;
                knob->setValueFormatter([weakPanel, tag](float normalized) {
                    if (auto panel = weakPanel.lock())
                        return panel->describe(tag, Core::Normal(normalized));
                    return std::string();
                });
                knob_ = knob;
            }
            break;

        case Core::WidgetKind::XYPad:
            if (auto* pad = dynamic_cast<UI::XYPad*>(control)) {
                pad->setDefaultPosition(defaultValue, widget.y.defaultValue.value());
                pad->setPosition(value, widget.y.value.value());
                xyPad_ = pad;
            }
            return;

        case Core::WidgetKind::Button:
        case Core::WidgetKind::Text:
            return;
    }

    control->setDefaultValue(defaultValue);
    control->setValueNormalized(value);
}

void PanelController::valueChanged(CControl* control) {
    const int32_t tag = control->getTag();
    const float value = control->getValueNormalized();

    float valueY = 0.0f;
    if (auto* pad = dynamic_cast<UI::XYPad*>(control))
        valueY = pad->getY();

    Core::Message message;
    if (!messageForControl(tag, value, valueY, panel_->buttonId(), message))
        return;

    // Logging happens in the panel's change listener
    panel_->handleEvent(message);
    syncViews();
}

void PanelController::syncViews() {
    const auto state = panel_->render();

    auto pushValue = [&state](CControl* control, Core::ControlTag tag) {
        if (!control)
            return;
        if (const auto* widget = state.find(tag)) {
            control->setValueNormalized(widget->x.value.value());
            control->invalid();
        }
    };

    pushValue(slider_, Core::kSliderTag);
    pushValue(hSlider_, Core::kHSliderIntTag);
    pushValue(vSlider_, Core::kVSliderDbTag);
    pushValue(knob_, Core::kKnobFreqTag);

    if (xyPad_) {
        if (const auto* widget = state.find(Core::kXYPadFloatTag))
            xyPad_->setPosition(widget->x.value.value(), widget->y.value.value());
    }

    if (outputLabel_) {
        outputLabel_->setText(state.outputText.c_str());
        outputLabel_->invalid();
    }
}

} // namespace Vernier::App
