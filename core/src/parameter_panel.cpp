// ==============================================================================
// ParameterPanel Implementation
// ==============================================================================

#include <vernier/core/parameter_panel.h>
#include <vernier/core/debug_log.h>

#include <cstdio>

namespace Vernier::Core {

namespace {

template <typename... Args>
std::string formatText(const char* format, Args... args) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), format, args...);
    return buffer;
}

template <typename RangeT, typename ValueT>
Parameter<RangeT> makeParameter(const RangeT& range, ValueT value, ValueT defaultValue) {
    return Parameter<RangeT>{range, range.normalParam(value, defaultValue)};
}

template <typename RangeT>
Parameter<RangeT> makeDefaultParameter(const RangeT& range) {
    return Parameter<RangeT>{range, range.defaultNormalParam()};
}

} // namespace

// ==============================================================================
// PanelView
// ==============================================================================

const WidgetView* PanelView::find(ControlTag tag) const noexcept {
    for (const auto& widget : widgets) {
        if (widget.tag == tag)
            return &widget;
    }
    return nullptr;
}

// ==============================================================================
// ParameterPanel
// ==============================================================================

ParameterPanel::ParameterPanel(const PanelConfig& config)
    : config_(config)
    , sliderValue_(config.sliderInitial)
    , hSliderParam_(makeParameter(IntRange(config.intMin, config.intMax),
                                  config.intInitial, config.intDefault))
    , vSliderParam_(makeDefaultParameter(
          LogDBRange(config.dbMin, config.dbMax, Normal(config.dbZeroPosition))))
    , knobParam_(makeParameter(FreqRange(config.freqMinHz, config.freqMaxHz),
                               config.freqInitialHz, config.freqDefaultHz))
    , xyPadXParam_(makeDefaultParameter(FloatRange(config.floatMin, config.floatMax)))
    , xyPadYParam_(makeDefaultParameter(FloatRange(config.floatMin, config.floatMax)))
    , centerTickMark_(TickMarks::Group::center(TickMarks::Tier::Two))
    , knobTickMarks_(TickMarks::Group::minMaxAndCenter(TickMarks::Tier::Two,
                                                       TickMarks::Tier::Three))
    , outputText_(config.initialText) {}

void ParameterPanel::handleEvent(const Message& message) {
    switch (message.type) {
        case MessageType::SliderChanged:
            sliderValue_ = message.scalar;
            setOutputText(formatText("Slider Changed: %g", static_cast<double>(sliderValue_)));
            break;

        case MessageType::ButtonClicked:
            setOutputText(formatText("Button Clicked: %u", static_cast<unsigned>(message.buttonId)));
            break;

        case MessageType::HSliderInt:
            // Snap so the slider jumps between integer positions
            hSliderParam_.update(message.x);
            setOutputText(formatText("HSliderInt: %d", static_cast<int>(hSliderParam_.value())));
            break;

        case MessageType::VSliderDB:
            vSliderParam_.update(message.x);
            setOutputText(formatText("VSliderDB: %.3f", static_cast<double>(vSliderParam_.value())));
            break;

        case MessageType::KnobFreq:
            knobParam_.update(message.x);
            setOutputText(formatText("KnobFreq: %.2f", static_cast<double>(knobParam_.value())));
            break;

        case MessageType::XYPadFloat:
            xyPadXParam_.update(message.x);
            xyPadYParam_.update(message.y);
            setOutputText(formatText("XYPadFloat: x: %.2f, y: %.2f",
                                     static_cast<double>(xyPadXParam_.value()),
                                     static_cast<double>(xyPadYParam_.value())));
            break;
    }

    VERNIER_LOG_PANEL("[panel] message %d -> %s\n", static_cast<int>(message.type),
                      outputText_.c_str());

    if (listener_)
        listener_(message, outputText_);
}

void ParameterPanel::resetToDefaults() {
    sliderValue_ = config_.sliderInitial;
    hSliderParam_.reset();
    vSliderParam_.reset();
    knobParam_.reset();
    xyPadXParam_.reset();
    xyPadYParam_.reset();
    setOutputText("Parameters Reset");

    VERNIER_LOG_PANEL("[panel] reset to defaults\n");
}

PanelView ParameterPanel::render() const {
    PanelView view;
    view.outputText = outputText_;
    view.widgets.reserve(7);

    WidgetView slider;
    slider.kind = WidgetKind::Slider;
    slider.tag = kSliderTag;
    slider.x = {Normal(sliderValue_), Normal(config_.sliderInitial)};
    slider.step = config_.sliderStep;
    view.widgets.push_back(slider);

    WidgetView button;
    button.kind = WidgetKind::Button;
    button.tag = kButtonTag;
    button.label = "Click here";
    view.widgets.push_back(button);

    WidgetView hSlider;
    hSlider.kind = WidgetKind::HSlider;
    hSlider.tag = kHSliderIntTag;
    hSlider.x = hSliderParam_.normal;
    hSlider.tickMarks = centerTickMark_;
    view.widgets.push_back(hSlider);

    WidgetView vSlider;
    vSlider.kind = WidgetKind::VSlider;
    vSlider.tag = kVSliderDbTag;
    vSlider.x = vSliderParam_.normal;
    vSlider.tickMarks = centerTickMark_;
    view.widgets.push_back(vSlider);

    WidgetView knob;
    knob.kind = WidgetKind::Knob;
    knob.tag = kKnobFreqTag;
    knob.x = knobParam_.normal;
    knob.tickMarks = knobTickMarks_;
    view.widgets.push_back(knob);

    WidgetView xyPad;
    xyPad.kind = WidgetKind::XYPad;
    xyPad.tag = kXYPadFloatTag;
    xyPad.x = xyPadXParam_.normal;
    xyPad.y = xyPadYParam_.normal;
    view.widgets.push_back(xyPad);

    WidgetView text;
    text.kind = WidgetKind::Text;
    text.label = outputText_;
    view.widgets.push_back(text);

    return view;
}

std::string ParameterPanel::describe(ControlTag tag, Normal normal) const {
    switch (tag) {
        case kSliderTag:
            return formatText("%g", static_cast<double>(normal.value()));
        case kHSliderIntTag:
            return formatText("%d", static_cast<int>(hSliderParam_.range.unmapToValue(normal)));
        case kVSliderDbTag:
            return formatText("%.3f dB", static_cast<double>(vSliderParam_.range.unmapToValue(normal)));
        case kKnobFreqTag:
            return formatText("%.2f Hz", static_cast<double>(knobParam_.range.unmapToValue(normal)));
        case kXYPadFloatTag:
            return formatText("%.2f", static_cast<double>(xyPadXParam_.range.unmapToValue(normal)));
        default:
            break;
    }
    return {};
}

void ParameterPanel::setOutputText(std::string text) {
    outputText_ = std::move(text);
}

} // namespace Vernier::Core
