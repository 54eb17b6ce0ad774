#pragma once

// ==============================================================================
// ParameterPanel - Demo Parameter State and Event Handling
// ==============================================================================
// Holds the demo's parameters (each a range plus a normalized value), turns
// incoming Messages into stored normals and a status string, and renders a
// toolkit-independent description of the widget tree.
//
// Single-threaded: all calls must come from the UI thread.
//
// Widget order in render():
//   plain slider, button, h-slider (int), v-slider (dB), knob (Hz),
//   XY pad (float), status text
// ==============================================================================

#include <vernier/core/control_tags.h>
#include <vernier/core/float_range.h>
#include <vernier/core/freq_range.h>
#include <vernier/core/int_range.h>
#include <vernier/core/log_db_range.h>
#include <vernier/core/normal.h>
#include <vernier/core/panel_config.h>
#include <vernier/core/panel_message.h>
#include <vernier/core/tick_marks.h>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace Vernier::Core {

// ==============================================================================
// Parameter
// ==============================================================================

/// A range and the normalized state of the widget that drives it.
/// update() snaps through the range, so stepped ranges only ever store
/// normals that land exactly on a step.
template <typename RangeT>
struct Parameter {
    RangeT range;
    NormalParam normal;

    void update(Normal n) noexcept { normal.update(range.snapped(n)); }
    void reset() noexcept { normal.reset(); }

    [[nodiscard]] auto value() const noexcept { return range.unmapToValue(normal.value); }
};

// ==============================================================================
// Render Output
// ==============================================================================

enum class WidgetKind : uint8_t {
    Slider = 0,
    Button,
    HSlider,
    VSlider,
    Knob,
    XYPad,
    Text
};

struct WidgetView {
    WidgetKind kind = WidgetKind::Text;
    ControlTag tag = kInvalidTag;
    NormalParam x;                                ///< Value (X axis for the pad)
    NormalParam y;                                ///< XYPad only
    float step = 0.0f;                            ///< Slider only, 0 = continuous
    TickMarks::Group tickMarks;                   ///< Empty for widgets without marks
    std::string label;                            ///< Button caption or text content
};

struct PanelLayout {
    float maxWidth = 300.0f;
    float maxHeight = 500.0f;
    float spacing = 20.0f;
    float padding = 20.0f;
    bool centered = true;
};

/// Snapshot of the panel. Owns all of its data and outlives the panel freely.
struct PanelView {
    std::vector<WidgetView> widgets;
    PanelLayout layout;
    std::string outputText;

    /// Widget bound to `tag`, or nullptr.
    [[nodiscard]] const WidgetView* find(ControlTag tag) const noexcept;
};

// ==============================================================================
// ParameterPanel
// ==============================================================================

class ParameterPanel {
public:
    /// Called after every handled message with the new status text.
    using ChangeListener = std::function<void(const Message& message, const std::string& outputText)>;

    explicit ParameterPanel(const PanelConfig& config = PanelConfig{});

    /// Apply one message: update exactly one parameter (both axes for the XY
    /// pad) and overwrite the status text.
    void handleEvent(const Message& message);

    /// Restore every parameter to its default normal and the plain slider to
    /// its initial value.
    void resetToDefaults();

    [[nodiscard]] PanelView render() const;

    [[nodiscard]] const std::string& title() const noexcept { return config_.windowTitle; }
    [[nodiscard]] const std::string& outputText() const noexcept { return outputText_; }

    /// Real-world value of `normal` for the widget bound to `tag`, formatted
    /// with its unit ("5", "-3.000 dB", "1000.00 Hz", "0.50").
    /// Empty for tags without a range.
    [[nodiscard]] std::string describe(ControlTag tag, Normal normal) const;

    void setChangeListener(ChangeListener listener) { listener_ = std::move(listener); }

    // =========================================================================
    // State Access
    // =========================================================================

    [[nodiscard]] const PanelConfig& config() const noexcept { return config_; }
    [[nodiscard]] float sliderValue() const noexcept { return sliderValue_; }
    [[nodiscard]] uint8_t buttonId() const noexcept { return config_.buttonId; }

    [[nodiscard]] const Parameter<IntRange>& hSliderParam() const noexcept { return hSliderParam_; }
    [[nodiscard]] const Parameter<LogDBRange>& vSliderParam() const noexcept { return vSliderParam_; }
    [[nodiscard]] const Parameter<FreqRange>& knobParam() const noexcept { return knobParam_; }
    [[nodiscard]] const Parameter<FloatRange>& xyPadXParam() const noexcept { return xyPadXParam_; }
    [[nodiscard]] const Parameter<FloatRange>& xyPadYParam() const noexcept { return xyPadYParam_; }

    [[nodiscard]] const TickMarks::Group& centerTickMark() const noexcept { return centerTickMark_; }
    [[nodiscard]] const TickMarks::Group& knobTickMarks() const noexcept { return knobTickMarks_; }

private:
    void setOutputText(std::string text);

    PanelConfig config_;

    float sliderValue_ = 0.0f;

    Parameter<IntRange> hSliderParam_;
    Parameter<LogDBRange> vSliderParam_;
    Parameter<FreqRange> knobParam_;
    Parameter<FloatRange> xyPadXParam_;
    Parameter<FloatRange> xyPadYParam_;

    TickMarks::Group centerTickMark_;
    TickMarks::Group knobTickMarks_;

    std::string outputText_;
    ChangeListener listener_;
};

} // namespace Vernier::Core
