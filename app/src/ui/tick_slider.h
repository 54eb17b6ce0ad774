#pragma once

// ==============================================================================
// TickSlider - Linear Slider with Tick Marks
// ==============================================================================
// A CControl that renders a horizontal or vertical slider track with a filled
// portion up to the current value, a round handle and optional tick marks
// from a TickMarks::Group.
//
// Interaction:
// - Drag along the track (right/up = increase), Shift for 0.1x fine adjust
// - Escape cancels the drag and restores the pre-drag value
// - Double-click resets to the control default value
//
// With a non-zero step the value is quantized to multiples of the step.
// Stepped parameters whose snapping is owned by a range (the integer slider)
// leave step at 0 and have the snapped value pushed back by the controller.
//
// Registered as "TickSlider" via VSTGUI ViewCreator system.
// ==============================================================================

#include "color_utils.h"

#include <vernier/core/tick_marks.h>

#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/ccolor.h"
#include "vstgui/uidescription/iviewcreator.h"
#include "vstgui/uidescription/uiviewfactory.h"
#include "vstgui/uidescription/uiviewcreator.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/uidescription/detail/uiviewcreatorattributes.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace Vernier::UI {

// ==============================================================================
// TickSlider Control
// ==============================================================================

class TickSlider : public VSTGUI::CControl {
public:
    enum class Orientation {
        Horizontal,
        Vertical
    };

    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr float kFineScale = 0.1f;
    static constexpr float kDefaultSensitivity = 1.0f / 200.0f; // 200px full range
    static constexpr VSTGUI::CCoord kTrackPadding = 8.0;
    static constexpr VSTGUI::CCoord kTrackThickness = 4.0;
    static constexpr VSTGUI::CCoord kHandleRadius = 6.0;

    // =========================================================================
    // Construction
    // =========================================================================

    TickSlider(const VSTGUI::CRect& size,
               VSTGUI::IControlListener* listener,
               int32_t tag)
        : CControl(size, listener, tag) {
        setMin(0.0f);
        setMax(1.0f);
        setOrientation(size.getHeight() > size.getWidth()
            ? Orientation::Vertical : Orientation::Horizontal);
    }

    TickSlider(const TickSlider& other)
        : CControl(other)
        , orientation_(other.orientation_)
        , step_(other.step_)
        , tickMarks_(other.tickMarks_)
        , fillColor_(other.fillColor_)
        , trackColor_(other.trackColor_)
        , handleColor_(other.handleColor_)
        , tickColor_(other.tickColor_) {}

    CLASS_METHODS(TickSlider, CControl)

    // =========================================================================
    // Configuration
    // =========================================================================

    void setOrientation(Orientation orientation) { orientation_ = orientation; setDirty(); }
    [[nodiscard]] Orientation getOrientation() const { return orientation_; }

    /// Quantization step in normalized units, 0 for continuous.
    void setStep(float step) { step_ = std::clamp(step, 0.0f, 1.0f); }
    [[nodiscard]] float getStep() const { return step_; }

    void setTickMarks(const Core::TickMarks::Group& marks) { tickMarks_ = marks; setDirty(); }
    [[nodiscard]] const Core::TickMarks::Group& getTickMarks() const { return tickMarks_; }

    void setFillColor(const VSTGUI::CColor& color) { fillColor_ = color; setDirty(); }
    [[nodiscard]] VSTGUI::CColor getFillColor() const { return fillColor_; }

    void setTrackColor(const VSTGUI::CColor& color) { trackColor_ = color; setDirty(); }
    [[nodiscard]] VSTGUI::CColor getTrackColor() const { return trackColor_; }

    void setHandleColor(const VSTGUI::CColor& color) { handleColor_ = color; setDirty(); }
    [[nodiscard]] VSTGUI::CColor getHandleColor() const { return handleColor_; }

    void setTickColor(const VSTGUI::CColor& color) { tickColor_ = color; setDirty(); }
    [[nodiscard]] VSTGUI::CColor getTickColor() const { return tickColor_; }

    // =========================================================================
    // Geometry Helpers
    // =========================================================================

    /// Round to the nearest multiple of `step`. A step of 0 passes through.
    [[nodiscard]] static float quantize(float normalized, float step) {
        if (step <= 0.0f)
            return std::clamp(normalized, 0.0f, 1.0f);
        float snapped = std::floor(normalized / step + 0.5f) * step;
        return std::clamp(snapped, 0.0f, 1.0f);
    }

    /// Pixel coordinate along the track axis for a normalized position.
    /// Horizontal: 0 at the left end. Vertical: 0 at the bottom end.
    [[nodiscard]] VSTGUI::CCoord positionToPixel(float normalized) const {
        VSTGUI::CRect r = getViewSize();
        if (orientation_ == Orientation::Horizontal) {
            VSTGUI::CCoord length = r.getWidth() - 2.0 * kTrackPadding;
            return r.left + kTrackPadding + static_cast<VSTGUI::CCoord>(normalized) * length;
        }
        VSTGUI::CCoord length = r.getHeight() - 2.0 * kTrackPadding;
        return r.bottom - kTrackPadding - static_cast<VSTGUI::CCoord>(normalized) * length;
    }

    /// Half-length of a tick line across the track for a tier.
    [[nodiscard]] static VSTGUI::CCoord tickHalfLength(Core::TickMarks::Tier tier) {
        switch (tier) {
            case Core::TickMarks::Tier::One:   return 9.0;
            case Core::TickMarks::Tier::Two:   return 7.0;
            case Core::TickMarks::Tier::Three: return 5.0;
        }
        return 5.0;
    }

    // =========================================================================
    // Drawing
    // =========================================================================

    void draw(VSTGUI::CDrawContext* context) override {
        context->setDrawMode(VSTGUI::kAntiAliasing | VSTGUI::kNonIntegralMode);

        drawTickMarks(context);
        drawTrack(context);
        drawHandle(context);

        setDirty(false);
    }

    // =========================================================================
    // Mouse Interaction
    // =========================================================================

    VSTGUI::CMouseEventResult onMouseDown(
        VSTGUI::CPoint& where,
        const VSTGUI::CButtonState& buttons) override {
        if (!(buttons & VSTGUI::kLButton))
            return VSTGUI::kMouseEventNotHandled;

        if (buttons.isDoubleClick()) {
            beginEdit();
            setValueNormalized(quantize(getDefaultValue(), step_));
            valueChanged();
            endEdit();
            invalid();
            return VSTGUI::kMouseEventHandled;
        }

        beginEdit();
        dragging_ = true;
        preDragValue_ = getValueNormalized();
        dragValue_ = preDragValue_;
        lastMouse_ = where;
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseMoved(
        VSTGUI::CPoint& where,
        const VSTGUI::CButtonState& buttons) override {
        if (!dragging_)
            return VSTGUI::kMouseEventNotHandled;

        float sensitivity = kDefaultSensitivity;
        if (buttons.isShiftSet())
            sensitivity *= kFineScale;

        // Right and up increase
        VSTGUI::CCoord pixels = (orientation_ == Orientation::Horizontal)
            ? where.x - lastMouse_.x
            : lastMouse_.y - where.y;
        lastMouse_ = where;

        // Accumulate unquantized so small moves still add up across steps
        dragValue_ = std::clamp(dragValue_ + static_cast<float>(pixels) * sensitivity,
                                0.0f, 1.0f);
        float newValue = quantize(dragValue_, step_);
        if (newValue != getValueNormalized()) {
            setValueNormalized(newValue);
            valueChanged();
            invalid();
        }

        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseUp(
        VSTGUI::CPoint& /*where*/,
        const VSTGUI::CButtonState& /*buttons*/) override {
        if (!dragging_)
            return VSTGUI::kMouseEventNotHandled;

        dragging_ = false;
        endEdit();
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseCancel() override {
        if (dragging_) {
            setValueNormalized(preDragValue_);
            valueChanged();
            invalid();
            dragging_ = false;
            endEdit();
        }
        return VSTGUI::kMouseEventHandled;
    }

private:
    // =========================================================================
    // Drawing Helpers
    // =========================================================================

    [[nodiscard]] VSTGUI::CCoord crossAxisCenter() const {
        VSTGUI::CRect r = getViewSize();
        return (orientation_ == Orientation::Horizontal)
            ? r.top + r.getHeight() / 2.0
            : r.left + r.getWidth() / 2.0;
    }

    [[nodiscard]] VSTGUI::CRect trackRect(float from, float to) const {
        VSTGUI::CCoord a = positionToPixel(from);
        VSTGUI::CCoord b = positionToPixel(to);
        VSTGUI::CCoord c = crossAxisCenter();
        VSTGUI::CCoord half = kTrackThickness / 2.0;
        if (orientation_ == Orientation::Horizontal)
            return VSTGUI::CRect(std::min(a, b), c - half, std::max(a, b), c + half);
        return VSTGUI::CRect(c - half, std::min(a, b), c + half, std::max(a, b));
    }

    void drawTickMarks(VSTGUI::CDrawContext* context) const {
        if (tickMarks_.empty())
            return;

        VSTGUI::CCoord c = crossAxisCenter();
        context->setLineWidth(1.0);
        context->setLineStyle(VSTGUI::kLineSolid);

        for (const auto& mark : tickMarks_) {
            VSTGUI::CCoord p = positionToPixel(mark.position.value());
            VSTGUI::CCoord half = tickHalfLength(mark.tier);

            // Fainter tiers are drawn darker
            float shade = 1.0f - 0.2f * static_cast<float>(static_cast<int>(mark.tier));
            context->setFrameColor(darkenColor(tickColor_, shade));

            if (orientation_ == Orientation::Horizontal) {
                context->drawLine(VSTGUI::CPoint(p, c - half), VSTGUI::CPoint(p, c + half));
            } else {
                context->drawLine(VSTGUI::CPoint(c - half, p), VSTGUI::CPoint(c + half, p));
            }
        }
    }

    void drawTrack(VSTGUI::CDrawContext* context) const {
        context->setFillColor(trackColor_);
        context->drawRect(trackRect(0.0f, 1.0f), VSTGUI::kDrawFilled);

        float normalized = getValueNormalized();
        if (normalized > 0.0f) {
            context->setFillColor(fillColor_);
            context->drawRect(trackRect(0.0f, normalized), VSTGUI::kDrawFilled);
        }
    }

    void drawHandle(VSTGUI::CDrawContext* context) const {
        VSTGUI::CCoord p = positionToPixel(getValueNormalized());
        VSTGUI::CCoord c = crossAxisCenter();
        VSTGUI::CPoint center = (orientation_ == Orientation::Horizontal)
            ? VSTGUI::CPoint(p, c) : VSTGUI::CPoint(c, p);

        VSTGUI::CRect handleRect(center.x - kHandleRadius, center.y - kHandleRadius,
                                 center.x + kHandleRadius, center.y + kHandleRadius);
        context->setFillColor(dragging_ ? brightenColor(handleColor_, 1.2f) : handleColor_);
        context->drawEllipse(handleRect, VSTGUI::kDrawFilled);
        context->setFrameColor(darkenColor(handleColor_, 0.5f));
        context->setLineWidth(1.0);
        context->drawEllipse(handleRect, VSTGUI::kDrawStroked);
    }

    // =========================================================================
    // State
    // =========================================================================

    Orientation orientation_ = Orientation::Horizontal;
    float step_ = 0.0f;
    Core::TickMarks::Group tickMarks_;

    VSTGUI::CColor fillColor_{78, 205, 196, 255};      // Cyan accent
    VSTGUI::CColor trackColor_{50, 50, 55, 255};        // Dark track
    VSTGUI::CColor handleColor_{210, 210, 215, 255};    // Light handle
    VSTGUI::CColor tickColor_{150, 150, 155, 255};

    bool dragging_ = false;
    float preDragValue_ = 0.0f;
    float dragValue_ = 0.0f;
    VSTGUI::CPoint lastMouse_;
};

// =============================================================================
// ViewCreator Registration
// =============================================================================

struct TickSliderCreator : VSTGUI::ViewCreatorAdapter {
    TickSliderCreator() {
        VSTGUI::UIViewFactory::registerViewCreator(*this);
    }

    VSTGUI::IdStringPtr getViewName() const override {
        return "TickSlider";
    }

    VSTGUI::IdStringPtr getBaseViewName() const override {
        return VSTGUI::UIViewCreator::kCControl;
    }

    VSTGUI::UTF8StringPtr getDisplayName() const override {
        return "Tick Slider";
    }

    VSTGUI::CView* create(
        const VSTGUI::UIAttributes& /*attributes*/,
        const VSTGUI::IUIDescription* /*description*/) const override {
        return new TickSlider(VSTGUI::CRect(0, 0, 200, 24), nullptr, -1);
    }

    bool apply(VSTGUI::CView* view, const VSTGUI::UIAttributes& attributes,
               const VSTGUI::IUIDescription* description) const override {
        auto* slider = dynamic_cast<TickSlider*>(view);
        if (!slider)
            return false;

        if (auto val = attributes.getAttributeValue("orientation")) {
            slider->setOrientation(*val == "vertical"
                ? TickSlider::Orientation::Vertical
                : TickSlider::Orientation::Horizontal);
        }

        double d;
        if (attributes.getDoubleAttribute("step", d))
            slider->setStep(static_cast<float>(d));

        VSTGUI::CColor color;
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("fill-color"), color, description))
            slider->setFillColor(color);
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("track-color"), color, description))
            slider->setTrackColor(color);
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("handle-color"), color, description))
            slider->setHandleColor(color);
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("tick-color"), color, description))
            slider->setTickColor(color);

        return true;
    }

    bool getAttributeNames(
        VSTGUI::IViewCreator::StringList& attributeNames) const override {
        attributeNames.emplace_back("orientation");
        attributeNames.emplace_back("step");
        attributeNames.emplace_back("fill-color");
        attributeNames.emplace_back("track-color");
        attributeNames.emplace_back("handle-color");
        attributeNames.emplace_back("tick-color");
        return true;
    }

    AttrType getAttributeType(
        const std::string& attributeName) const override {
        if (attributeName == "orientation") return kListType;
        if (attributeName == "step") return kFloatType;
        if (attributeName == "fill-color") return kColorType;
        if (attributeName == "track-color") return kColorType;
        if (attributeName == "handle-color") return kColorType;
        if (attributeName == "tick-color") return kColorType;
        return kUnknownType;
    }

    bool getPossibleListValues(
        const std::string& attributeName,
        VSTGUI::IViewCreator::ConstStringPtrList& values) const override {
        if (attributeName == "orientation") {
            static const std::string kHorizontal = "horizontal";
            static const std::string kVertical = "vertical";
            values.emplace_back(&kHorizontal);
            values.emplace_back(&kVertical);
            return true;
        }
        return false;
    }

    bool getAttributeValue(VSTGUI::CView* view,
                           const std::string& attributeName,
                           std::string& stringValue,
                           const VSTGUI::IUIDescription* desc) const override {
        auto* slider = dynamic_cast<TickSlider*>(view);
        if (!slider)
            return false;

        if (attributeName == "orientation") {
            stringValue = (slider->getOrientation() == TickSlider::Orientation::Vertical)
                ? "vertical" : "horizontal";
            return true;
        }
        if (attributeName == "step") {
            stringValue = VSTGUI::UIAttributes::doubleToString(
                static_cast<double>(slider->getStep()));
            return true;
        }
        if (attributeName == "fill-color") {
            VSTGUI::UIViewCreator::colorToString(
                slider->getFillColor(), stringValue, desc);
            return true;
        }
        if (attributeName == "track-color") {
            VSTGUI::UIViewCreator::colorToString(
                slider->getTrackColor(), stringValue, desc);
            return true;
        }
        if (attributeName == "handle-color") {
            VSTGUI::UIViewCreator::colorToString(
                slider->getHandleColor(), stringValue, desc);
            return true;
        }
        if (attributeName == "tick-color") {
            VSTGUI::UIViewCreator::colorToString(
                slider->getTickColor(), stringValue, desc);
            return true;
        }
        return false;
    }
};

inline TickSliderCreator gTickSliderCreator;

} // namespace Vernier::UI
