#pragma once

// ==============================================================================
// TickKnob - Rotary knob with tick marks and a value readout
// ==============================================================================
// Drawn as a round body inside a value arc, with the panel's tick marks on
// the outside of the arc and a pointer dot on the body rim.
//
// Drag up to increase, down to decrease; kDragPixels of travel covers the
// full range and Shift scales it by kFineScale. While dragging, the body
// shows the formatted value (value formatter, or a percentage).
// Double-click restores the default value.
//
// Registered as "TickKnob" via VSTGUI ViewCreator system.
// ==============================================================================

#include "color_utils.h"

#include <vernier/core/tick_marks.h>

#include "vstgui/lib/controls/cknob.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/cgraphicspath.h"
#include "vstgui/lib/ccolor.h"
#include "vstgui/lib/cfont.h"
#include "vstgui/uidescription/iviewcreator.h"
#include "vstgui/uidescription/uiviewfactory.h"
#include "vstgui/uidescription/uiviewcreator.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/uidescription/detail/uiviewcreatorattributes.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>

namespace Vernier::UI {

class TickKnob : public VSTGUI::CKnobBase {
public:
    /// Produces the readout text for a normalized value.
    using ValueFormatter = std::function<std::string(float normalized)>;

    static constexpr float kDragPixels = 200.0f;
    static constexpr float kFineScale = 0.1f;
    static constexpr VSTGUI::CCoord kArcWidth = 3.0;

    TickKnob(const VSTGUI::CRect& size, VSTGUI::IControlListener* listener, int32_t tag)
        : CKnobBase(size, listener, tag, nullptr) {}

    TickKnob(const TickKnob& other)
        : CKnobBase(other)
        , tickMarks_(other.tickMarks_)
        , valueFormatter_(other.valueFormatter_)
        , arcColor_(other.arcColor_)
        , tickColor_(other.tickColor_) {}

    CLASS_METHODS(TickKnob, CKnobBase)

    void setTickMarks(const Core::TickMarks::Group& marks) { tickMarks_ = marks; setDirty(); }
    [[nodiscard]] const Core::TickMarks::Group& getTickMarks() const { return tickMarks_; }

    void setValueFormatter(ValueFormatter formatter) { valueFormatter_ = std::move(formatter); }

    /// Readout text for the current value.
    [[nodiscard]] std::string getFormattedValue() const {
        if (valueFormatter_) {
            std::string text = valueFormatter_(getValueNormalized());
            if (!text.empty())
                return text;
        }
        return std::to_string(static_cast<int>(getValueNormalized() * 100.0f + 0.5f)) + "%";
    }

    void setArcColor(VSTGUI::CColor color) { arcColor_ = color; }
    [[nodiscard]] VSTGUI::CColor getArcColor() const { return arcColor_; }

    void setTickColor(VSTGUI::CColor color) { tickColor_ = color; }
    [[nodiscard]] VSTGUI::CColor getTickColor() const { return tickColor_; }

    [[nodiscard]] bool isDragging() const { return drag_.active; }

    // =========================================================================
    // Geometry
    // =========================================================================

    /// Angle in degrees for a normalized value, from CKnobBase's start and
    /// range angles (radians).
    [[nodiscard]] double valueToAngleDeg(float normalized) const {
        const double radians = static_cast<double>(startAngle) +
                               static_cast<double>(normalized) * static_cast<double>(rangeAngle);
        return radians * 180.0 / VSTGUI::Constants::pi;
    }

    /// Tick line length outside the arc.
    [[nodiscard]] static VSTGUI::CCoord tickLength(Core::TickMarks::Tier tier) {
        switch (tier) {
            case Core::TickMarks::Tier::One:   return 5.0;
            case Core::TickMarks::Tier::Two:   return 4.0;
            case Core::TickMarks::Tier::Three: return 2.5;
        }
        return 2.5;
    }

    /// Value after dragging `pixelsUp` from `startValue`, clamped to [0, 1].
    [[nodiscard]] static float dragValue(float startValue, VSTGUI::CCoord pixelsUp, bool fine) {
        const float scale = fine ? kFineScale : 1.0f;
        return std::clamp(startValue + static_cast<float>(pixelsUp) / kDragPixels * scale,
                          0.0f, 1.0f);
    }

    // =========================================================================
    // Drawing
    // =========================================================================

    void draw(VSTGUI::CDrawContext* context) override {
        context->setDrawMode(VSTGUI::kAntiAliasing | VSTGUI::kNonIntegralMode);

        const double radius = arcRadius();
        drawTicks(context, radius + kArcWidth);
        drawArc(context, radius);
        drawBody(context, radius - kArcWidth - 2.0);

        setDirty(false);
    }

    // =========================================================================
    // Mouse
    // =========================================================================

    VSTGUI::CMouseEventResult onMouseDown(VSTGUI::CPoint& where,
                                          const VSTGUI::CButtonState& buttons) override {
        if (!buttons.isLeftButton())
            return VSTGUI::kMouseEventNotHandled;

        beginEdit();
        if (buttons.isDoubleClick()) {
            setValueAndNotify(getDefaultValue());
            endEdit();
            return VSTGUI::kMouseEventHandled;
        }

        drag_.active = true;
        drag_.restore = getValueNormalized();
        anchorDrag(where, buttons.isShiftSet());
        invalid();
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseMoved(VSTGUI::CPoint& where,
                                           const VSTGUI::CButtonState& buttons) override {
        if (!drag_.active || !buttons.isLeftButton())
            return VSTGUI::kMouseEventNotHandled;

        if (buttons.isShiftSet() != drag_.fine)
            anchorDrag(where, buttons.isShiftSet());

        setValueAndNotify(dragValue(drag_.startValue, drag_.startY - where.y, drag_.fine));
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseUp(VSTGUI::CPoint& /*where*/,
                                        const VSTGUI::CButtonState& /*buttons*/) override {
        if (drag_.active)
            endDrag();
        return VSTGUI::kMouseEventHandled;
    }

    VSTGUI::CMouseEventResult onMouseCancel() override {
        if (drag_.active) {
            setValueAndNotify(drag_.restore);
            endDrag();
        }
        return VSTGUI::kMouseEventHandled;
    }

private:
    struct DragState {
        bool active = false;
        bool fine = false;
        VSTGUI::CCoord startY = 0.0;
        float startValue = 0.0f;
        float restore = 0.0f;
    };

    static constexpr VSTGUI::CColor kBodyColor{44, 44, 50, 255};
    static constexpr VSTGUI::CColor kTrackColor{60, 60, 66, 255};
    static constexpr VSTGUI::CColor kReadoutColor{235, 235, 240, 255};

    void anchorDrag(const VSTGUI::CPoint& where, bool fine) {
        drag_.fine = fine;
        drag_.startY = where.y;
        drag_.startValue = getValueNormalized();
    }

    void endDrag() {
        drag_ = DragState{};
        endEdit();
        invalid();
    }

    void setValueAndNotify(float normalized) {
        if (normalized == getValueNormalized())
            return;
        setValueNormalized(normalized);
        valueChanged();
        invalid();
    }

    [[nodiscard]] VSTGUI::CPoint center() const {
        return getViewSize().getCenter();
    }

    [[nodiscard]] VSTGUI::CPoint pointAt(double angleDeg, double radius) const {
        const double radians = angleDeg * VSTGUI::Constants::pi / 180.0;
        const VSTGUI::CPoint c = center();
        return VSTGUI::CPoint(c.x + std::cos(radians) * radius, c.y + std::sin(radians) * radius);
    }

    /// Leaves room for the longest tick outside the arc.
    [[nodiscard]] double arcRadius() const {
        const VSTGUI::CRect vs = getViewSize();
        return std::min(vs.getWidth(), vs.getHeight()) / 2.0 -
               tickLength(Core::TickMarks::Tier::One) - kArcWidth;
    }

    [[nodiscard]] VSTGUI::CRect circleRect(double radius) const {
        const VSTGUI::CPoint c = center();
        return VSTGUI::CRect(c.x - radius, c.y - radius, c.x + radius, c.y + radius);
    }

    void drawTicks(VSTGUI::CDrawContext* context, double innerRadius) const {
        context->setLineWidth(1.0);
        context->setLineStyle(VSTGUI::kLineSolid);
        for (const auto& mark : tickMarks_) {
            const double angle = valueToAngleDeg(mark.position.value());
            const float shade = 1.0f - 0.2f * static_cast<float>(static_cast<int>(mark.tier));
            context->setFrameColor(darkenColor(tickColor_, shade));
            context->drawLine(pointAt(angle, innerRadius),
                              pointAt(angle, innerRadius + tickLength(mark.tier)));
        }
    }

    /// Full travel in the track color, then the filled part from 0 to the value.
    void drawArc(VSTGUI::CDrawContext* context, double radius) const {
        const VSTGUI::CRect rect = circleRect(radius);
        context->setLineWidth(kArcWidth);
        context->setLineStyle(VSTGUI::CLineStyle(VSTGUI::CLineStyle::kLineCapRound));

        auto strokeArc = [&](float from, float to, const VSTGUI::CColor& color) {
            auto path = VSTGUI::owned(context->createGraphicsPath());
            if (!path)
                return;
            path->addArc(rect, valueToAngleDeg(from), valueToAngleDeg(to), true);
            context->setFrameColor(color);
            context->drawGraphicsPath(path, VSTGUI::CDrawContext::kPathStroked);
        };

        strokeArc(0.0f, 1.0f, kTrackColor);
        const float value = getValueNormalized();
        if (value > 0.0f)
            strokeArc(0.0f, value, drag_.active ? brightenColor(arcColor_, 1.15f) : arcColor_);
    }

    void drawBody(VSTGUI::CDrawContext* context, double radius) const {
        if (radius <= 0.0)
            return;

        context->setFillColor(kBodyColor);
        context->drawEllipse(circleRect(radius), VSTGUI::kDrawFilled);

        const VSTGUI::CPoint dot = pointAt(valueToAngleDeg(getValueNormalized()), radius - 4.0);
        context->setFillColor(arcColor_);
        context->drawEllipse(VSTGUI::CRect(dot.x - 2.0, dot.y - 2.0, dot.x + 2.0, dot.y + 2.0),
                             VSTGUI::kDrawFilled);

        if (!drag_.active)
            return;

        auto font = VSTGUI::makeOwned<VSTGUI::CFontDesc>("", 8);
        context->setFont(font);
        context->setFontColor(kReadoutColor);
        context->drawString(getFormattedValue().c_str(), circleRect(radius), VSTGUI::kCenterText);
    }

    DragState drag_;

    Core::TickMarks::Group tickMarks_;
    ValueFormatter valueFormatter_;

    VSTGUI::CColor arcColor_{220, 180, 100, 255};
    VSTGUI::CColor tickColor_{150, 150, 155, 255};
};

// =============================================================================
// ViewCreator Registration
// =============================================================================
// Angles are given in degrees in the uidesc and stored in radians.

struct TickKnobCreator : VSTGUI::ViewCreatorAdapter {
    TickKnobCreator() { VSTGUI::UIViewFactory::registerViewCreator(*this); }

    VSTGUI::IdStringPtr getViewName() const override { return "TickKnob"; }
    VSTGUI::IdStringPtr getBaseViewName() const override { return VSTGUI::UIViewCreator::kCControl; }
    VSTGUI::UTF8StringPtr getDisplayName() const override { return "Tick Knob"; }

    VSTGUI::CView* create(const VSTGUI::UIAttributes& /*attributes*/,
                          const VSTGUI::IUIDescription* /*description*/) const override {
        return new TickKnob(VSTGUI::CRect(0, 0, 80, 80), nullptr, -1);
    }

    bool apply(VSTGUI::CView* view, const VSTGUI::UIAttributes& attributes,
               const VSTGUI::IUIDescription* description) const override {
        auto* knob = dynamic_cast<TickKnob*>(view);
        if (!knob)
            return false;

        VSTGUI::CColor color;
        if (VSTGUI::UIViewCreator::stringToColor(attributes.getAttributeValue("arc-color"), color, description))
            knob->setArcColor(color);
        if (VSTGUI::UIViewCreator::stringToColor(attributes.getAttributeValue("tick-color"), color, description))
            knob->setTickColor(color);

        double degrees = 0.0;
        if (attributes.getDoubleAttribute("angle-start", degrees))
            knob->setStartAngle(static_cast<float>(degreesToRadians(degrees)));
        if (attributes.getDoubleAttribute("angle-range", degrees))
            knob->setRangeAngle(static_cast<float>(degreesToRadians(degrees)));
        return true;
    }

    bool getAttributeNames(VSTGUI::IViewCreator::StringList& attributeNames) const override {
        for (const char* name : {"arc-color", "tick-color", "angle-start", "angle-range"})
            attributeNames.emplace_back(name);
        return true;
    }

    AttrType getAttributeType(const std::string& attributeName) const override {
        if (attributeName == "arc-color" || attributeName == "tick-color")
            return kColorType;
        if (attributeName == "angle-start" || attributeName == "angle-range")
            return kFloatType;
        return kUnknownType;
    }

    bool getAttributeValue(VSTGUI::CView* view, const std::string& attributeName,
                           std::string& stringValue,
                           const VSTGUI::IUIDescription* desc) const override {
        auto* knob = dynamic_cast<TickKnob*>(view);
        if (!knob)
            return false;

        if (attributeName == "arc-color") {
            VSTGUI::UIViewCreator::colorToString(knob->getArcColor(), stringValue, desc);
        } else if (attributeName == "tick-color") {
            VSTGUI::UIViewCreator::colorToString(knob->getTickColor(), stringValue, desc);
        } else if (attributeName == "angle-start") {
            stringValue = VSTGUI::UIAttributes::doubleToString(radiansToDegrees(knob->getStartAngle()), 5);
        } else if (attributeName == "angle-range") {
            stringValue = VSTGUI::UIAttributes::doubleToString(radiansToDegrees(knob->getRangeAngle()), 5);
        } else {
            return false;
        }
        return true;
    }

private:
    static double degreesToRadians(double degrees) { return degrees / 180.0 * VSTGUI::Constants::pi; }
    static double radiansToDegrees(float radians) {
        return static_cast<double>(radians) / VSTGUI::Constants::pi * 180.0;
    }
};

inline TickKnobCreator gTickKnobCreator;

} // namespace Vernier::UI
