#pragma once

// ==============================================================================
// XYPad - Two-Axis Parameter Pad
// ==============================================================================
// Edits two normalized values at once. X is the regular CControl value and
// Y is held by the pad. A move of either axis is reported through a single
// valueChanged(), so a listener reads both with getX()/getY() as one update.
//
// Interaction:
// - Click jumps the handle to the pointer, drag follows it
// - Shift+drag moves at 0.1x relative to where the drag (re)started
// - Double-click restores the default position
// - Escape during a drag restores the position from before the drag
//
// The dashed axes mark the center of each range (0 for a bipolar range).
//
// Registered as "XYPad" via VSTGUI ViewCreator system.
// ==============================================================================

#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/ccolor.h"
#include "vstgui/lib/events.h"
#include "vstgui/uidescription/iviewcreator.h"
#include "vstgui/uidescription/uiviewfactory.h"
#include "vstgui/uidescription/uiviewcreator.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/uidescription/detail/uiviewcreatorattributes.h"

#include <algorithm>
#include <string>

namespace Vernier::UI {

class XYPad : public VSTGUI::CControl {
public:
    struct Position {
        float x = 0.5f;
        float y = 0.5f;
    };

    static constexpr VSTGUI::CCoord kInset = 8.0;
    static constexpr VSTGUI::CCoord kHandleRadius = 6.0;
    static constexpr float kFineScale = 0.1f;

    XYPad(const VSTGUI::CRect& size, VSTGUI::IControlListener* listener, int32_t tag)
        : CControl(size, listener, tag) {
        setMin(0.0f);
        setMax(1.0f);
        setValue(0.5f);
        setDefaultValue(0.5f);
    }

    XYPad(const XYPad& other)
        : CControl(other)
        , y_(other.y_)
        , defaultY_(other.defaultY_)
        , cursorColor_(other.cursorColor_) {}

    CLASS_METHODS(XYPad, CControl)

    // =========================================================================
    // Position
    // =========================================================================

    /// Programmatic update: redraws without notifying the listener.
    void setPosition(float x, float y) {
        setValue(clampUnit(x));
        y_ = clampUnit(y);
        invalid();
    }

    /// Position restored by double-click.
    void setDefaultPosition(float x, float y) {
        setDefaultValue(clampUnit(x));
        defaultY_ = clampUnit(y);
    }

    [[nodiscard]] float getX() const { return getValueNormalized(); }
    [[nodiscard]] float getY() const { return y_; }
    [[nodiscard]] float getDefaultY() const { return defaultY_; }
    [[nodiscard]] Position getPosition() const { return {getX(), y_}; }

    void setCursorColor(VSTGUI::CColor color) { cursorColor_ = color; }
    [[nodiscard]] VSTGUI::CColor getCursorColor() const { return cursorColor_; }

    // =========================================================================
    // Geometry
    // =========================================================================

    /// Area the handle center can reach: the view inset by kInset.
    [[nodiscard]] VSTGUI::CRect getTravelRect() const {
        VSTGUI::CRect r = getViewSize();
        r.inset(kInset, kInset);
        return r;
    }

    /// Pixel for a position. Y grows upwards.
    [[nodiscard]] VSTGUI::CPoint toPixel(Position position) const {
        const VSTGUI::CRect r = getTravelRect();
        return VSTGUI::CPoint(r.left + static_cast<VSTGUI::CCoord>(position.x) * r.getWidth(),
                              r.bottom - static_cast<VSTGUI::CCoord>(position.y) * r.getHeight());
    }

    /// Position under a pixel, clamped into the pad.
    [[nodiscard]] Position fromPixel(const VSTGUI::CPoint& where) const {
        const VSTGUI::CRect r = getTravelRect();
        if (r.getWidth() <= 0.0 || r.getHeight() <= 0.0)
            return getPosition();
        return {clampUnit(static_cast<float>((where.x - r.left) / r.getWidth())),
                clampUnit(static_cast<float>((r.bottom - where.y) / r.getHeight()))};
    }

    // =========================================================================
    // Drawing
    // =========================================================================

    void draw(VSTGUI::CDrawContext* context) override {
        context->setDrawMode(VSTGUI::kAntiAliasing | VSTGUI::kNonIntegralMode);

        const VSTGUI::CRect bounds = getViewSize();
        context->setFillColor(kPadColor);
        context->drawRect(bounds, VSTGUI::kDrawFilled);
        context->setFrameColor(kBorderColor);
        context->setLineWidth(1.0);
        context->drawRect(bounds, VSTGUI::kDrawStroked);

        drawAxes(context);
        drawHandle(context);
        setDirty(false);
    }

    // =========================================================================
    // Events
    // =========================================================================

    void onMouseDownEvent(VSTGUI::MouseDownEvent& event) override {
        if (!event.buttonState.isLeft())
            return;
        event.consumed = true;

        beginEdit();
        if (event.clickCount == 2) {
            movePosition({getDefaultValue(), defaultY_});
            endEdit();
            return;
        }

        drag_.active = true;
        drag_.restore = getPosition();
        startDragFrom(event.mousePosition, event.modifiers.has(VSTGUI::ModifierKey::Shift));
        if (!drag_.fine)
            movePosition(fromPixel(event.mousePosition));
    }

    void onMouseMoveEvent(VSTGUI::MouseMoveEvent& event) override {
        if (!drag_.active)
            return;
        event.consumed = true;

        const bool fine = event.modifiers.has(VSTGUI::ModifierKey::Shift);
        if (fine != drag_.fine)
            startDragFrom(event.mousePosition, fine);

        if (!drag_.fine) {
            movePosition(fromPixel(event.mousePosition));
            return;
        }

        const VSTGUI::CRect r = getTravelRect();
        if (r.getWidth() <= 0.0 || r.getHeight() <= 0.0)
            return;
        const auto dx = static_cast<float>((event.mousePosition.x - drag_.anchorPixel.x) / r.getWidth());
        const auto dy = static_cast<float>((drag_.anchorPixel.y - event.mousePosition.y) / r.getHeight());
        movePosition({drag_.anchor.x + dx * kFineScale, drag_.anchor.y + dy * kFineScale});
    }

    void onMouseUpEvent(VSTGUI::MouseUpEvent& event) override {
        if (!drag_.active)
            return;
        event.consumed = true;
        finishDrag();
    }

    void onKeyboardEvent(VSTGUI::KeyboardEvent& event) override {
        if (event.type != VSTGUI::EventType::KeyDown || !drag_.active)
            return;
        if (event.virt == VSTGUI::VirtualKey::Escape) {
            movePosition(drag_.restore);
            finishDrag();
            event.consumed = true;
        }
    }

private:
    struct DragState {
        bool active = false;
        bool fine = false;
        VSTGUI::CPoint anchorPixel;
        Position anchor;
        Position restore;
    };

    static constexpr VSTGUI::CColor kPadColor{34, 34, 40, 255};
    static constexpr VSTGUI::CColor kBorderColor{90, 90, 98, 255};
    static constexpr VSTGUI::CColor kAxisColor{70, 70, 78, 255};

    [[nodiscard]] static float clampUnit(float v) { return std::clamp(v, 0.0f, 1.0f); }

    void startDragFrom(const VSTGUI::CPoint& where, bool fine) {
        drag_.fine = fine;
        drag_.anchorPixel = where;
        drag_.anchor = getPosition();
    }

    void finishDrag() {
        drag_ = DragState{};
        endEdit();
    }

    /// Set both axes and notify once.
    void movePosition(Position position) {
        setValue(clampUnit(position.x));
        y_ = clampUnit(position.y);
        valueChanged();
        invalid();
    }

    void drawAxes(VSTGUI::CDrawContext* context) const {
        const VSTGUI::CRect r = getTravelRect();
        const VSTGUI::CPoint center = toPixel({0.5f, 0.5f});

        context->setFrameColor(kAxisColor);
        context->setLineWidth(1.0);
        context->setLineStyle(VSTGUI::kLineOnOffDash);
        context->drawLine(VSTGUI::CPoint(r.left, center.y), VSTGUI::CPoint(r.right, center.y));
        context->drawLine(VSTGUI::CPoint(center.x, r.top), VSTGUI::CPoint(center.x, r.bottom));
        context->setLineStyle(VSTGUI::kLineSolid);
    }

    void drawHandle(VSTGUI::CDrawContext* context) const {
        const VSTGUI::CRect bounds = getViewSize();
        const VSTGUI::CPoint p = toPixel(getPosition());

        // Crosshair through the handle
        VSTGUI::CColor guide = cursorColor_;
        guide.alpha = 60;
        context->setFrameColor(guide);
        context->drawLine(VSTGUI::CPoint(p.x, bounds.top), VSTGUI::CPoint(p.x, bounds.bottom));
        context->drawLine(VSTGUI::CPoint(bounds.left, p.y), VSTGUI::CPoint(bounds.right, p.y));

        const VSTGUI::CRect handle(p.x - kHandleRadius, p.y - kHandleRadius,
                                   p.x + kHandleRadius, p.y + kHandleRadius);
        context->setFillColor(drag_.active ? cursorColor_ : kPadColor);
        context->drawEllipse(handle, VSTGUI::kDrawFilled);
        context->setFrameColor(cursorColor_);
        context->setLineWidth(2.0);
        context->drawEllipse(handle, VSTGUI::kDrawStroked);
    }

    float y_ = 0.5f;
    float defaultY_ = 0.5f;
    DragState drag_;
    VSTGUI::CColor cursorColor_{230, 230, 235, 255};
};

// =============================================================================
// ViewCreator Registration
// =============================================================================

struct XYPadCreator : VSTGUI::ViewCreatorAdapter {
    XYPadCreator() { VSTGUI::UIViewFactory::registerViewCreator(*this); }

    VSTGUI::IdStringPtr getViewName() const override { return "XYPad"; }
    VSTGUI::IdStringPtr getBaseViewName() const override { return VSTGUI::UIViewCreator::kCControl; }
    VSTGUI::UTF8StringPtr getDisplayName() const override { return "XY Pad"; }

    VSTGUI::CView* create(const VSTGUI::UIAttributes& /*attributes*/,
                          const VSTGUI::IUIDescription* /*description*/) const override {
        return new XYPad(VSTGUI::CRect(0, 0, 100, 100), nullptr, -1);
    }

    bool apply(VSTGUI::CView* view, const VSTGUI::UIAttributes& attributes,
               const VSTGUI::IUIDescription* description) const override {
        auto* pad = dynamic_cast<XYPad*>(view);
        if (!pad)
            return false;

        VSTGUI::CColor color;
        if (VSTGUI::UIViewCreator::stringToColor(
                attributes.getAttributeValue("cursor-color"), color, description))
            pad->setCursorColor(color);
        return true;
    }

    bool getAttributeNames(VSTGUI::IViewCreator::StringList& attributeNames) const override {
        attributeNames.emplace_back("cursor-color");
        return true;
    }

    AttrType getAttributeType(const std::string& attributeName) const override {
        return attributeName == "cursor-color" ? kColorType : kUnknownType;
    }

    bool getAttributeValue(VSTGUI::CView* view, const std::string& attributeName,
                           std::string& stringValue,
                           const VSTGUI::IUIDescription* desc) const override {
        auto* pad = dynamic_cast<XYPad*>(view);
        if (!pad || attributeName != "cursor-color")
            return false;
        VSTGUI::UIViewCreator::colorToString(pad->getCursorColor(), stringValue, desc);
        return true;
    }
};

inline XYPadCreator gXYPadCreator;

} // namespace Vernier::UI
