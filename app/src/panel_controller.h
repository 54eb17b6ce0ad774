// =============================================================================
// Panel Controller - Binds the VSTGUI controls to the ParameterPanel
// =============================================================================

#pragma once

#include <vernier/core/panel_message.h>
#include <vernier/core/parameter_panel.h>

#include "vstgui/uidescription/delegationcontroller.h"
#include "vstgui/uidescription/iuidescription.h"
#include "vstgui/uidescription/uiattributes.h"
#include "vstgui/lib/controls/ccontrol.h"
#include "vstgui/lib/controls/ctextlabel.h"

#include <cstdint>
#include <memory>

namespace Vernier::UI {
class TickKnob;
class TickSlider;
class XYPad;
} // namespace Vernier::UI

namespace Vernier::App {

// =============================================================================
// messageForControl - Translate a control change into a panel Message
// =============================================================================
// `value` is the control's normalized value, `valueY` the second axis (XY pad
// only). Returns false when the change carries no message: unknown tags and
// the button's release edge.
[[nodiscard]] bool messageForControl(int32_t tag, float value, float valueY,
                                     uint8_t buttonId, Core::Message& message) noexcept;

// =============================================================================
// PanelController - Sub-controller of the main view template
// =============================================================================
// Created by the delegate for sub-controller="PanelController" and owned by
// the view it is attached to. The ParameterPanel is shared with the delegate.
class PanelController : public VSTGUI::DelegationController {
public:
    PanelController(std::shared_ptr<Core::ParameterPanel> panel,
                    VSTGUI::IController* parent);
    ~PanelController() override;

    // IController interface
    VSTGUI::CView* createView(
        const VSTGUI::UIAttributes& attributes,
        const VSTGUI::IUIDescription* description) override;

    VSTGUI::CView* verifyView(
        VSTGUI::CView* view,
        const VSTGUI::UIAttributes& attributes,
        const VSTGUI::IUIDescription* description) override;

    void valueChanged(VSTGUI::CControl* control) override;

    // Push the panel state (values and status text) into the views
    void syncViews();

    [[nodiscard]] const Core::ParameterPanel& panel() const { return *panel_; }

private:
    void applyWidget(VSTGUI::CControl* control, const Core::WidgetView& widget);

    std::shared_ptr<Core::ParameterPanel> panel_;

    // Owned by the view hierarchy
    UI::TickSlider* slider_ = nullptr;
    UI::TickSlider* hSlider_ = nullptr;
    UI::TickSlider* vSlider_ = nullptr;
    UI::TickKnob* knob_ = nullptr;
    UI::XYPad* xyPad_ = nullptr;
    VSTGUI::CTextLabel* outputLabel_ = nullptr;
};

} // namespace Vernier::App
