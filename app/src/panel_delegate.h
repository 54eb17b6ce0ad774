// =============================================================================
// Panel Delegate - Application delegate for the Vernier demo
// =============================================================================

#pragma once

#include <vernier/core/panel_config.h>
#include <vernier/core/parameter_panel.h>

#include "vstgui/standalone/include/helpers/appdelegate.h"
#include "vstgui/standalone/include/helpers/windowlistener.h"
#include "vstgui/standalone/include/icommand.h"
#include <memory>
#include <string>

namespace Vernier::App {

class PanelController;

// =============================================================================
// PanelDelegate - Application delegate
// =============================================================================
class PanelDelegate : public VSTGUI::Standalone::Application::DelegateAdapter,
                      public VSTGUI::Standalone::ICommandHandler,
                      public VSTGUI::Standalone::WindowListenerAdapter
{
public:
    explicit PanelDelegate(Core::PanelConfig config = Core::PanelConfig{});
    ~PanelDelegate() override;

    // Application::IDelegate
    void finishLaunching() override;
    void showAboutDialog() override;
    bool hasAboutDialog() override;
    VSTGUI::UTF8StringPtr getSharedUIResourceFilename() const override;

    // ICommandHandler
    bool canHandleCommand(const VSTGUI::Standalone::Command& command) override;
    bool handleCommand(const VSTGUI::Standalone::Command& command) override;

    // WindowListenerAdapter
    void onClosed(const VSTGUI::Standalone::IWindow& window) override;

private:
    bool createMainWindow();
    void showFatalError(const std::string& headline, const std::string& description);

    Core::PanelConfig config_;
    std::shared_ptr<Core::ParameterPanel> panel_;
    PanelController* controller_ = nullptr;  // Owned by the main view
};

} // namespace Vernier::App
