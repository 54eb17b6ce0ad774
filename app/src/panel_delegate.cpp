// =============================================================================
// Panel Delegate Implementation
// =============================================================================

#include "panel_delegate.h"
#include "panel_controller.h"
#include "parameter_logger.h"
#include "version.h"

#include <vernier/core/control_tags.h>
#include <vernier/core/debug_log.h>

#include "vstgui/standalone/include/iapplication.h"
#include "vstgui/standalone/include/iuidescwindow.h"
#include "vstgui/standalone/include/ialertbox.h"
#include "vstgui/standalone/include/helpers/uidesc/customization.h"
#include "vstgui/lib/cframe.h"

namespace Vernier::App {

using namespace VSTGUI;
using namespace VSTGUI::Standalone;

// =============================================================================
// Commands
// =============================================================================
static Command ResetParameters{CommandGroup::Edit, "Reset Parameters"};
static Command ClearLog{CommandGroup::Edit, "Clear Log"};

// =============================================================================
// PanelDelegate Implementation
// =============================================================================

PanelDelegate::PanelDelegate(Core::PanelConfig config)
    : Application::DelegateAdapter({
        VERNIER_APP_NAME,
        VERNIER_VERSION_STR,
        VERNIER_APP_IDENTIFIER
    })
    , config_(std::move(config))
{
    // Knobs track vertical drags
    CFrame::kDefaultKnobMode = CKnobMode::kLinearMode;
}

PanelDelegate::~PanelDelegate() = default;

void PanelDelegate::finishLaunching() {
    const auto error = config_.validate();
    if (error != Core::ConfigError::None) {
        showFatalError("Invalid panel configuration", Core::toString(error));
        return;
    }

    panel_ = std::make_shared<Core::ParameterPanel>(config_);
    panel_->setChangeListener(&logPanelMessage);

    IApplication::instance().registerCommand(ResetParameters, 'r');
    IApplication::instance().registerCommand(ClearLog, 'l');

    if (!createMainWindow()) {
        showFatalError("Could not open the main window",
                       "The UI description panel.uidesc failed to load.");
    }
}

bool PanelDelegate::createMainWindow() {
    UIDesc::Config config;
    config.windowConfig.title = panel_->title().c_str();
    config.windowConfig.autoSaveFrameName = "VernierPanelFrame";
    config.windowConfig.style.close().size().border();
    config.windowConfig.size = {620, 560};
    config.uiDescFileName = "panel.uidesc";
    config.viewName = "view";

    // The view that carries sub-controller="PanelController" owns the controller
    auto customization = UIDesc::Customization::make();
    customization->addCreateViewControllerFunc(
        "PanelController",
        [this](const UTF8StringView&, IController* parent, const IUIDescription*) {
            controller_ = new PanelController(panel_, parent);
            return controller_;
        }
    );
    config.customization = customization;

    auto window = UIDesc::makeWindow(config);
    if (!window)
        return false;

    window->show();
    window->registerWindowListener(this);
    VERNIER_LOG_PANEL("[app] main window open: %s\n", panel_->title().c_str());
    return true;
}

void PanelDelegate::showFatalError(const std::string& headline, const std::string& description) {
    VERNIER_LOG_PANEL("[app] fatal: %s - %s\n", headline.c_str(), description.c_str());

    AlertBoxConfig config;
    config.headline = headline.c_str();
    config.description = description.c_str();
    config.defaultButton = "Quit";
    IApplication::instance().showAlertBox(config);
    IApplication::instance().quit();
}

void PanelDelegate::onClosed(const IWindow& window) {
    controller_ = nullptr;

    // Quit when last window closes
    if (IApplication::instance().getWindows().empty()) {
        IApplication::instance().quit();
    }
}

bool PanelDelegate::canHandleCommand(const Command& command) {
    if (command == ResetParameters) return panel_ != nullptr;
    if (command == ClearLog) return getGlobalLogger() != nullptr;
    return false;
}

bool PanelDelegate::handleCommand(const Command& command) {
    if (command == ResetParameters) {
        if (!panel_)
            return false;
        panel_->resetToDefaults();
        logParameterChange(Core::kInvalidTag, 0.0f, panel_->outputText());
        if (controller_)
            controller_->syncViews();
        return true;
    }
    if (command == ClearLog) {
        if (auto* logger = getGlobalLogger()) {
            logger->clear();
        }
        return true;
    }
    return false;
}

void PanelDelegate::showAboutDialog() {
    AlertBoxConfig config;
    config.headline = VERNIER_APP_NAME " " VERNIER_VERSION_STR;
    config.description = "Audio parameter widgets mapped through integer, decibel,\n"
                         "frequency and linear ranges.";
    config.defaultButton = "OK";
    IApplication::instance().showAlertBox(config);
}

bool PanelDelegate::hasAboutDialog() {
    return true;
}

UTF8StringPtr PanelDelegate::getSharedUIResourceFilename() const {
    return nullptr;
}

} // namespace Vernier::App
