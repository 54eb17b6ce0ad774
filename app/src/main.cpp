// =============================================================================
// Vernier - Main Entry Point
// =============================================================================
// Standalone VSTGUI application showing parameter widgets mapped through
// value ranges.
//
// Usage:
//   vernier[.exe]
//
// Commands (Edit menu / context menu):
// - Reset Parameters (r)
// - Clear Log (l)
// =============================================================================

#include "panel_delegate.h"
#include "vstgui/standalone/include/appinit.h"

// =============================================================================
// Application Entry Point
// =============================================================================
// VSTGUI Standalone uses this static initialization pattern to set up the
// application before main() is called.

static VSTGUI::Standalone::Application::Init gAppDelegate(
    std::make_unique<Vernier::App::PanelDelegate>(),
    {
        {VSTGUI::Standalone::Application::ConfigKey::ShowCommandsInContextMenu, 1}
    }
);
