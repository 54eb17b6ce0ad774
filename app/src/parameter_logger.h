// =============================================================================
// Parameter Logger - Displays panel messages in the main window
// =============================================================================

#pragma once

#include <vernier/core/control_tags.h>
#include <vernier/core/panel_message.h>

#include "vstgui/lib/cview.h"
#include "vstgui/lib/cdrawcontext.h"
#include "vstgui/lib/cfont.h"
#include <cstdint>
#include <deque>
#include <string>

namespace Vernier::App {

// Maximum number of log entries to display
constexpr size_t kMaxLogEntries = 20;

// =============================================================================
// LogEntry - A single handled panel message
// =============================================================================
struct LogEntry {
    int32_t tag;
    float value;
    std::string name;
    std::string text;
};

// =============================================================================
// ParameterLogView - Scrolling log of panel messages, newest first
// =============================================================================
class ParameterLogView : public VSTGUI::CView {
public:
    explicit ParameterLogView(const VSTGUI::CRect& size);

    void draw(VSTGUI::CDrawContext* context) override;

    // Add a new log entry
    void logParameter(int32_t tag, float value, const std::string& name,
                      const std::string& text);

    // Clear all entries
    void clear();

    [[nodiscard]] const std::deque<LogEntry>& entries() const { return entries_; }

    CLASS_METHODS_NOCOPY(ParameterLogView, CView)

private:
    std::deque<LogEntry> entries_;

    static constexpr VSTGUI::CColor kBackgroundColor{25, 25, 28, 255};
    static constexpr VSTGUI::CColor kTextColor{180, 180, 185, 255};
    static constexpr VSTGUI::CColor kValueColor{100, 180, 100, 255};
    static constexpr VSTGUI::CColor kTagColor{180, 140, 100, 255};
};

// =============================================================================
// Global logger instance (for access from the delegate and controller)
// =============================================================================
void setGlobalLogger(ParameterLogView* logger);
ParameterLogView* getGlobalLogger();

// Display name for a control tag ("HSliderInt", "KnobFreq", ...)
const char* controlName(int32_t tag);

// Convenience function to log from anywhere; no-op without a logger
void logParameterChange(int32_t tag, float value, const std::string& text);

// Control that sends messages of `type`
Core::ControlTag controlTagFor(Core::MessageType type);

// Log a handled panel message; installed as the panel's change listener
void logPanelMessage(const Core::Message& message, const std::string& text);

} // namespace Vernier::App
