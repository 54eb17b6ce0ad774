// =============================================================================
// Parameter Logger Implementation
// =============================================================================

#include "parameter_logger.h"

#include <vernier/core/control_tags.h>

#include <cstdio>

namespace Vernier::App {

// Global logger pointer
static ParameterLogView* g_logger = nullptr;

void setGlobalLogger(ParameterLogView* logger) {
    g_logger = logger;
}

ParameterLogView* getGlobalLogger() {
    return g_logger;
}

const char* controlName(int32_t tag) {
    switch (tag) {
        case Core::kInvalidTag:     return "Panel";
        case Core::kSliderTag:      return "Slider";
        case Core::kButtonTag:      return "Button";
        case Core::kHSliderIntTag:  return "HSliderInt";
        case Core::kVSliderDbTag:   return "VSliderDB";
        case Core::kKnobFreqTag:    return "KnobFreq";
        case Core::kXYPadFloatTag:  return "XYPadFloat";
        default:                    break;
    }
    return "Unknown";
}

void logParameterChange(int32_t tag, float value, const std::string& text) {
    if (g_logger) {
        g_logger->logParameter(tag, value, controlName(tag), text);
    }
}

Core::ControlTag controlTagFor(Core::MessageType type) {
    switch (type) {
        case Core::MessageType::SliderChanged: return Core::kSliderTag;
        case Core::MessageType::ButtonClicked: return Core::kButtonTag;
        case Core::MessageType::HSliderInt:    return Core::kHSliderIntTag;
        case Core::MessageType::VSliderDB:     return Core::kVSliderDbTag;
        case Core::MessageType::KnobFreq:      return Core::kKnobFreqTag;
        case Core::MessageType::XYPadFloat:    return Core::kXYPadFloatTag;
    }
    return Core::kInvalidTag;
}

void logPanelMessage(const Core::Message& message, const std::string& text) {
    float value = message.x.value();
    if (message.type == Core::MessageType::SliderChanged)
        value = message.scalar;
    else if (message.type == Core::MessageType::ButtonClicked)
        value = static_cast<float>(message.buttonId);

    logParameterChange(controlTagFor(message.type), value, text);
}

// =============================================================================
// ParameterLogView Implementation
// =============================================================================

ParameterLogView::ParameterLogView(const VSTGUI::CRect& size)
    : CView(size)
{
}

void ParameterLogView::draw(VSTGUI::CDrawContext* context) {
    auto viewRect = getViewSize();

    // Fill background
    context->setFillColor(kBackgroundColor);
    context->drawRect(viewRect, VSTGUI::kDrawFilled);

    // Draw border
    context->setFrameColor(VSTGUI::CColor(50, 50, 55, 255));
    context->setLineWidth(1.0);
    context->drawRect(viewRect, VSTGUI::kDrawStroked);

    // Draw title
    auto titleFont = VSTGUI::makeOwned<VSTGUI::CFontDesc>("Arial", 10, VSTGUI::kBoldFace);
    context->setFont(titleFont);
    context->setFontColor(kTextColor);
    VSTGUI::CRect titleRect(viewRect.left + 5, viewRect.top + 2, viewRect.right - 5, viewRect.top + 16);
    context->drawString("Message Log", titleRect, VSTGUI::kLeftText);

    auto font = VSTGUI::makeOwned<VSTGUI::CFontDesc>("Consolas", 9);
    context->setFont(font);

    float y = static_cast<float>(viewRect.top) + 20.0f;
    float lineHeight = 14.0f;

    for (const auto& entry : entries_) {
        if (y + lineHeight > viewRect.bottom) break;

        // Format: [tag] Name = value  -> status text
        char prefix[48];
        std::snprintf(prefix, sizeof(prefix), "[%03d] %-10s", entry.tag, entry.name.c_str());

        char value[24];
        std::snprintf(value, sizeof(value), "%.4f", static_cast<double>(entry.value));

        VSTGUI::CRect lineRect(viewRect.left + 5, y, viewRect.right - 5, y + lineHeight);
        context->setFontColor(kTagColor);
        context->drawString(prefix, lineRect, VSTGUI::kLeftText);

        VSTGUI::CRect valueRect(lineRect.left + 120, y, lineRect.left + 175, y + lineHeight);
        context->setFontColor(kValueColor);
        context->drawString(value, valueRect, VSTGUI::kLeftText);

        VSTGUI::CRect textRect(lineRect.left + 180, y, lineRect.right, y + lineHeight);
        context->setFontColor(kTextColor);
        context->drawString(entry.text.c_str(), textRect, VSTGUI::kLeftText);

        y += lineHeight;
    }

    setDirty(false);
}

void ParameterLogView::logParameter(int32_t tag, float value, const std::string& name,
                                    const std::string& text) {
    entries_.push_front({tag, value, name, text});

    // Limit size
    while (entries_.size() > kMaxLogEntries) {
        entries_.pop_back();
    }

    invalid();
}

void ParameterLogView::clear() {
    entries_.clear();
    invalid();
}

} // namespace Vernier::App
