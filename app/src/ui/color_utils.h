#pragma once

// ==============================================================================
// Color Utilities - Shared color helpers for the custom controls
// ==============================================================================

#include "vstgui/lib/ccolor.h"

#include <algorithm>
#include <cstdint>

namespace Vernier::UI {

namespace Detail {

[[nodiscard]] inline uint8_t toChannel(float value) noexcept {
    return static_cast<uint8_t>(std::clamp(value + 0.5f, 0.0f, 255.0f));
}

[[nodiscard]] inline VSTGUI::CColor scaleRGB(const VSTGUI::CColor& color,
                                             float factor) noexcept {
    return VSTGUI::CColor(
        toChannel(static_cast<float>(color.red) * factor),
        toChannel(static_cast<float>(color.green) * factor),
        toChannel(static_cast<float>(color.blue) * factor),
        color.alpha);
}

} // namespace Detail

/// Scale RGB towards black. Factors above 1 leave the color unchanged.
[[nodiscard]] inline VSTGUI::CColor darkenColor(const VSTGUI::CColor& color,
                                                float factor) noexcept {
    return Detail::scaleRGB(color, std::min(factor, 1.0f));
}

/// Scale RGB up, clamped to 255. Factors below 1 leave the color unchanged.
[[nodiscard]] inline VSTGUI::CColor brightenColor(const VSTGUI::CColor& color,
                                                  float factor) noexcept {
    return Detail::scaleRGB(color, std::max(factor, 1.0f));
}

} // namespace Vernier::UI
