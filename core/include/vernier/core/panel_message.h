#pragma once

// ==============================================================================
// Panel Messages
// ==============================================================================
// The closed set of events a ParameterPanel accepts. A Message is a tagged
// struct: `type` selects which payload fields are meaningful.
//
//   SliderChanged  - scalar        plain slider moved
//   ButtonClicked  - buttonId      push button pressed
//   HSliderInt     - x             stepped integer slider moved
//   VSliderDB      - x             decibel slider moved
//   KnobFreq       - x             frequency knob turned
//   XYPadFloat     - x, y          XY pad moved (both axes at once)
// ==============================================================================

#include <vernier/core/normal.h>

#include <cstdint>

namespace Vernier::Core {

enum class MessageType : uint8_t {
    SliderChanged = 0,
    ButtonClicked,
    HSliderInt,
    VSliderDB,
    KnobFreq,
    XYPadFloat
};

struct Message {
    MessageType type = MessageType::SliderChanged;
    float scalar = 0.0f;
    uint8_t buttonId = 0;
    Normal x;
    Normal y;

    [[nodiscard]] static constexpr Message sliderChanged(float value) noexcept {
        Message m;
        m.type = MessageType::SliderChanged;
        m.scalar = value;
        return m;
    }

    [[nodiscard]] static constexpr Message buttonClicked(uint8_t id) noexcept {
        Message m;
        m.type = MessageType::ButtonClicked;
        m.buttonId = id;
        return m;
    }

    [[nodiscard]] static constexpr Message hSliderInt(Normal normal) noexcept {
        Message m;
        m.type = MessageType::HSliderInt;
        m.x = normal;
        return m;
    }

    [[nodiscard]] static constexpr Message vSliderDb(Normal normal) noexcept {
        Message m;
        m.type = MessageType::VSliderDB;
        m.x = normal;
        return m;
    }

    [[nodiscard]] static constexpr Message knobFreq(Normal normal) noexcept {
        Message m;
        m.type = MessageType::KnobFreq;
        m.x = normal;
        return m;
    }

    [[nodiscard]] static constexpr Message xyPadFloat(Normal normalX, Normal normalY) noexcept {
        Message m;
        m.type = MessageType::XYPadFloat;
        m.x = normalX;
        m.y = normalY;
        return m;
    }
};

} // namespace Vernier::Core
