#pragma once

// ==============================================================================
// Panel Configuration
// ==============================================================================
// Every tunable of the parameter panel. The defaults reproduce the demo:
//
//   HSlider  - integer 0..10, starts and resets at 5
//   VSlider  - decibels -12..+12, 0 dB at the center
//   Knob     - frequency 20 Hz..20480 Hz, starts and resets at 1000 Hz
//   XY pad   - linear float -1..+1 on both axes, starts at 0
//   Slider   - plain 0..1 slider with a 0.025 step
//   Button   - reports id 128
// ==============================================================================

#include <vernier/core/freq_range.h>
#include <vernier/core/int_range.h>

#include <cstdint>
#include <string>

namespace Vernier::Core {

enum class ConfigError : uint8_t {
    None = 0,
    EmptyFloatRange,
    EmptyIntRange,
    IntRangeTooWide,
    DecibelRangeMissesZero,
    FrequencyOutsideSpectrum,
    InvalidSliderStep
};

[[nodiscard]] inline const char* toString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::None:
            return "no error";
        case ConfigError::EmptyFloatRange:
            return "float range minimum must be below its maximum";
        case ConfigError::EmptyIntRange:
            return "integer range minimum must be below its maximum";
        case ConfigError::IntRangeTooWide:
            return "integer range must span at most 2^24 steps";
        case ConfigError::DecibelRangeMissesZero:
            return "decibel range must satisfy min < 0 < max with its zero position inside (0, 1)";
        case ConfigError::FrequencyOutsideSpectrum:
            return "frequency range must lie within 20 Hz - 20480 Hz with min < max";
        case ConfigError::InvalidSliderStep:
            return "slider step must lie in (0, 1]";
    }
    return "unknown error";
}

struct PanelConfig {
    // Linear float range (XY pad, both axes)
    float floatMin = -1.0f;
    float floatMax = 1.0f;

    // Stepped integer range (horizontal slider)
    int32_t intMin = 0;
    int32_t intMax = 10;
    int32_t intInitial = 5;
    int32_t intDefault = 5;

    // Logarithmic decibel range (vertical slider)
    float dbMin = -12.0f;
    float dbMax = 12.0f;
    float dbZeroPosition = 0.5f;

    // Logarithmic frequency range (knob)
    float freqMinHz = kSpectrumMinHz;
    float freqMaxHz = kSpectrumMaxHz;
    float freqInitialHz = 1000.0f;
    float freqDefaultHz = 1000.0f;

    // Plain demo controls
    float sliderInitial = 0.0f;
    float sliderStep = 0.025f;
    uint8_t buttonId = 128;

    std::string initialText = "try anything";
    std::string windowTitle = "Simple Example - Vernier";

    /// First problem found, or ConfigError::None.
    [[nodiscard]] ConfigError validate() const noexcept {
        if (!(floatMin < floatMax))
            return ConfigError::EmptyFloatRange;
        if (!(intMin < intMax))
            return ConfigError::EmptyIntRange;
        if (IntRange(intMin, intMax).stepCount() > IntRange::kMaxExactSteps)
            return ConfigError::IntRangeTooWide;
        if (!(dbMin < 0.0f && dbMax > 0.0f) ||
            !(dbZeroPosition > 0.0f && dbZeroPosition < 1.0f))
            return ConfigError::DecibelRangeMissesZero;
        if (freqMinHz < kSpectrumMinHz || freqMaxHz > kSpectrumMaxHz ||
            !(freqMinHz < freqMaxHz))
            return ConfigError::FrequencyOutsideSpectrum;
        if (!(sliderStep > 0.0f && sliderStep <= 1.0f))
            return ConfigError::InvalidSliderStep;
        return ConfigError::None;
    }
};

} // namespace Vernier::Core
