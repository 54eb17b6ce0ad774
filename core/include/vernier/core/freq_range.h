#pragma once

// ==============================================================================
// FreqRange - Logarithmic Frequency Range
// ==============================================================================
// Frequencies live on a fixed 10-octave spectrum, 20 Hz to 20480 Hz, where
// every octave takes the same share of the normal. A FreqRange covers a
// window [minHz, maxHz] of that spectrum and stretches it over [0, 1].
//
// With the full spectrum (defaultSpectrum()), 0.1 of normal is one octave.
// ==============================================================================

#include <vernier/core/normal.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Vernier::Core {

inline constexpr float kSpectrumMinHz = 20.0f;
inline constexpr float kSpectrumMaxHz = 20480.0f;
inline constexpr float kSpectrumOctaves = 10.0f;

/// Position of a frequency on the 10-octave spectrum, clipped to [0, 1].
[[nodiscard]] inline float octaveSpectrumToNormal(float hz) noexcept {
    if (hz <= kSpectrumMinHz)
        return 0.0f;
    if (hz >= kSpectrumMaxHz)
        return 1.0f;
    return std::log2(hz / kSpectrumMinHz) / kSpectrumOctaves;
}

/// Frequency at a spectrum position: 20 Hz * 2^(10 * s).
[[nodiscard]] inline float octaveSpectrumToHz(float spectrumNormal) noexcept {
    return kSpectrumMinHz * std::exp2(spectrumNormal * kSpectrumOctaves);
}

class FreqRange {
public:
    /// Bounds are clipped to the 20 Hz - 20480 Hz spectrum.
    FreqRange(float minHz, float maxHz) noexcept
        : minHz_(std::clamp(minHz, kSpectrumMinHz, kSpectrumMaxHz))
        , maxHz_(std::clamp(maxHz, kSpectrumMinHz, kSpectrumMaxHz)) {
        if (maxHz_ < minHz_)
            std::swap(minHz_, maxHz_);
        spectrumMin_ = octaveSpectrumToNormal(minHz_);
        spectrumSpan_ = octaveSpectrumToNormal(maxHz_) - spectrumMin_;
        spectrumSpanRecip_ = (spectrumSpan_ != 0.0f) ? 1.0f / spectrumSpan_ : 0.0f;
    }

    [[nodiscard]] static FreqRange defaultSpectrum() noexcept {
        return FreqRange(kSpectrumMinHz, kSpectrumMaxHz);
    }

    [[nodiscard]] float minHz() const noexcept { return minHz_; }
    [[nodiscard]] float maxHz() const noexcept { return maxHz_; }

    [[nodiscard]] Normal mapToNormal(float hz) const noexcept {
        if (hz <= minHz_)
            return Normal::min();
        if (hz >= maxHz_)
            return Normal::max();
        return Normal((octaveSpectrumToNormal(hz) - spectrumMin_) * spectrumSpanRecip_);
    }

    [[nodiscard]] float unmapToValue(Normal normal) const noexcept {
        const float n = normal.value();
        if (n <= 0.0f)
            return minHz_;
        if (n >= 1.0f)
            return maxHz_;
        return octaveSpectrumToHz(spectrumMin_ + n * spectrumSpan_);
    }

    [[nodiscard]] Normal snapped(Normal normal) const noexcept {
        return normal;
    }

    [[nodiscard]] NormalParam normalParam(float valueHz, float defaultHz) const noexcept {
        return {mapToNormal(valueHz), mapToNormal(defaultHz)};
    }

    [[nodiscard]] NormalParam defaultNormalParam() const noexcept {
        return normalParam(minHz_, minHz_);
    }

private:
    float minHz_;
    float maxHz_;
    float spectrumMin_ = 0.0f;
    float spectrumSpan_ = 0.0f;
    float spectrumSpanRecip_ = 0.0f;
};

} // namespace Vernier::Core
