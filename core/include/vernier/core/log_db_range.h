#pragma once

// ==============================================================================
// LogDBRange - Logarithmic Decibel Range
// ==============================================================================
// Maps [0, 1] onto [minDb, maxDb] with 0 dB pinned at zeroPosition. Each side
// of the zero position follows a square curve:
//
//   n <  zero:  dB = minDb * (1 - n / zero)^2
//   n >= zero:  dB = maxDb * ((n - zero) / (1 - zero))^2
//
// Values close to 0 dB move slowly per unit of normal; values far from it
// move quickly.
// ==============================================================================

#include <vernier/core/normal.h>

#include <algorithm>
#include <cmath>

namespace Vernier::Core {

class LogDBRange {
public:
    /// @param minDb Lower bound (clipped to <= 0 dB)
    /// @param maxDb Upper bound (clipped to >= 0 dB)
    /// @param zeroPosition Normal at which the range outputs 0 dB
    LogDBRange(float minDb, float maxDb, Normal zeroPosition) noexcept
        : minDb_(std::min(minDb, 0.0f))
        , maxDb_(std::max(maxDb, 0.0f))
        , zero_(zeroPosition) {
        minRecip_ = (minDb_ != 0.0f) ? 1.0f / minDb_ : 0.0f;
        maxRecip_ = (maxDb_ != 0.0f) ? 1.0f / maxDb_ : 0.0f;
        zeroRecip_ = (zero_.value() != 0.0f) ? 1.0f / zero_.value() : 0.0f;
        oneMinusZeroRecip_ =
            (zero_.value() != 1.0f) ? 1.0f / (1.0f - zero_.value()) : 0.0f;
    }

    [[nodiscard]] float minDb() const noexcept { return minDb_; }
    [[nodiscard]] float maxDb() const noexcept { return maxDb_; }
    [[nodiscard]] Normal zeroPosition() const noexcept { return zero_; }

    [[nodiscard]] Normal mapToNormal(float db) const noexcept {
        if (db == 0.0f)
            return zero_;

        if (db < 0.0f) {
            if (db <= minDb_)
                return Normal::min();
            const float logNormal = 1.0f - std::sqrt(db * minRecip_);
            return Normal(logNormal * zero_.value());
        }

        if (db >= maxDb_)
            return Normal::max();
        const float logNormal = std::sqrt(db * maxRecip_);
        return Normal(zero_.value() + logNormal * (1.0f - zero_.value()));
    }

    [[nodiscard]] float unmapToValue(Normal normal) const noexcept {
        const float n = normal.value();
        if (n <= 0.0f)
            return minDb_;
        if (n >= 1.0f)
            return maxDb_;

        if (n < zero_.value()) {
            const float t = 1.0f - n * zeroRecip_;
            return t * t * minDb_;
        }

        const float t = (n - zero_.value()) * oneMinusZeroRecip_;
        return t * t * maxDb_;
    }

    [[nodiscard]] Normal snapped(Normal normal) const noexcept {
        return normal;
    }

    [[nodiscard]] NormalParam normalParam(float valueDb, float defaultDb) const noexcept {
        return {mapToNormal(valueDb), mapToNormal(defaultDb)};
    }

    /// Value and default both at 0 dB.
    [[nodiscard]] NormalParam defaultNormalParam() const noexcept {
        return {zero_, zero_};
    }

private:
    float minDb_;
    float maxDb_;
    Normal zero_;
    float minRecip_ = 0.0f;
    float maxRecip_ = 0.0f;
    float zeroRecip_ = 0.0f;
    float oneMinusZeroRecip_ = 0.0f;
};

} // namespace Vernier::Core
