#pragma once

// ==============================================================================
// FloatRange - Linear Float Range
// ==============================================================================
// Maps [0, 1] linearly onto [min, max].
// ==============================================================================

#include <vernier/core/normal.h>

#include <utility>

namespace Vernier::Core {

class FloatRange {
public:
    constexpr FloatRange(float min, float max) noexcept
        : min_(min), max_(max) {
        if (max_ < min_)
            std::swap(min_, max_);
        span_ = max_ - min_;
        spanRecip_ = (span_ != 0.0f) ? 1.0f / span_ : 0.0f;
    }

    /// [-1, +1], centered on 0.
    [[nodiscard]] static constexpr FloatRange defaultBipolar() noexcept {
        return FloatRange(-1.0f, 1.0f);
    }

    [[nodiscard]] constexpr float min() const noexcept { return min_; }
    [[nodiscard]] constexpr float max() const noexcept { return max_; }

    /// Values outside the range clip to 0 or 1.
    [[nodiscard]] constexpr Normal mapToNormal(float value) const noexcept {
        if (value <= min_)
            return Normal::min();
        if (value >= max_)
            return Normal::max();
        return Normal((value - min_) * spanRecip_);
    }

    [[nodiscard]] constexpr float unmapToValue(Normal normal) const noexcept {
        return min_ + normal.value() * span_;
    }

    /// Continuous range: snapping leaves the value untouched.
    [[nodiscard]] constexpr Normal snapped(Normal normal) const noexcept {
        return normal;
    }

    [[nodiscard]] constexpr NormalParam normalParam(float value, float defaultValue) const noexcept {
        return {mapToNormal(value), mapToNormal(defaultValue)};
    }

    /// Value and default both at the midpoint of the range.
    [[nodiscard]] constexpr NormalParam defaultNormalParam() const noexcept {
        const float center = min_ + span_ * 0.5f;
        return normalParam(center, center);
    }

private:
    float min_;
    float max_;
    float span_ = 0.0f;
    float spanRecip_ = 0.0f;
};

} // namespace Vernier::Core
