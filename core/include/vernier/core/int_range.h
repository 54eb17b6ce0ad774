#pragma once

// ==============================================================================
// IntRange - Stepped Integer Range
// ==============================================================================
// Maps [0, 1] onto the integers in [min, max]. A widget bound to this range
// must store snapped() values so its position always lands on a step.
//
// Rounding: half up. A normal exactly on the boundary between step k and
// step k + 1 resolves to k + 1.
//
// The span is held in 64 bits, so any pair of int32_t bounds is valid. Above
// kMaxExactSteps steps a float normal can no longer address every integer.
// ==============================================================================

#include <vernier/core/normal.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

namespace Vernier::Core {

class IntRange {
public:
    /// Largest step count a float normal resolves exactly (2^24).
    static constexpr int64_t kMaxExactSteps = int64_t{1} << 24;

    constexpr IntRange(int32_t min, int32_t max) noexcept
        : min_(min), max_(max) {
        if (max_ < min_)
            std::swap(min_, max_);
        span_ = static_cast<int64_t>(max_) - static_cast<int64_t>(min_);
    }

    [[nodiscard]] constexpr int32_t min() const noexcept { return min_; }
    [[nodiscard]] constexpr int32_t max() const noexcept { return max_; }

    /// Number of discrete steps between min and max.
    [[nodiscard]] constexpr int64_t stepCount() const noexcept { return span_; }

    [[nodiscard]] constexpr Normal mapToNormal(int32_t value) const noexcept {
        if (span_ == 0 || value <= min_)
            return Normal::min();
        if (value >= max_)
            return Normal::max();
        const int64_t offset = static_cast<int64_t>(value) - static_cast<int64_t>(min_);
        return Normal(static_cast<float>(static_cast<double>(offset) / static_cast<double>(span_)));
    }

    [[nodiscard]] int32_t unmapToValue(Normal normal) const noexcept {
        const double scaled = static_cast<double>(normal.value()) * static_cast<double>(span_);
        const auto step = std::clamp(static_cast<int64_t>(std::floor(scaled + 0.5)),
                                     int64_t{0}, span_);
        return static_cast<int32_t>(static_cast<int64_t>(min_) + step);
    }

    /// Nearest normal that corresponds exactly to an integer. Idempotent.
    [[nodiscard]] Normal snapped(Normal normal) const noexcept {
        return mapToNormal(unmapToValue(normal));
    }

    [[nodiscard]] constexpr NormalParam normalParam(int32_t value, int32_t defaultValue) const noexcept {
        return {mapToNormal(value), mapToNormal(defaultValue)};
    }

    [[nodiscard]] constexpr NormalParam defaultNormalParam() const noexcept {
        return normalParam(min_, min_);
    }

private:
    int32_t min_;
    int32_t max_;
    int64_t span_ = 0;
};

} // namespace Vernier::Core
