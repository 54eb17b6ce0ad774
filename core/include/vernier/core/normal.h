#pragma once

// ==============================================================================
// Normal - Normalized Parameter Value
// ==============================================================================
// A widget position in [0, 1], independent of the real-world unit the
// parameter represents. Construction clips into [0, 1].
//
// NormalParam pairs the current value with the default value used when a
// widget is reset (double-click, Reset Parameters command).
// ==============================================================================

#include <algorithm>

namespace Vernier::Core {

class Normal {
public:
    constexpr Normal() noexcept = default;

    constexpr explicit Normal(float value) noexcept
        : value_(std::clamp(value, 0.0f, 1.0f)) {}

    [[nodiscard]] static constexpr Normal min() noexcept { return Normal(0.0f); }
    [[nodiscard]] static constexpr Normal center() noexcept { return Normal(0.5f); }
    [[nodiscard]] static constexpr Normal max() noexcept { return Normal(1.0f); }

    [[nodiscard]] constexpr float value() const noexcept { return value_; }

    friend constexpr bool operator==(Normal a, Normal b) noexcept {
        return a.value_ == b.value_;
    }

private:
    float value_ = 0.0f;
};

struct NormalParam {
    Normal value;
    Normal defaultValue;

    constexpr void update(Normal normal) noexcept { value = normal; }
    constexpr void reset() noexcept { value = defaultValue; }

    friend constexpr bool operator==(const NormalParam&, const NormalParam&) noexcept = default;
};

} // namespace Vernier::Core
