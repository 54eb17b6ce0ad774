#pragma once

// ==============================================================================
// Control Tags
// ==============================================================================
// Identify which widget a value change came from. The numeric values are
// referenced by name from resources/panel.uidesc (control-tags section) and
// must stay in sync with it.
//
// ID Range Allocation:
//   100-109:   Demo controls (plain slider, button)
//   110-119:   Parameter widgets
// ==============================================================================

#include <cstdint>

namespace Vernier::Core {

enum ControlTag : int32_t {
    kInvalidTag = -1,

    kSliderTag = 100,
    kButtonTag = 101,

    kHSliderIntTag = 110,
    kVSliderDbTag = 111,
    kKnobFreqTag = 112,
    kXYPadFloatTag = 113,
};

} // namespace Vernier::Core
