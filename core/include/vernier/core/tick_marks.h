#pragma once

// ==============================================================================
// TickMarks - Cosmetic Position Markers
// ==============================================================================
// A group of marks drawn along a slider track or around a knob arc. Each mark
// has a normalized position and a tier (visual weight). Tick marks carry no
// meaning for value conversion.
//
// Tier::One is the most prominent, Tier::Three the faintest.
// ==============================================================================

#include <vernier/core/normal.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

namespace Vernier::Core::TickMarks {

enum class Tier : uint8_t {
    One = 0,
    Two = 1,
    Three = 2
};

struct TickMark {
    Normal position;
    Tier tier = Tier::One;
};

class Group {
public:
    Group() = default;

    explicit Group(std::vector<TickMark> marks)
        : marks_(std::move(marks)) {}

    /// A single mark at 0.5.
    [[nodiscard]] static Group center(Tier tier) {
        return Group(std::vector<TickMark>{{Normal::center(), tier}});
    }

    /// Marks at 0 and 1.
    [[nodiscard]] static Group minMax(Tier tier) {
        return Group(std::vector<TickMark>{{Normal::min(), tier}, {Normal::max(), tier}});
    }

    [[nodiscard]] static Group minMaxAndCenter(Tier minMaxTier, Tier centerTier) {
        return Group(std::vector<TickMark>{{Normal::min(), minMaxTier},
                                           {Normal::center(), centerTier},
                                           {Normal::max(), minMaxTier}});
    }

    /// `count` marks spread evenly from 0 to 1 inclusive.
    /// A count of 1 yields a single center mark.
    [[nodiscard]] static Group evenlySpaced(size_t count, Tier tier) {
        std::vector<TickMark> marks;
        if (count == 0)
            return Group(std::move(marks));
        if (count == 1)
            return center(tier);

        marks.reserve(count);
        const float denom = static_cast<float>(count - 1);
        for (size_t i = 0; i < count; ++i)
            marks.push_back({Normal(static_cast<float>(i) / denom), tier});
        return Group(std::move(marks));
    }

    /// Ends at `sidesTier`, then recursive subdivision: `one` marks split
    /// the range, `two` marks split each of those sections and `three` marks
    /// split each of those again. Tier One goes at the `one` positions and
    /// so on. Counts are marks per section, not including section ends.
    [[nodiscard]] static Group subdivided(size_t one, size_t two, size_t three,
                                          Tier sidesTier) {
        std::vector<TickMark> marks;
        marks.push_back({Normal::min(), sidesTier});
        marks.push_back({Normal::max(), sidesTier});

        std::vector<float> bounds{0.0f, 1.0f};
        const size_t counts[3] = {one, two, three};
        const Tier tiers[3] = {Tier::One, Tier::Two, Tier::Three};

        for (int level = 0; level < 3; ++level) {
            const size_t count = counts[level];
            if (count == 0)
                continue;

            std::vector<float> nextBounds;
            nextBounds.reserve(bounds.size() * (count + 1));
            for (size_t s = 0; s + 1 < bounds.size(); ++s) {
                const float start = bounds[s];
                const float width = (bounds[s + 1] - start) / static_cast<float>(count + 1);
                nextBounds.push_back(start);
                for (size_t i = 1; i <= count; ++i) {
                    const float pos = start + width * static_cast<float>(i);
                    marks.push_back({Normal(pos), tiers[level]});
                    nextBounds.push_back(pos);
                }
            }
            nextBounds.push_back(1.0f);
            bounds = std::move(nextBounds);
        }
        return Group(std::move(marks));
    }

    [[nodiscard]] static Group fromPositions(std::initializer_list<TickMark> marks) {
        return Group(std::vector<TickMark>(marks));
    }

    [[nodiscard]] size_t size() const noexcept { return marks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return marks_.empty(); }

    [[nodiscard]] bool hasTier(Tier tier) const noexcept {
        for (const auto& mark : marks_) {
            if (mark.tier == tier)
                return true;
        }
        return false;
    }

    [[nodiscard]] const std::vector<TickMark>& marks() const noexcept { return marks_; }

    [[nodiscard]] auto begin() const noexcept { return marks_.begin(); }
    [[nodiscard]] auto end() const noexcept { return marks_.end(); }

private:
    std::vector<TickMark> marks_;
};

} // namespace Vernier::Core::TickMarks
