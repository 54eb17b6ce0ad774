// Core Tests - Tick Mark Groups

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <vernier/core/tick_marks.h>

#include <algorithm>
#include <vector>

using namespace Vernier::Core;
using namespace Vernier::Core::TickMarks;
using Catch::Approx;

namespace {

size_t countTier(const Group& group, Tier tier) {
    return static_cast<size_t>(std::count_if(group.begin(), group.end(),
        [tier](const TickMark& mark) { return mark.tier == tier; }));
}

} // namespace

TEST_CASE("center group has one mark at 0.5", "[core][tick_marks]") {
    const auto group = Group::center(Tier::Two);

    REQUIRE(group.size() == 1);
    REQUIRE(group.marks()[0].position == Normal::center());
    REQUIRE(group.marks()[0].tier == Tier::Two);
    REQUIRE(group.hasTier(Tier::Two));
    REQUIRE_FALSE(group.hasTier(Tier::One));
}

TEST_CASE("minMax group marks both ends", "[core][tick_marks]") {
    const auto group = Group::minMax(Tier::One);

    REQUIRE(group.size() == 2);
    REQUIRE(group.marks()[0].position == Normal::min());
    REQUIRE(group.marks()[1].position == Normal::max());
}

TEST_CASE("minMaxAndCenter uses separate tiers", "[core][tick_marks]") {
    const auto group = Group::minMaxAndCenter(Tier::Two, Tier::Three);

    REQUIRE(group.size() == 3);
    REQUIRE(countTier(group, Tier::Two) == 2);
    REQUIRE(countTier(group, Tier::Three) == 1);

    const auto centerIt = std::find_if(group.begin(), group.end(),
        [](const TickMark& mark) { return mark.tier == Tier::Three; });
    REQUIRE(centerIt->position == Normal::center());
}

TEST_CASE("evenlySpaced spreads marks from 0 to 1", "[core][tick_marks]") {
    SECTION("five marks") {
        const auto group = Group::evenlySpaced(5, Tier::Three);
        REQUIRE(group.size() == 5);
        REQUIRE(group.marks()[0].position.value() == 0.0f);
        REQUIRE(group.marks()[1].position.value() == Approx(0.25f));
        REQUIRE(group.marks()[2].position.value() == Approx(0.5f));
        REQUIRE(group.marks()[4].position.value() == 1.0f);
    }

    SECTION("one mark sits at the center") {
        const auto group = Group::evenlySpaced(1, Tier::One);
        REQUIRE(group.size() == 1);
        REQUIRE(group.marks()[0].position == Normal::center());
    }

    SECTION("zero marks is empty") {
        REQUIRE(Group::evenlySpaced(0, Tier::One).empty());
    }
}

TEST_CASE("subdivided splits sections recursively", "[core][tick_marks]") {
    const auto group = Group::subdivided(1, 1, 0, Tier::One);

    // Ends + one center + one mark in each half
    REQUIRE(group.size() == 5);
    REQUIRE(countTier(group, Tier::One) == 3);
    REQUIRE(countTier(group, Tier::Two) == 2);

    std::vector<float> tierTwo;
    for (const auto& mark : group) {
        if (mark.tier == Tier::Two)
            tierTwo.push_back(mark.position.value());
    }
    std::sort(tierTwo.begin(), tierTwo.end());
    REQUIRE(tierTwo[0] == Approx(0.25f));
    REQUIRE(tierTwo[1] == Approx(0.75f));
}

TEST_CASE("subdivided third level", "[core][tick_marks]") {
    const auto group = Group::subdivided(3, 0, 1, Tier::Two);

    // 2 ends, 3 tier-one marks, then 4 sections with 1 tier-three mark each
    REQUIRE(group.size() == 9);
    REQUIRE(countTier(group, Tier::One) == 3);
    REQUIRE(countTier(group, Tier::Three) == 4);
}

TEST_CASE("fromPositions keeps the given marks", "[core][tick_marks]") {
    const auto group = Group::fromPositions({{Normal(0.1f), Tier::One},
                                             {Normal(0.9f), Tier::Three}});
    REQUIRE(group.size() == 2);
    REQUIRE(group.marks()[1].position == Normal(0.9f));
    REQUIRE(group.marks()[1].tier == Tier::Three);
}
