// Core Tests - PanelConfig Validation

#include <catch2/catch_test_macros.hpp>

#include <vernier/core/panel_config.h>

#include <string>

using namespace Vernier::Core;

TEST_CASE("Default PanelConfig is valid", "[core][config]") {
    REQUIRE(PanelConfig{}.validate() == ConfigError::None);
}

TEST_CASE("PanelConfig rejects bad ranges", "[core][config]") {
    PanelConfig config;

    SECTION("empty float range") {
        config.floatMin = 1.0f;
        config.floatMax = 1.0f;
        REQUIRE(config.validate() == ConfigError::EmptyFloatRange);
    }

    SECTION("reversed integer range") {
        config.intMin = 10;
        config.intMax = 0;
        REQUIRE(config.validate() == ConfigError::EmptyIntRange);
    }

    SECTION("integer range wider than a normal can address") {
        config.intMin = -2000000000;
        config.intMax = 2000000000;
        REQUIRE(config.validate() == ConfigError::IntRangeTooWide);
    }

    SECTION("decibel range without zero") {
        config.dbMin = 3.0f;
        REQUIRE(config.validate() == ConfigError::DecibelRangeMissesZero);
    }

    SECTION("decibel zero position at an end") {
        config.dbZeroPosition = 1.0f;
        REQUIRE(config.validate() == ConfigError::DecibelRangeMissesZero);
    }

    SECTION("frequency below the spectrum") {
        config.freqMinHz = 10.0f;
        REQUIRE(config.validate() == ConfigError::FrequencyOutsideSpectrum);
    }

    SECTION("frequency above the spectrum") {
        config.freqMaxHz = 22050.0f;
        REQUIRE(config.validate() == ConfigError::FrequencyOutsideSpectrum);
    }

    SECTION("zero slider step") {
        config.sliderStep = 0.0f;
        REQUIRE(config.validate() == ConfigError::InvalidSliderStep);
    }
}

TEST_CASE("PanelConfig accepts an integer range of exactly 2^24 steps", "[core][config]") {
    PanelConfig config;
    config.intMin = 0;
    config.intMax = 1 << 24;
    config.intInitial = 0;
    config.intDefault = 0;
    REQUIRE(config.validate() == ConfigError::None);

    config.intMax += 1;
    REQUIRE(config.validate() == ConfigError::IntRangeTooWide);
}

TEST_CASE("PanelConfig reports the first error", "[core][config]") {
    PanelConfig config;
    config.intMin = 5;
    config.intMax = 5;
    config.sliderStep = 2.0f;
    REQUIRE(config.validate() == ConfigError::EmptyIntRange);
}

TEST_CASE("ConfigError has readable descriptions", "[core][config]") {
    REQUIRE(std::string(toString(ConfigError::None)) == "no error");
    REQUIRE(std::string(toString(ConfigError::InvalidSliderStep)).find("step") != std::string::npos);
}
