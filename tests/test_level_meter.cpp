#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "level_meter.hpp"

#include <vector>

using Catch::Matchers::WithinAbs;

TEST_CASE("LevelMeter", "[level]") {
    LevelMeter meter;

    SECTION("StartsAtZero") {
        REQUIRE(meter.level() == 0.0f);
    }

    SECTION("NormalizeWindow") {
        REQUIRE(LevelMeter::normalize(-60.0f) == 0.0f);
        REQUIRE(LevelMeter::normalize(-35.0f) == 0.0f);
        // Above the window: clamped, then boosted past 1 and capped.
        REQUIRE(LevelMeter::normalize(-20.0f) == 1.0f);
        REQUIRE(LevelMeter::normalize(0.0f) == 1.0f);

        float mid = LevelMeter::normalize(-30.0f);
        REQUIRE(mid > 0.0f);
        REQUIRE(mid <= 1.0f);
        REQUIRE(LevelMeter::normalize(-32.0f) < mid);
    }

    SECTION("SilenceStaysZero") {
        std::vector<int16_t> silence(1600, 0);
        meter.update(silence);
        REQUIRE(meter.level() == 0.0f);
    }

    SECTION("LoudSignalSmoothed") {
        // Full-scale square wave: RMS 0 dB, target level 1.
        std::vector<int16_t> loud(1600);
        for (size_t i = 0; i < loud.size(); ++i) loud[i] = (i % 2) ? 32767 : -32767;

        meter.update(loud);
        REQUIRE_THAT(meter.level(), WithinAbs(0.8, 1e-4));
        meter.update(loud);
        REQUIRE_THAT(meter.level(), WithinAbs(0.96, 1e-4));

        meter.reset();
        REQUIRE(meter.level() == 0.0f);
    }

    SECTION("EmptyBufferIgnored") {
        meter.update({});
        REQUIRE(meter.level() == 0.0f);
    }
}
