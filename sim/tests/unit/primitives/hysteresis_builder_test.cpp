// ==============================================================================
// Layer 1: Plant Primitive - HysteresisBuilder Tests
// ==============================================================================
// Tests for: sim/include/plantsim/sim/primitives/hysteresis_switch.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <plantsim/sim/primitives/hysteresis_switch.h>

#include <cstdint>

using namespace Plantsim::Sim;
using Catch::Approx;

namespace {

constexpr LinearSegment<double> kIdentity{1.0, 0.0};
constexpr LinearSegment<double> kShifted{1.0, 1.0};
constexpr LinearSegment<double> kHalf{0.5, 0.0};

void requireThresholds(const HysteresisThresholds<double>& t, double lower, double upper) {
    REQUIRE(t.lower == Approx(lower).margin(1e-12));
    REQUIRE(t.upper == Approx(upper).margin(1e-12));
}

} // anonymous namespace

// ==============================================================================
// Threshold Derivation
// ==============================================================================

TEST_CASE("HysteresisBuilder without calls yields a zero-width band at 0", "[hysteresis_builder]") {
    HysteresisBuilder<double> builder(kIdentity, kShifted);
    requireThresholds(builder.thresholds(), 0.0, 0.0);
    REQUIRE(builder.config().initialBranch == HysteresisBranch::FromLower);
    REQUIRE(builder.status());
}

TEST_CASE("HysteresisBuilder upperDirection selects the upper starting branch", "[hysteresis_builder]") {
    HysteresisSwitch<double> h;
    REQUIRE(HysteresisBuilder<double>(kIdentity, kShifted).upperDirection().build(h));
    REQUIRE(h.thresholds() == HysteresisThresholds<double>{0.0, 0.0});
    REQUIRE(h.activeBranch() == HysteresisBranch::FromUpper);
    REQUIRE(h.config().initialBranch == HysteresisBranch::FromUpper);
}

TEST_CASE("HysteresisBuilder spreadX centres the band on the midpoint", "[hysteresis_builder]") {
    requireThresholds(HysteresisBuilder<double>(kIdentity, kShifted).spreadX(1.0).thresholds(),
                      -0.5, 0.5);
}

TEST_CASE("HysteresisBuilder spreadY divides by the slope difference", "[hysteresis_builder]") {
    requireThresholds(HysteresisBuilder<double>(kHalf, kShifted).spreadY(1.0).thresholds(),
                      -1.0, 1.0);
}

TEST_CASE("HysteresisBuilder cross places the midpoint at the intersection", "[hysteresis_builder]") {
    requireThresholds(HysteresisBuilder<double>(kHalf, kShifted).cross().thresholds(), -2.0, -2.0);

    SECTION("combined with a spread") {
        requireThresholds(
            HysteresisBuilder<double>(kHalf, kShifted).cross().spreadX(2.0).thresholds(),
            -3.0, -1.0);
    }
}

TEST_CASE("HysteresisBuilder one explicit threshold places the other a spread away",
          "[hysteresis_builder]") {
    SECTION("lowerX") {
        requireThresholds(
            HysteresisBuilder<double>(kHalf, kShifted).spreadX(1.0).lowerX(1.0).thresholds(),
            1.0, 2.0);
    }

    SECTION("upperX") {
        requireThresholds(
            HysteresisBuilder<double>(kHalf, kShifted).spreadX(1.0).upperX(1.0).thresholds(),
            0.0, 1.0);
    }

    SECTION("lowerY") {
        requireThresholds(
            HysteresisBuilder<double>(kHalf, kShifted).spreadX(1.0).lowerY(1.0).thresholds(),
            0.0, 1.0);
    }

    SECTION("upperY") {
        requireThresholds(
            HysteresisBuilder<double>(kHalf, kShifted).spreadX(1.0).upperY(1.0).thresholds(),
            -1.0, 0.0);
    }
}

TEST_CASE("HysteresisBuilder explicit thresholds override derivations", "[hysteresis_builder]") {
    requireThresholds(HysteresisBuilder<double>(kHalf, kShifted)
                          .cross()
                          .spreadX(10.0)
                          .lowerX(-0.25)
                          .upperX(0.75)
                          .thresholds(),
                      -0.25, 0.75);
}

TEST_CASE("HysteresisBuilder lowerY offset matches the segment gap", "[hysteresis_builder]") {
    const auto t = HysteresisBuilder<double>(kHalf, kShifted).lowerY(2.0).upperY(3.0).thresholds();
    // lowerSegment(x) + deltaY == upperSegment(x) at each threshold
    REQUIRE(kHalf(t.lower) + 2.0 == Approx(kShifted(t.lower)));
    REQUIRE(kHalf(t.upper) + 3.0 == Approx(kShifted(t.upper)));
}

// ==============================================================================
// Build
// ==============================================================================

TEST_CASE("HysteresisBuilder build configures the target", "[hysteresis_builder][build]") {
    HysteresisSwitch<double> h;
    const auto status = HysteresisBuilder<double>(kHalf, kShifted).spreadY(1.0).build(h);
    REQUIRE(status);
    REQUIRE(h.config().lowerSegment == kHalf);
    REQUIRE(h.config().upperSegment == kShifted);
    REQUIRE(h.thresholds().lower == Approx(-1.0));
    REQUIRE(h.thresholds().upper == Approx(1.0));
    REQUIRE(h.process(0.0) == Approx(0.0));
}

TEST_CASE("HysteresisBuilder reports parallel segments", "[hysteresis_builder][build]") {
    HysteresisSwitch<double> h;
    const HysteresisSwitch<double> untouched = h;

    SECTION("cross") {
        const auto status = HysteresisBuilder<double>(kIdentity, kShifted).cross().build(h);
        REQUIRE(status.error == ConfigError::UndefinedSlopeDifference);
    }

    SECTION("spreadY") {
        const auto status = HysteresisBuilder<double>(kIdentity, kShifted).spreadY(1.0).build(h);
        REQUIRE(status.error == ConfigError::UndefinedSlopeDifference);
    }

    SECTION("lowerY") {
        HysteresisBuilder<double> builder(kIdentity, kShifted);
        builder.spreadX(1.0).lowerY(0.5);
        REQUIRE(builder.status().error == ConfigError::UndefinedSlopeDifference);
        REQUIRE(builder.build(h).error == ConfigError::UndefinedSlopeDifference);
    }

    SECTION("upperY after explicit thresholds") {
        const auto status = HysteresisBuilder<double>(kIdentity, kShifted)
                                .lowerX(0.0)
                                .upperX(1.0)
                                .upperY(2.0)
                                .build(h);
        REQUIRE(status.error == ConfigError::UndefinedSlopeDifference);
    }

    REQUIRE(h == untouched);
}

TEST_CASE("HysteresisBuilder reports inverted explicit thresholds", "[hysteresis_builder][build]") {
    HysteresisSwitch<double> h;
    const auto status =
        HysteresisBuilder<double>(kHalf, kShifted).lowerX(2.0).upperX(1.0).build(h);
    REQUIRE(status.error == ConfigError::ThresholdsInverted);
    REQUIRE(h.thresholds() == HysteresisThresholds<double>{0.0, 0.0});
}

TEST_CASE("HysteresisBuilder works with integer samples", "[hysteresis_builder][integer]") {
    HysteresisSwitch<std::int32_t> h;
    const auto status = HysteresisBuilder<std::int32_t>({1, 0}, {3, 40}).cross().spreadX(10).build(h);
    REQUIRE(status);
    // segments cross at -20
    REQUIRE(h.thresholds() == HysteresisThresholds<std::int32_t>{-25, -15});
}
