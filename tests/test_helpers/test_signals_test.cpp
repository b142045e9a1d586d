// ==============================================================================
// Unit Tests: Test Signal Generators and Response Metrics
// ==============================================================================
// Tests for the helpers the plant tests are driven and measured with.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <buffer_comparison.h>
#include <response_metrics.h>
#include <test_signals.h>

#include <vector>

using namespace TestHelpers;
using Catch::Approx;

// ==============================================================================
// Test Tags
// ==============================================================================
// [signals]    - Signal generators and time ranges
// [test_utils] - Test utility infrastructure

TEST_CASE("StepSignal switches at the step time", "[signals][test_utils]") {
    const StepSignal<double> step{2.0, 3.0, 1.1};
    REQUIRE(step(0.0) == 2.0);
    REQUIRE(step(1.0) == 2.0);
    REQUIRE(step(1.1) == 3.0);
    REQUIRE(step(20.0) == 3.0);

    const StepSignal<double> unit;
    REQUIRE(unit(-0.5) == 0.0);
    REQUIRE(unit(0.0) == 1.0);
}

TEST_CASE("ImpulseSignal includes both edges", "[signals][test_utils]") {
    const ImpulseSignal<double> impulse;
    REQUIRE(impulse(-1.0) == 0.0);
    REQUIRE(impulse(0.0) == 1.0);
    REQUIRE(impulse(1.0) == 1.0);
    REQUIRE(impulse(2.0) == 0.0);

    const ImpulseSignal<double> shifted{2.0, 3.0, 20.0, 1.0};
    REQUIRE(shifted(0.0) == 2.0);
    REQUIRE(shifted(20.0) == 3.0);
}

TEST_CASE("SuperPosition adds two signals", "[signals][test_utils]") {
    const SuperPosition sum{StepSignal<double>{0.0, 1.0, 5.0}, ImpulseSignal<double>{0.0, 10.0, 2.0, 1.0}};
    REQUIRE(sum(0.0) == 0.0);
    REQUIRE(sum(2.5) == 10.0);
    REQUIRE(sum(6.0) == 1.0);
}

TEST_CASE("TimeRange includes both end points", "[signals][test_utils]") {
    SECTION("unit interval") {
        const TimeRange range;
        REQUIRE(range.size() == 101);
        REQUIRE(range.at(0) == 0.0);
        REQUIRE(range.at(100) == 100.0);
    }

    SECTION("decimal interval") {
        const TimeRange range{0.0, 1.0, 0.1};
        REQUIRE(range.size() == 11);
        REQUIRE(range.times().back() == Approx(1.0));
    }

    SECTION("by sample count") {
        const auto range = TimeRange::withSamples(0.0, 10.0, 5);
        REQUIRE(range.sampleInterval == 2.0);
        REQUIRE(range.size() == 6);
    }
}

TEST_CASE("sampleSignal evaluates a signal at every time of a range", "[signals][test_utils]") {
    const auto values = sampleSignal(StepSignal<float>{2.0f, 3.0f, 1.5}, TimeRange{0.0, 3.0, 1.0});
    REQUIRE(values == std::vector<float>{2.0f, 2.0f, 3.0f, 3.0f});
}

TEST_CASE("compareSequences reports the first difference", "[signals][test_utils]") {
    const std::vector<double> expected{1.0, 2.0, 3.0};

    REQUIRE(compareSequences(expected, std::vector<int>{1, 2, 3}).passed);

    const auto differ = compareSequences(expected, std::vector<double>{1.0, 2.5, 4.0}, 0.1);
    REQUIRE_FALSE(differ.passed);
    REQUIRE(differ.firstDifferenceIndex == 1);
    REQUIRE(differ.maxDifference == Approx(1.0));

    const auto shorter = compareSequences(expected, std::vector<double>{1.0, 2.0});
    REQUIRE_FALSE(shorter.passed);
    REQUIRE(shorter.firstDifferenceIndex == 2);
}

TEST_CASE("measureStepResponse characterises overshoot and settling", "[signals][test_utils]") {
    const std::vector<double> response{0.0, 0.5, 0.95, 1.2, 1.05, 0.99, 1.0, 1.0};
    const auto m = measureStepResponse(response, 1.0);
    REQUIRE(m.peak == 1.2);
    REQUIRE(m.peakIndex == 3);
    REQUIRE(m.overshootRatio == Approx(0.2));
    REQUIRE(m.riseIndex == 2);
    REQUIRE(m.settlingIndex == 5);
    REQUIRE_FALSE(m.monotonic);
}

TEST_CASE("sequenceToString writes one value per line", "[signals][test_utils]") {
    REQUIRE(sequenceToString(std::vector<int>{1, 2}, 1) == "1.0\n2.0\n");
    REQUIRE(sequenceToString(std::vector<double>{-0.25}, 2) == "-0.25\n");
    REQUIRE(sequenceToString(std::vector<double>{}).empty());
}
