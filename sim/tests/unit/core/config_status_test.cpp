// ==============================================================================
// Layer 0: Core Utility - Configuration Status Tests
// ==============================================================================
// Tests for: sim/include/plantsim/sim/core/config_status.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <plantsim/sim/core/config_status.h>

#include <cmath>
#include <iterator>
#include <limits>
#include <string>

using namespace Plantsim::Sim;

TEST_CASE("ConfigStatus success converts to true", "[config_status]") {
    const auto status = ConfigStatus::success("PT1");
    REQUIRE(status.ok());
    REQUIRE(static_cast<bool>(status));
    REQUIRE(std::string{status.errorName()} == "None");
}

TEST_CASE("ConfigStatus failure carries context", "[config_status]") {
    const auto status = ConfigStatus::failure(ConfigError::DelayExceedsCapacity, "PT0", 5000.0, 4096.0);
    REQUIRE_FALSE(status.ok());
    REQUIRE_FALSE(static_cast<bool>(status));
    REQUIRE(status.error == ConfigError::DelayExceedsCapacity);
    REQUIRE(std::string{status.element} == "PT0");
    REQUIRE(status.requested == 5000.0);
    REQUIRE(status.limit == 4096.0);
}

TEST_CASE("formatStatus renders element, reason and bounds", "[config_status]") {
    char buf[128];

    SECTION("failure") {
        const auto status = ConfigStatus::failure(ConfigError::DelayExceedsCapacity, "PT0", 5000.0, 4096.0);
        formatStatus(buf, sizeof(buf), status);
        REQUIRE(std::string{buf} == "PT0: DelayExceedsCapacity (requested 5000, limit 4096)");
    }

    SECTION("success") {
        formatStatus(buf, sizeof(buf), ConfigStatus::success("PT2"));
        REQUIRE(std::string{buf} == "PT2: ok");
    }

    SECTION("truncates to the buffer") {
        char small[8];
        const auto status = ConfigStatus::failure(ConfigError::NegativeDamping, "PT2", -1.0, 0.0);
        const int needed = formatStatus(small, sizeof(small), status);
        REQUIRE(needed > static_cast<int>(sizeof(small)));
        REQUIRE(std::string{small} == "PT2: Ne");
    }
}

TEST_CASE("Every ConfigError has a distinct name", "[config_status]") {
    const ConfigError all[] = {
        ConfigError::None,
        ConfigError::NonPositiveSampleInterval,
        ConfigError::NegativeDelayTime,
        ConfigError::NonPositiveGain,
        ConfigError::TimeConstantBelowSampleInterval,
        ConfigError::NonPositiveTimeConstant,
        ConfigError::NonPositiveNaturalFrequency,
        ConfigError::NegativeDamping,
        ConfigError::DelayExceedsCapacity,
        ConfigError::ThresholdsInverted,
        ConfigError::UndefinedSlopeDifference,
        ConfigError::NonFiniteParameter,
        ConfigError::CoefficientOutOfRange,
    };
    for (size_t i = 0; i < std::size(all); ++i) {
        REQUIRE(std::string{errorName(all[i])} != "Unknown");
        for (size_t j = i + 1; j < std::size(all); ++j) {
            REQUIRE(std::string{errorName(all[i])} != std::string{errorName(all[j])});
        }
    }
}

TEST_CASE("allFinite rejects NaN and infinity", "[config_status]") {
    REQUIRE(detail::allFinite(1.0, -2.0, 0.0));
    REQUIRE(detail::allFinite(1.0f, 3));
    REQUIRE_FALSE(detail::allFinite(1.0, std::nan("")));
    REQUIRE_FALSE(detail::allFinite(std::numeric_limits<double>::infinity()));
}

TEST_CASE("checkFinite reports the first non-finite value", "[config_status]") {
    REQUIRE(detail::checkFinite("PT1", 1.0, 2.0));

    const auto status = detail::checkFinite("PT1", 1.0, -std::numeric_limits<double>::infinity(),
                                            std::nan(""));
    REQUIRE(status.error == ConfigError::NonFiniteParameter);
    REQUIRE(status.requested == -std::numeric_limits<double>::infinity());
    REQUIRE(std::string{status.element} == "PT1");
}
