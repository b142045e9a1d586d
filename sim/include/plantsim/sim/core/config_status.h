// ==============================================================================
// Layer 0: Core Utility - Configuration Status
// ==============================================================================
// Value-type error reporting for element configuration.
//
// Processing never fails: every process() call is noexcept and saturates to a
// border-case output instead of signalling. Configuration is where invalid
// parameters are caught. configure() and every setter return a ConfigStatus;
// a rejected configuration leaves the element exactly as it was.
//
// Dependencies:
//   - stdlib: <cmath>, <cstddef>, <cstdint>, <cstdio>
// ==============================================================================

#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace Plantsim {
namespace Sim {

// =============================================================================
// ConfigError
// =============================================================================

/// @brief Reason a configuration was rejected.
enum class ConfigError : std::uint8_t {
    None = 0,
    NonPositiveSampleInterval,       ///< sampleInterval <= 0
    NegativeDelayTime,               ///< delayTime < 0
    NonPositiveGain,                 ///< gain <= 0
    TimeConstantBelowSampleInterval, ///< 0 < timeConstant < sampleInterval
    NonPositiveTimeConstant,         ///< t1 or t2 <= 0 when deriving PT2 parameters
    NonPositiveNaturalFrequency,     ///< naturalFrequency <= 0
    NegativeDamping,                 ///< damping < 0
    DelayExceedsCapacity,            ///< delay length above the buffer capacity
    ThresholdsInverted,              ///< lowerThreshold > upperThreshold
    UndefinedSlopeDifference,        ///< derivation divides by (m_upper - m_lower) == 0
    NonFiniteParameter,              ///< NaN or infinite parameter
    CoefficientOutOfRange            ///< derived coefficient not representable by the sample type
};

/// @brief Stable identifier for a ConfigError.
[[nodiscard]] constexpr const char* errorName(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::None:                            return "None";
        case ConfigError::NonPositiveSampleInterval:       return "NonPositiveSampleInterval";
        case ConfigError::NegativeDelayTime:               return "NegativeDelayTime";
        case ConfigError::NonPositiveGain:                 return "NonPositiveGain";
        case ConfigError::TimeConstantBelowSampleInterval: return "TimeConstantBelowSampleInterval";
        case ConfigError::NonPositiveTimeConstant:         return "NonPositiveTimeConstant";
        case ConfigError::NonPositiveNaturalFrequency:     return "NonPositiveNaturalFrequency";
        case ConfigError::NegativeDamping:                 return "NegativeDamping";
        case ConfigError::DelayExceedsCapacity:            return "DelayExceedsCapacity";
        case ConfigError::ThresholdsInverted:              return "ThresholdsInverted";
        case ConfigError::UndefinedSlopeDifference:        return "UndefinedSlopeDifference";
        case ConfigError::NonFiniteParameter:              return "NonFiniteParameter";
        case ConfigError::CoefficientOutOfRange:           return "CoefficientOutOfRange";
    }
    return "Unknown";
}

// =============================================================================
// ConfigStatus
// =============================================================================

/// @brief Outcome of a configure() or setter call.
///
/// Carries enough context to diagnose a misconfiguration: the element kind,
/// the offending value and the limit it violated.
struct ConfigStatus {
    ConfigError error = ConfigError::None;
    const char* element = "";   ///< Display name of the element kind
    double requested = 0.0;     ///< Offending parameter value
    double limit = 0.0;         ///< Bound the value violated

    [[nodiscard]] constexpr bool ok() const noexcept {
        return error == ConfigError::None;
    }

    constexpr explicit operator bool() const noexcept {
        return ok();
    }

    [[nodiscard]] constexpr const char* errorName() const noexcept {
        return Sim::errorName(error);
    }

    /// Successful status for an element kind.
    [[nodiscard]] static constexpr ConfigStatus success(const char* element) noexcept {
        return ConfigStatus{ConfigError::None, element, 0.0, 0.0};
    }

    [[nodiscard]] static constexpr ConfigStatus failure(ConfigError error,
                                                        const char* element,
                                                        double requested,
                                                        double limit) noexcept {
        return ConfigStatus{error, element, requested, limit};
    }
};

/// @brief Render a status as "PT0: DelayExceedsCapacity (requested 5000, limit 4096)".
///
/// @param buffer Destination, always null-terminated when size > 0
/// @param size   Capacity of buffer in bytes
/// @return Number of characters that would have been written (snprintf semantics)
inline int formatStatus(char* buffer, size_t size, const ConfigStatus& status) noexcept {
    if (status.ok()) {
        return std::snprintf(buffer, size, "%s: ok", status.element);
    }
    return std::snprintf(buffer, size, "%s: %s (requested %g, limit %g)",
                         status.element, status.errorName(),
                         status.requested, status.limit);
}

namespace detail {

/// True when every parameter is a finite number.
template <typename... Values>
[[nodiscard]] inline bool allFinite(Values... values) noexcept {
    return (std::isfinite(static_cast<double>(values)) && ...);
}

/// First NaN or infinite parameter, 0 when all are finite.
template <typename... Values>
[[nodiscard]] inline double firstNonFinite(Values... values) noexcept {
    const double all[] = {static_cast<double>(values)...};
    for (double v : all) {
        if (!std::isfinite(v)) {
            return v;
        }
    }
    return 0.0;
}

/// Failure with the offending value when any parameter is not finite.
template <typename... Values>
[[nodiscard]] inline ConfigStatus checkFinite(const char* element, Values... values) noexcept {
    if (allFinite(values...)) {
        return ConfigStatus::success(element);
    }
    return ConfigStatus::failure(ConfigError::NonFiniteParameter, element,
                                 firstNonFinite(values...), 0.0);
}

/// @brief Check that a positive parameter survives conversion to a coefficient.
///
/// Fixed point resolves 1/1024 at the low end and saturates near 2^21 at the
/// high end; a coefficient outside that range would freeze or clip the
/// element. The reported limit is the bound that was crossed.
template <typename Traits>
[[nodiscard]] inline ConfigStatus checkCoefficient(const char* element, double value) noexcept {
    if (value < Traits::kMinCoefficient) {
        return ConfigStatus::failure(ConfigError::CoefficientOutOfRange, element,
                                     value, Traits::kMinCoefficient);
    }
    if (value >= Traits::kMaxCoefficient) {
        return ConfigStatus::failure(ConfigError::CoefficientOutOfRange, element,
                                     value, Traits::kMaxCoefficient);
    }
    return ConfigStatus::success(element);
}

} // namespace detail

} // namespace Sim
} // namespace Plantsim
