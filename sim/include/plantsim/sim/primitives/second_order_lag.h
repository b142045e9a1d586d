// ==============================================================================
// Layer 1: Plant Primitive - SecondOrderLag (PT2)
// ==============================================================================
// Damped second-order lag with gain, integrated with explicit Euler steps of
// size h = Ts. Two state variables, output x1 and derivative x2:
//
//   x2[k] = x2[k-1] + h * (-2*D*w*x2[k-1] - w^2*x1[k-1] + K*w^2*u[k])
//   x1[k] = x1[k-1] + h * w * x2[k-1]
//
// D is the damping, w the natural frequency, K the gain. Both updates read the
// previous state, so the output of the first step after rest is always zero.
//
// Parameters are given either directly (w, D) or as two time constants:
//
//   w = 1 / sqrt(T1 * T2),   D = (T1 + T2) / (2 * T1 * T2)
//
// Explicit Euler is only stable for h small relative to 1/w. That choice is
// the caller's; configure() does not check it.
//
// Dependencies:
//   - Layer 0: sample_traits.h, config_status.h, sim_log.h
//   - stdlib: <cmath>, <cstddef>, <cstdint>, <cstdio>, <string>
// ==============================================================================

#pragma once

#include <plantsim/sim/core/config_status.h>
#include <plantsim/sim/core/sample_traits.h>
#include <plantsim/sim/core/sim_log.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Plantsim {
namespace Sim {

/// @brief Damping classification of a second-order element.
enum class DampingRegime : std::uint8_t {
    Underdamped,      ///< D < 1, oscillating step response
    CriticallyDamped, ///< D == 1, fastest response without overshoot
    Overdamped        ///< D > 1, slow non-oscillating response
};

[[nodiscard]] constexpr DampingRegime classifyDamping(double damping) noexcept {
    if (damping < 1.0) {
        return DampingRegime::Underdamped;
    }
    if (damping > 1.0) {
        return DampingRegime::Overdamped;
    }
    return DampingRegime::CriticallyDamped;
}

/// @brief Parameters of a SecondOrderLag.
struct SecondOrderLagConfig {
    double sampleInterval = 1.0;   ///< h, must be > 0
    double naturalFrequency = 1.0; ///< w, must be > 0
    double damping = 1.0;          ///< D, must be >= 0
    double gain = 1.0;             ///< K, must be > 0

    bool operator==(const SecondOrderLagConfig&) const = default;

    /// @brief Derive w and D from two time constants.
    ///
    /// Both must be > 0 (see SecondOrderLag::validateTimeConstants). Other
    /// values give a non-finite w or a negative D, which validation rejects
    /// as such.
    [[nodiscard]] static SecondOrderLagConfig fromTimeConstants(double t1,
                                                                double t2,
                                                                double sampleInterval = 1.0,
                                                                double gain = 1.0) noexcept {
        SecondOrderLagConfig c;
        c.sampleInterval = sampleInterval;
        c.gain = gain;
        c.naturalFrequency = 1.0 / std::sqrt(t1 * t2);
        c.damping = (t1 + t2) / (2.0 * t1 * t2);
        return c;
    }
};

/// @brief PT2 element: second-order lag / damped oscillator with gain.
///
/// @tparam Sample float, double or std::int32_t (fixed point)
///
/// @par Fixed point
/// Every coefficient (w, w^2, 2*D*w, h, K) is scaled by 2^10, and each
/// coefficient product is shifted down once, so both state variables stay at
/// single scale. The coefficients are quantized to 1/1024; choose h and w so
/// that h*1024 and w*1024 are representable with the accuracy you need.
/// Configurations where h, w, w^2, 2*D*w (for D > 0) or K falls below 1/1024
/// or beyond the int32 range are rejected with CoefficientOutOfRange.
template <typename Sample>
class SecondOrderLag {
public:
    using Traits = SampleTraits<Sample>;
    using Coefficient = typename Traits::Coefficient;
    using Accumulator = typename Traits::Accumulator;

    static constexpr const char* kDisplayName = "PT2";

    SecondOrderLag() noexcept {
        updateCoefficients();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] static ConfigStatus validate(const SecondOrderLagConfig& config) noexcept {
        if (const auto finite = detail::checkFinite(kDisplayName, config.sampleInterval,
                                                    config.naturalFrequency, config.damping,
                                                    config.gain);
            !finite) {
            return finite;
        }
        if (config.sampleInterval <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveSampleInterval, kDisplayName,
                                         config.sampleInterval, 0.0);
        }
        if (config.naturalFrequency <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveNaturalFrequency, kDisplayName,
                                         config.naturalFrequency, 0.0);
        }
        if (config.damping < 0.0) {
            return ConfigStatus::failure(ConfigError::NegativeDamping, kDisplayName,
                                         config.damping, 0.0);
        }
        if (config.gain <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveGain, kDisplayName,
                                         config.gain, 0.0);
        }
        return validateCoefficients(config);
    }

    /// @brief Check two time constants before they are turned into w and D.
    [[nodiscard]] static ConfigStatus validateTimeConstants(double t1, double t2) noexcept {
        if (const auto finite = detail::checkFinite(kDisplayName, t1, t2); !finite) {
            return finite;
        }
        if (t1 <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveTimeConstant, kDisplayName,
                                         t1, 0.0);
        }
        if (t2 <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveTimeConstant, kDisplayName,
                                         t2, 0.0);
        }
        return ConfigStatus::success(kDisplayName);
    }

    /// @brief Apply a configuration; the state (output and derivative) is kept.
    /// @return Status; on failure the element is left unchanged.
    [[nodiscard]] ConfigStatus configure(const SecondOrderLagConfig& config) noexcept {
        const ConfigStatus status = validate(config);
        if (!status) {
            logConfigRejection(status);
            return status;
        }
        config_ = config;
        updateCoefficients();
        return status;
    }

    [[nodiscard]] ConfigStatus setSampleInterval(double sampleInterval) noexcept {
        SecondOrderLagConfig c = config_;
        c.sampleInterval = sampleInterval;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setNaturalFrequency(double naturalFrequency) noexcept {
        SecondOrderLagConfig c = config_;
        c.naturalFrequency = naturalFrequency;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setDamping(double damping) noexcept {
        SecondOrderLagConfig c = config_;
        c.damping = damping;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setGain(double gain) noexcept {
        SecondOrderLagConfig c = config_;
        c.gain = gain;
        return configure(c);
    }

    /// Replace w and D by the values derived from T1 and T2.
    [[nodiscard]] ConfigStatus setTimeConstants(double t1, double t2) noexcept {
        if (const auto status = validateTimeConstants(t1, t2); !status) {
            logConfigRejection(status);
            return status;
        }
        return configure(SecondOrderLagConfig::fromTimeConstants(
            t1, t2, config_.sampleInterval, config_.gain));
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] Sample process(Sample input) noexcept {
        const Accumulator target = Traits::mul(gain_, input);

        // -2*D*w*x2 - w^2*x1 + K*w^2*u  ==  w^2*(K*u - x1) - 2*D*w*x2
        const Accumulator acceleration = Traits::mulScaled(omegaSquared_, target - output_)
                                       - Traits::mulScaled(twoDampingOmega_, derivative_);

        const Accumulator nextDerivative = derivative_ + Traits::mulScaled(dt_, acceleration);
        const Accumulator nextOutput =
            output_ + Traits::mulScaled(dt_, Traits::mulScaled(omega_, derivative_));

        derivative_ = nextDerivative;
        output_ = nextOutput;
        return Traits::toSample(output_);
    }

    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) {
            return;
        }
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Return to rest: output and derivative zero.
    void reset() noexcept {
        output_ = Accumulator{0};
        derivative_ = Accumulator{0};
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] const SecondOrderLagConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] DampingRegime dampingRegime() const noexcept {
        return classifyDamping(config_.damping);
    }

    [[nodiscard]] Sample previousOutput() const noexcept {
        return Traits::toSample(output_);
    }

    [[nodiscard]] Sample previousDerivative() const noexcept {
        return Traits::toSample(derivative_);
    }

    [[nodiscard]] std::string describe() const {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "PT2(sample_interval: %g, natural_frequency: %g, damping: %g, gain: %g)",
                      config_.sampleInterval, config_.naturalFrequency, config_.damping,
                      config_.gain);
        return buf;
    }

    [[nodiscard]] bool operator==(const SecondOrderLag& other) const noexcept {
        return config_ == other.config_
            && output_ == other.output_
            && derivative_ == other.derivative_;
    }

private:
    // Every coefficient process() multiplies by must be representable.
    [[nodiscard]] static ConfigStatus validateCoefficients(const SecondOrderLagConfig& config) noexcept {
        const double w = config.naturalFrequency;
        const double twoDampingOmega = 2.0 * config.damping * w;
        const double coefficients[] = {config.sampleInterval, w, w * w, config.gain};
        for (double value : coefficients) {
            if (const auto status = detail::checkCoefficient<Traits>(kDisplayName, value); !status) {
                return status;
            }
        }
        // D == 0 leaves the damping term out entirely
        if (config.damping > 0.0) {
            return detail::checkCoefficient<Traits>(kDisplayName, twoDampingOmega);
        }
        return ConfigStatus::success(kDisplayName);
    }

    void updateCoefficients() noexcept {
        const double w = config_.naturalFrequency;
        gain_ = Traits::toCoefficient(config_.gain);
        omega_ = Traits::toCoefficient(w);
        omegaSquared_ = Traits::toCoefficient(w * w);
        twoDampingOmega_ = Traits::toCoefficient(2.0 * config_.damping * w);
        dt_ = Traits::toCoefficient(config_.sampleInterval);
    }

    SecondOrderLagConfig config_{};
    Coefficient gain_{};
    Coefficient omega_{};
    Coefficient omegaSquared_{};
    Coefficient twoDampingOmega_{};
    Coefficient dt_{};
    Accumulator output_{0};      ///< x1[k-1]
    Accumulator derivative_{0};  ///< x2[k-1]
};

} // namespace Sim
} // namespace Plantsim
