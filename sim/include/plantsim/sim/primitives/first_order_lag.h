// ==============================================================================
// Layer 1: Plant Primitive - FirstOrderLag (PT1)
// ==============================================================================
// Single-pole exponential smoothing with gain, Euler forward:
//
//   out[k] = out[k-1] + alpha * (P * in[k] - out[k-1]),   alpha = Ts / T1
//
// where Ts is the sample interval, T1 the time constant and P the gain.
// T1 == 0 is an instantaneous gain element (alpha = 1).
//
// Fixed point: P and alpha are scaled by 2^10 and the state is held at that
// single scale. alpha * (P*in - out) is doubly scaled and is shifted down
// once before it is added to the state; the output shifts the state down
// once more. Shifting the sum (state + increment) instead of the increment
// alone drops the state to raw scale after the first step. The shifts floor,
// so a rising response settles up to one output unit below P * in while a
// falling one reaches it exactly. P and alpha must both stay at or above one
// scaled unit (1/1024).
//
// Dependencies:
//   - Layer 0: sample_traits.h, config_status.h, sim_log.h
//   - stdlib: <cstddef>, <cstdio>, <string>
// ==============================================================================

#pragma once

#include <plantsim/sim/core/config_status.h>
#include <plantsim/sim/core/sample_traits.h>
#include <plantsim/sim/core/sim_log.h>

#include <cstddef>
#include <cstdio>
#include <string>

namespace Plantsim {
namespace Sim {

/// @brief Parameters of a FirstOrderLag. The defaults (alpha = 1) form a
/// unity pass-through.
struct FirstOrderLagConfig {
    double sampleInterval = 1.0; ///< Ts, must be > 0
    double timeConstant = 1.0;   ///< T1, must be >= Ts, or exactly 0
    double gain = 1.0;           ///< P, must be > 0

    bool operator==(const FirstOrderLagConfig&) const = default;

    /// Smoothing factor Ts / T1 (1 for T1 == 0).
    [[nodiscard]] double alpha() const noexcept {
        return timeConstant == 0.0 ? 1.0 : sampleInterval / timeConstant;
    }
};

/// @brief PT1 element: first-order lag with gain.
///
/// @tparam Sample float, double or std::int32_t (fixed point)
///
/// @par Usage
/// @code
/// FirstOrderLag<float> pt1;
/// if (!pt1.configure({.sampleInterval = 0.01, .timeConstant = 0.5, .gain = 2.0})) {
///     return;
/// }
/// for (size_t i = 0; i < numSamples; ++i) {
///     output[i] = pt1.process(input[i]);
/// }
/// @endcode
template <typename Sample>
class FirstOrderLag {
public:
    using Traits = SampleTraits<Sample>;
    using Coefficient = typename Traits::Coefficient;
    using Accumulator = typename Traits::Accumulator;

    static constexpr const char* kDisplayName = "PT1";

    FirstOrderLag() noexcept = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] static ConfigStatus validate(const FirstOrderLagConfig& config) noexcept {
        if (const auto finite = detail::checkFinite(kDisplayName, config.sampleInterval,
                                                    config.timeConstant, config.gain);
            !finite) {
            return finite;
        }
        if (config.sampleInterval <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveSampleInterval, kDisplayName,
                                         config.sampleInterval, 0.0);
        }
        if (config.timeConstant != 0.0 && config.timeConstant < config.sampleInterval) {
            return ConfigStatus::failure(ConfigError::TimeConstantBelowSampleInterval,
                                         kDisplayName, config.timeConstant,
                                         config.sampleInterval);
        }
        if (config.gain <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveGain, kDisplayName,
                                         config.gain, 0.0);
        }
        if (const auto gain = detail::checkCoefficient<Traits>(kDisplayName, config.gain); !gain) {
            return gain;
        }
        return detail::checkCoefficient<Traits>(kDisplayName, config.alpha());
    }

    /// @brief Apply a configuration. The filter state is kept so that a
    /// running simulation continues smoothly from its current output.
    /// @return Status; on failure the element is left unchanged.
    [[nodiscard]] ConfigStatus configure(const FirstOrderLagConfig& config) noexcept {
        const ConfigStatus status = validate(config);
        if (!status) {
            logConfigRejection(status);
            return status;
        }
        config_ = config;
        gain_ = Traits::toCoefficient(config.gain);
        alpha_ = Traits::toCoefficient(config.alpha());
        return status;
    }

    [[nodiscard]] ConfigStatus setSampleInterval(double sampleInterval) noexcept {
        FirstOrderLagConfig c = config_;
        c.sampleInterval = sampleInterval;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setTimeConstant(double timeConstant) noexcept {
        FirstOrderLagConfig c = config_;
        c.timeConstant = timeConstant;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setGain(double gain) noexcept {
        FirstOrderLagConfig c = config_;
        c.gain = gain;
        return configure(c);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] Sample process(Sample input) noexcept {
        const Accumulator target = Traits::mul(gain_, input);
        state_ += Traits::mulScaled(alpha_, target - state_);
        return Traits::toSample(state_);
    }

    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) {
            return;
        }
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Return to rest (output 0).
    void reset() noexcept {
        state_ = Accumulator{0};
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] const FirstOrderLagConfig& config() const noexcept {
        return config_;
    }

    /// Smoothing factor as applied, after any fixed-point quantization.
    [[nodiscard]] double effectiveAlpha() const noexcept {
        return Traits::fromCoefficient(alpha_);
    }

    /// Last output, in sample units.
    [[nodiscard]] Sample previousOutput() const noexcept {
        return Traits::toSample(state_);
    }

    [[nodiscard]] std::string describe() const {
        char buf[128];
        std::snprintf(buf, sizeof(buf),
                      "PT1(sample_interval: %g, time_constant: %g, gain: %g)",
                      config_.sampleInterval, config_.timeConstant, config_.gain);
        return buf;
    }

    [[nodiscard]] bool operator==(const FirstOrderLag& other) const noexcept {
        return config_ == other.config_ && state_ == other.state_;
    }

private:
    FirstOrderLagConfig config_{};
    Coefficient gain_ = Traits::toCoefficient(1.0);
    Coefficient alpha_ = Traits::toCoefficient(1.0);
    Accumulator state_{0};   ///< out[k-1], scaled once in fixed point
};

} // namespace Sim
} // namespace Plantsim
