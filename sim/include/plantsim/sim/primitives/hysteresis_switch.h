// ==============================================================================
// Layer 1: Plant Primitive - HysteresisSwitch
// ==============================================================================
// Two-branch hysteresis nonlinearity. Two linear segments and two thresholds:
//
//   in < lower             -> lower segment, remember FromLower
//   in > upper             -> upper segment, remember FromUpper
//   lower <= in <= upper   -> segment of the remembered branch
//
//            y ^        upper segment
//              |      ___/____
//              |     /  /
//              |    /  /   <- band: output depends on history
//              |   /__/
//              |  /  lower segment
//              +--|--|---------> x
//               lower upper
//
// HysteresisBuilder derives the thresholds from any of: explicit values, a
// spread in input units around a midpoint, a spread in output units, the
// segments' crossing point, or a vertical offset between the segments.
//
// Dependencies:
//   - Layer 0: linear_segment.h, config_status.h, sim_log.h
//   - stdlib: <cstddef>, <cstdint>, <cstdio>, <optional>, <string>, <type_traits>
// ==============================================================================

#pragma once

#include <plantsim/sim/core/config_status.h>
#include <plantsim/sim/core/linear_segment.h>
#include <plantsim/sim/core/sim_log.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <type_traits>

namespace Plantsim {
namespace Sim {

/// @brief Branch that was active when the input last left the band.
enum class HysteresisBranch : std::uint8_t {
    FromLower,
    FromUpper
};

[[nodiscard]] constexpr const char* branchName(HysteresisBranch branch) noexcept {
    return branch == HysteresisBranch::FromLower ? "FromLower" : "FromUpper";
}

/// @brief Lower/upper threshold pair.
template <typename N>
struct HysteresisThresholds {
    N lower{};
    N upper{};

    bool operator==(const HysteresisThresholds&) const = default;
};

/// @brief Full parameter set of a HysteresisSwitch.
template <typename N>
struct HysteresisConfig {
    LinearSegment<N> lowerSegment{};
    LinearSegment<N> upperSegment{};
    N lowerThreshold{};
    N upperThreshold{};
    HysteresisBranch initialBranch = HysteresisBranch::FromLower;

    bool operator==(const HysteresisConfig&) const = default;
};

// =============================================================================
// HysteresisSwitch
// =============================================================================

/// @brief Hysteresis nonlinearity with branch memory.
///
/// Never fails while processing: any input maps onto one of the two segments.
///
/// @tparam N float, double or an integer sample type
template <typename N>
class HysteresisSwitch {
public:
    static constexpr const char* kDisplayName = "Hysteresis";

    /// Default: identity segments, both thresholds at 0.
    HysteresisSwitch() noexcept = default;

    [[nodiscard]] static ConfigStatus validate(const HysteresisConfig<N>& config) noexcept {
        if constexpr (std::is_floating_point_v<N>) {
            if (const auto finite = detail::checkFinite(
                    kDisplayName, config.lowerSegment.slope, config.lowerSegment.intercept,
                    config.upperSegment.slope, config.upperSegment.intercept,
                    config.lowerThreshold, config.upperThreshold);
                !finite) {
                return finite;
            }
        }
        if (config.lowerThreshold > config.upperThreshold) {
            return ConfigStatus::failure(ConfigError::ThresholdsInverted, kDisplayName,
                                         static_cast<double>(config.lowerThreshold),
                                         static_cast<double>(config.upperThreshold));
        }
        return ConfigStatus::success(kDisplayName);
    }

    /// @brief Apply a configuration. The active branch is set to the
    /// configuration's initial branch.
    /// @return Status; on failure the element is left unchanged.
    [[nodiscard]] ConfigStatus configure(const HysteresisConfig<N>& config) noexcept {
        const ConfigStatus status = validate(config);
        if (!status) {
            logConfigRejection(status);
            return status;
        }
        config_ = config;
        branch_ = config.initialBranch;
        return status;
    }

    [[nodiscard]] ConfigStatus setThresholds(N lower, N upper) noexcept {
        HysteresisConfig<N> c = config_;
        c.lowerThreshold = lower;
        c.upperThreshold = upper;
        return configure(c);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    [[nodiscard]] N process(N input) noexcept {
        if (input < config_.lowerThreshold) {
            branch_ = HysteresisBranch::FromLower;
            return config_.lowerSegment(input);
        }
        if (input > config_.upperThreshold) {
            branch_ = HysteresisBranch::FromUpper;
            return config_.upperSegment(input);
        }
        return branch_ == HysteresisBranch::FromLower ? config_.lowerSegment(input)
                                                      : config_.upperSegment(input);
    }

    void processBlock(N* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) {
            return;
        }
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Restore the configured initial branch.
    void reset() noexcept {
        branch_ = config_.initialBranch;
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] HysteresisBranch activeBranch() const noexcept {
        return branch_;
    }

    [[nodiscard]] HysteresisThresholds<N> thresholds() const noexcept {
        return {config_.lowerThreshold, config_.upperThreshold};
    }

    [[nodiscard]] const HysteresisConfig<N>& config() const noexcept {
        return config_;
    }

    [[nodiscard]] std::string describe() const {
        char buf[192];
        std::snprintf(buf, sizeof(buf),
                      "Hysteresis(lower: %g*x%+g below %g, upper: %g*x%+g above %g, branch: %s)",
                      static_cast<double>(config_.lowerSegment.slope),
                      static_cast<double>(config_.lowerSegment.intercept),
                      static_cast<double>(config_.lowerThreshold),
                      static_cast<double>(config_.upperSegment.slope),
                      static_cast<double>(config_.upperSegment.intercept),
                      static_cast<double>(config_.upperThreshold),
                      branchName(branch_));
        return buf;
    }

    bool operator==(const HysteresisSwitch&) const = default;

private:
    HysteresisConfig<N> config_{};
    HysteresisBranch branch_ = HysteresisBranch::FromLower;
};

// =============================================================================
// HysteresisBuilder
// =============================================================================

/// @brief Derives a consistent threshold pair for a HysteresisSwitch.
///
/// Resolution in build():
/// - both thresholds explicit: used as given
/// - one explicit: the other lies one spread away from it
/// - none explicit: midpoint -/+ spread/2
///
/// Derivations that divide by the slope difference (spreadY, cross, lowerY,
/// upperY) are undefined for parallel segments; the builder remembers that
/// and build() reports UndefinedSlopeDifference.
///
/// @par Usage
/// @code
/// HysteresisSwitch<double> h;
/// auto status = HysteresisBuilder<double>({0.5, 0.0}, {1.0, 1.0})
///                   .cross()
///                   .spreadY(1.0)
///                   .upperDirection()
///                   .build(h);
/// @endcode
template <typename N>
class HysteresisBuilder {
public:
    HysteresisBuilder(LinearSegment<N> lowerSegment, LinearSegment<N> upperSegment) noexcept
        : lowerSegment_(lowerSegment)
        , upperSegment_(upperSegment) {
    }

    /// Explicit lower threshold.
    HysteresisBuilder& lowerX(N x) noexcept {
        lower_ = x;
        return *this;
    }

    /// Explicit upper threshold.
    HysteresisBuilder& upperX(N x) noexcept {
        upper_ = x;
        return *this;
    }

    /// Band width in input units.
    HysteresisBuilder& spreadX(N spread) noexcept {
        spread_ = spread;
        return *this;
    }

    /// Band width in output units: spread / (m_upper - m_lower).
    HysteresisBuilder& spreadY(N spread) noexcept {
        if (isDefined()) {
            spread_ = spread / slopeDifference();
        }
        return *this;
    }

    /// Midpoint at the input where the two segments intersect.
    HysteresisBuilder& cross() noexcept {
        if (isDefined()) {
            midpoint_ = lowerSegment_.intersectX(upperSegment_);
        }
        return *this;
    }

    /// Lower threshold where lowerSegment(x) + deltaY == upperSegment(x).
    HysteresisBuilder& lowerY(N deltaY) noexcept {
        if (isDefined()) {
            lower_ = offsetCrossing(deltaY);
        }
        return *this;
    }

    /// Upper threshold where lowerSegment(x) + deltaY == upperSegment(x).
    HysteresisBuilder& upperY(N deltaY) noexcept {
        if (isDefined()) {
            upper_ = offsetCrossing(deltaY);
        }
        return *this;
    }

    /// Start on the upper branch instead of the lower one.
    HysteresisBuilder& upperDirection() noexcept {
        initialBranch_ = HysteresisBranch::FromUpper;
        return *this;
    }

    /// Resolved threshold pair.
    [[nodiscard]] HysteresisThresholds<N> thresholds() const noexcept {
        const N two = N{2};
        HysteresisThresholds<N> t;
        if (lower_) {
            t.lower = *lower_;
        } else if (upper_) {
            t.lower = *upper_ - spread_;
        } else {
            t.lower = midpoint_ - spread_ / two;
        }
        if (upper_) {
            t.upper = *upper_;
        } else if (lower_) {
            t.upper = *lower_ + spread_;
        } else {
            t.upper = midpoint_ + spread_ / two;
        }
        return t;
    }

    [[nodiscard]] HysteresisConfig<N> config() const noexcept {
        const HysteresisThresholds<N> t = thresholds();
        return HysteresisConfig<N>{lowerSegment_, upperSegment_, t.lower, t.upper, initialBranch_};
    }

    /// Status build() would return, without a target.
    [[nodiscard]] ConfigStatus status() const noexcept {
        if (undefinedDerivation_) {
            return ConfigStatus::failure(ConfigError::UndefinedSlopeDifference,
                                         HysteresisSwitch<N>::kDisplayName,
                                         static_cast<double>(upperSegment_.slope),
                                         static_cast<double>(lowerSegment_.slope));
        }
        return HysteresisSwitch<N>::validate(config());
    }

    /// @brief Validate and configure target.
    /// @return Status; target is untouched on failure.
    [[nodiscard]] ConfigStatus build(HysteresisSwitch<N>& target) const noexcept {
        const ConfigStatus s = status();
        if (!s) {
            logConfigRejection(s);
            return s;
        }
        return target.configure(config());
    }

private:
    [[nodiscard]] N slopeDifference() const noexcept {
        return upperSegment_.slope - lowerSegment_.slope;
    }

    // Records the failure for parallel segments.
    [[nodiscard]] bool isDefined() noexcept {
        if (lowerSegment_.isParallelTo(upperSegment_)) {
            undefinedDerivation_ = true;
            return false;
        }
        return true;
    }

    [[nodiscard]] N offsetCrossing(N deltaY) const noexcept {
        return (lowerSegment_.intercept - upperSegment_.intercept + deltaY) / slopeDifference();
    }

    LinearSegment<N> lowerSegment_;
    LinearSegment<N> upperSegment_;
    std::optional<N> lower_;
    std::optional<N> upper_;
    N midpoint_{};
    N spread_{};
    HysteresisBranch initialBranch_ = HysteresisBranch::FromLower;
    bool undefinedDerivation_ = false;
};

} // namespace Sim
} // namespace Plantsim
