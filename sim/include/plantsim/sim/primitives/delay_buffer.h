// ==============================================================================
// Layer 1: Plant Primitive - DelayBuffer (PT0)
// ==============================================================================
// Zero-order lag element: pure transport delay with gain.
//
//   out[k] = P * in[k - d],   d = floor(T0 / Ts)
//
// where Ts is the sample interval, T0 the delay time and P the gain. The
// first d outputs are zero while the delay line fills.
//
// The history is a ring of exactly d scaled products. Memory is allocated
// only in configure(); process() is O(1) and allocation-free.
//
// Dependencies:
//   - Layer 0: sample_traits.h, config_status.h, sim_log.h
//   - stdlib: <algorithm>, <cmath>, <cstddef>, <cstdio>, <string>, <utility>, <vector>
// ==============================================================================

#pragma once

#include <plantsim/sim/core/config_status.h>
#include <plantsim/sim/core/sample_traits.h>
#include <plantsim/sim/core/sim_log.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace Plantsim {
namespace Sim {

// =============================================================================
// Constants
// =============================================================================

/// Default maximum delay length in samples
inline constexpr size_t kDefaultMaxDelaySamples = 4096;

/// Absolute upper bound for any configured capacity (1M samples)
inline constexpr size_t kMaxDelayBufferCapacity = size_t{1} << 20;

/// Relative tolerance applied before flooring T0/Ts, so that 0.3/0.1 yields 3
inline constexpr double kDelayRatioTolerance = 1e-9;

// =============================================================================
// DelayBufferConfig
// =============================================================================

/// @brief Parameters of a DelayBuffer. The defaults form a unity pass-through.
struct DelayBufferConfig {
    double sampleInterval = 1.0;                 ///< Ts, must be > 0
    double delayTime = 0.0;                      ///< T0, must be >= 0
    double gain = 1.0;                           ///< P, must be > 0
    size_t maxDelaySamples = kDefaultMaxDelaySamples; ///< Capacity of the delay line

    bool operator==(const DelayBufferConfig&) const = default;
};

/// @brief Delay length in whole samples for a delay time and sample interval.
/// @pre sampleInterval > 0, delayTime >= 0
[[nodiscard]] inline double delayRatio(double delayTime, double sampleInterval) noexcept {
    const double ratio = delayTime / sampleInterval;
    return std::floor(ratio * (1.0 + kDelayRatioTolerance));
}

// =============================================================================
// DelayBuffer
// =============================================================================

/// @brief PT0 element: delays its input by a whole number of samples.
///
/// @tparam Sample float, double or std::int32_t (fixed point, gain scaled by 2^10)
///
/// @par Usage
/// @code
/// DelayBuffer<double> pt0;
/// auto status = pt0.configure({.sampleInterval = 1.0, .delayTime = 2.0});
/// if (!status) { /* report status, do not simulate */ }
///
/// pt0.process(100.0);   // 0
/// pt0.process(1000.0);  // 0
/// pt0.process(2000.0);  // 100
/// @endcode
template <typename Sample>
class DelayBuffer {
public:
    using Traits = SampleTraits<Sample>;
    using Coefficient = typename Traits::Coefficient;
    using Accumulator = typename Traits::Accumulator;

    static constexpr const char* kDisplayName = "PT0";

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Default: zero delay, unity gain.
    DelayBuffer() noexcept = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Check a configuration without applying it.
    [[nodiscard]] static ConfigStatus validate(const DelayBufferConfig& config) noexcept {
        if (const auto finite = detail::checkFinite(kDisplayName, config.sampleInterval,
                                                    config.delayTime, config.gain);
            !finite) {
            return finite;
        }
        if (config.sampleInterval <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveSampleInterval, kDisplayName,
                                         config.sampleInterval, 0.0);
        }
        if (config.delayTime < 0.0) {
            return ConfigStatus::failure(ConfigError::NegativeDelayTime, kDisplayName,
                                         config.delayTime, 0.0);
        }
        if (config.gain <= 0.0) {
            return ConfigStatus::failure(ConfigError::NonPositiveGain, kDisplayName,
                                         config.gain, 0.0);
        }
        if (const auto gain = detail::checkCoefficient<Traits>(kDisplayName, config.gain); !gain) {
            return gain;
        }
        if (config.maxDelaySamples > kMaxDelayBufferCapacity) {
            return ConfigStatus::failure(ConfigError::DelayExceedsCapacity, kDisplayName,
                                         static_cast<double>(config.maxDelaySamples),
                                         static_cast<double>(kMaxDelayBufferCapacity));
        }
        const double samples = delayRatio(config.delayTime, config.sampleInterval);
        if (samples > static_cast<double>(config.maxDelaySamples)) {
            return ConfigStatus::failure(ConfigError::DelayExceedsCapacity, kDisplayName,
                                         samples, static_cast<double>(config.maxDelaySamples));
        }
        return ConfigStatus::success(kDisplayName);
    }

    /// @brief Apply a configuration.
    ///
    /// On success the delay line is resized to the new length. Samples already
    /// in flight are kept, newest first: shrinking drops the oldest entries,
    /// growing prepends zeros.
    ///
    /// @return Status; on failure the element is left unchanged.
    [[nodiscard]] ConfigStatus configure(const DelayBufferConfig& config) noexcept {
        const ConfigStatus status = validate(config);
        if (!status) {
            logConfigRejection(status);
            return status;
        }

        const auto newLength = static_cast<size_t>(
            delayRatio(config.delayTime, config.sampleInterval));
        resizeHistory(newLength);

        config_ = config;
        gain_ = Traits::toCoefficient(config.gain);
        return status;
    }

    [[nodiscard]] ConfigStatus setSampleInterval(double sampleInterval) noexcept {
        DelayBufferConfig c = config_;
        c.sampleInterval = sampleInterval;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setDelayTime(double delayTime) noexcept {
        DelayBufferConfig c = config_;
        c.delayTime = delayTime;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setGain(double gain) noexcept {
        DelayBufferConfig c = config_;
        c.gain = gain;
        return configure(c);
    }

    [[nodiscard]] ConfigStatus setMaxDelaySamples(size_t maxDelaySamples) noexcept {
        DelayBufferConfig c = config_;
        c.maxDelaySamples = maxDelaySamples;
        return configure(c);
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Push one input sample and return the sample delayed by d steps.
    [[nodiscard]] Sample process(Sample input) noexcept {
        const Accumulator scaled = Traits::mul(gain_, input);
        if (history_.empty()) {
            return Traits::toSample(scaled);
        }

        const Accumulator delayed = history_[head_];
        history_[head_] = scaled;
        head_ = (head_ + 1 == history_.size()) ? 0 : head_ + 1;
        return Traits::toSample(delayed);
    }

    /// @brief Process a block in place; identical to numSamples process() calls.
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) {
            return;
        }
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// @brief Clear the delay line to zero without changing its length.
    void reset() noexcept {
        std::fill(history_.begin(), history_.end(), Accumulator{0});
        head_ = 0;
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// Current delay d in samples.
    [[nodiscard]] size_t delaySamples() const noexcept {
        return history_.size();
    }

    /// Maximum delay the current configuration accepts.
    [[nodiscard]] size_t capacity() const noexcept {
        return config_.maxDelaySamples;
    }

    [[nodiscard]] const DelayBufferConfig& config() const noexcept {
        return config_;
    }

    /// Gain as applied, after any fixed-point quantization.
    [[nodiscard]] double effectiveGain() const noexcept {
        return Traits::fromCoefficient(gain_);
    }

    /// Scaled product waiting at logical position i (0 = oldest).
    [[nodiscard]] Accumulator pending(size_t i) const noexcept {
        if (i >= history_.size()) {
            return Accumulator{0};
        }
        return history_[(head_ + i) % history_.size()];
    }

    [[nodiscard]] std::string describe() const {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "PT0(sample_interval: %g, delay_time: %g, gain: %g, delay_samples: %zu)",
                      config_.sampleInterval, config_.delayTime, config_.gain,
                      history_.size());
        return buf;
    }

    /// Equal when configured identically and holding the same pending samples
    /// in the same order.
    [[nodiscard]] bool operator==(const DelayBuffer& other) const noexcept {
        if (!(config_ == other.config_) || history_.size() != other.history_.size()) {
            return false;
        }
        for (size_t i = 0; i < history_.size(); ++i) {
            if (pending(i) != other.pending(i)) {
                return false;
            }
        }
        return true;
    }

private:
    void resizeHistory(size_t newLength) {
        if (newLength == history_.size()) {
            return;
        }
        std::vector<Accumulator> reordered(newLength, Accumulator{0});
        const size_t keep = std::min(newLength, history_.size());
        const size_t skip = history_.size() - keep;
        for (size_t i = 0; i < keep; ++i) {
            reordered[newLength - keep + i] = pending(skip + i);
        }
        history_ = std::move(reordered);
        head_ = 0;
    }

    DelayBufferConfig config_{};
    Coefficient gain_ = Traits::toCoefficient(1.0);
    std::vector<Accumulator> history_;   ///< Ring of d scaled products
    size_t head_ = 0;                    ///< Oldest entry, next to be emitted
};

} // namespace Sim
} // namespace Plantsim
