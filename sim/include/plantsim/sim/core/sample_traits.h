// ==============================================================================
// Layer 0: Core Utility - Sample Traits
// ==============================================================================
// Numeric policy shared by every plant element. One difference equation is
// written once per element and instantiated for two representations:
//
//   float / double  : plain floating-point arithmetic
//   std::int32_t    : embedded-style fixed point, parameters pre-scaled by
//                     2^kFixedPointShiftBits, state held in 64-bit accumulators
//
// Scale bookkeeping for the fixed-point path:
//
//   toCoefficient(p)   p * 2^10                    (scale 1)
//   mul(c, x)          c * x                       (scale 1, x is raw)
//   mulScaled(c, a)    (c * a) >> 10               (scale 2 -> scale 1)
//   toSample(a)        a >> 10, saturated to int32 (scale 1 -> raw)
//
// Every product of two scaled quantities goes through mulScaled() so that it
// is shifted down exactly once. Both shifts floor, so a recursion that
// approaches its target from below stops short of it by less than one
// increment (a PT1 driven with 1000 settles at 999), while one approaching
// from above reaches it exactly.
//
// Dependencies:
//   - stdlib: <cstdint>, <limits>, <type_traits>
// ==============================================================================

#pragma once

#include <cstdint>
#include <limits>
#include <type_traits>

namespace Plantsim {
namespace Sim {

// =============================================================================
// Fixed-Point Constants
// =============================================================================

/// Number of fractional bits used by the fixed-point representation
inline constexpr int kFixedPointShiftBits = 10;

/// Fixed-point scale factor (1.0 == 1024)
inline constexpr std::int32_t kFixedPointScale = std::int32_t{1} << kFixedPointShiftBits;

// =============================================================================
// SampleTraits
// =============================================================================

/// @brief Arithmetic policy for floating-point samples.
///
/// Coefficients and accumulators are the sample type itself; all scaling
/// operations are identities.
///
/// @tparam Sample float or double
template <typename Sample>
struct SampleTraits {
    static_assert(std::is_floating_point_v<Sample>,
                  "SampleTraits: use float, double or std::int32_t samples");

    using Coefficient = Sample;
    using Accumulator = Sample;

    static constexpr bool kIsFixedPoint = false;

    /// Smallest and largest positive parameter a coefficient resolves
    static constexpr double kMinCoefficient = static_cast<double>(std::numeric_limits<Sample>::min());
    static constexpr double kMaxCoefficient = static_cast<double>(std::numeric_limits<Sample>::max());

    [[nodiscard]] static constexpr Coefficient toCoefficient(double value) noexcept {
        return static_cast<Sample>(value);
    }

    [[nodiscard]] static constexpr double fromCoefficient(Coefficient c) noexcept {
        return static_cast<double>(c);
    }

    [[nodiscard]] static constexpr Accumulator mul(Coefficient c, Sample x) noexcept {
        return c * x;
    }

    [[nodiscard]] static constexpr Accumulator mulScaled(Coefficient c, Accumulator a) noexcept {
        return c * a;
    }

    [[nodiscard]] static constexpr Sample toSample(Accumulator a) noexcept {
        return a;
    }
};

/// @brief Arithmetic policy for 32-bit fixed-point samples.
///
/// Parameters are stored as 32-bit values scaled by kFixedPointScale. State
/// and intermediate products use 64-bit accumulators holding values at a
/// single scale factor. Right shifts are arithmetic (C++20), so negative
/// values round toward negative infinity: -2048 >> 10 == -2.
template <>
struct SampleTraits<std::int32_t> {
    using Coefficient = std::int32_t;
    using Accumulator = std::int64_t;

    static constexpr bool kIsFixedPoint = true;

    /// Smallest and largest positive parameter a coefficient resolves (1/1024 .. ~2^21)
    static constexpr double kMinCoefficient = 1.0 / static_cast<double>(kFixedPointScale);
    static constexpr double kMaxCoefficient =
        static_cast<double>(std::numeric_limits<Coefficient>::max()) / static_cast<double>(kFixedPointScale);

    /// Scale a real-valued parameter, truncating toward zero and saturating
    /// at the 32-bit range.
    [[nodiscard]] static constexpr Coefficient toCoefficient(double value) noexcept {
        const double scaled = value * static_cast<double>(kFixedPointScale);
        if (scaled >= static_cast<double>(std::numeric_limits<Coefficient>::max())) {
            return std::numeric_limits<Coefficient>::max();
        }
        if (scaled <= static_cast<double>(std::numeric_limits<Coefficient>::min())) {
            return std::numeric_limits<Coefficient>::min();
        }
        return static_cast<Coefficient>(scaled);
    }

    [[nodiscard]] static constexpr double fromCoefficient(Coefficient c) noexcept {
        return static_cast<double>(c) / static_cast<double>(kFixedPointScale);
    }

    [[nodiscard]] static constexpr Accumulator mul(Coefficient c, std::int32_t x) noexcept {
        return static_cast<Accumulator>(c) * static_cast<Accumulator>(x);
    }

    [[nodiscard]] static constexpr Accumulator mulScaled(Coefficient c, Accumulator a) noexcept {
        return (static_cast<Accumulator>(c) * a) >> kFixedPointShiftBits;
    }

    /// Remove the scale factor, saturating at the int32 range.
    [[nodiscard]] static constexpr std::int32_t toSample(Accumulator a) noexcept {
        const Accumulator raw = a >> kFixedPointShiftBits;
        if (raw > std::numeric_limits<std::int32_t>::max()) {
            return std::numeric_limits<std::int32_t>::max();
        }
        if (raw < std::numeric_limits<std::int32_t>::min()) {
            return std::numeric_limits<std::int32_t>::min();
        }
        return static_cast<std::int32_t>(raw);
    }
};

} // namespace Sim
} // namespace Plantsim
