// ==============================================================================
// Layer 0: Core Utility - Linear Segment
// ==============================================================================
// Affine map y = m*x + n. Building block of the hysteresis branches.
//
// Dependencies:
//   - stdlib: none
// ==============================================================================

#pragma once

namespace Plantsim {
namespace Sim {

/// @brief Stateless affine map y = slope * x + intercept.
///
/// @tparam N Numeric type (float, double or an integer type)
///
/// @par Usage
/// @code
/// constexpr LinearSegment<double> seg{0.5, 1.0};
/// static_assert(seg(2.0) == 2.0);
/// @endcode
template <typename N>
struct LinearSegment {
    N slope{1};
    N intercept{0};

    /// Evaluate the segment at x.
    [[nodiscard]] constexpr N operator()(N x) const noexcept {
        return slope * x + intercept;
    }

    /// Input value at which this segment and other meet:
    /// m_a*x + n_a = m_b*x + n_b  ->  x = (n_a - n_b) / (m_b - m_a).
    /// @pre slope != other.slope
    [[nodiscard]] constexpr N intersectX(const LinearSegment& other) const noexcept {
        return (intercept - other.intercept) / (other.slope - slope);
    }

    [[nodiscard]] constexpr bool isParallelTo(const LinearSegment& other) const noexcept {
        return slope == other.slope;
    }

    constexpr bool operator==(const LinearSegment&) const = default;
};

} // namespace Sim
} // namespace Plantsim
