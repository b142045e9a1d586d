// ==============================================================================
// Layer 3: System Component - ElementHandle
// ==============================================================================
// Value-semantic handle over any plant element. The catalogue of element
// kinds is closed (PT0, PT1, PT2, Hysteresis), so the handle is a sum type:
//
//   - process()   dispatches to the held element's update rule
//   - clone()     is a copy; the copy owns its own state
//   - operator==  compares the kind first, then parameters and state
//   - displayName() / describe() identify the kind and dump its parameters
//
// Typed access goes through holds<T>() / getIf<T>(), which return false /
// nullptr for the wrong kind. There is no unchecked cast.
//
// Dependencies:
//   - Layer 1: delay_buffer.h, first_order_lag.h, second_order_lag.h,
//              hysteresis_switch.h
//   - stdlib: <cstddef>, <cstdint>, <string>, <type_traits>, <utility>, <variant>
// ==============================================================================

#pragma once

#include <plantsim/sim/primitives/delay_buffer.h>
#include <plantsim/sim/primitives/first_order_lag.h>
#include <plantsim/sim/primitives/hysteresis_switch.h>
#include <plantsim/sim/primitives/second_order_lag.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace Plantsim {
namespace Sim {

/// @brief Element kinds an ElementHandle can hold, in variant order.
enum class ElementKind : std::uint8_t {
    DelayBuffer = 0,    ///< PT0
    FirstOrderLag,      ///< PT1
    SecondOrderLag,     ///< PT2
    Hysteresis
};

[[nodiscard]] constexpr const char* kindName(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::DelayBuffer:    return DelayBuffer<double>::kDisplayName;
        case ElementKind::FirstOrderLag:  return FirstOrderLag<double>::kDisplayName;
        case ElementKind::SecondOrderLag: return SecondOrderLag<double>::kDisplayName;
        case ElementKind::Hysteresis:     return HysteresisSwitch<double>::kDisplayName;
    }
    return "Unknown";
}

/// @brief Owning, copyable, comparable handle over one plant element.
///
/// @tparam Sample float, double or std::int32_t; all held elements share it.
///
/// @par Usage
/// @code
/// ElementHandle<double> a{FirstOrderLag<double>{}};
/// ElementHandle<double> b = a.clone();
/// (void)b.process(1.0);          // a is unaffected
/// assert(a != b);                // same kind, different state
/// assert(a.displayName() == std::string{"PT1"});
/// @endcode
template <typename Sample>
class ElementHandle {
public:
    using Element = std::variant<DelayBuffer<Sample>,
                                 FirstOrderLag<Sample>,
                                 SecondOrderLag<Sample>,
                                 HysteresisSwitch<Sample>>;

    /// Holds a default FirstOrderLag (unity pass-through).
    ElementHandle() noexcept
        : element_(std::in_place_type<FirstOrderLag<Sample>>) {
    }

    ElementHandle(DelayBuffer<Sample> element) noexcept
        : element_(std::move(element)) {
    }

    ElementHandle(FirstOrderLag<Sample> element) noexcept
        : element_(std::move(element)) {
    }

    ElementHandle(SecondOrderLag<Sample> element) noexcept
        : element_(std::move(element)) {
    }

    ElementHandle(HysteresisSwitch<Sample> element) noexcept
        : element_(std::move(element)) {
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Advance the held element by one sample.
    [[nodiscard]] Sample process(Sample input) noexcept {
        return std::visit([input](auto& e) noexcept { return e.process(input); }, element_);
    }

    /// In-place block processing, identical to numSamples process() calls.
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        std::visit([buffer, numSamples](auto& e) noexcept { e.processBlock(buffer, numSamples); },
                   element_);
    }

    /// Clear the held element's dynamic state, keeping its configuration.
    void reset() noexcept {
        std::visit([](auto& e) noexcept { e.reset(); }, element_);
    }

    // =========================================================================
    // Value Semantics
    // =========================================================================

    /// Independent deep copy.
    [[nodiscard]] ElementHandle clone() const {
        return *this;
    }

    /// Same kind and equal parameters and state.
    [[nodiscard]] bool equals(const ElementHandle& other) const noexcept {
        return element_ == other.element_;
    }

    [[nodiscard]] bool operator==(const ElementHandle& other) const noexcept {
        return equals(other);
    }

    // =========================================================================
    // Identification
    // =========================================================================

    [[nodiscard]] ElementKind kind() const noexcept {
        return static_cast<ElementKind>(element_.index());
    }

    /// Short stable identifier of the held kind ("PT0", "PT1", "PT2", "Hysteresis").
    [[nodiscard]] const char* displayName() const noexcept {
        return std::visit([](const auto& e) noexcept {
            return std::decay_t<decltype(e)>::kDisplayName;
        }, element_);
    }

    /// Human-readable parameter dump of the held element.
    [[nodiscard]] std::string describe() const {
        return std::visit([](const auto& e) { return e.describe(); }, element_);
    }

    // =========================================================================
    // Typed Access
    // =========================================================================

    template <typename T>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<T>(element_);
    }

    /// Pointer to the held element if it is a T, nullptr otherwise.
    template <typename T>
    [[nodiscard]] T* getIf() noexcept {
        return std::get_if<T>(&element_);
    }

    template <typename T>
    [[nodiscard]] const T* getIf() const noexcept {
        return std::get_if<T>(&element_);
    }

private:
    Element element_;
};

} // namespace Sim
} // namespace Plantsim
