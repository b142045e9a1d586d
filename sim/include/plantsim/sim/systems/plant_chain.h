// ==============================================================================
// Layer 3: System Component - PlantChain
// ==============================================================================
// Heterogeneous series connection of plant elements, e.g. an actuator
// modelled as dead time -> first-order lag -> backlash:
//
//   in -> [PT0] -> [PT1] -> [Hysteresis] -> out
//
// The chain owns its elements through ElementHandle and keeps full value
// semantics: copying a chain copies every element's state, two chains are
// equal when they hold equal elements in the same order.
//
// Dependencies:
//   - Layer 3: element_handle.h
//   - stdlib: <cstddef>, <string>, <utility>, <vector>
// ==============================================================================

#pragma once

#include <plantsim/sim/systems/element_handle.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace Plantsim {
namespace Sim {

/// @brief Ordered series of plant elements sharing one sample type.
///
/// An empty chain is the identity.
///
/// @par Usage
/// @code
/// PlantChain<double> actuator;
/// actuator.append(deadTime);   // DelayBuffer<double>
/// actuator.append(motor);      // FirstOrderLag<double>
/// for (double t = 0.0; t < 10.0; t += 0.01) {
///     position = actuator.process(command);
/// }
/// @endcode
template <typename Sample>
class PlantChain {
public:
    using Handle = ElementHandle<Sample>;

    PlantChain() = default;

    // =========================================================================
    // Composition (allocates; not for the processing loop)
    // =========================================================================

    /// Append an element at the output end of the chain.
    void append(Handle element) {
        elements_.push_back(std::move(element));
    }

    void clear() noexcept {
        elements_.clear();
    }

    [[nodiscard]] size_t size() const noexcept {
        return elements_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return elements_.empty();
    }

    /// Element at position index (0 = input end).
    /// @pre index < size()
    [[nodiscard]] Handle& at(size_t index) noexcept {
        return elements_[index];
    }

    [[nodiscard]] const Handle& at(size_t index) const noexcept {
        return elements_[index];
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Feed one sample through every element in order.
    [[nodiscard]] Sample process(Sample input) noexcept {
        Sample signal = input;
        for (auto& element : elements_) {
            signal = element.process(signal);
        }
        return signal;
    }

    /// In-place block processing, identical to numSamples process() calls.
    void processBlock(Sample* buffer, size_t numSamples) noexcept {
        if (buffer == nullptr) {
            return;
        }
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Return every element to rest.
    void reset() noexcept {
        for (auto& element : elements_) {
            element.reset();
        }
    }

    // =========================================================================
    // Value Semantics
    // =========================================================================

    /// Independent copy of the whole chain, for fanning out a simulation.
    [[nodiscard]] PlantChain clone() const {
        return *this;
    }

    bool operator==(const PlantChain&) const = default;

    /// Element names joined in signal order, e.g. "PT0 -> PT1 -> Hysteresis".
    [[nodiscard]] std::string describe() const {
        std::string text;
        for (size_t i = 0; i < elements_.size(); ++i) {
            if (i > 0) {
                text += " -> ";
            }
            text += elements_[i].displayName();
        }
        return text;
    }

private:
    std::vector<Handle> elements_;
};

} // namespace Sim
} // namespace Plantsim
