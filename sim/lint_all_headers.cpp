// ==============================================================================
// Plantsim Lint Stub - Analysis of all public headers
// ==============================================================================
// Gives clang-tidy and the compiler a .cpp translation unit that includes
// every public simulation header, so each header is checked to be
// self-contained.
//
// This file is NOT part of the plantsim_sim library itself; it is compiled as
// a separate OBJECT library target (plantsim_lint_stub).
// ==============================================================================

// Layer 0: Core
#include <plantsim/sim/core/config_status.h>
#include <plantsim/sim/core/linear_segment.h>
#include <plantsim/sim/core/sample_traits.h>
#include <plantsim/sim/core/sim_log.h>

// Layer 1: Primitives
#include <plantsim/sim/primitives/delay_buffer.h>
#include <plantsim/sim/primitives/first_order_lag.h>
#include <plantsim/sim/primitives/hysteresis_switch.h>
#include <plantsim/sim/primitives/second_order_lag.h>

// Layer 3: Systems
#include <plantsim/sim/systems/element_handle.h>
#include <plantsim/sim/systems/plant_chain.h>

#include <cstdint>

// Instantiate every element for each supported sample type
template class Plantsim::Sim::PlantChain<float>;
template class Plantsim::Sim::PlantChain<double>;
template class Plantsim::Sim::PlantChain<std::int32_t>;
template class Plantsim::Sim::ElementHandle<float>;
template class Plantsim::Sim::ElementHandle<double>;
template class Plantsim::Sim::ElementHandle<std::int32_t>;
template class Plantsim::Sim::HysteresisBuilder<double>;
