// Body State Provider - Interface to the physical simulation
//
// Purpose: The IMU synthesizer consumes snapshots of the simulated rigid
// body. Whatever integrates the body's dynamics (a physics engine, a scripted
// trajectory, the servo model in validation/) implements this interface.
//
// Contract:
//   - sample() reads the state at the current tick; stepping the physical
//     model is the simulation's business, not the consumer's
//   - sample() never blocks; false means no state is available this tick

#pragma once

#include "core/sensor_types.hpp"

namespace sensemu {

class BodyStateProvider {
public:
    virtual ~BodyStateProvider() = default;

    virtual bool sample(PhysicalBodyState& state) const = 0;
};

}  // namespace sensemu
