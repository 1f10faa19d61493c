// src/hal/RYN4ActuatorGateway.h
// Heating contactor and pump on the RYN4 relay module

#pragma once

#include "hal/ControlGateways.h"

class RYN4;

namespace HAL {

/**
 * @brief Actuator gateway backed by an RYN4 relay module
 *
 * HEATING and PUMP are mapped to physical relays through RelayIndex.
 * Every call writes the relay, the control core decides when a write is
 * needed.
 */
class RYN4ActuatorGateway : public IActuatorGateway {
public:
    explicit RYN4ActuatorGateway(RYN4* device);

    Result<void> setActuator(Actuator actuator, bool on) override;

    const char* getName() const override { return "RYN4"; }

private:
    RYN4* device_;

    static constexpr const char* TAG = "RYN4Gw";
};

} // namespace HAL
