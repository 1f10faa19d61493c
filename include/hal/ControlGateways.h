// include/hal/ControlGateways.h
#pragma once

#include <cstdint>
#include "utils/ErrorHandler.h"

/**
 * @brief Hardware contracts of the tank control loop
 *
 * The control core talks to sensors and relays only through these
 * interfaces. The firmware wires in the Modbus adapters, the native
 * tests wire in scripted mocks.
 */

namespace HAL {

/**
 * @brief Tank temperature source
 */
class ITankSensorGateway {
public:
    struct Reading {
        float temperature;    // Temperature in Celsius
        bool valid;           // False if the tank probe timed out or returned nothing
        uint32_t timestamp;   // Timestamp in milliseconds
    };

    virtual ~ITankSensorGateway() = default;

    /**
     * @brief Read one tank probe
     * @param tankId Tank number (1-based)
     * @param timeoutMs Maximum time this call may block
     * @return Reading, valid == false if unavailable
     */
    virtual Reading readTank(uint8_t tankId, uint32_t timeoutMs) = 0;

    /**
     * @brief Get sensor source name
     */
    virtual const char* getName() const = 0;
};

/**
 * @brief Relay outputs driven by the control loop
 */
class IActuatorGateway {
public:
    enum class Actuator : uint8_t {
        HEATING = 0,
        PUMP = 1
    };

    virtual ~IActuatorGateway() = default;

    /**
     * @brief Switch an actuator
     * @return RELAY_OPERATION_FAILED / DEVICE_NOT_INITIALIZED on failure
     */
    virtual Result<void> setActuator(Actuator actuator, bool on) = 0;

    /**
     * @brief Get relay module name
     */
    virtual const char* getName() const = 0;
};

inline const char* actuatorToString(IActuatorGateway::Actuator actuator) {
    return actuator == IActuatorGateway::Actuator::HEATING ? "heating" : "pump";
}

} // namespace HAL
