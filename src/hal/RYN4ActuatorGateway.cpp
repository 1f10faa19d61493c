// src/hal/RYN4ActuatorGateway.cpp

#include "hal/RYN4ActuatorGateway.h"
#include <RYN4.h>
#include "config/RelayIndices.h"
#include "LoggingMacros.h"

namespace HAL {

RYN4ActuatorGateway::RYN4ActuatorGateway(RYN4* device)
    : device_(device) {}

Result<void> RYN4ActuatorGateway::setActuator(Actuator actuator, bool on) {
    if (!device_ || !device_->isInitialized()) {
        return Result<void>(SystemError::DEVICE_NOT_INITIALIZED, "RYN4 not initialized");
    }

    const uint8_t index = (actuator == Actuator::HEATING) ? RelayIndex::HEATING : RelayIndex::PUMP;
    // RYN4 uses 1-based relay indexing
    const uint8_t relay = RelayIndex::toPhysical(index);

    // DELAY-safe methods (cancel any active DELAY timers)
    ryn4::RelayErrorCode result = on ? device_->turnOnRelay(relay)
                                     : device_->turnOffRelay(relay);

    if (result != ryn4::RelayErrorCode::SUCCESS) {
        LOG_ERROR(TAG, "Failed to set relay %u (%s) to %s - code %d",
                  relay, actuatorToString(actuator), on ? "ON" : "OFF",
                  static_cast<int>(result));
        return Result<void>(SystemError::RELAY_OPERATION_FAILED, actuatorToString(actuator));
    }

    LOG_DEBUG(TAG, "Relay %u (%s) -> %s", relay, actuatorToString(actuator), on ? "ON" : "OFF");
    return Result<void>();
}

} // namespace HAL
