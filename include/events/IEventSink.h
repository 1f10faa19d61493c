// include/events/IEventSink.h
#pragma once

#include "shared/TankControlTypes.h"

/**
 * @brief Consumer of controller output (MQTT broadcast, FRAM log, tests)
 *
 * publishState() is called once per completed cycle, changed or not.
 * publishEvent() is called for discrete occurrences. Implementations must
 * not block the control loop for long; drop rather than wait.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void publishState(const SystemState& state) = 0;

    virtual void publishEvent(ControlEventKind kind, const char* description) = 0;
};
