// src/modules/mqtt/MQTTEventSink.h
#pragma once

#include "events/IEventSink.h"

/**
 * @brief Broadcasts controller state and events over MQTT
 *
 * State goes to tankctl/status/state every cycle, events to
 * tankctl/status/event. Both are queued through MQTTTask::publish(), so
 * the control loop never waits for the broker. While disconnected the
 * messages are dropped, the next cycle's state supersedes them.
 */
class MQTTEventSink : public IEventSink {
public:
    void publishState(const SystemState& state) override;

    void publishEvent(ControlEventKind kind, const char* description) override;

private:
    static constexpr const char* TAG = "MQTTSink";
};
