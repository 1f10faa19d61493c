// src/modules/mqtt/MQTTEventSink.cpp
#include "MQTTEventSink.h"
#include <Arduino.h>
#include "modules/mqtt/MQTTPayloads.h"
#include "modules/tasks/MQTTTask.h"
#include "MQTTTopics.h"
#include "LoggingMacros.h"

void MQTTEventSink::publishState(const SystemState& state) {
    if (!MQTTTask::isConnected()) {
        return;
    }

    char buffer[sizeof(MQTTPublishRequest::payload)];
    size_t written = MQTTPayloads::buildStateJson(state, buffer, sizeof(buffer));
    if (written == 0) {
        LOG_ERROR(TAG, "State JSON serialization failed or truncated");
        return;
    }

    if (!MQTTTask::publish(MQTT_STATUS_STATE, buffer, 0, true)) {
        LOG_DEBUG(TAG, "State publish not queued");
    }
}

void MQTTEventSink::publishEvent(ControlEventKind kind, const char* description) {
    if (!MQTTTask::isConnected()) {
        LOG_DEBUG(TAG, "Offline, event %s not broadcast", eventKindToString(kind));
        return;
    }

    char buffer[256];
    size_t written = MQTTPayloads::buildEventJson(kind, description, millis(), buffer, sizeof(buffer));
    if (written == 0) {
        LOG_ERROR(TAG, "Event JSON serialization failed or truncated");
        return;
    }

    // QoS 1: events are not repeated like the state heartbeat
    if (!MQTTTask::publish(MQTT_STATUS_EVENT, buffer, 1, false)) {
        LOG_WARN(TAG, "Event %s not queued", eventKindToString(kind));
    }
}
