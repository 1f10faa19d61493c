// src/modules/storage/FramEventSink.cpp
#include "FramEventSink.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"

namespace {

// Event type enumerator type as declared by RuntimeStorage
using FramEventType = decltype(rtstorage::EVENT_ERROR);

FramEventType eventTypeFor(ControlEventKind kind) {
    switch (kind) {
        case ControlEventKind::SENSOR_FAILURE:
        case ControlEventKind::SAFETY_TRIP:
        case ControlEventKind::ACTUATOR_FAILURE:
            return rtstorage::EVENT_ERROR;
        case ControlEventKind::MODE_CHANGE:
        case ControlEventKind::CONTROL_ACTION:
            return rtstorage::EVENT_STATE_CHANGE;
        case ControlEventKind::SYSTEM:
        default:
            return rtstorage::EVENT_SYSTEM;
    }
}

} // namespace

FramEventSink::FramEventSink(rtstorage::RuntimeStorage* storage)
    : storage_(storage) {}

void FramEventSink::publishState(const SystemState& state) {
    if (!storage_) {
        return;
    }

    // Count confirmed relay transitions, not commanded targets
    if (state.heatingRelayOn && !lastHeating_) {
        countStart(rtstorage::COUNTER_BURNER_STARTS, "Heater");
        heatingStartMs_ = state.timestampMs;
    } else if (!state.heatingRelayOn && lastHeating_) {
        addHeatingRuntime(state.timestampMs);
    }

    if (state.pumpRelayOn && !lastPump_) {
        countStart(rtstorage::COUNTER_HEATING_PUMP_STARTS, "Pump");
    }

    lastHeating_ = state.heatingRelayOn;
    lastPump_ = state.pumpRelayOn;
}

void FramEventSink::publishEvent(ControlEventKind kind, const char* description) {
    if (!storage_) {
        return;
    }

    // Encode kind in the data field, the text stays in the MQTT stream
    uint16_t data = static_cast<uint16_t>(kind);
    if (!storage_->logEvent(eventTypeFor(kind), data)) {
        LOG_WARN(TAG, "FRAM event log write failed (%s: %s)",
                 eventKindToString(kind), description ? description : "");
    }
}

void FramEventSink::countStart(rtstorage::CounterType counterId, const char* what) {
    if (storage_->incrementCounter(counterId)) {
        uint32_t count = storage_->getCounter(counterId);
        LOG_INFO(TAG, "%s start count: %lu", what, static_cast<unsigned long>(count));
    } else {
        LOG_WARN(TAG, "%s start counter update failed", what);
    }
}

void FramEventSink::addHeatingRuntime(uint32_t nowMs) {
    // Use elapsed-time helper (handles millis() wraparound)
    uint32_t runTimeMs = Utils::elapsedMs(heatingStartMs_, nowMs);
    float runTimeHours = runTimeMs / 3600000.0f;

    // ACCUMULATE, don't overwrite
    float heatingHours = storage_->getRuntimeHours(rtstorage::RUNTIME_HEATING) + runTimeHours;
    if (storage_->updateRuntimeHours(rtstorage::RUNTIME_HEATING, heatingHours)) {
        uint32_t totalSeconds = runTimeMs / 1000;
        LOG_INFO(TAG, "Heating run: %lu:%02lu:%02lu (Total: %d.%d hours)",
                 static_cast<unsigned long>(totalSeconds / 3600),
                 static_cast<unsigned long>((totalSeconds % 3600) / 60),
                 static_cast<unsigned long>(totalSeconds % 60),
                 (int)heatingHours, (int)(heatingHours * 10) % 10);
    } else {
        LOG_WARN(TAG, "Heating runtime update failed");
    }
}
