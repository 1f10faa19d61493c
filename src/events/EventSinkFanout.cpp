// src/events/EventSinkFanout.cpp
#include "events/EventSinkFanout.h"
#include "LoggingMacros.h"

static const char* TAG = "EventFanout";

bool EventSinkFanout::addSink(IEventSink* sink) {
    if (sink == nullptr) {
        return false;
    }
    if (sinkCount_ >= MAX_SINKS) {
        LOG_ERROR(TAG, "Sink table full (%u)", MAX_SINKS);
        return false;
    }
    sinks_[sinkCount_++] = sink;
    return true;
}

void EventSinkFanout::publishState(const SystemState& state) {
    for (uint8_t i = 0; i < sinkCount_; i++) {
        sinks_[i]->publishState(state);
    }
}

void EventSinkFanout::publishEvent(ControlEventKind kind, const char* description) {
    for (uint8_t i = 0; i < sinkCount_; i++) {
        sinks_[i]->publishEvent(kind, description);
    }
}
