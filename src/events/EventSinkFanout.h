// src/events/EventSinkFanout.h
#pragma once

#include <cstdint>
#include "events/IEventSink.h"

/**
 * @brief Forwards every state and event to a fixed set of sinks
 *
 * Sinks are registered once at boot and must outlive the fanout.
 */
class EventSinkFanout : public IEventSink {
public:
    static constexpr uint8_t MAX_SINKS = 4;

    EventSinkFanout() = default;

    /**
     * @brief Add a sink
     * @return false if sink is null or MAX_SINKS is reached
     */
    bool addSink(IEventSink* sink);

    uint8_t getSinkCount() const { return sinkCount_; }

    void publishState(const SystemState& state) override;
    void publishEvent(ControlEventKind kind, const char* description) override;

private:
    IEventSink* sinks_[MAX_SINKS] = {};
    uint8_t sinkCount_ = 0;
};
