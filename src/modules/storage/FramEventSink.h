// src/modules/storage/FramEventSink.h
#pragma once

#include <cstdint>
#include <RuntimeStorage.h>
#include "events/IEventSink.h"

/**
 * @brief Persists controller events and relay statistics to FRAM
 *
 * Discrete events go to the RuntimeStorage event log. From the state
 * stream it derives heater and pump start counters and accumulates the
 * heating runtime. A null storage pointer (FRAM missing) turns every call
 * into a no-op.
 */
class FramEventSink : public IEventSink {
public:
    explicit FramEventSink(rtstorage::RuntimeStorage* storage);

    void publishState(const SystemState& state) override;

    void publishEvent(ControlEventKind kind, const char* description) override;

private:
    void countStart(rtstorage::CounterType counterId, const char* what);
    void addHeatingRuntime(uint32_t nowMs);

    rtstorage::RuntimeStorage* storage_;
    bool lastHeating_ = false;
    bool lastPump_ = false;
    uint32_t heatingStartMs_ = 0;

    static constexpr const char* TAG = "FramSink";
};
