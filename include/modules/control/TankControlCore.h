// include/modules/control/TankControlCore.h
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include "config/IConfigStore.h"
#include "events/IEventSink.h"
#include "hal/ControlGateways.h"
#include "modules/control/HysteresisController.h"
#include "modules/control/PumpDelayTimer.h"
#include "modules/control/SafetyCeiling.h"
#include "modules/control/TankTemperatureSampler.h"
#include "shared/TankControlTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Tank heating control loop body
 *
 * One runCycle() call:
 *  1. snapshot parameters from the config store (heating held off if
 *     the store cannot hand out a consistent copy)
 *  2. sample and average the tank probes
 *  3. decide heating (manual flags, master switch or hysteresis)
 *  4. apply the safety ceiling / fail-safe (always wins, also over manual)
 *  5. advance the pump overrun timer (bypassed under manual override)
 *  6. write relays whose target differs from the last confirmed command,
 *     the heater is not switched on while the pump write is failing
 *  7. publish the resulting SystemState
 *
 * The heating decision and pump timer are owned here and only mutated by
 * runCycle(). Outside writers talk to the config store instead. A second
 * runCycle() entered while one is in progress is refused with
 * CYCLE_IN_PROGRESS. Nothing in here touches FreeRTOS, so the firmware
 * task and the native tests drive the same code.
 */
class TankControlCore {
public:
    TankControlCore(IConfigStore& config,
                    HAL::ITankSensorGateway& sensors,
                    HAL::IActuatorGateway& actuators,
                    IEventSink& sink);

    /**
     * @brief Probe the tank sensors once and announce the start
     *
     * Logs how many of the expected probes answered. Starting with none is
     * allowed: the loop then runs fail-safe until a probe comes back.
     */
    Result<void> begin(uint32_t nowMs);

    /**
     * @brief Run one control cycle
     * @param nowMs Monotonic millisecond clock, wraparound safe
     * @return The published state, or CYCLE_IN_PROGRESS
     */
    Result<SystemState> runCycle(uint32_t nowMs);

    /**
     * @brief Announce the stop. Relays keep their last commanded state.
     */
    void shutdown();

    /**
     * @brief Last published state (control loop context only)
     */
    const SystemState& getLastState() const { return lastState_; }

    uint32_t getCycleCount() const { return cycleCount_; }

private:
    struct ActuatorCommand {
        bool known = false;  // false until a write succeeded, and after a failed write
        bool on = false;
    };

    void trackSensorAvailability(const TankSample& sample);
    void trackModeChanges(const ControlParameters& params);
    void trackSafety(SafetyCeiling::Verdict verdict, const TankSample& sample,
                     const ControlParameters& params);
    void reportTransitions(bool wasHeating, bool heating, bool wasPump, bool pump,
                           const TankSample& sample, const ControlParameters& params);
    void driveActuators(bool heating, bool pump);
    // true once the relay is confirmed in the requested state
    bool driveActuator(HAL::IActuatorGateway::Actuator actuator, bool on, ActuatorCommand& command);
    void emitEvent(ControlEventKind kind, const char* format, ...);

    IConfigStore& config_;
    HAL::IActuatorGateway& actuators_;
    IEventSink& sink_;

    TankTemperatureSampler sampler_;
    HysteresisController hysteresis_;
    PumpDelayTimer pumpTimer_;

    std::atomic<bool> cycleActive_;

    ActuatorCommand heatingCommand_;
    ActuatorCommand pumpCommand_;

    bool tankAvailable_[TankSensorIndex::TANK_COUNT];
    bool failSafe_ = false;
    bool safetyTripped_ = false;
    bool haveModeBaseline_ = false;
    bool lastManualOverride_ = false;
    bool lastHeatingSystemEnabled_ = true;

    uint32_t cycleCount_ = 0;
    ControlParameters lastParams_;
    SystemState lastState_;

    static constexpr const char* TAG = "TankCtrl";
    static constexpr size_t EVENT_TEXT_SIZE = 128;
};
