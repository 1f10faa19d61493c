// include/shared/TankControlTypes.h
#ifndef TANK_CONTROL_TYPES_H
#define TANK_CONTROL_TYPES_H

#include <cstdint>
#include "shared/Temperature.h"
#include "config/SensorIndices.h"

/**
 * @brief One tank temperature as seen by a single control cycle
 */
struct TankReading {
    uint8_t tankId;             // 1..TANK_COUNT
    Temperature_t temperature;  // TEMP_INVALID when unavailable
    bool available;
};

/**
 * @brief Phase of the pump overrun timer
 */
enum class PumpPhase : uint8_t {
    IDLE = 0,             // pump off, no pending timer
    RUNNING = 1,          // heating on (or manual), pump on
    PENDING_SHUTOFF = 2   // heating off, pump kept on until deadline
};

inline const char* pumpPhaseToString(PumpPhase phase) {
    switch (phase) {
        case PumpPhase::IDLE: return "idle";
        case PumpPhase::RUNNING: return "running";
        case PumpPhase::PENDING_SHUTOFF: return "pending_shutoff";
        default: return "unknown";
    }
}

/**
 * @brief Discrete occurrences published next to the periodic state
 */
enum class ControlEventKind : uint8_t {
    SENSOR_FAILURE = 0,
    SAFETY_TRIP = 1,
    MODE_CHANGE = 2,
    ACTUATOR_FAILURE = 3,
    CONTROL_ACTION = 4,
    SYSTEM = 5
};

inline const char* eventKindToString(ControlEventKind kind) {
    switch (kind) {
        case ControlEventKind::SENSOR_FAILURE: return "sensor_failure";
        case ControlEventKind::SAFETY_TRIP: return "safety_trip";
        case ControlEventKind::MODE_CHANGE: return "mode_change";
        case ControlEventKind::ACTUATOR_FAILURE: return "actuator_failure";
        case ControlEventKind::CONTROL_ACTION: return "control_action";
        case ControlEventKind::SYSTEM: return "system";
        default: return "unknown";
    }
}

/**
 * @brief Snapshot of the controller after one cycle
 *
 * Rebuilt every cycle and handed to the event sinks by value.
 */
struct SystemState {
    uint32_t cycle = 0;
    uint32_t timestampMs = 0;

    TankReading tanks[TankSensorIndex::TANK_COUNT] = {};
    uint8_t availableSensors = 0;
    Temperature_t averageTemperature = TEMP_INVALID;

    bool heatingActive = false;
    bool pumpActive = false;
    PumpPhase pumpPhase = PumpPhase::IDLE;
    bool pumpShutoffPending = false;
    uint32_t pumpShutoffDeadlineMs = 0;  // valid only if pumpShutoffPending

    // Last relay state confirmed by a successful write
    bool heatingRelayOn = false;
    bool pumpRelayOn = false;

    bool manualOverride = false;
    bool heatingSystemEnabled = true;
    bool safetyTripped = false;
    bool failSafe = false;               // no sensor available

    Temperature_t setpoint = TEMP_INVALID;
    Temperature_t hysteresis = TEMP_INVALID;
};

#endif // TANK_CONTROL_TYPES_H
