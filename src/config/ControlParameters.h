// src/config/ControlParameters.h
#ifndef CONTROL_PARAMETERS_H
#define CONTROL_PARAMETERS_H

#include <cstdint>
#include "shared/Temperature.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Parameters the tank control loop reads at the start of every cycle.
 *
 * Owned by the configuration store. The loop only ever sees a copy taken
 * under the store's lock, so a cycle never mixes old and new values.
 */
struct ControlParameters {
    Temperature_t setpoint;          // Target average tank temperature
    Temperature_t hysteresis;        // Half-width of the dead band around setpoint
    Temperature_t maxTemperature;    // Safety ceiling, heating forced off at or above

    uint16_t pumpDelaySeconds;       // Pump overrun after heating turns off
    uint16_t updateIntervalSeconds;  // Control cycle period
    uint16_t sensorTimeoutSeconds;   // Upper bound for one sampling pass

    bool manualOverride;             // Bypass hysteresis and pump overrun
    bool manualHeating;
    bool manualPump;
    bool heatingSystemEnabled;       // Master switch for automatic heating
};

/**
 * @brief Get the default control parameters.
 */
ControlParameters getDefaultControlParameters();

/**
 * @brief Range-check every field.
 * @return CONFIG_INVALID naming the first offending field
 */
Result<void> validateControlParameters(const ControlParameters& params);

/**
 * @brief True when setpoint - hysteresis > 0 and setpoint + hysteresis < max.
 *
 * Not enforced: a degenerate band still yields safe decisions, it only
 * makes hysteresis pointless. Callers log a warning.
 */
bool isHysteresisBandMeaningful(const ControlParameters& params);

/**
 * @brief Parse and apply a single named field.
 *
 * Keys: setpoint, hysteresis, max_temperature (°C as decimal text),
 * pump_delay, update_interval, sensor_timeout (whole seconds) and
 * heating_system_enabled (true/false/on/off/1/0). Manual flags are not
 * settable here. params is modified only if the value parses and the
 * resulting parameter set validates.
 */
Result<void> applyControlParameter(ControlParameters& params, const char* key, const char* value);

#endif // CONTROL_PARAMETERS_H
