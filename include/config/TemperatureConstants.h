// include/config/TemperatureConstants.h
#ifndef TEMPERATURE_CONSTANTS_H
#define TEMPERATURE_CONSTANTS_H

// Temperature conversion constants that can be included by Temperature.h
// These are separated to avoid circular dependencies with SystemConstants.h

namespace TemperatureConstants {
    // Temperature conversion constants
    constexpr float TEMP_SCALE_FACTOR = 10.0f;
    constexpr float TEMP_ROUNDING_POSITIVE = 0.5f;
    constexpr float TEMP_ROUNDING_NEGATIVE = -0.5f;
    constexpr float TEMP_MAX_FLOAT = 3276.7f;
    constexpr float TEMP_MIN_FLOAT = -3276.8f;

    // Plausible range for a PT1000 probe immersed in a water tank.
    // Anything outside is a broken or disconnected probe, not a temperature.
    constexpr float TANK_PROBE_MIN_FLOAT = -30.0f;
    constexpr float TANK_PROBE_MAX_FLOAT = 150.0f;
}

#endif // TEMPERATURE_CONSTANTS_H
