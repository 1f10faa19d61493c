#pragma once
#include <cstdint>
#include "shared/Temperature.h"

/**
 * @brief Defaults and valid ranges for the tank control parameters
 *
 * Temperatures are Temperature_t (tenths of °C), durations are seconds.
 * Values loaded from NVS or received over MQTT are checked against Limits
 * before they can reach the control loop.
 */
namespace ControlLimits {
    // Compile-time defaults
    namespace Defaults {
        constexpr Temperature_t SETPOINT = 600;         // 60.0°C
        constexpr Temperature_t HYSTERESIS = 20;        // 2.0°C
        constexpr Temperature_t MAX_TEMPERATURE = 850;  // 85.0°C
        constexpr uint16_t PUMP_DELAY_S = 60;
        constexpr uint16_t UPDATE_INTERVAL_S = 5;
        constexpr uint16_t SENSOR_TIMEOUT_S = 30;
        constexpr bool MANUAL_OVERRIDE = false;
        constexpr bool MANUAL_HEATING = false;
        constexpr bool MANUAL_PUMP = false;
        constexpr bool HEATING_SYSTEM_ENABLED = true;
    }

    // Valid ranges (inclusive)
    namespace Limits {
        constexpr Temperature_t SETPOINT_MIN = 50;         // 5.0°C
        constexpr Temperature_t SETPOINT_MAX = 850;        // 85.0°C

        constexpr Temperature_t HYSTERESIS_MIN = 5;        // 0.5°C
        constexpr Temperature_t HYSTERESIS_MAX = 100;      // 10.0°C

        constexpr Temperature_t MAX_TEMPERATURE_MIN = 600; // 60.0°C
        constexpr Temperature_t MAX_TEMPERATURE_MAX = 950; // 95.0°C

        constexpr uint16_t PUMP_DELAY_MIN_S = 0;
        constexpr uint16_t PUMP_DELAY_MAX_S = 300;         // 5min

        constexpr uint16_t UPDATE_INTERVAL_MIN_S = 1;
        constexpr uint16_t UPDATE_INTERVAL_MAX_S = 60;

        constexpr uint16_t SENSOR_TIMEOUT_MIN_S = 5;
        constexpr uint16_t SENSOR_TIMEOUT_MAX_S = 120;
    }
}
