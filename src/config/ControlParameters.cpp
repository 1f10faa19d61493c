// src/config/ControlParameters.cpp
#include "config/ControlParameters.h"
#include "config/ControlLimits.h"
#include "LoggingMacros.h"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static const char* TAG = "CtrlParams";

ControlParameters getDefaultControlParameters() {
    ControlParameters params;
    params.setpoint = ControlLimits::Defaults::SETPOINT;
    params.hysteresis = ControlLimits::Defaults::HYSTERESIS;
    params.maxTemperature = ControlLimits::Defaults::MAX_TEMPERATURE;
    params.pumpDelaySeconds = ControlLimits::Defaults::PUMP_DELAY_S;
    params.updateIntervalSeconds = ControlLimits::Defaults::UPDATE_INTERVAL_S;
    params.sensorTimeoutSeconds = ControlLimits::Defaults::SENSOR_TIMEOUT_S;
    params.manualOverride = ControlLimits::Defaults::MANUAL_OVERRIDE;
    params.manualHeating = ControlLimits::Defaults::MANUAL_HEATING;
    params.manualPump = ControlLimits::Defaults::MANUAL_PUMP;
    params.heatingSystemEnabled = ControlLimits::Defaults::HEATING_SYSTEM_ENABLED;
    return params;
}

namespace {

bool tempInRange(Temperature_t value, Temperature_t min, Temperature_t max) {
    return tempIsValid(value) && value >= min && value <= max;
}

Result<void> rangeError(const char* field, const char* range) {
    char msg[96];
    snprintf(msg, sizeof(msg), "%s out of range (%s)", field, range);
    return Result<void>(SystemError::CONFIG_INVALID, msg);
}

bool parseDecimal(const char* text, float& out) {
    char* endptr = nullptr;
    float value = strtof(text, &endptr);
    // Check if parsing succeeded (endptr moved past the number)
    if (endptr == text || (*endptr != '\0' && !isspace(static_cast<unsigned char>(*endptr)))) {
        return false;
    }
    out = value;
    return true;
}

bool parseSeconds(const char* text, uint16_t& out) {
    char* endptr = nullptr;
    long value = strtol(text, &endptr, 10);
    if (endptr == text || (*endptr != '\0' && !isspace(static_cast<unsigned char>(*endptr)))) {
        return false;
    }
    if (value < 0 || value > UINT16_MAX) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

bool parseFlag(const char* text, bool& out) {
    if (strcmp(text, "true") == 0 || strcmp(text, "on") == 0 || strcmp(text, "1") == 0) {
        out = true;
        return true;
    }
    if (strcmp(text, "false") == 0 || strcmp(text, "off") == 0 || strcmp(text, "0") == 0) {
        out = false;
        return true;
    }
    return false;
}

} // namespace

Result<void> validateControlParameters(const ControlParameters& params) {
    using namespace ControlLimits::Limits;

    if (!tempInRange(params.setpoint, SETPOINT_MIN, SETPOINT_MAX)) {
        return rangeError("setpoint", "5-85");
    }
    if (!tempInRange(params.hysteresis, HYSTERESIS_MIN, HYSTERESIS_MAX)) {
        return rangeError("hysteresis", "0.5-10");
    }
    if (!tempInRange(params.maxTemperature, MAX_TEMPERATURE_MIN, MAX_TEMPERATURE_MAX)) {
        return rangeError("max_temperature", "60-95");
    }
    if (params.pumpDelaySeconds > PUMP_DELAY_MAX_S) {
        return rangeError("pump_delay", "0-300");
    }
    if (params.updateIntervalSeconds < UPDATE_INTERVAL_MIN_S ||
        params.updateIntervalSeconds > UPDATE_INTERVAL_MAX_S) {
        return rangeError("update_interval", "1-60");
    }
    if (params.sensorTimeoutSeconds < SENSOR_TIMEOUT_MIN_S ||
        params.sensorTimeoutSeconds > SENSOR_TIMEOUT_MAX_S) {
        return rangeError("sensor_timeout", "5-120");
    }
    return Result<void>();
}

bool isHysteresisBandMeaningful(const ControlParameters& params) {
    int32_t low = static_cast<int32_t>(params.setpoint) - params.hysteresis;
    int32_t high = static_cast<int32_t>(params.setpoint) + params.hysteresis;
    return low > 0 && high < params.maxTemperature;
}

Result<void> applyControlParameter(ControlParameters& params, const char* key, const char* value) {
    if (key == nullptr || value == nullptr) {
        return Result<void>(SystemError::INVALID_PARAMETER, "null key or value");
    }

    ControlParameters candidate = params;
    bool parsed = false;
    bool known = true;

    if (strcmp(key, "setpoint") == 0 || strcmp(key, "hysteresis") == 0 ||
        strcmp(key, "max_temperature") == 0) {
        float degrees = 0.0f;
        parsed = parseDecimal(value, degrees);
        if (parsed) {
            Temperature_t t = tempFromFloat(degrees);
            if (key[0] == 's') {
                candidate.setpoint = t;
            } else if (key[0] == 'h') {
                candidate.hysteresis = t;
            } else {
                candidate.maxTemperature = t;
            }
        }
    } else if (strcmp(key, "pump_delay") == 0) {
        parsed = parseSeconds(value, candidate.pumpDelaySeconds);
    } else if (strcmp(key, "update_interval") == 0) {
        parsed = parseSeconds(value, candidate.updateIntervalSeconds);
    } else if (strcmp(key, "sensor_timeout") == 0) {
        parsed = parseSeconds(value, candidate.sensorTimeoutSeconds);
    } else if (strcmp(key, "heating_system_enabled") == 0) {
        parsed = parseFlag(value, candidate.heatingSystemEnabled);
    } else {
        known = false;
    }

    if (!known) {
        LOG_WARN(TAG, "Unknown parameter '%s'", key);
        return Result<void>(SystemError::INVALID_PARAMETER, std::string("unknown parameter ") + key);
    }
    if (!parsed) {
        LOG_WARN(TAG, "Invalid %s format: %s", key, value);
        return Result<void>(SystemError::CONFIG_INVALID, std::string("invalid format for ") + key);
    }

    auto check = validateControlParameters(candidate);
    if (check.isError()) {
        LOG_WARN(TAG, "Rejected %s=%s: %s", key, value, check.message().c_str());
        return check;
    }

    if (!isHysteresisBandMeaningful(candidate)) {
        char sp[8], hy[8], mx[8];
        LOG_TEMP(sp, candidate.setpoint);
        LOG_TEMP(hy, candidate.hysteresis);
        LOG_TEMP(mx, candidate.maxTemperature);
        LOG_WARN(TAG, "Band %s +/- %s reaches the %s ceiling - hysteresis degraded", sp, hy, mx);
    }

    params = candidate;
    LOG_INFO(TAG, "Set %s to %s", key, value);
    return Result<void>();
}
