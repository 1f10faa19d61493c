// src/config/NvsConfigStore.cpp
#include "config/NvsConfigStore.h"
#include "config/ControlLimits.h"
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "LoggingMacros.h"
#include <Preferences.h>
#include <SemaphoreGuard.h>

namespace {
    Preferences prefs;

    // NVS keys (max 15 chars)
    constexpr const char* KEY_SETPOINT = "setpoint";
    constexpr const char* KEY_HYSTERESIS = "hysteresis";
    constexpr const char* KEY_MAX_TEMP = "max_temp";
    constexpr const char* KEY_PUMP_DELAY = "pump_delay";
    constexpr const char* KEY_INTERVAL = "interval";
    constexpr const char* KEY_SENSOR_TIMEOUT = "sensor_tmo";
    constexpr const char* KEY_MANUAL = "manual";
    constexpr const char* KEY_MANUAL_HEATING = "man_heat";
    constexpr const char* KEY_MANUAL_PUMP = "man_pump";
    constexpr const char* KEY_SYSTEM_ENABLED = "sys_enabled";
    constexpr const char* KEY_MANUAL_PIN = "manual_pin";

    constexpr TickType_t MUTEX_TIMEOUT =
        pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_DEFAULT_TIMEOUT_MS);
    constexpr TickType_t SNAPSHOT_TIMEOUT =
        pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_LONG_TIMEOUT_MS);
}

NvsConfigStore::NvsConfigStore()
    : mutex_(nullptr)
    , params_(getDefaultControlParameters()) {}

NvsConfigStore::~NvsConfigStore() {
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}

Result<void> NvsConfigStore::begin() {
    if (mutex_ == nullptr) {
        mutex_ = xSemaphoreCreateMutex();
        if (mutex_ == nullptr) {
            return Result<void>(SystemError::MUTEX_CREATE_FAILED, "config store mutex");
        }
    }

    SemaphoreGuard guard(mutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_LONG_TIMEOUT_MS));
    if (!guard.hasLock()) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, "config store load");
    }
    loadFromNVS();
    return Result<void>();
}

void NvsConfigStore::loadFromNVS() {
    using namespace ControlLimits;
    ControlParameters loaded = getDefaultControlParameters();

    // Open in read-write mode to auto-create namespace on first boot
    prefs.begin(NVS_NAMESPACE, false);
    loaded.setpoint = static_cast<Temperature_t>(prefs.getInt(KEY_SETPOINT, Defaults::SETPOINT));
    loaded.hysteresis = static_cast<Temperature_t>(prefs.getInt(KEY_HYSTERESIS, Defaults::HYSTERESIS));
    loaded.maxTemperature = static_cast<Temperature_t>(prefs.getInt(KEY_MAX_TEMP, Defaults::MAX_TEMPERATURE));
    uint32_t pumpDelay = prefs.getUInt(KEY_PUMP_DELAY, Defaults::PUMP_DELAY_S);
    uint32_t interval = prefs.getUInt(KEY_INTERVAL, Defaults::UPDATE_INTERVAL_S);
    uint32_t sensorTimeout = prefs.getUInt(KEY_SENSOR_TIMEOUT, Defaults::SENSOR_TIMEOUT_S);
    loaded.manualOverride = prefs.getBool(KEY_MANUAL, Defaults::MANUAL_OVERRIDE);
    loaded.manualHeating = prefs.getBool(KEY_MANUAL_HEATING, Defaults::MANUAL_HEATING);
    loaded.manualPump = prefs.getBool(KEY_MANUAL_PUMP, Defaults::MANUAL_PUMP);
    loaded.heatingSystemEnabled = prefs.getBool(KEY_SYSTEM_ENABLED, Defaults::HEATING_SYSTEM_ENABLED);
    String pin = prefs.getString(KEY_MANUAL_PIN, TANKCTL_MANUAL_PIN);
    prefs.end();

    // Validate loaded values
    if (loaded.setpoint < Limits::SETPOINT_MIN || loaded.setpoint > Limits::SETPOINT_MAX) {
        LOG_WARN(TAG, "Invalid setpoint %d in NVS, using default %d",
                 loaded.setpoint, Defaults::SETPOINT);
        loaded.setpoint = Defaults::SETPOINT;
    }
    if (loaded.hysteresis < Limits::HYSTERESIS_MIN || loaded.hysteresis > Limits::HYSTERESIS_MAX) {
        LOG_WARN(TAG, "Invalid hysteresis %d in NVS, using default %d",
                 loaded.hysteresis, Defaults::HYSTERESIS);
        loaded.hysteresis = Defaults::HYSTERESIS;
    }
    if (loaded.maxTemperature < Limits::MAX_TEMPERATURE_MIN ||
        loaded.maxTemperature > Limits::MAX_TEMPERATURE_MAX) {
        LOG_WARN(TAG, "Invalid max_temp %d in NVS, using default %d",
                 loaded.maxTemperature, Defaults::MAX_TEMPERATURE);
        loaded.maxTemperature = Defaults::MAX_TEMPERATURE;
    }
    if (pumpDelay > Limits::PUMP_DELAY_MAX_S) {
        LOG_WARN(TAG, "Invalid pump_delay %lu s in NVS, using default %u s",
                 static_cast<unsigned long>(pumpDelay), Defaults::PUMP_DELAY_S);
        pumpDelay = Defaults::PUMP_DELAY_S;
    }
    if (interval < Limits::UPDATE_INTERVAL_MIN_S || interval > Limits::UPDATE_INTERVAL_MAX_S) {
        LOG_WARN(TAG, "Invalid interval %lu s in NVS, using default %u s",
                 static_cast<unsigned long>(interval), Defaults::UPDATE_INTERVAL_S);
        interval = Defaults::UPDATE_INTERVAL_S;
    }
    if (sensorTimeout < Limits::SENSOR_TIMEOUT_MIN_S || sensorTimeout > Limits::SENSOR_TIMEOUT_MAX_S) {
        LOG_WARN(TAG, "Invalid sensor_tmo %lu s in NVS, using default %u s",
                 static_cast<unsigned long>(sensorTimeout), Defaults::SENSOR_TIMEOUT_S);
        sensorTimeout = Defaults::SENSOR_TIMEOUT_S;
    }
    loaded.pumpDelaySeconds = static_cast<uint16_t>(pumpDelay);
    loaded.updateIntervalSeconds = static_cast<uint16_t>(interval);
    loaded.sensorTimeoutSeconds = static_cast<uint16_t>(sensorTimeout);

    if (!isHysteresisBandMeaningful(loaded)) {
        LOG_WARN(TAG, "Stored setpoint/hysteresis band touches the ceiling - hysteresis degraded");
    }

    params_ = loaded;
    if (!authorizer_.setPin(pin.c_str())) {
        LOG_WARN(TAG, "Stored override PIN rejected - manual override disabled");
    }

    char sp[8], hy[8], mx[8];
    LOG_TEMP(sp, params_.setpoint);
    LOG_TEMP(hy, params_.hysteresis);
    LOG_TEMP(mx, params_.maxTemperature);
    LOG_INFO(TAG, "Loaded config: setpoint=%s hyst=%s max=%s pump_delay=%us interval=%us sensor_timeout=%us",
             sp, hy, mx, params_.pumpDelaySeconds, params_.updateIntervalSeconds,
             params_.sensorTimeoutSeconds);
    LOG_INFO(TAG, "Heating system %s, manual override %s, PIN %s",
             params_.heatingSystemEnabled ? "enabled" : "disabled",
             params_.manualOverride ? "ACTIVE" : "off",
             authorizer_.isEnabled() ? "set" : "not set");
}

void NvsConfigStore::saveToNVS(const ControlParameters& params) {
    prefs.begin(NVS_NAMESPACE, false);  // read-write
    prefs.putInt(KEY_SETPOINT, params.setpoint);
    prefs.putInt(KEY_HYSTERESIS, params.hysteresis);
    prefs.putInt(KEY_MAX_TEMP, params.maxTemperature);
    prefs.putUInt(KEY_PUMP_DELAY, params.pumpDelaySeconds);
    prefs.putUInt(KEY_INTERVAL, params.updateIntervalSeconds);
    prefs.putUInt(KEY_SENSOR_TIMEOUT, params.sensorTimeoutSeconds);
    prefs.putBool(KEY_MANUAL, params.manualOverride);
    prefs.putBool(KEY_MANUAL_HEATING, params.manualHeating);
    prefs.putBool(KEY_MANUAL_PUMP, params.manualPump);
    prefs.putBool(KEY_SYSTEM_ENABLED, params.heatingSystemEnabled);
    prefs.end();

    LOG_DEBUG(TAG, "Saved config to NVS");
}

Result<ControlParameters> NvsConfigStore::snapshot() const {
    SemaphoreGuard guard(mutex_, SNAPSHOT_TIMEOUT);
    if (!guard.hasLock()) {
        LOG_ERROR(TAG, "Config snapshot timed out");
        return Result<ControlParameters>(SystemError::MUTEX_TIMEOUT, "config store busy");
    }
    return Result<ControlParameters>(params_);
}

Result<void> NvsConfigStore::applyManual(bool manualOverride, bool heating, bool pump,
                                         const char* credential) {
    SemaphoreGuard guard(mutex_, MUTEX_TIMEOUT);
    if (!guard.hasLock()) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, "config store busy");
    }

    if (!authorizer_.isAuthorized(credential)) {
        LOG_WARN(TAG, "Manual change rejected - %s",
                 authorizer_.isEnabled() ? "wrong PIN" : "manual override disabled (no PIN)");
        return Result<void>(SystemError::UNAUTHORIZED,
                            authorizer_.isEnabled() ? "unauthorized" : "manual_disabled");
    }

    params_.manualOverride = manualOverride;
    params_.manualHeating = heating;
    params_.manualPump = pump;
    saveToNVS(params_);

    LOG_INFO(TAG, "Manual state set: override=%s heating=%s pump=%s",
             manualOverride ? "ON" : "OFF", heating ? "ON" : "OFF", pump ? "ON" : "OFF");
    return Result<void>();
}

Result<void> NvsConfigStore::applyParameters(const ControlParameters& params) {
    SemaphoreGuard guard(mutex_, MUTEX_TIMEOUT);
    if (!guard.hasLock()) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, "config store busy");
    }

    ControlParameters candidate = params;
    candidate.manualOverride = params_.manualOverride;
    candidate.manualHeating = params_.manualHeating;
    candidate.manualPump = params_.manualPump;

    auto check = validateControlParameters(candidate);
    if (check.isError()) {
        LOG_WARN(TAG, "Parameter set rejected: %s", check.message().c_str());
        return check;
    }

    params_ = candidate;
    saveToNVS(params_);
    LOG_INFO(TAG, "Parameter set applied");
    return Result<void>();
}

Result<void> NvsConfigStore::setParameter(const char* key, const char* value) {
    SemaphoreGuard guard(mutex_, MUTEX_TIMEOUT);
    if (!guard.hasLock()) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, "config store busy");
    }

    auto result = applyControlParameter(params_, key, value);
    if (result.isSuccess()) {
        saveToNVS(params_);
    }
    return result;
}

Result<void> NvsConfigStore::changePin(const char* currentPin, const char* newPin) {
    SemaphoreGuard guard(mutex_, MUTEX_TIMEOUT);
    if (!guard.hasLock()) {
        return Result<void>(SystemError::MUTEX_TIMEOUT, "config store busy");
    }

    auto result = authorizer_.changePin(currentPin, newPin);
    if (result.isError()) {
        return result;
    }

    prefs.begin(NVS_NAMESPACE, false);
    prefs.putString(KEY_MANUAL_PIN, newPin);
    prefs.end();

    LOG_INFO(TAG, "Override PIN updated (%s)", authorizer_.isEnabled() ? "enabled" : "disabled");
    return Result<void>();
}
