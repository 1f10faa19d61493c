// src/modules/control/TankControlCore.cpp
#include "modules/control/TankControlCore.h"
#include "LoggingMacros.h"
#include "utils/Utils.h"
#include <cstdarg>
#include <cstdio>

using Actuator = HAL::IActuatorGateway::Actuator;

TankControlCore::TankControlCore(IConfigStore& config,
                                 HAL::ITankSensorGateway& sensors,
                                 HAL::IActuatorGateway& actuators,
                                 IEventSink& sink)
    : config_(config)
    , actuators_(actuators)
    , sink_(sink)
    , sampler_(sensors)
    , cycleActive_(false)
    , lastParams_(getDefaultControlParameters()) {
    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        tankAvailable_[i] = true;
    }
}

Result<void> TankControlCore::begin(uint32_t nowMs) {
    auto snap = config_.snapshot();
    if (snap.isSuccess()) {
        lastParams_ = snap.value();
    } else {
        LOG_WARN(TAG, "Config store busy at start - using defaults for the sensor probe");
    }
    const ControlParameters& params = lastParams_;
    TankSample probe = sampler_.sample(Utils::secondsToMs(params.sensorTimeoutSeconds));

    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        tankAvailable_[i] = probe.tanks[i].available;
    }

    if (probe.availableCount == 0) {
        LOG_ERROR(TAG, "No tank temperature sensors found - running fail-safe until one answers");
    } else if (probe.availableCount < TankSensorIndex::TANK_COUNT) {
        LOG_WARN(TAG, "Only %u of %u expected tank sensors found",
                 probe.availableCount, TankSensorIndex::TANK_COUNT);
    } else {
        LOG_INFO(TAG, "Discovered %u tank temperature sensors", probe.availableCount);
    }

    if (params.manualOverride) {
        LOG_WARN(TAG, "Starting with manual override active (heating=%s pump=%s)",
                 params.manualHeating ? "ON" : "OFF", params.manualPump ? "ON" : "OFF");
    }

    char sp[8], hy[8], mx[8];
    LOG_TEMP(sp, params.setpoint);
    LOG_TEMP(hy, params.hysteresis);
    LOG_TEMP(mx, params.maxTemperature);
    LOG_INFO(TAG, "Controller start at %lu ms: setpoint=%s hyst=%s max=%s pump_delay=%us interval=%us",
             static_cast<unsigned long>(nowMs), sp, hy, mx,
             params.pumpDelaySeconds, params.updateIntervalSeconds);

    emitEvent(ControlEventKind::SYSTEM, "Tank controller started (%u/%u sensors)",
              probe.availableCount, TankSensorIndex::TANK_COUNT);
    return Result<void>();
}

Result<SystemState> TankControlCore::runCycle(uint32_t nowMs) {
    if (cycleActive_.exchange(true)) {
        LOG_WARN(TAG, "Cycle requested while previous cycle still running - skipped");
        return Result<SystemState>(SystemError::CYCLE_IN_PROGRESS, "control cycle already running");
    }

    // Without a fresh snapshot the last good parameters stand in, heating is
    // held off and the mode flags are left alone
    auto snap = config_.snapshot();
    const bool configAvailable = snap.isSuccess();
    if (configAvailable) {
        lastParams_ = snap.value();
    } else {
        LOG_WARN(TAG, "No parameter snapshot (%s) - heating held off this cycle",
                 snap.message().c_str());
    }
    const ControlParameters params = lastParams_;

    TankSample sample = sampler_.sample(Utils::secondsToMs(params.sensorTimeoutSeconds));
    trackSensorAvailability(sample);
    if (configAvailable) {
        trackModeChanges(params);
    }

    const bool wasHeating = hysteresis_.isActive();
    const bool wasPump = lastState_.pumpActive;

    // Heating decision
    if (!configAvailable) {
        hysteresis_.force(false);
    } else if (params.manualOverride) {
        hysteresis_.force(params.manualHeating);
    } else if (!params.heatingSystemEnabled) {
        hysteresis_.force(false);
    } else {
        (void)hysteresis_.evaluate(sample.sum, sample.availableCount,
                                  params.setpoint, params.hysteresis);
    }

    // Safety ceiling / fail-safe, dominant over every mode
    SafetyCeiling::Verdict verdict =
        SafetyCeiling::evaluate(sample.sum, sample.availableCount, params.maxTemperature);
    trackSafety(verdict, sample, params);
    if (!SafetyCeiling::allowsHeating(verdict)) {
        hysteresis_.force(false);
    }
    const bool heating = hysteresis_.isActive();

    // Pump
    bool pump;
    if (params.manualOverride) {
        pump = params.manualPump;
        pumpTimer_.followManual(heating, pump);
    } else {
        pump = pumpTimer_.update(heating, nowMs, Utils::secondsToMs(params.pumpDelaySeconds));
    }

    reportTransitions(wasHeating, heating, wasPump, pump, sample, params);
    driveActuators(heating, pump);

    SystemState state;
    state.cycle = ++cycleCount_;
    state.timestampMs = nowMs;
    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        state.tanks[i] = sample.tanks[i];
    }
    state.availableSensors = sample.availableCount;
    state.averageTemperature = sample.average;
    state.heatingActive = heating;
    state.pumpActive = pump;
    state.heatingRelayOn = heatingCommand_.known && heatingCommand_.on;
    state.pumpRelayOn = pumpCommand_.known && pumpCommand_.on;
    state.pumpPhase = pumpTimer_.getPhase();
    state.pumpShutoffPending = pumpTimer_.isShutoffPending();
    state.pumpShutoffDeadlineMs = pumpTimer_.getDeadlineMs();
    state.manualOverride = params.manualOverride;
    state.heatingSystemEnabled = params.heatingSystemEnabled;
    state.safetyTripped = safetyTripped_;
    state.failSafe = failSafe_;
    state.setpoint = params.setpoint;
    state.hysteresis = params.hysteresis;

    lastState_ = state;
    sink_.publishState(state);

    cycleActive_.store(false);
    return Result<SystemState>(state);
}

void TankControlCore::shutdown() {
    LOG_INFO(TAG, "Controller stopping after %lu cycles - relays left as commanded",
             static_cast<unsigned long>(cycleCount_));
    emitEvent(ControlEventKind::SYSTEM, "Tank controller stopped");
}

void TankControlCore::trackSensorAvailability(const TankSample& sample) {
    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        const TankReading& reading = sample.tanks[i];
        if (tankAvailable_[i] && !reading.available) {
            LOG_WARN(TAG, "Tank %u sensor unavailable", reading.tankId);
            emitEvent(ControlEventKind::SENSOR_FAILURE, "Tank %u sensor unavailable", reading.tankId);
        } else if (!tankAvailable_[i] && reading.available) {
            LOG_INFO(TAG, "Tank %u sensor back online", reading.tankId);
        }
        tankAvailable_[i] = reading.available;
    }

    if (sample.availableCount > 0 && sample.availableCount < TankSensorIndex::TANK_COUNT) {
        LOG_DEBUG(TAG, "Averaging over %u of %u tanks", sample.availableCount,
                  TankSensorIndex::TANK_COUNT);
    }
}

void TankControlCore::trackModeChanges(const ControlParameters& params) {
    if (!haveModeBaseline_) {
        haveModeBaseline_ = true;
        lastManualOverride_ = params.manualOverride;
        lastHeatingSystemEnabled_ = params.heatingSystemEnabled;
        return;
    }

    if (params.manualOverride != lastManualOverride_) {
        if (params.manualOverride) {
            LOG_WARN(TAG, "Manual override ENABLED - hysteresis and pump overrun bypassed");
            emitEvent(ControlEventKind::MODE_CHANGE, "Manual override enabled (heating=%s pump=%s)",
                      params.manualHeating ? "on" : "off", params.manualPump ? "on" : "off");
        } else {
            LOG_INFO(TAG, "Manual override disabled - automatic control resumed");
            emitEvent(ControlEventKind::MODE_CHANGE, "Manual override disabled");
        }
        lastManualOverride_ = params.manualOverride;
    }

    if (params.heatingSystemEnabled != lastHeatingSystemEnabled_) {
        LOG_INFO(TAG, "Heating system %s", params.heatingSystemEnabled ? "enabled" : "disabled");
        emitEvent(ControlEventKind::MODE_CHANGE, "Heating system %s",
                  params.heatingSystemEnabled ? "enabled" : "disabled");
        lastHeatingSystemEnabled_ = params.heatingSystemEnabled;
    }
}

void TankControlCore::trackSafety(SafetyCeiling::Verdict verdict, const TankSample& sample,
                                  const ControlParameters& params) {
    const bool failSafe = (verdict == SafetyCeiling::Verdict::NO_VALID_TEMPERATURE);
    const bool tripped = (verdict == SafetyCeiling::Verdict::CEILING_REACHED);

    if (failSafe && !failSafe_) {
        LOG_ERROR(TAG, "No valid tank temperature - heating forced OFF (fail-safe)");
        emitEvent(ControlEventKind::SENSOR_FAILURE,
                  "All tank sensors unavailable - heating forced off");
    } else if (!failSafe && failSafe_) {
        LOG_INFO(TAG, "Tank temperature available again (%u sensors) - fail-safe cleared",
                 sample.availableCount);
        emitEvent(ControlEventKind::MODE_CHANGE, "Fail-safe cleared (%u/%u sensors)",
                  sample.availableCount, TankSensorIndex::TANK_COUNT);
    }

    char avg[8], mx[8];
    LOG_TEMP(avg, sample.average);
    LOG_TEMP(mx, params.maxTemperature);

    if (tripped && !safetyTripped_) {
        LOG_WARN(TAG, "Temperature %s°C reached maximum %s°C - heating forced OFF", avg, mx);
        emitEvent(ControlEventKind::SAFETY_TRIP, "Average %s >= max %s - heating forced off%s",
                  avg, mx, params.manualOverride ? " (manual request overridden)" : "");
    } else if (!tripped && safetyTripped_) {
        LOG_INFO(TAG, "Temperature %s°C back below maximum %s°C", avg, mx);
    }

    failSafe_ = failSafe;
    safetyTripped_ = tripped;
}

void TankControlCore::reportTransitions(bool wasHeating, bool heating, bool wasPump, bool pump,
                                        const TankSample& sample, const ControlParameters& params) {
    char avg[8], sp[8];
    LOG_TEMP(avg, sample.average);
    LOG_TEMP(sp, params.setpoint);

    if (heating && !wasHeating) {
        LOG_INFO(TAG, "Heating ON (avg=%s setpoint=%s%s)", avg, sp,
                 params.manualOverride ? ", manual" : "");
        emitEvent(ControlEventKind::CONTROL_ACTION, "heating_on avg=%s setpoint=%s", avg, sp);
    } else if (!heating && wasHeating) {
        if (!params.manualOverride && pump) {
            LOG_INFO(TAG, "Heating OFF (avg=%s setpoint=%s), pump stops in %us",
                     avg, sp, params.pumpDelaySeconds);
        } else {
            LOG_INFO(TAG, "Heating OFF (avg=%s setpoint=%s)", avg, sp);
        }
        emitEvent(ControlEventKind::CONTROL_ACTION, "heating_off avg=%s setpoint=%s", avg, sp);
    }

    if (pump && !wasPump) {
        LOG_INFO(TAG, "Circulation pump ON");
        emitEvent(ControlEventKind::CONTROL_ACTION, "pump_on");
    } else if (!pump && wasPump) {
        LOG_INFO(TAG, "Circulation pump OFF");
        emitEvent(ControlEventKind::CONTROL_ACTION, "pump_off");
    }
}

void TankControlCore::driveActuators(bool heating, bool pump) {
    // Pump leads when the heater comes on, heater leads otherwise
    if (heating) {
        if (!driveActuator(Actuator::PUMP, pump, pumpCommand_) && pump) {
            if (!heatingCommand_.known || !heatingCommand_.on) {
                LOG_WARN(TAG, "Heater held off - pump not confirmed running");
                return;
            }
        }
        (void)driveActuator(Actuator::HEATING, heating, heatingCommand_);
    } else {
        (void)driveActuator(Actuator::HEATING, heating, heatingCommand_);
        (void)driveActuator(Actuator::PUMP, pump, pumpCommand_);
    }
}

bool TankControlCore::driveActuator(Actuator actuator, bool on, ActuatorCommand& command) {
    if (command.known && command.on == on) {
        return true;
    }

    auto result = actuators_.setActuator(actuator, on);
    if (result.isError()) {
        command.known = false;
        LOG_ERROR(TAG, "Failed to switch %s %s: %s - retry next cycle",
                  HAL::actuatorToString(actuator), on ? "ON" : "OFF",
                  ErrorHandler::errorToString(result.error()));
        emitEvent(ControlEventKind::ACTUATOR_FAILURE, "Failed to switch %s %s: %s",
                  HAL::actuatorToString(actuator), on ? "on" : "off",
                  result.message().empty() ? ErrorHandler::errorToString(result.error())
                                           : result.message().c_str());
        return false;
    }

    command.known = true;
    command.on = on;
    LOG_DEBUG(TAG, "%s relay -> %s", HAL::actuatorToString(actuator), on ? "ON" : "OFF");
    return true;
}

void TankControlCore::emitEvent(ControlEventKind kind, const char* format, ...) {
    char text[EVENT_TEXT_SIZE];
    va_list args;
    va_start(args, format);
    vsnprintf(text, sizeof(text), format, args);
    va_end(args);
    sink_.publishEvent(kind, text);
}
