// src/modules/mqtt/MQTTPayloads.cpp
#include "MQTTPayloads.h"
#include <ArduinoJson.h>
#include <cmath>
#include <cstring>
#include <strings.h>

namespace MQTTPayloads {

namespace {

// One decimal, matching the tenths resolution of Temperature_t
template <typename TTarget>
void setTemperature(TTarget&& target, Temperature_t value) {
    if (!tempIsValid(value)) {
        target.set(nullptr);
        return;
    }
    target.set(std::round(tempToFloat(value) * 10.0f) / 10.0f);
}

size_t serializeInto(const JsonDocument& doc, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return 0;
    }
    size_t needed = measureJson(doc);
    if (needed >= size) {
        return 0;
    }
    return serializeJson(doc, buffer, size);
}

bool readOptionalBool(JsonVariantConst value, bool& out) {
    if (value.isNull()) {
        return true;
    }
    if (!value.is<bool>()) {
        return false;
    }
    out = value.as<bool>();
    return true;
}

} // namespace

size_t buildStateJson(const SystemState& state, char* buffer, size_t size) {
    JsonDocument doc;  // ArduinoJson v7

    doc["cycle"] = state.cycle;
    doc["ts"] = state.timestampMs;

    JsonArray tanks = doc["tanks"].to<JsonArray>();
    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        JsonObject tank = tanks.add<JsonObject>();
        tank["id"] = state.tanks[i].tankId;
        setTemperature(tank["temp"], state.tanks[i].temperature);
        tank["ok"] = state.tanks[i].available;
    }
    doc["sensors"] = state.availableSensors;
    setTemperature(doc["average"], state.averageTemperature);

    doc["heating"] = state.heatingActive;
    doc["pump"] = state.pumpActive;
    doc["pump_phase"] = pumpPhaseToString(state.pumpPhase);
    if (state.pumpShutoffPending) {
        doc["pump_deadline"] = state.pumpShutoffDeadlineMs;
    } else {
        doc["pump_deadline"] = nullptr;
    }

    doc["manual_override"] = state.manualOverride;
    doc["system_enabled"] = state.heatingSystemEnabled;
    doc["safety_trip"] = state.safetyTripped;
    doc["failsafe"] = state.failSafe;

    setTemperature(doc["setpoint"], state.setpoint);
    setTemperature(doc["hysteresis"], state.hysteresis);

    return serializeInto(doc, buffer, size);
}

size_t buildEventJson(ControlEventKind kind, const char* description, uint32_t timestampMs,
                      char* buffer, size_t size) {
    JsonDocument doc;
    doc["kind"] = eventKindToString(kind);
    doc["description"] = description ? description : "";
    doc["ts"] = timestampMs;
    return serializeInto(doc, buffer, size);
}

size_t buildParametersJson(const ControlParameters& params, char* buffer, size_t size) {
    JsonDocument doc;
    setTemperature(doc["setpoint"], params.setpoint);
    setTemperature(doc["hysteresis"], params.hysteresis);
    setTemperature(doc["max_temperature"], params.maxTemperature);
    doc["pump_delay"] = params.pumpDelaySeconds;
    doc["update_interval"] = params.updateIntervalSeconds;
    doc["sensor_timeout"] = params.sensorTimeoutSeconds;
    doc["manual_override"] = params.manualOverride;
    doc["manual_heating"] = params.manualHeating;
    doc["manual_pump"] = params.manualPump;
    doc["heating_system_enabled"] = params.heatingSystemEnabled;
    return serializeInto(doc, buffer, size);
}

Result<ManualCommand> parseManualCommand(const char* payload) {
    if (!payload || payload[0] == '\0') {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "empty");
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, payload);
    if (err || !doc.is<JsonObject>()) {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "bad_json");
    }

    ManualCommand command;
    JsonVariantConst overrideFlag = doc["override"];
    if (overrideFlag.isNull()) {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "missing_override");
    }
    if (!overrideFlag.is<bool>()) {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "bad_override");
    }
    command.manualOverride = overrideFlag.as<bool>();

    if (!readOptionalBool(doc["heating"], command.heating)) {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "bad_heating");
    }
    if (!readOptionalBool(doc["pump"], command.pump)) {
        return Result<ManualCommand>(SystemError::INVALID_PARAMETER, "bad_pump");
    }

    JsonVariantConst auth = doc["auth"];
    if (auth.is<const char*>()) {
        command.credential = auth.as<const char*>();
    }

    return Result<ManualCommand>(command);
}

Result<PinChange> parsePinChange(const char* payload) {
    if (!payload || payload[0] == '\0') {
        return Result<PinChange>(SystemError::INVALID_PARAMETER, "empty");
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, payload);
    if (err || !doc.is<JsonObject>()) {
        return Result<PinChange>(SystemError::INVALID_PARAMETER, "bad_json");
    }
    if (!doc["pin"].is<const char*>()) {
        return Result<PinChange>(SystemError::INVALID_PARAMETER, "missing_pin");
    }

    PinChange change;
    change.newPin = doc["pin"].as<const char*>();
    if (doc["auth"].is<const char*>()) {
        change.currentPin = doc["auth"].as<const char*>();
    }
    return Result<PinChange>(change);
}

Result<bool> parseSwitch(const char* payload) {
    if (!payload) {
        return Result<bool>(SystemError::INVALID_PARAMETER, "empty");
    }
    if (strcasecmp(payload, "on") == 0 || strcasecmp(payload, "true") == 0 ||
        strcmp(payload, "1") == 0 || strcasecmp(payload, "enable") == 0) {
        return Result<bool>(true);
    }
    if (strcasecmp(payload, "off") == 0 || strcasecmp(payload, "false") == 0 ||
        strcmp(payload, "0") == 0 || strcasecmp(payload, "disable") == 0) {
        return Result<bool>(false);
    }
    return Result<bool>(SystemError::INVALID_PARAMETER, "expected on/off");
}

} // namespace MQTTPayloads
