// src/modules/mqtt/MQTTPayloads.h
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "config/ControlParameters.h"
#include "shared/TankControlTypes.h"
#include "utils/ErrorHandler.h"

/**
 * @file MQTTPayloads.h
 * @brief JSON payloads exchanged on the tankctl MQTT topics
 *
 * Pure ArduinoJson code with no MQTT or FreeRTOS dependency, shared by the
 * event sink and the command handlers. Temperatures go out in °C with one
 * decimal, unavailable values as null.
 *
 * The build* functions return the number of bytes written, or 0 if the
 * document did not fit into the buffer.
 */
namespace MQTTPayloads {

/**
 * @brief Manual override request as received on tankctl/cmd/manual
 *
 * {"override":true,"heating":true,"pump":false,"auth":"1234"}
 * "override" is required, "heating" and "pump" default to false.
 */
struct ManualCommand {
    bool manualOverride = false;
    bool heating = false;
    bool pump = false;
    std::string credential;
};

size_t buildStateJson(const SystemState& state, char* buffer, size_t size);

size_t buildEventJson(ControlEventKind kind, const char* description, uint32_t timestampMs,
                      char* buffer, size_t size);

size_t buildParametersJson(const ControlParameters& params, char* buffer, size_t size);

/**
 * @brief Parse a manual override request
 * @return INVALID_PARAMETER with a short reason ("bad_json", "missing_override", ...)
 */
Result<ManualCommand> parseManualCommand(const char* payload);

/**
 * @brief Override PIN change as received on tankctl/config/manual_pin
 *
 * {"auth":"<current PIN>","pin":"<new PIN>"}, "auth" may be omitted while
 * no PIN is set yet.
 */
struct PinChange {
    std::string currentPin;
    std::string newPin;
};

Result<PinChange> parsePinChange(const char* payload);

/**
 * @brief Parse on/off style payloads (on, off, true, false, 1, 0, enable, disable)
 */
Result<bool> parseSwitch(const char* payload);

} // namespace MQTTPayloads
