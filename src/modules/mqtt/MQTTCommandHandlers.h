// src/modules/mqtt/MQTTCommandHandlers.h
#pragma once

/**
 * @file MQTTCommandHandlers.h
 * @brief MQTT command handler declarations
 *
 * Commands arrive on tankctl/cmd/{command} and tankctl/config/{key}. Every
 * change goes through the config store, the control loop picks it up with
 * its next snapshot. Replies are "ok" or "error:<reason>".
 */

namespace MQTTCommandHandlers {

/**
 * @brief Handle manual override request (JSON, PIN protected)
 * @param payload {"override":bool,"heating":bool,"pump":bool,"auth":"PIN"}
 */
void handleManualCommand(const char* payload);

/**
 * @brief Handle heating system master switch
 * @param payload "on"/"off" (also true/false, 1/0, enable/disable)
 */
void handleSystemCommand(const char* payload);

/**
 * @brief Publish the current parameter snapshot
 */
void handleStatusCommand();

/**
 * @brief Update one parameter
 * @param key Last topic level (setpoint, hysteresis, max_temperature, ...)
 * @param payload Value as text
 */
void handleConfigCommand(const char* key, const char* payload);

/**
 * @brief Main command router - dispatches to specific handlers
 * @param topic Full topic path (e.g., "tankctl/cmd/manual")
 * @param payload Command payload
 */
void routeCommand(const char* topic, const char* payload);

/**
 * @brief Publish current parameters to tankctl/status/parameters (retained)
 */
void publishParameters();

} // namespace MQTTCommandHandlers
