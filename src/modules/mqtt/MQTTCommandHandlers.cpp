// src/modules/mqtt/MQTTCommandHandlers.cpp
/**
 * @file MQTTCommandHandlers.cpp
 * @brief MQTT command handler implementations
 */

#include "MQTTCommandHandlers.h"

#include <cstring>
#include <string>
#include "config/NvsConfigStore.h"
#include "core/SystemResourceProvider.h"
#include "modules/mqtt/MQTTPayloads.h"
#include "modules/tasks/MQTTTask.h"
#include "utils/ErrorHandler.h"
#include "MQTTTopics.h"
#include "LoggingMacros.h"

static const char* TAG_CMD = "MQTTCmd";

namespace {

    constexpr const char* KEY_MANUAL_PIN = "manual_pin";

    void reply(const char* topic, const Result<void>& result) {
        if (result.isSuccess()) {
            MQTTTask::publish(topic, "ok");
            return;
        }
        std::string response = "error:";
        response += result.message().empty() ? ErrorHandler::errorToString(result.error())
                                             : result.message();
        MQTTTask::publish(topic, response.c_str());
    }

    void replyError(const char* topic, const std::string& reason) {
        std::string response = "error:" + reason;
        MQTTTask::publish(topic, response.c_str());
    }

    void handlePinChange(const char* payload) {
        auto parsed = MQTTPayloads::parsePinChange(payload);
        if (parsed.isError()) {
            LOG_WARN(TAG_CMD, "Invalid PIN change request: %s", parsed.message().c_str());
            replyError(MQTT_STATUS_CONFIG, parsed.message());
            return;
        }

        const auto& change = parsed.value();
        auto result = SRP::getConfigStore().changePin(change.currentPin.c_str(), change.newPin.c_str());
        reply(MQTT_STATUS_CONFIG, result);
    }
}

namespace MQTTCommandHandlers {

void handleManualCommand(const char* payload) {
    auto parsed = MQTTPayloads::parseManualCommand(payload);
    if (parsed.isError()) {
        LOG_WARN(TAG_CMD, "Invalid manual command: %s", parsed.message().c_str());
        replyError(MQTT_STATUS_MANUAL, parsed.message());
        return;
    }

    const auto& cmd = parsed.value();
    auto result = SRP::getConfigStore().applyManual(cmd.manualOverride, cmd.heating, cmd.pump,
                                                    cmd.credential.c_str());
    reply(MQTT_STATUS_MANUAL, result);

    if (result.isSuccess()) {
        if (cmd.manualOverride) {
            LOG_WARN(TAG_CMD, "Manual override ACTIVE - hysteresis and pump delay bypassed");
        }
        publishParameters();
    }
}

void handleSystemCommand(const char* payload) {
    auto parsed = MQTTPayloads::parseSwitch(payload);
    if (parsed.isError()) {
        LOG_WARN(TAG_CMD, "Invalid system command: %s", payload ? payload : "(null)");
        replyError(MQTT_STATUS_SYSTEM, parsed.message());
        return;
    }

    const bool enable = parsed.value();
    auto result = SRP::getConfigStore().setParameter("heating_system_enabled", enable ? "on" : "off");
    if (result.isError()) {
        ErrorHandler::logError(TAG_CMD, result.error(), result.message().c_str());
        reply(MQTT_STATUS_SYSTEM, result);
        return;
    }

    LOG_INFO(TAG_CMD, "Heating system %s via MQTT", enable ? "enabled" : "disabled");
    MQTTTask::publish(MQTT_STATUS_SYSTEM, enable ? "on" : "off", 0, true);
    publishParameters();
}

void handleStatusCommand() {
    publishParameters();
}

void handleConfigCommand(const char* key, const char* payload) {
    if (!key || key[0] == '\0') {
        replyError(MQTT_STATUS_CONFIG, "missing key");
        return;
    }

    if (strcmp(key, KEY_MANUAL_PIN) == 0) {
        handlePinChange(payload);
        return;
    }

    auto result = SRP::getConfigStore().setParameter(key, payload);
    if (result.isError()) {
        LOG_WARN(TAG_CMD, "Config %s=%s rejected: %s", key, payload ? payload : "(null)",
                 result.message().c_str());
    } else {
        LOG_INFO(TAG_CMD, "Config %s=%s applied", key, payload);
    }
    reply(MQTT_STATUS_CONFIG, result);

    if (result.isSuccess()) {
        publishParameters();
    }
}

void routeCommand(const char* topic, const char* payload) {
    if (!topic) {
        return;
    }

    LOG_DEBUG(TAG_CMD, "Command on %s", topic);

    static const size_t configPrefixLen = strlen(MQTT_CONFIG_PREFIX "/");

    if (strcmp(topic, MQTT_CMD_MANUAL) == 0) {
        handleManualCommand(payload);
    } else if (strcmp(topic, MQTT_CMD_SYSTEM) == 0) {
        handleSystemCommand(payload);
    } else if (strcmp(topic, MQTT_CMD_STATUS) == 0) {
        handleStatusCommand();
    } else if (strncmp(topic, MQTT_CONFIG_PREFIX "/", configPrefixLen) == 0) {
        handleConfigCommand(topic + configPrefixLen, payload);
    } else {
        LOG_WARN(TAG_CMD, "Unknown command topic: %s", topic);
    }
}

void publishParameters() {
    char buffer[384];
    auto params = SRP::getConfigStore().snapshot();
    if (params.isError()) {
        LOG_WARN(TAG_CMD, "Parameters not published: %s", params.message().c_str());
        return;
    }
    size_t written = MQTTPayloads::buildParametersJson(params.value(), buffer, sizeof(buffer));
    if (written == 0) {
        LOG_ERROR(TAG_CMD, "Parameter JSON serialization failed or truncated");
        return;
    }
    MQTTTask::publish(MQTT_STATUS_PARAMETERS, buffer, 0, true);
}

} // namespace MQTTCommandHandlers
