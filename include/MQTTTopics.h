// include/MQTTTopics.h
// Centralized MQTT topic definitions for consistent naming
#ifndef MQTT_TOPICS_H
#define MQTT_TOPICS_H

// Base topic prefix - all topics start with this
#define MQTT_BASE_PREFIX "tankctl"

// Status topics (published by device)
#define MQTT_STATUS_PREFIX              MQTT_BASE_PREFIX "/status"
#define MQTT_STATUS_ONLINE              MQTT_STATUS_PREFIX "/online"
#define MQTT_STATUS_DEVICE_IP           MQTT_STATUS_PREFIX "/device/ip"
#define MQTT_STATUS_DEVICE_FIRMWARE     MQTT_STATUS_PREFIX "/device/firmware"
#define MQTT_STATUS_STATE               MQTT_STATUS_PREFIX "/state"       // SystemState every cycle
#define MQTT_STATUS_EVENT               MQTT_STATUS_PREFIX "/event"       // discrete control events
#define MQTT_STATUS_PARAMETERS          MQTT_STATUS_PREFIX "/parameters"  // reply to cmd/status
#define MQTT_STATUS_MANUAL              MQTT_STATUS_PREFIX "/manual"      // ok / error:<reason>
#define MQTT_STATUS_CONFIG              MQTT_STATUS_PREFIX "/config"      // ok / error:<reason>
#define MQTT_STATUS_SYSTEM              MQTT_STATUS_PREFIX "/system"

// Command topics (subscribed by device)
#define MQTT_CMD_PREFIX                 MQTT_BASE_PREFIX "/cmd"
#define MQTT_CMD_MANUAL                 MQTT_CMD_PREFIX "/manual"
#define MQTT_CMD_SYSTEM                 MQTT_CMD_PREFIX "/system"
#define MQTT_CMD_STATUS                 MQTT_CMD_PREFIX "/status"

// Parameter updates: tankctl/config/<key>
#define MQTT_CONFIG_PREFIX              MQTT_BASE_PREFIX "/config"
#define MQTT_CONFIG_WILDCARD            MQTT_CONFIG_PREFIX "/+"

#endif // MQTT_TOPICS_H
