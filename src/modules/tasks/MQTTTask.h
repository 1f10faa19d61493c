// src/modules/tasks/MQTTTask.h
#pragma once

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <freertos/queue.h>
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "MQTTManager.h"

/**
 * Structure for MQTT publish requests
 */
struct MQTTPublishRequest {
    char topic[64];      // Topic path
    char payload[512];   // Fits the per-cycle state JSON
    uint8_t qos;
    bool retain;
    TickType_t timestamp;
};

/**
 * @brief MQTT communication task for the tank controller
 *
 * Manages the broker connection, subscriptions and a bounded publish queue.
 * publish() may be called from any task. It never blocks: when the queue
 * is full the oldest request is dropped.
 */
class MQTTTask {
public:
    /**
     * Initialize the MQTT task
     * @return true if initialization successful, false otherwise
     */
    static bool init();

    /**
     * Start the MQTT task
     * @return true if task started successfully, false otherwise
     */
    static bool start();

    /**
     * Ask the task to disconnect and exit
     */
    static void stop();

    static bool isRunning();

    /**
     * Check if MQTT is connected
     */
    static bool isConnected();

    /**
     * Queue a message for publishing (thread-safe, non-blocking)
     * @return false if not running or the arguments are invalid
     */
    static bool publish(const char* topic, const char* payload, int qos = 0, bool retain = false);

private:
    MQTTTask() = delete;  // Prevent instantiation

    static void taskFunction(void* parameter);

    static void initializeMQTT();
    static void setupSubscriptions();
    static void processPublishQueue();
    static void publishOnlineStatus();
    static void cleanup();

    static TaskHandle_t taskHandle_;
    static bool isRunning_;
    static MQTTManager* mqttManager_;
    static SemaphoreHandle_t mqttMutex_;
    static QueueHandle_t publishQueue_;

    static constexpr uint32_t MIN_RECONNECT_INTERVAL_MS = SystemConstants::Tasks::MQTT::MIN_RECONNECT_INTERVAL_MS;
    static constexpr uint32_t MAX_RECONNECT_INTERVAL_MS = SystemConstants::Tasks::MQTT::MAX_RECONNECT_INTERVAL_MS;
    static constexpr uint8_t MAX_RECONNECT_ATTEMPTS = SystemConstants::Tasks::MQTT::MAX_RECONNECT_ATTEMPTS;
    static constexpr size_t PUBLISH_QUEUE_SIZE = SystemConstants::Tasks::MQTT::PUBLISH_QUEUE_SIZE;
    static constexpr int MAX_PUBLISH_PER_ITERATION = 4;
};
