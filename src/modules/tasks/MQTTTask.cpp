// src/modules/tasks/MQTTTask.cpp
// MQTT task - handles communication with MQTT broker

#include "MQTTTask.h"

#include <EthernetManager.h>
#include <ETH.h>
#include <SemaphoreGuard.h>
#include <TaskManager.h>
#include <esp_task_wdt.h>
#include <cstring>
#include "core/SystemResourceProvider.h"
#include "events/SystemEvents.h"
#include "modules/mqtt/MQTTCommandHandlers.h"
#include "MQTTTopics.h"
#include "LoggingMacros.h"

static const char* TAG = "MQTT";

// Static member definitions (must match MQTTTask.h)
TaskHandle_t MQTTTask::taskHandle_ = nullptr;
bool MQTTTask::isRunning_ = false;
MQTTManager* MQTTTask::mqttManager_ = nullptr;
SemaphoreHandle_t MQTTTask::mqttMutex_ = nullptr;
QueueHandle_t MQTTTask::publishQueue_ = nullptr;

namespace TaskEvents = SystemEvents::MQTTTask;

// Event group for MQTT task (used by the MQTTManager callback)
static EventGroupHandle_t mqttTaskEventGroup = nullptr;

// Only accessed from MQTTTask::publish(), under mqttMutex_
static uint32_t droppedPublishes = 0;

/**
 * @brief MQTT event callback handler
 */
static void mqttEventCallback(MQTTManager::MQTTEvent event, void* data) {
    if (!mqttTaskEventGroup) return;

    switch (event) {
        case MQTTManager::MQTTEvent::CONNECTED:
            LOG_INFO(TAG, "MQTT connected event received");
            xEventGroupSetBits(mqttTaskEventGroup, TaskEvents::CONNECTED);
            break;

        case MQTTManager::MQTTEvent::DISCONNECTED:
            LOG_WARN(TAG, "MQTT disconnected event received");
            xEventGroupSetBits(mqttTaskEventGroup, TaskEvents::DISCONNECTED);
            break;

        case MQTTManager::MQTTEvent::ERROR:
            if (data) {
                auto* errorData = static_cast<MQTTManager::ErrorEventData*>(data);
                LOG_ERROR(TAG, "MQTT error: %s", errorData->message);
            }
            break;

        default:
            break;
    }
}

void MQTTTask::initializeMQTT() {
    LOG_INFO(TAG, "Initializing MQTT...");

    SemaphoreGuard guard(mqttMutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_LONG_TIMEOUT_MS));
    if (!guard.hasLock()) {
        LOG_ERROR(TAG, "Failed to acquire mutex for MQTT init");
        return;
    }

    if (mqttManager_ == nullptr) {
        mqttManager_ = &MQTTManager::getInstance();
    }

    mqttManager_->registerEventCallback(mqttEventCallback);

    // Configure auto-reconnect with exponential backoff
    MQTTManager::ReconnectConfig reconnectConfig;
    reconnectConfig.minInterval = MIN_RECONNECT_INTERVAL_MS;
    reconnectConfig.maxInterval = MAX_RECONNECT_INTERVAL_MS;
    reconnectConfig.maxAttempts = MAX_RECONNECT_ATTEMPTS;
    reconnectConfig.exponentialBackoff = true;
    mqttManager_->setAutoReconnect(true, reconnectConfig);

    // MQTTConfig stores pointers (not copies), so buffers must persist
    static char mqtt_uri[128];
    snprintf(mqtt_uri, sizeof(mqtt_uri), "mqtt://%s:%d", MQTT_SERVER, MQTT_PORT);

    static char client_id[64];
    snprintf(client_id, sizeof(client_id), "%s-%s", MQTT_BASE_PREFIX, DEVICE_HOSTNAME);

    LOG_INFO(TAG, "MQTT URI: %s", mqtt_uri);
    LOG_INFO(TAG, "Client ID: %s", client_id);

    auto config = MQTTConfig(mqtt_uri)
        .withClientId(client_id)
        .withCredentials(MQTT_USERNAME, MQTT_PASSWORD)
        .withLastWill(MQTT_STATUS_ONLINE, "{\"online\":false}", 0, true)
        .withAutoReconnect(true);

    auto result = mqttManager_->begin(config);
    if (!result.isOk()) {
        LOG_ERROR(TAG, "MQTT initialization failed");
        mqttManager_ = nullptr;
        return;
    }

    LOG_INFO(TAG, "MQTT initialized");
}

void MQTTTask::setupSubscriptions() {
    if (!mqttManager_ || !mqttManager_->isConnected()) {
        LOG_ERROR(TAG, "Cannot setup subscriptions - MQTT not connected");
        return;
    }

    static const char* const topics[] = {
        MQTT_CMD_MANUAL,
        MQTT_CMD_SYSTEM,
        MQTT_CMD_STATUS,
        MQTT_CONFIG_WILDCARD
    };

    uint8_t failed = 0;
    for (const char* topic : topics) {
        auto result = mqttManager_->subscribe(topic,
            [](const String& msgTopic, const String& payload) {
                MQTTCommandHandlers::routeCommand(msgTopic.c_str(), payload.c_str());
            }, 1);
        if (!result.isOk()) {
            LOG_ERROR(TAG, "Subscribe failed: %s", topic);
            failed++;
        } else {
            LOG_DEBUG(TAG, "Subscribed: %s", topic);
        }
    }

    if (failed > 0) {
        LOG_WARN(TAG, "%u subscriptions failed - retried on next reconnect", failed);
    }
}

void MQTTTask::publishOnlineStatus() {
    auto ipStr = ETH.localIP().toString();
    publish(MQTT_STATUS_ONLINE, "{\"online\":true}", 0, true);
    publish(MQTT_STATUS_DEVICE_IP, ipStr.c_str(), 0, true);
    publish(MQTT_STATUS_DEVICE_FIRMWARE, FIRMWARE_VERSION, 0, true);
}

void MQTTTask::processPublishQueue() {
    if (!mqttManager_ || !publishQueue_) {
        return;
    }

    MQTTPublishRequest request;
    int processed = 0;
    while (processed < MAX_PUBLISH_PER_ITERATION && xQueueReceive(publishQueue_, &request, 0) == pdTRUE) {
        auto result = mqttManager_->publish(request.topic, request.payload, request.qos, request.retain);
        if (!result.isOk()) {
            LOG_WARN(TAG, "Failed to publish to %s", request.topic);
            if (!mqttManager_->isConnected()) {
                // Message is lost, state is republished next cycle anyway
                SRP::clearSystemStateEventBits(SystemEvents::SystemState::MQTT_OPERATIONAL);
                break;
            }
        } else {
            LOG_DEBUG(TAG, "Published to %s", request.topic);
        }
        processed++;
    }

    if (uxQueueMessagesWaiting(publishQueue_) > 0) {
        xEventGroupSetBits(mqttTaskEventGroup, TaskEvents::PUBLISH_PENDING);
    }
}

void MQTTTask::cleanup() {
    if (mqttManager_ != nullptr) {
        mqttManager_->disconnect();
    }
    SRP::clearSystemStateEventBits(SystemEvents::SystemState::MQTT_OPERATIONAL);
    if (mqttTaskEventGroup) {
        vEventGroupDelete(mqttTaskEventGroup);
        mqttTaskEventGroup = nullptr;
    }
    taskHandle_ = nullptr;
}

// Main task function
void MQTTTask::taskFunction(void* parameter) {
    (void)parameter;

    LOG_INFO(TAG, "MQTTTask started on core %d", xPortGetCoreID());

    // Wait for network connection
    LOG_INFO(TAG, "Waiting for network connection...");
    while (!EthernetManager::isConnected()) {
        if (!isRunning_) {
            cleanup();
            vTaskDelete(NULL);
            return;
        }
        vTaskDelay(pdMS_TO_TICKS(1000));
    }
    SRP::setSystemStateEventBits(SystemEvents::SystemState::NETWORK_READY);
    LOG_INFO(TAG, "Network up, initializing MQTT...");

    initializeMQTT();
    if (mqttManager_ == nullptr) {
        LOG_ERROR(TAG, "MQTT initialization failed - task exiting");
        isRunning_ = false;
        cleanup();
        vTaskDelete(NULL);
        return;
    }

    auto connectResult = mqttManager_->connect();
    if (!connectResult.isOk()) {
        LOG_ERROR(TAG, "Initial MQTT connection failed - auto-reconnect active");
    }

    // Register with watchdog after initialization
    TaskManager::WatchdogConfig wdtConfig = TaskManager::WatchdogConfig::enabled(
        false,  // not critical (won't reset system)
        SystemConstants::System::WDT_MQTT_TASK_MS
    );
    if (!SRP::getTaskManager().registerCurrentTaskWithWatchdog("MQTTTask", wdtConfig)) {
        LOG_ERROR(TAG, "WDT reg failed");
    } else {
        (void)SRP::getTaskManager().feedWatchdog();
    }

    while (isRunning_) {
        EventBits_t events = xEventGroupWaitBits(
            mqttTaskEventGroup,
            TaskEvents::ALL,
            pdTRUE,   // Clear bits on exit
            pdFALSE,  // Wait for any bit
            pdMS_TO_TICKS(SystemConstants::Tasks::MQTT::EVENT_WAIT_MS)
        );

        if (events & TaskEvents::STOP) {
            break;
        }

        if (events & TaskEvents::CONNECTED) {
            SRP::setSystemStateEventBits(SystemEvents::SystemState::MQTT_OPERATIONAL);
            // Always re-subscribe on connect (subscriptions may be lost after reconnect)
            setupSubscriptions();
            publishOnlineStatus();
            MQTTCommandHandlers::publishParameters();
        }

        if (events & TaskEvents::DISCONNECTED) {
            SRP::clearSystemStateEventBits(SystemEvents::SystemState::MQTT_OPERATIONAL);
        }

        if (mqttManager_->isConnected()) {
            // Incoming messages run the command handlers in this task
            mqttManager_->processMessages(5, 0);
            processPublishQueue();
        }

        (void)SRP::getTaskManager().feedWatchdog();
    }

    LOG_INFO(TAG, "MQTTTask stopping");
    (void)esp_task_wdt_delete(NULL);
    cleanup();
    vTaskDelete(NULL);
}

// Public interface implementations
bool MQTTTask::init() {
    if (mqttMutex_ != nullptr) {
        return true; // Already initialized
    }

    mqttMutex_ = xSemaphoreCreateMutex();
    if (mqttMutex_ == nullptr) {
        LOG_ERROR(TAG, "Failed to create mutex");
        return false;
    }

    publishQueue_ = xQueueCreate(PUBLISH_QUEUE_SIZE, sizeof(MQTTPublishRequest));
    if (publishQueue_ == nullptr) {
        LOG_ERROR(TAG, "Failed to create publish queue");
        vSemaphoreDelete(mqttMutex_);
        mqttMutex_ = nullptr;
        return false;
    }

    return true;
}

bool MQTTTask::start() {
    if (!init()) {
        return false;
    }

    if (isRunning_) {
        return true;
    }

    mqttTaskEventGroup = xEventGroupCreate();
    if (!mqttTaskEventGroup) {
        LOG_ERROR(TAG, "Failed to create event group");
        return false;
    }

    isRunning_ = true;

    // Task registers its own watchdog once MQTT is initialized
    TaskManager::WatchdogConfig wdtConfig = TaskManager::WatchdogConfig::disabled();
    bool result = SRP::getTaskManager().startTaskPinned(
        taskFunction,
        "MQTTTask",
        STACK_SIZE_MQTT_TASK,
        nullptr,
        PRIORITY_MQTT_TASK,
        CORE_MQTT_TASK,
        wdtConfig
    );

    if (!result) {
        LOG_ERROR(TAG, "Failed to create task");
        isRunning_ = false;
        vEventGroupDelete(mqttTaskEventGroup);
        mqttTaskEventGroup = nullptr;
        return false;
    }

    taskHandle_ = SRP::getTaskManager().getTaskHandleByName("MQTTTask");
    return true;
}

void MQTTTask::stop() {
    if (!isRunning_) {
        return;
    }
    isRunning_ = false;
    if (mqttTaskEventGroup) {
        xEventGroupSetBits(mqttTaskEventGroup, TaskEvents::STOP);
    }
}

bool MQTTTask::isRunning() {
    return isRunning_;
}

bool MQTTTask::isConnected() {
    return mqttManager_ != nullptr && mqttManager_->isConnected();
}

bool MQTTTask::publish(const char* topic, const char* payload, int qos, bool retain) {
    if (!isRunning_ || !publishQueue_ || !topic || !payload) {
        return false;
    }

    MQTTPublishRequest request;
    strncpy(request.topic, topic, sizeof(request.topic) - 1);
    request.topic[sizeof(request.topic) - 1] = '\0';
    strncpy(request.payload, payload, sizeof(request.payload) - 1);
    request.payload[sizeof(request.payload) - 1] = '\0';
    request.qos = static_cast<uint8_t>(qos);
    request.retain = retain;
    request.timestamp = xTaskGetTickCount();

    SemaphoreGuard guard(mqttMutex_, pdMS_TO_TICKS(SystemConstants::Timing::MUTEX_SHORT_TIMEOUT_MS));
    if (!guard.hasLock()) {
        return false;
    }

    if (xQueueSend(publishQueue_, &request, 0) != pdTRUE) {
        // Queue full: drop the oldest request to make room
        MQTTPublishRequest oldest;
        (void)xQueueReceive(publishQueue_, &oldest, 0);
        droppedPublishes++;
        if (droppedPublishes == 1 || (droppedPublishes % 50) == 0) {
            LOG_WARN(TAG, "Publish queue full - dropped %lu messages so far",
                     static_cast<unsigned long>(droppedPublishes));
        }
        if (xQueueSend(publishQueue_, &request, 0) != pdTRUE) {
            return false;
        }
    }

    if (mqttTaskEventGroup) {
        xEventGroupSetBits(mqttTaskEventGroup, TaskEvents::PUBLISH_PENDING);
    }
    return true;
}
