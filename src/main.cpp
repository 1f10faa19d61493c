// src/main.cpp - Tank heating controller entry point
#include <Arduino.h>
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "config/NvsConfigStore.h"
#include "init/SystemInitializer.h"
#include "utils/ErrorHandler.h"
#include <TaskManager.h>
#include <Watchdog.h>
#include "LoggingMacros.h"
#ifndef LOG_NO_CUSTOM_LOGGER
#include <Logger.h>
#include <LogInterfaceImpl.cpp>  // Include implementation once
#endif
#include <MB8ART.h>
#include <RYN4.h>
#include <esp32ModbusRTU.h>
#include <RuntimeStorage.h>
#include "core/SystemResourceProvider.h"
#include "events/SystemEvents.h"
#include <esp_log.h>
#include <nvs_flash.h>

static const char* TAG = "Main";

// Override weak function to reduce loopTask stack size
size_t getArduinoLoopTaskStackSize() {
    return STACK_SIZE_LOOP_TASK;
}

SystemInitializer* gSystemInitializer = nullptr;

// Global task manager with Watchdog singleton injection
TaskManager taskManager(&Watchdog::getInstance());

// Modbus master instance
esp32ModbusRTU modbusMaster(&Serial1);

// Modbus devices, created by SystemInitializer
MB8ART* gMB8ART = nullptr;
RYN4* gRYN4 = nullptr;

// Runtime storage (FRAM), null if the chip did not answer
rtstorage::RuntimeStorage* gRuntimeStorage = nullptr;

// Parameters, manual override and operator PIN (NVS)
NvsConfigStore gConfigStore;

EventGroupHandle_t xSystemStateEventGroup = nullptr;

void configureLibraryLogging();
void updateStatusLed();
void reportMemory();

static void haltWithBlink() {
    while (true) {
        digitalWrite(LED_BUILTIN, !digitalRead(LED_BUILTIN));
        delay(SystemConstants::Timing::FAILSAFE_LED_BLINK_MS);
    }
}

void setup() {
    // Phase 1: Critical early initialization
    Serial.setTxBufferSize(8192);
    Serial.begin(SERIAL_BAUD_RATE);
    delay(100);

    // NVS holds the control parameters, erase and retry if the layout changed
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        ret = nvs_flash_init();
    }
    if (ret != ESP_OK) {
        // LOG_* not available yet
        Serial.printf("CRITICAL: NVS init failed (error: 0x%x)!\n", ret);
        Serial.println("Running with compile-time defaults - parameters NOT persisted!");
    }

    #ifndef LOG_NO_CUSTOM_LOGGER
    Logger& logger = Logger::getInstance();
    logger.init(1024);

    #ifdef LOG_MODE_RELEASE
        logger.setLogLevel(ESP_LOG_WARN);
    #else
        logger.setLogLevel(ESP_LOG_INFO);
    #endif

    // Unlimited during startup for complete boot logs
    logger.setMaxLogsPerSecond(0);
    logger.enableESPLogRedirection();
    configureLibraryLogging();
    #else
    esp_log_level_set("*", ESP_LOG_INFO);
    #endif

    pinMode(LED_BUILTIN, OUTPUT);
    digitalWrite(LED_BUILTIN, LOW);

    // Phase 2: Shared resources
    xSystemStateEventGroup = xEventGroupCreate();
    if (!xSystemStateEventGroup) {
        Serial.println("FATAL: Failed to create system state event group!");
        haltWithBlink();
    }

    LOG_INFO(TAG, "==== %s ====", PROJECT_NAME);
    LOG_INFO(TAG, "Firmware v%s", FIRMWARE_VERSION);

    // Phase 3: Staged initialization
    gSystemInitializer = new SystemInitializer();
    auto result = gSystemInitializer->initializeSystem();

    if (result.isError()) {
        Serial.printf("FATAL: System initialization failed at stage %d: %s\n",
                      static_cast<int>(gSystemInitializer->getCurrentStage()),
                      ErrorHandler::errorToString(result.error()));
        ErrorHandler::logError(TAG, result.error(), result.message().c_str());
        gSystemInitializer->cleanup();
        haltWithBlink();
    }

    digitalWrite(LED_BUILTIN, HIGH);

    #ifndef LOG_NO_CUSTOM_LOGGER
    vTaskDelay(pdMS_TO_TICKS(100));
    Logger::getInstance().setMaxLogsPerSecond(200);
    #endif
}

void loop() {
    reportMemory();
    updateStatusLed();
    delay(10);
}

void reportMemory() {
    if (!gSystemInitializer || !gSystemInitializer->isFullyInitialized()) {
        return;
    }

    static uint32_t lastMemoryReport = 0;
    static uint32_t lastLowMemoryWarning = 0;
    uint32_t now = millis();
    size_t freeHeap = ESP.getFreeHeap();

    if (now - lastMemoryReport > SystemConstants::System::MEMORY_REPORT_INTERVAL_MS) {
        lastMemoryReport = now;
        if (freeHeap < SystemConstants::System::MIN_FREE_HEAP_WARNING) {
            LOG_WARN(TAG, "LOW MEMORY WARNING: Free: %u, Min: %u bytes",
                     static_cast<unsigned>(freeHeap), static_cast<unsigned>(ESP.getMinFreeHeap()));
        } else {
            LOG_DEBUG(TAG, "Memory status: Free: %u, Min: %u bytes",
                      static_cast<unsigned>(freeHeap), static_cast<unsigned>(ESP.getMinFreeHeap()));
        }
    }

    if (freeHeap < SystemConstants::System::MIN_FREE_HEAP_CRITICAL &&
        now - lastLowMemoryWarning > 10000) {
        lastLowMemoryWarning = now;
        LOG_WARN(TAG, "LOW MEMORY WARNING: Free: %u bytes", static_cast<unsigned>(freeHeap));
    }
}

/**
 * @brief Heartbeat LED: slow when healthy, fast while fail-safe or tripped
 */
void updateStatusLed() {
    if (!gSystemInitializer || !gSystemInitializer->isFullyInitialized()) {
        return;
    }

    static uint32_t lastLedToggle = 0;
    static bool ledState = true;
    uint32_t now = millis();

    const EventBits_t alarmBits = SystemEvents::SystemState::FAILSAFE_ACTIVE |
                                  SystemEvents::SystemState::SAFETY_TRIPPED;
    const uint32_t period = (SRP::getSystemStateEventBits() & alarmBits)
        ? SystemConstants::Timing::FAILSAFE_LED_BLINK_MS
        : SystemConstants::System::LED_HEARTBEAT_MS;

    if (now - lastLedToggle > period) {
        lastLedToggle = now;
        ledState = !ledState;
        digitalWrite(LED_BUILTIN, ledState);
    }
}

void configureLibraryLogging() {
    #ifndef LOG_NO_CUSTOM_LOGGER
    Logger& logger = Logger::getInstance();

    // ========== Control loop ==========
    logger.setTagLevel("TankCtrl", ESP_LOG_INFO);
    logger.setTagLevel("TankCtrlTask", ESP_LOG_INFO);
    logger.setTagLevel("NvsConfig", ESP_LOG_INFO);
    logger.setTagLevel("SystemInit", ESP_LOG_INFO);
    logger.setTagLevel(TAG, ESP_LOG_INFO);

    // ========== Hardware Devices ==========
    #ifdef MB8ART_DEBUG
        logger.setTagLevel("MB8ART", ESP_LOG_DEBUG);
        logger.setTagLevel("MB8ARTGw", ESP_LOG_DEBUG);
    #else
        logger.setTagLevel("MB8ART", ESP_LOG_WARN);
    #endif

    #ifdef RYN4_DEBUG
        logger.setTagLevel("RYN4", ESP_LOG_DEBUG);
        logger.setTagLevel("RYN4Gw", ESP_LOG_DEBUG);
    #else
        logger.setTagLevel("RYN4", ESP_LOG_WARN);
    #endif

    #ifdef MODBUSDEVICE_DEBUG
        logger.setTagLevel("ModbusD", ESP_LOG_DEBUG);
        logger.setTagLevel("ModbusDevice", ESP_LOG_DEBUG);
    #else
        logger.setTagLevel("ModbusD", ESP_LOG_WARN);
        logger.setTagLevel("ModbusDevice", ESP_LOG_WARN);
    #endif

    logger.setTagLevel("ModbusRTU", ESP_LOG_WARN);

    // ========== Network Components ==========
    #ifdef ETH_DEBUG
        logger.setTagLevel("ETH", ESP_LOG_DEBUG);
        logger.setTagLevel("EthernetManager", ESP_LOG_DEBUG);
    #else
        logger.setTagLevel("ETH", ESP_LOG_WARN);
        logger.setTagLevel("EthernetManager", ESP_LOG_WARN);
    #endif

    logger.setTagLevel("MQTTManager", ESP_LOG_WARN);
    logger.setTagLevel("MQTT", ESP_LOG_INFO);

    // ========== Utility Libraries ==========
    #ifdef TASK_MANAGER_DEBUG
        logger.setTagLevel("TaskManager", ESP_LOG_DEBUG);
    #else
        logger.setTagLevel("TaskManager", ESP_LOG_ERROR);
    #endif

    logger.setTagLevel("SemaphoreGuard", ESP_LOG_ERROR);
    logger.setTagLevel("Watchdog", ESP_LOG_ERROR);
    #endif // LOG_NO_CUSTOM_LOGGER
}
