// src/init/SystemInitializer.cpp
#include "SystemInitializer.h"
#include "HardwareInitializer.h"

#include <Arduino.h>
#include <TaskManager.h>
#include <Watchdog.h>
#include <EthernetManager.h>
#include <MB8ART.h>
#include <RYN4.h>
#include <RuntimeStorage.h>

#include "LoggingMacros.h"
#include "config/NvsConfigStore.h"
#include "config/ProjectConfig.h"
#include "core/SystemResourceProvider.h"
#include "events/EventSinkFanout.h"
#include "events/SystemEvents.h"
#include "hal/MB8ARTTankSensorGateway.h"
#include "hal/RYN4ActuatorGateway.h"
#include "modules/control/TankControlCore.h"
#include "modules/mqtt/MQTTEventSink.h"
#include "modules/storage/FramEventSink.h"
#include "modules/tasks/MQTTTask.h"
#include "modules/tasks/TankControlTask.h"


static const char* TAG = "SystemInit";

// Device pointers live in main.cpp so SRP can hand them out
extern MB8ART* gMB8ART;
extern RYN4* gRYN4;
extern rtstorage::RuntimeStorage* gRuntimeStorage;

namespace {
constexpr uint32_t INITIAL_RETRIES = 2;
constexpr uint32_t RETRY_DELAY_MS = 250;
constexpr uint32_t RS485_BUS_SETTLE_MS = 20;
constexpr uint32_t WATCHDOG_TIMEOUT_S = 30;
constexpr uint32_t TASK_STOP_WAIT_MS = 5000;
}

SystemInitializer::SystemInitializer()
    : currentStage_(InitStage::NONE) {
}

SystemInitializer::~SystemInitializer() {
    if (currentStage_ != InitStage::NONE) {
        cleanup();
    }
}

Result<void> SystemInitializer::initializeSystem() {
    LOG_INFO(TAG, "Starting system initialization...");

    if (!SRP::getTaskManager().initWatchdog(WATCHDOG_TIMEOUT_S, true)) {
        LOG_ERROR(TAG, "Failed to initialize TaskManager watchdog");
        return Result<void>(SystemError::NOT_INITIALIZED, "Failed to initialize TaskManager watchdog");
    }
    if (!Watchdog::quickInit(WATCHDOG_TIMEOUT_S, true)) {
        // Not fatal, the IDF watchdog may already be running
        LOG_WARN(TAG, "ESP-IDF Task Watchdog already initialized");
    }

    auto result = HardwareInitializer::initialize();
    if (result.isError()) {
        cleanup();
        return result;
    }
    currentStage_ = InitStage::HARDWARE;

    result = initializeModbusDevices();
    if (result.isError()) {
        cleanup();
        return result;
    }
    currentStage_ = InitStage::MODBUS_DEVICES;

    result = initializeNetwork();
    if (result.isError()) {
        // MQTT will be unavailable, control keeps running
        ErrorHandler::logError(TAG, result.error(), "Network unavailable - running offline");
    }
    currentStage_ = InitStage::NETWORK;

    result = initializeConfig();
    if (result.isError()) {
        cleanup();
        return result;
    }
    currentStage_ = InitStage::CONFIG;

    result = initializeControl();
    if (result.isError()) {
        cleanup();
        return result;
    }
    currentStage_ = InitStage::CONTROL;

    result = initializeTasks();
    if (result.isError()) {
        cleanup();
        return result;
    }
    currentStage_ = InitStage::TASKS;

    currentStage_ = InitStage::COMPLETE;
    LOG_INFO(TAG, "System initialization complete!");
    LOG_INFO(TAG, "Free heap: %d bytes", ESP.getFreeHeap());
    return Result<void>();
}

Result<void> SystemInitializer::initializeModbusDevices() {
    LOG_INFO(TAG, "Initializing Modbus devices...");

    // Watchdog off while the devices answer their first (slow) requests
    SRP::getModbusMaster().setWatchdogEnabled(false);

    bool mb8artOk = initializeMB8ART();

    vTaskDelay(pdMS_TO_TICKS(RS485_BUS_SETTLE_MS));

    bool ryn4Ok = initializeRYN4();

    SRP::getModbusMaster().setWatchdogEnabled(true);

    if (!ryn4Ok) {
        // Without the relay module nothing can be switched, not even off
        return Result<void>(SystemError::DEVICE_NOT_INITIALIZED, "RYN4 relay module not available");
    }

    if (!mb8artOk) {
        // The control loop treats missing probes as fail-safe, keep going
        LOG_WARN(TAG, "MB8ART not available - control loop will start in fail-safe");
    }

    LOG_INFO(TAG, "Modbus devices - MB8ART: %s, RYN4: %s",
             mb8artOk ? "OK" : "FAILED", ryn4Ok ? "OK" : "FAILED");
    return Result<void>();
}

bool SystemInitializer::initializeMB8ART() {
    gMB8ART = new MB8ART(MB8ART_ADDRESS, "MB8ART1");

    for (uint32_t attempt = 1; attempt <= INITIAL_RETRIES; attempt++) {
        unsigned long startTime = millis();
        IDeviceInstance::DeviceResult<void> result = gMB8ART->initialize();
        if (result.isOk()) {
            LOG_INFO(TAG, "MB8ART initialized after %lu attempts", static_cast<unsigned long>(attempt));
            return true;
        }
        LOG_WARN(TAG, "MB8ART init attempt %lu failed (%lu ms, device error %d)",
                 static_cast<unsigned long>(attempt), millis() - startTime,
                 static_cast<int>(result.error()));
        vTaskDelay(pdMS_TO_TICKS(RETRY_DELAY_MS));
    }

    // Keep the instance: the gateway reports it as not ready and the
    // library keeps retrying on the next request
    return false;
}

bool SystemInitializer::initializeRYN4() {
    gRYN4 = new RYN4(RYN4_ADDRESS, "RYN41");

    // All relays off and read back, the module may have kept power through our reset
    RYN4::InitConfig initConfig;
    initConfig.resetRelaysOnInit = true;
    initConfig.skipRelayStateRead = false;

    for (uint32_t attempt = 1; attempt <= INITIAL_RETRIES; attempt++) {
        unsigned long startTime = millis();
        IDeviceInstance::DeviceResult<void> result = gRYN4->initialize(initConfig);
        if (result.isOk()) {
            LOG_INFO(TAG, "RYN4 initialized after %lu attempts", static_cast<unsigned long>(attempt));
            return true;
        }
        LOG_WARN(TAG, "RYN4 init attempt %lu failed (%lu ms, device error %d)",
                 static_cast<unsigned long>(attempt), millis() - startTime,
                 static_cast<int>(result.error()));
        vTaskDelay(pdMS_TO_TICKS(RETRY_DELAY_MS));
    }

    delete gRYN4;
    gRYN4 = nullptr;
    return false;
}

Result<void> SystemInitializer::initializeNetwork() {
    LOG_INFO(TAG, "Starting network initialization (async)...");

    EthernetConfig ethConfig;
    ethConfig.withHostname(DEVICE_HOSTNAME)
             .withPHYAddress(ETH_PHY_ADDR)
             .withMDCPin(ETH_PHY_MDC_PIN)
             .withMDIOPin(ETH_PHY_MDIO_PIN)
             .withPowerPin(ETH_PHY_POWER_PIN)
             .withClockMode(ETH_CLOCK_MODE);

#ifdef USE_STATIC_IP
    ethConfig.withStaticIP(
        IPAddress(ETH_STATIC_IP),
        IPAddress(ETH_GATEWAY),
        IPAddress(ETH_SUBNET),
        IPAddress(ETH_DNS1),
        IPAddress(ETH_DNS2)
    );
    LOG_INFO(TAG, "Using static IP: %d.%d.%d.%d", ETH_STATIC_IP);
#else
    LOG_INFO(TAG, "Using DHCP");
#endif

    if (!EthernetManager::initializeAsync(ethConfig)) {
        return Result<void>(SystemError::NOT_INITIALIZED, "Failed to start Ethernet");
    }

    // MQTTTask waits for the link and sets NETWORK_READY
    return Result<void>();
}

Result<void> SystemInitializer::initializeConfig() {
    LOG_INFO(TAG, "Loading configuration...");
    return SRP::getConfigStore().begin();
}

Result<void> SystemInitializer::initializeControl() {
    LOG_INFO(TAG, "Creating control objects...");

    sensorGateway_.reset(new HAL::MB8ARTTankSensorGateway(gMB8ART));
    actuatorGateway_.reset(new HAL::RYN4ActuatorGateway(gRYN4));

    framSink_.reset(new FramEventSink(gRuntimeStorage));
    mqttSink_.reset(new MQTTEventSink());
    fanout_.reset(new EventSinkFanout());
    if (!fanout_->addSink(framSink_.get()) || !fanout_->addSink(mqttSink_.get())) {
        return Result<void>(SystemError::INVALID_PARAMETER, "Failed to register event sinks");
    }

    controlCore_.reset(new TankControlCore(SRP::getConfigStore(), *sensorGateway_,
                                           *actuatorGateway_, *fanout_));
    return Result<void>();
}

Result<void> SystemInitializer::initializeTasks() {
    LOG_INFO(TAG, "Starting tasks...");

    // MQTT first so the begin event of the control core finds a queue
    if (!MQTTTask::init() || !MQTTTask::start()) {
        // Broadcast only, control runs without it
        LOG_ERROR(TAG, "Failed to start MQTT task - running without broadcast");
    }

    if (!TankControlTask::start(controlCore_.get())) {
        return Result<void>(SystemError::TASK_CREATE_FAILED, "Tank control task creation failed");
    }

    return Result<void>();
}

void SystemInitializer::cleanup() {
    LOG_WARN(TAG, "Performing system cleanup from stage: %d", static_cast<int>(currentStage_));

    cleanupTasks();

    if (TankControlTask::isRunning()) {
        // Still referenced by the task, leak rather than free under it
        (void)controlCore_.release();
        (void)fanout_.release();
        (void)mqttSink_.release();
        (void)framSink_.release();
        (void)actuatorGateway_.release();
        (void)sensorGateway_.release();
        currentStage_ = InitStage::NONE;
        return;
    }

    controlCore_.reset();
    fanout_.reset();
    mqttSink_.reset();
    framSink_.reset();
    actuatorGateway_.reset();
    sensorGateway_.reset();

    cleanupModbusDevices();

    currentStage_ = InitStage::NONE;
}

void SystemInitializer::cleanupTasks() {
    if (TankControlTask::isRunning()) {
        TankControlTask::stop();
        // The core must outlive the task, wait for it to delete itself
        uint32_t waited = 0;
        while (TankControlTask::isRunning() && waited < TASK_STOP_WAIT_MS) {
            vTaskDelay(pdMS_TO_TICKS(100));
            waited += 100;
        }
        if (TankControlTask::isRunning()) {
            LOG_ERROR(TAG, "Tank control task did not stop within %lu ms",
                      static_cast<unsigned long>(TASK_STOP_WAIT_MS));
        }
    }

    if (MQTTTask::isRunning()) {
        MQTTTask::stop();
    }
}

void SystemInitializer::cleanupModbusDevices() {
    delete gMB8ART;
    gMB8ART = nullptr;
    delete gRYN4;
    gRYN4 = nullptr;
}
