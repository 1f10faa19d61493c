// src/init/SystemInitializer.h
#ifndef SYSTEM_INITIALIZER_H
#define SYSTEM_INITIALIZER_H

#include <memory>
#include "utils/ErrorHandler.h"

// Forward declarations
class EventSinkFanout;
class FramEventSink;
class MQTTEventSink;
class TankControlCore;
namespace HAL {
    class MB8ARTTankSensorGateway;
    class RYN4ActuatorGateway;
}

/**
 * @brief Brings the controller up in a fixed order
 *
 * Hardware and Modbus devices first, then the network (async, never fatal),
 * then the configuration store, the control objects and finally the tasks.
 * If a fatal stage fails, everything created so far is torn down again.
 */
class SystemInitializer {
public:
    enum class InitStage {
        NONE = 0,
        HARDWARE,
        MODBUS_DEVICES,
        NETWORK,
        CONFIG,
        CONTROL,
        TASKS,
        COMPLETE
    };

    SystemInitializer();

    /**
     * @brief Destructor - performs cleanup if needed
     */
    ~SystemInitializer();

    SystemInitializer(const SystemInitializer&) = delete;
    SystemInitializer& operator=(const SystemInitializer&) = delete;

    /**
     * @brief Initialize the entire system
     * @return Result indicating success or failure
     */
    Result<void> initializeSystem();

    InitStage getCurrentStage() const { return currentStage_; }

    bool isFullyInitialized() const { return currentStage_ == InitStage::COMPLETE; }

    /**
     * @brief Stop the tasks and release everything created so far
     */
    void cleanup();

    TankControlCore* getControlCore() const { return controlCore_.get(); }

private:
    Result<void> initializeModbusDevices();
    Result<void> initializeNetwork();
    Result<void> initializeConfig();
    Result<void> initializeControl();
    Result<void> initializeTasks();

    void cleanupTasks();
    void cleanupModbusDevices();

    static bool initializeMB8ART();
    static bool initializeRYN4();

    InitStage currentStage_;

    std::unique_ptr<HAL::MB8ARTTankSensorGateway> sensorGateway_;
    std::unique_ptr<HAL::RYN4ActuatorGateway> actuatorGateway_;
    std::unique_ptr<FramEventSink> framSink_;
    std::unique_ptr<MQTTEventSink> mqttSink_;
    std::unique_ptr<EventSinkFanout> fanout_;
    std::unique_ptr<TankControlCore> controlCore_;
};

#endif // SYSTEM_INITIALIZER_H
