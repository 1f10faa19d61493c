// src/core/SystemResourceProvider.h
#ifndef SYSTEM_RESOURCE_PROVIDER_H
#define SYSTEM_RESOURCE_PROVIDER_H

#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

// Forward declarations
class MB8ART;
class RYN4;
class TaskManager;
class esp32ModbusRTU;
class NvsConfigStore;
namespace rtstorage { class RuntimeStorage; }

/**
 * @brief Convenience class to provide easy access to system resources
 *
 * Static accessors for the objects created once in main.cpp, so tasks and
 * adapters do not need the globals spelled out. Device accessors return
 * nullptr until the device has been created.
 */
class SystemResourceProvider {
public:
    // Core System Resources
    static TaskManager& getTaskManager();
    static esp32ModbusRTU& getModbusMaster();

    // Modbus devices
    static MB8ART* getMB8ART();
    static RYN4* getRYN4();

    // Runtime Storage (FRAM), nullptr if the chip did not answer
    static rtstorage::RuntimeStorage* getRuntimeStorage();

    static NvsConfigStore& getConfigStore();

    // System state event group (network / MQTT bits, see SystemEvents.h)
    static EventGroupHandle_t getSystemStateEventGroup();

    static EventBits_t getSystemStateEventBits() {
        return xEventGroupGetBits(getSystemStateEventGroup());
    }

    static EventBits_t setSystemStateEventBits(const EventBits_t bitsToSet) {
        return xEventGroupSetBits(getSystemStateEventGroup(), bitsToSet);
    }

    static EventBits_t clearSystemStateEventBits(const EventBits_t bitsToClear) {
        return xEventGroupClearBits(getSystemStateEventGroup(), bitsToClear);
    }

    static EventBits_t waitSystemStateEventBits(const EventBits_t bitsToWaitFor,
                                                const BaseType_t clearOnExit,
                                                const BaseType_t waitForAllBits,
                                                TickType_t ticksToWait) {
        return xEventGroupWaitBits(getSystemStateEventGroup(), bitsToWaitFor,
                                   clearOnExit, waitForAllBits, ticksToWait);
    }
};

// Convenience macros for even shorter access (optional)
#define SRP SystemResourceProvider

#endif // SYSTEM_RESOURCE_PROVIDER_H
