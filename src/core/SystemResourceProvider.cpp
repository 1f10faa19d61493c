// src/core/SystemResourceProvider.cpp
#include "SystemResourceProvider.h"
#include <TaskManager.h>
#include <esp32ModbusRTU.h>
#include <RuntimeStorage.h>
#include "config/NvsConfigStore.h"

// External resource declarations (defined in main.cpp)
extern TaskManager taskManager;
extern esp32ModbusRTU modbusMaster;
extern MB8ART* gMB8ART;
extern RYN4* gRYN4;
extern rtstorage::RuntimeStorage* gRuntimeStorage;
extern NvsConfigStore gConfigStore;
extern EventGroupHandle_t xSystemStateEventGroup;

TaskManager& SystemResourceProvider::getTaskManager() {
    return taskManager;
}

esp32ModbusRTU& SystemResourceProvider::getModbusMaster() {
    return modbusMaster;
}

MB8ART* SystemResourceProvider::getMB8ART() {
    return gMB8ART;
}

RYN4* SystemResourceProvider::getRYN4() {
    return gRYN4;
}

rtstorage::RuntimeStorage* SystemResourceProvider::getRuntimeStorage() {
    return gRuntimeStorage;
}

NvsConfigStore& SystemResourceProvider::getConfigStore() {
    return gConfigStore;
}

EventGroupHandle_t SystemResourceProvider::getSystemStateEventGroup() {
    return xSystemStateEventGroup;
}
