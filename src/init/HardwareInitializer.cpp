// src/init/HardwareInitializer.cpp
#include "HardwareInitializer.h"

#include <Arduino.h>
#include <Wire.h>
#include <esp32ModbusRTU.h>
#include <ModbusRegistry.h>
#include <ModbusDevice.h>
#include <RuntimeStorage.h>

#include "LoggingMacros.h"
#include "config/ProjectConfig.h"
#include "core/SystemResourceProvider.h"


static const char* TAG = "HardwareInit";
// Owned by main.cpp, handed out through SRP::getRuntimeStorage()
extern rtstorage::RuntimeStorage* gRuntimeStorage;

Result<void> HardwareInitializer::initialize() {
    LOG_INFO(TAG, "Initializing hardware interfaces...");

    auto result = initializeModbus();
    if (result.isError()) {
        return result;
    }

    // FRAM only backs counters and the event log, the loop runs without it
    initializeFRAM(gRuntimeStorage);

    LOG_INFO(TAG, "Hardware initialized successfully");
    return Result<void>();
}

Result<void> HardwareInitializer::initializeModbus() {
    // Drive TX low before the UART takes over so the RS485 transceiver
    // does not start stuck in transmit mode
    pinMode(RS485_TX_PIN, OUTPUT);
    digitalWrite(RS485_TX_PIN, LOW);
    vTaskDelay(pdMS_TO_TICKS(10));

    // Both modules are configured for 8E1
    Serial1.begin(MODBUS_BAUD_RATE, SERIAL_8E1, RS485_RX_PIN, RS485_TX_PIN);
    LOG_INFO(TAG, "Serial1 initialized at %d baud with RX:GPIO%d, TX:GPIO%d",
             MODBUS_BAUD_RATE, RS485_RX_PIN, RS485_TX_PIN);
    vTaskDelay(pdMS_TO_TICKS(100));

    // ModbusDevice base class resolves the master through the registry
    modbus::ModbusRegistry::getInstance().setModbusRTU(&SRP::getModbusMaster());

    SRP::getModbusMaster().onData([](uint8_t serverAddress, esp32Modbus::FunctionCode fc,
                                     uint16_t address, const uint8_t* data, size_t length) {
        mainHandleData(serverAddress, fc, address, data, length);
    });

    SRP::getModbusMaster().onError([](esp32Modbus::Error error) {
        LOG_ERROR(TAG, "Modbus communication error: %d", static_cast<int>(error));
    });

    // Same core as the control task
    SRP::getModbusMaster().begin(CORE_TANK_CONTROL_TASK);
    LOG_INFO(TAG, "Modbus master started on core %d", CORE_TANK_CONTROL_TASK);

    // Let the RTU task create its queue before the first request
    vTaskDelay(pdMS_TO_TICKS(100));
    return Result<void>();
}

bool HardwareInitializer::initializeFRAM(rtstorage::RuntimeStorage*& storage) {
    LOG_INFO(TAG, "Initializing RuntimeStorage (FRAM)...");
    Wire.begin(I2C_SDA_PIN, I2C_SCL_PIN);

    storage = new rtstorage::RuntimeStorage();
    if (!storage->begin(Wire, FRAM_I2C_ADDRESS)) {
        LOG_WARN(TAG, "RuntimeStorage (FRAM) not found - counters will not persist");
        delete storage;
        storage = nullptr;
        return false;
    }

    if (!storage->verifyIntegrity()) {
        LOG_WARN(TAG, "FRAM data corrupted - formatting...");
        if (!storage->format()) {
            LOG_ERROR(TAG, "Failed to format FRAM");
            delete storage;
            storage = nullptr;
            return false;
        }
        LOG_INFO(TAG, "FRAM formatted successfully");
    }

    LOG_INFO(TAG, "RuntimeStorage initialized: %lu bytes available",
             static_cast<unsigned long>(storage->getSize()));
    return true;
}
