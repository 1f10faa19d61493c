// src/init/HardwareInitializer.h
#ifndef HARDWARE_INITIALIZER_H
#define HARDWARE_INITIALIZER_H

#include "utils/ErrorHandler.h"

namespace rtstorage { class RuntimeStorage; }

/**
 * @brief Handles hardware initialization
 *
 * Initializes:
 * - RS485/Modbus serial communication
 * - RuntimeStorage (FRAM) on the shared I2C bus
 */
class HardwareInitializer {
public:
    /**
     * @brief Initialize all hardware interfaces
     * @return Error only if the Modbus bus could not be brought up.
     *         A missing FRAM is logged and tolerated.
     */
    static Result<void> initialize();

private:
    // Prevent instantiation
    HardwareInitializer() = delete;

    static Result<void> initializeModbus();

    /**
     * @brief Initialize RuntimeStorage (FRAM)
     * @param storage Output pointer, null if FRAM not found
     * @return true if successful
     */
    static bool initializeFRAM(rtstorage::RuntimeStorage*& storage);
};

#endif // HARDWARE_INITIALIZER_H
