// src/config/IConfigStore.h
#pragma once

#include "config/ControlParameters.h"
#include "utils/ErrorHandler.h"

/**
 * @brief Source of control parameters for the tank control loop
 *
 * The control loop only reads through snapshot(). Every writer (MQTT
 * commands, boot-time loading) goes through the apply* methods, which
 * validate and commit atomically. The loop never observes a partial update.
 */
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    /**
     * @brief Consistent copy of all parameters
     * @return MUTEX_TIMEOUT if no consistent copy could be taken in time
     */
    virtual Result<ControlParameters> snapshot() const = 0;

    /**
     * @brief Set override, heating and pump manual flags together
     * @param credential Operator credential checked before anything changes
     * @return UNAUTHORIZED if the credential is rejected, state unchanged
     */
    virtual Result<void> applyManual(bool manualOverride, bool heating, bool pump,
                                     const char* credential) = 0;

    /**
     * @brief Replace all non-manual parameters after validating them as a set
     * @return CONFIG_INVALID if any field is out of range, state unchanged
     */
    virtual Result<void> applyParameters(const ControlParameters& params) = 0;

    /**
     * @brief Update one named parameter from its text form
     */
    virtual Result<void> setParameter(const char* key, const char* value) = 0;
};
