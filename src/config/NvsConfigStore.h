// src/config/NvsConfigStore.h
#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include "config/IConfigStore.h"
#include "config/ManualOverrideAuthorizer.h"

/**
 * @brief Firmware configuration store backed by NVS
 *
 * All access goes through one FreeRTOS mutex. snapshot() copies the whole
 * parameter set under the lock, writers validate a candidate copy and swap
 * it in under the same lock, then persist it. Values read from NVS at boot
 * are range-checked field by field, an invalid field falls back to its
 * default.
 */
class NvsConfigStore : public IConfigStore {
public:
    NvsConfigStore();
    ~NvsConfigStore() override;

    NvsConfigStore(const NvsConfigStore&) = delete;
    NvsConfigStore& operator=(const NvsConfigStore&) = delete;

    /**
     * @brief Create the mutex and load parameters and PIN from NVS
     * @return MUTEX_CREATE_FAILED if the mutex could not be created
     */
    Result<void> begin();

    Result<ControlParameters> snapshot() const override;

    Result<void> applyManual(bool manualOverride, bool heating, bool pump,
                             const char* credential) override;

    Result<void> applyParameters(const ControlParameters& params) override;

    Result<void> setParameter(const char* key, const char* value) override;

    /**
     * @brief Store a new operator PIN (requires the current one)
     *
     * Refused while no PIN is provisioned, see ManualOverrideAuthorizer.
     */
    Result<void> changePin(const char* currentPin, const char* newPin);

private:
    void loadFromNVS();
    void saveToNVS(const ControlParameters& params);

    mutable SemaphoreHandle_t mutex_;
    ControlParameters params_;
    ManualOverrideAuthorizer authorizer_;

    static constexpr const char* TAG = "NvsConfig";
    static constexpr const char* NVS_NAMESPACE = "tankctl";
};
