// src/config/ManualOverrideAuthorizer.h
#pragma once

#include <cstddef>
#include <string>
#include "utils/ErrorHandler.h"

/**
 * @brief Gatekeeper for manual heating/pump changes
 *
 * Holds the operator PIN and compares presented credentials in constant
 * time. A PIN shorter than MIN_PIN_LENGTH disables manual changes, and
 * also PIN changes over the command channel: the first PIN comes from the
 * build (TANKCTL_MANUAL_PIN) or from NVS provisioning.
 */
class ManualOverrideAuthorizer {
public:
    static constexpr size_t MIN_PIN_LENGTH = 4;
    static constexpr size_t MAX_PIN_LENGTH = 32;

    explicit ManualOverrideAuthorizer(const char* pin = nullptr);

    /**
     * @brief Replace the PIN
     * @return false if the PIN is longer than MAX_PIN_LENGTH (PIN unchanged)
     */
    bool setPin(const char* pin);

    bool isEnabled() const { return pin_.size() >= MIN_PIN_LENGTH; }

    bool isAuthorized(const char* credential) const;

    /**
     * @brief Replace the PIN after checking the current one
     * @return UNAUTHORIZED while disabled or on a wrong current PIN,
     *         INVALID_PARAMETER if newPin is too long. PIN unchanged on error.
     */
    Result<void> changePin(const char* currentPin, const char* newPin);

private:
    std::string pin_;
};
