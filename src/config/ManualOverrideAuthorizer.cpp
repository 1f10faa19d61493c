// src/config/ManualOverrideAuthorizer.cpp
#include "config/ManualOverrideAuthorizer.h"
#include "LoggingMacros.h"
#include <cstdint>
#include <cstring>

static const char* TAG = "ManualAuth";

ManualOverrideAuthorizer::ManualOverrideAuthorizer(const char* pin) {
    if (pin != nullptr) {
        (void)setPin(pin);
    }
}

bool ManualOverrideAuthorizer::setPin(const char* pin) {
    size_t len = (pin != nullptr) ? strlen(pin) : 0;
    if (len > MAX_PIN_LENGTH) {
        LOG_WARN(TAG, "Override PIN too long (%u > %u) - keeping previous",
                 static_cast<unsigned>(len), static_cast<unsigned>(MAX_PIN_LENGTH));
        return false;
    }
    pin_.assign(pin != nullptr ? pin : "", len);
    if (!isEnabled()) {
        LOG_WARN(TAG, "Override PIN shorter than %u chars - manual changes disabled",
                 static_cast<unsigned>(MIN_PIN_LENGTH));
    }
    return true;
}

bool ManualOverrideAuthorizer::isAuthorized(const char* credential) const {
    if (!isEnabled() || credential == nullptr) {
        return false;
    }

    // Walk the full PIN length regardless of where the first mismatch is
    size_t credLen = strnlen(credential, MAX_PIN_LENGTH + 1);
    uint8_t diff = static_cast<uint8_t>(credLen != pin_.size());
    for (size_t i = 0; i < pin_.size(); i++) {
        char c = (i < credLen) ? credential[i] : '\0';
        diff |= static_cast<uint8_t>(c ^ pin_[i]);
    }
    return diff == 0;
}

Result<void> ManualOverrideAuthorizer::changePin(const char* currentPin, const char* newPin) {
    if (!isEnabled()) {
        LOG_WARN(TAG, "PIN change rejected - no PIN provisioned");
        return Result<void>(SystemError::UNAUTHORIZED, "manual_disabled");
    }
    if (!isAuthorized(currentPin)) {
        LOG_WARN(TAG, "PIN change rejected - wrong current PIN");
        return Result<void>(SystemError::UNAUTHORIZED, "unauthorized");
    }
    if (!setPin(newPin)) {
        return Result<void>(SystemError::INVALID_PARAMETER, "pin_too_long");
    }
    return Result<void>();
}
