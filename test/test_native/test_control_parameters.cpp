/**
 * @file test_control_parameters.cpp
 * @brief Parameter validation, text updates and manual override authorization
 */

#include <unity.h>
#include <cstring>

#include "config/ControlParameters.h"
#include "config/ControlLimits.h"
#include "config/ManualOverrideAuthorizer.h"
#include "mocks/MockConfigStore.h"

void test_default_parameters_are_valid() {
    ControlParameters params = getDefaultControlParameters();

    TEST_ASSERT_TRUE(validateControlParameters(params).isSuccess());
    TEST_ASSERT_TRUE(isHysteresisBandMeaningful(params));
    TEST_ASSERT_EQUAL_INT16(600, params.setpoint);
    TEST_ASSERT_EQUAL_UINT16(60, params.pumpDelaySeconds);
    TEST_ASSERT_FALSE(params.manualOverride);
    TEST_ASSERT_TRUE(params.heatingSystemEnabled);
}

void test_validation_rejects_out_of_range() {
    ControlParameters params = getDefaultControlParameters();
    params.setpoint = 851;
    auto result = validateControlParameters(params);
    TEST_ASSERT_TRUE(result.isError());
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, result.error());
    TEST_ASSERT_NOT_NULL(strstr(result.message().c_str(), "setpoint"));

    params = getDefaultControlParameters();
    params.hysteresis = 4;
    TEST_ASSERT_TRUE(validateControlParameters(params).isError());

    params = getDefaultControlParameters();
    params.maxTemperature = TEMP_INVALID;
    TEST_ASSERT_TRUE(validateControlParameters(params).isError());

    params = getDefaultControlParameters();
    params.pumpDelaySeconds = 301;
    TEST_ASSERT_TRUE(validateControlParameters(params).isError());

    params = getDefaultControlParameters();
    params.updateIntervalSeconds = 0;
    TEST_ASSERT_TRUE(validateControlParameters(params).isError());

    params = getDefaultControlParameters();
    params.sensorTimeoutSeconds = 4;
    TEST_ASSERT_TRUE(validateControlParameters(params).isError());
}

void test_validation_accepts_range_limits() {
    ControlParameters params = getDefaultControlParameters();
    params.setpoint = ControlLimits::Limits::SETPOINT_MIN;
    params.hysteresis = ControlLimits::Limits::HYSTERESIS_MAX;
    params.maxTemperature = ControlLimits::Limits::MAX_TEMPERATURE_MAX;
    params.pumpDelaySeconds = 0;
    params.updateIntervalSeconds = 60;
    params.sensorTimeoutSeconds = 120;
    TEST_ASSERT_TRUE(validateControlParameters(params).isSuccess());

    // Valid, but setpoint - hysteresis is below zero
    TEST_ASSERT_FALSE(isHysteresisBandMeaningful(params));
}

void test_set_parameter_parses_values() {
    ControlParameters params = getDefaultControlParameters();

    TEST_ASSERT_TRUE(applyControlParameter(params, "setpoint", "55.5").isSuccess());
    TEST_ASSERT_EQUAL_INT16(555, params.setpoint);

    TEST_ASSERT_TRUE(applyControlParameter(params, "hysteresis", "1.5").isSuccess());
    TEST_ASSERT_EQUAL_INT16(15, params.hysteresis);

    TEST_ASSERT_TRUE(applyControlParameter(params, "max_temperature", "90").isSuccess());
    TEST_ASSERT_EQUAL_INT16(900, params.maxTemperature);

    TEST_ASSERT_TRUE(applyControlParameter(params, "pump_delay", "120").isSuccess());
    TEST_ASSERT_EQUAL_UINT16(120, params.pumpDelaySeconds);

    TEST_ASSERT_TRUE(applyControlParameter(params, "update_interval", "10").isSuccess());
    TEST_ASSERT_EQUAL_UINT16(10, params.updateIntervalSeconds);

    TEST_ASSERT_TRUE(applyControlParameter(params, "sensor_timeout", "20").isSuccess());
    TEST_ASSERT_EQUAL_UINT16(20, params.sensorTimeoutSeconds);

    TEST_ASSERT_TRUE(applyControlParameter(params, "heating_system_enabled", "off").isSuccess());
    TEST_ASSERT_FALSE(params.heatingSystemEnabled);
    TEST_ASSERT_TRUE(applyControlParameter(params, "heating_system_enabled", "1").isSuccess());
    TEST_ASSERT_TRUE(params.heatingSystemEnabled);
}

// A rejected update leaves every field untouched
void test_set_parameter_rejects_without_side_effects() {
    ControlParameters params = getDefaultControlParameters();
    const ControlParameters before = params;

    auto unknown = applyControlParameter(params, "manual_heating", "true");
    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER, unknown.error());

    auto badFormat = applyControlParameter(params, "setpoint", "60abc");
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, badFormat.error());

    auto empty = applyControlParameter(params, "pump_delay", "");
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, empty.error());

    auto negative = applyControlParameter(params, "pump_delay", "-5");
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, negative.error());

    auto outOfRange = applyControlParameter(params, "setpoint", "90");
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, outOfRange.error());

    auto badFlag = applyControlParameter(params, "heating_system_enabled", "maybe");
    TEST_ASSERT_EQUAL(SystemError::CONFIG_INVALID, badFlag.error());

    TEST_ASSERT_TRUE(applyControlParameter(params, nullptr, "1").isError());

    TEST_ASSERT_EQUAL_INT16(before.setpoint, params.setpoint);
    TEST_ASSERT_EQUAL_UINT16(before.pumpDelaySeconds, params.pumpDelaySeconds);
    TEST_ASSERT_EQUAL(before.heatingSystemEnabled, params.heatingSystemEnabled);
}

void test_authorizer_checks_pin() {
    ManualOverrideAuthorizer auth("4711");

    TEST_ASSERT_TRUE(auth.isEnabled());
    TEST_ASSERT_TRUE(auth.isAuthorized("4711"));
    TEST_ASSERT_FALSE(auth.isAuthorized("4712"));
    TEST_ASSERT_FALSE(auth.isAuthorized("471"));
    TEST_ASSERT_FALSE(auth.isAuthorized("47110"));
    TEST_ASSERT_FALSE(auth.isAuthorized(""));
    TEST_ASSERT_FALSE(auth.isAuthorized(nullptr));
}

void test_authorizer_short_pin_disables_manual() {
    ManualOverrideAuthorizer none;
    TEST_ASSERT_FALSE(none.isEnabled());
    TEST_ASSERT_FALSE(none.isAuthorized(""));

    ManualOverrideAuthorizer shortPin("123");
    TEST_ASSERT_FALSE(shortPin.isEnabled());
    TEST_ASSERT_FALSE(shortPin.isAuthorized("123"));

    // Overlong PIN is refused and the previous one kept
    ManualOverrideAuthorizer auth("1234");
    TEST_ASSERT_FALSE(auth.setPin("0123456789012345678901234567890123"));
    TEST_ASSERT_TRUE(auth.isAuthorized("1234"));
}

void test_pin_change_needs_provisioned_pin() {
    // No PIN: the command channel cannot set the first one
    MockConfigStore store;
    TEST_ASSERT_TRUE(store.authorizer.setPin(""));
    auto result = store.changePin("", "9999");
    TEST_ASSERT_EQUAL(SystemError::UNAUTHORIZED, result.error());
    TEST_ASSERT_FALSE(store.authorizer.isEnabled());

    // So the manual change with that PIN is still refused
    TEST_ASSERT_EQUAL(SystemError::UNAUTHORIZED,
                      store.applyManual(true, true, true, "9999").error());
    ControlParameters snap = store.snapshot().value();
    TEST_ASSERT_FALSE(snap.manualOverride);
    TEST_ASSERT_FALSE(snap.manualHeating);
    TEST_ASSERT_FALSE(snap.manualPump);
}

void test_pin_change_requires_current_pin() {
    MockConfigStore store;

    TEST_ASSERT_EQUAL(SystemError::UNAUTHORIZED, store.changePin("0000", "5678").error());
    TEST_ASSERT_TRUE(store.authorizer.isAuthorized("1234"));

    TEST_ASSERT_EQUAL(SystemError::INVALID_PARAMETER,
                      store.changePin("1234", "0123456789012345678901234567890123").error());
    TEST_ASSERT_TRUE(store.authorizer.isAuthorized("1234"));

    TEST_ASSERT_TRUE(store.changePin("1234", "5678").isSuccess());
    TEST_ASSERT_FALSE(store.authorizer.isAuthorized("1234"));
    TEST_ASSERT_TRUE(store.applyManual(true, false, true, "5678").isSuccess());
}

// Manual flags change together or not at all
void test_manual_update_is_atomic() {
    MockConfigStore store;

    auto denied = store.applyManual(true, true, true, "9999");
    TEST_ASSERT_EQUAL(SystemError::UNAUTHORIZED, denied.error());
    ControlParameters snap = store.snapshot().value();
    TEST_ASSERT_FALSE(snap.manualOverride);
    TEST_ASSERT_FALSE(snap.manualHeating);
    TEST_ASSERT_FALSE(snap.manualPump);

    TEST_ASSERT_TRUE(store.applyManual(true, true, false, "1234").isSuccess());
    snap = store.snapshot().value();
    TEST_ASSERT_TRUE(snap.manualOverride);
    TEST_ASSERT_TRUE(snap.manualHeating);
    TEST_ASSERT_FALSE(snap.manualPump);
}

// Bulk parameter updates keep the manual flags and validate as a set
void test_apply_parameters_validates_as_set() {
    MockConfigStore store;
    TEST_ASSERT_TRUE(store.applyManual(true, false, true, "1234").isSuccess());

    ControlParameters candidate = store.snapshot().value();
    candidate.setpoint = 500;
    candidate.hysteresis = 150;
    candidate.manualOverride = false;
    TEST_ASSERT_TRUE(store.applyParameters(candidate).isError());
    TEST_ASSERT_EQUAL_INT16(600, store.snapshot().value().setpoint);

    candidate.hysteresis = 30;
    TEST_ASSERT_TRUE(store.applyParameters(candidate).isSuccess());
    ControlParameters snap = store.snapshot().value();
    TEST_ASSERT_EQUAL_INT16(500, snap.setpoint);
    TEST_ASSERT_EQUAL_INT16(30, snap.hysteresis);
    TEST_ASSERT_TRUE(snap.manualOverride);
    TEST_ASSERT_TRUE(snap.manualPump);
}
