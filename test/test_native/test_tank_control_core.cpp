/**
 * @file test_tank_control_core.cpp
 * @brief Control cycle behaviour against mocked sensors, relays and sinks
 */

#include <unity.h>

#include "modules/control/TankControlCore.h"
#include "mocks/MockActuatorGateway.h"
#include "mocks/MockConfigStore.h"
#include "mocks/MockEventSink.h"
#include "mocks/MockTankSensorGateway.h"
#include "mocks/MockTime.h"

using Actuator = HAL::IActuatorGateway::Actuator;

namespace {

struct ControlRig {
    MockConfigStore config;
    MockTankSensorGateway sensors;
    MockActuatorGateway actuators;
    MockEventSink sink;
    TankControlCore core;

    ControlRig() : core(config, sensors, actuators, sink) {}

    SystemState cycle() {
        auto result = core.runCycle(millis());
        TEST_ASSERT_TRUE(result.isSuccess());
        return result.value();
    }

    SystemState cycleAt(uint32_t nowMs) {
        setMockMillis(nowMs);
        return cycle();
    }
};

} // namespace

// setpoint 60, hysteresis 2, average 57 -> heating on
void test_core_heats_below_band() {
    ControlRig rig;
    rig.sensors.setTank(1, 56.0f);
    rig.sensors.setTank(2, 57.0f);
    rig.sensors.setTank(3, 58.0f);

    SystemState state = rig.cycleAt(0);

    TEST_ASSERT_EQUAL_INT16(570, state.averageTemperature);
    TEST_ASSERT_EQUAL_UINT8(3, state.availableSensors);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_TRUE(state.pumpActive);
    TEST_ASSERT_TRUE(state.pumpPhase == PumpPhase::RUNNING);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);

    // Pump is switched before the heater
    TEST_ASSERT_EQUAL(2, rig.actuators.writes.size());
    TEST_ASSERT_TRUE(rig.actuators.writes[0].actuator == Actuator::PUMP);
    TEST_ASSERT_TRUE(rig.actuators.writes[1].actuator == Actuator::HEATING);

    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::CONTROL_ACTION,
                                                 "heating_on avg=57.0 setpoint=60.0"));
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::CONTROL_ACTION, "pump_on"));
}

// setpoint 60, hysteresis 2, average 63 with heating on -> off, pump overrun armed
void test_core_heating_off_arms_pump_overrun() {
    ControlRig rig;
    rig.sensors.setAll(57.0f);
    rig.cycleAt(0);

    rig.sensors.setAll(63.0f);
    SystemState state = rig.cycleAt(10000);

    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.pumpActive);
    TEST_ASSERT_TRUE(state.pumpShutoffPending);
    TEST_ASSERT_TRUE(state.pumpPhase == PumpPhase::PENDING_SHUTOFF);
    TEST_ASSERT_EQUAL_UINT32(70000, state.pumpShutoffDeadlineMs);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::CONTROL_ACTION, "heating_off"));
}

// pump_delay 60: the pump keeps running for exactly 60 s after heating stops
void test_core_pump_stops_after_delay() {
    ControlRig rig;
    rig.sensors.setAll(57.0f);
    rig.cycleAt(0);

    rig.sensors.setAll(63.0f);
    rig.cycleAt(10000);

    TEST_ASSERT_TRUE(rig.cycleAt(40000).pumpActive);
    TEST_ASSERT_TRUE(rig.cycleAt(69999).pumpActive);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);

    SystemState state = rig.cycleAt(70000);
    TEST_ASSERT_FALSE(state.pumpActive);
    TEST_ASSERT_FALSE(state.pumpShutoffPending);
    TEST_ASSERT_FALSE(rig.actuators.pumpOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::CONTROL_ACTION, "pump_off"));
}

// max 85, average 86, manual heating requested -> heating stays off
void test_core_safety_ceiling_overrides_manual() {
    ControlRig rig;
    rig.config.params.manualOverride = true;
    rig.config.params.manualHeating = true;
    rig.config.params.manualPump = true;
    rig.sensors.setAll(86.0f);

    SystemState state = rig.cycleAt(0);

    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.safetyTripped);
    TEST_ASSERT_TRUE(state.pumpActive);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::SAFETY_TRIP,
                                                 "manual request overridden"));

    // Still tripped: no repeated event
    rig.cycleAt(5000);
    TEST_ASSERT_EQUAL(1, rig.sink.countEvents(ControlEventKind::SAFETY_TRIP));

    // Below the ceiling the manual request takes effect again
    rig.sensors.setAll(80.0f);
    state = rig.cycleAt(10000);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_FALSE(state.safetyTripped);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
}

void test_core_safety_ceiling_in_auto() {
    ControlRig rig;
    rig.config.params.setpoint = 840;
    rig.sensors.setAll(80.0f);
    TEST_ASSERT_TRUE(rig.cycleAt(0).heatingActive);

    // Exactly at the ceiling trips even inside the dead band
    rig.sensors.setAll(85.0f);
    SystemState state = rig.cycleAt(5000);
    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.safetyTripped);
    TEST_ASSERT_EQUAL(1, rig.sink.countEvents(ControlEventKind::SAFETY_TRIP));
}

// One tank left: average is that tank, control continues
void test_core_degraded_single_sensor() {
    ControlRig rig;
    rig.sensors.setTankUnavailable(1);
    rig.sensors.setTankUnavailable(2);
    rig.sensors.setTank(3, 57.5f);

    SystemState state = rig.cycleAt(0);

    TEST_ASSERT_EQUAL_UINT8(1, state.availableSensors);
    TEST_ASSERT_EQUAL_INT16(575, state.averageTemperature);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_FALSE(state.failSafe);
    TEST_ASSERT_FALSE(state.tanks[0].available);
    TEST_ASSERT_TRUE(state.tanks[2].available);
    TEST_ASSERT_EQUAL(2, rig.sink.countEvents(ControlEventKind::SENSOR_FAILURE));
}

// A single tank sitting exactly on setpoint - hysteresis does not switch
void test_core_degraded_reading_on_band_edge() {
    ControlRig rig;
    rig.sensors.setTankUnavailable(1);
    rig.sensors.setTankUnavailable(2);
    rig.sensors.setTank(3, 58.0f);

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_EQUAL_INT16(580, state.averageTemperature);
    TEST_ASSERT_FALSE(state.heatingActive);

    rig.sensors.setTank(3, 57.9f);
    TEST_ASSERT_TRUE(rig.cycleAt(5000).heatingActive);
}

void test_core_fail_safe_without_sensors() {
    ControlRig rig;
    rig.sensors.setAll(50.0f);
    TEST_ASSERT_TRUE(rig.cycleAt(0).heatingActive);

    rig.sensors.setAllUnavailable();
    SystemState state = rig.cycleAt(5000);

    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.failSafe);
    TEST_ASSERT_EQUAL_UINT8(0, state.availableSensors);
    TEST_ASSERT_EQUAL_INT16(TEMP_INVALID, state.averageTemperature);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::SENSOR_FAILURE,
                                                 "All tank sensors unavailable"));
    // Three per-tank events plus the fail-safe event
    TEST_ASSERT_EQUAL(4, rig.sink.countEvents(ControlEventKind::SENSOR_FAILURE));

    // Manual heating cannot bypass the fail-safe either
    rig.config.params.manualOverride = true;
    rig.config.params.manualHeating = true;
    TEST_ASSERT_FALSE(rig.cycleAt(10000).heatingActive);
    TEST_ASSERT_EQUAL(4, rig.sink.countEvents(ControlEventKind::SENSOR_FAILURE));

    rig.config.params.manualOverride = false;
    rig.sensors.setAll(50.0f);
    state = rig.cycleAt(15000);
    TEST_ASSERT_FALSE(state.failSafe);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::MODE_CHANGE, "Fail-safe cleared"));
}

// Steady state: relays are written on the first cycle and then only on change
void test_core_writes_relays_only_on_change() {
    ControlRig rig;
    rig.sensors.setAll(60.0f);

    rig.cycleAt(0);
    TEST_ASSERT_EQUAL(2, rig.actuators.writes.size());
    TEST_ASSERT_FALSE(rig.actuators.writes[0].on);
    TEST_ASSERT_FALSE(rig.actuators.writes[1].on);

    for (uint32_t t = 5000; t <= 50000; t += 5000) {
        rig.cycleAt(t);
    }
    TEST_ASSERT_EQUAL(2, rig.actuators.writes.size());

    rig.sensors.setAll(57.0f);
    rig.cycleAt(55000);
    TEST_ASSERT_EQUAL(4, rig.actuators.writes.size());
}

void test_core_retries_failed_relay_write() {
    ControlRig rig;
    rig.actuators.failHeating = true;
    rig.sensors.setAll(57.0f);

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::ACTUATOR_FAILURE,
                                                 "Failed to switch heating on: injected failure"));

    // Loop keeps running and every failed attempt is reported
    rig.cycleAt(5000);
    TEST_ASSERT_EQUAL(2, rig.sink.countEvents(ControlEventKind::ACTUATOR_FAILURE));
    TEST_ASSERT_EQUAL(2, rig.sink.states.size());

    rig.actuators.failHeating = false;
    rig.cycleAt(10000);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
    TEST_ASSERT_EQUAL(3, rig.actuators.countWrites(Actuator::HEATING));
    TEST_ASSERT_EQUAL(1, rig.actuators.countWrites(Actuator::PUMP));

    rig.cycleAt(15000);
    TEST_ASSERT_EQUAL(3, rig.actuators.countWrites(Actuator::HEATING));
    TEST_ASSERT_EQUAL(2, rig.sink.countEvents(ControlEventKind::ACTUATOR_FAILURE));
}

void test_core_publishes_state_every_cycle() {
    ControlRig rig;
    rig.sensors.setAll(60.0f);

    for (uint32_t i = 0; i < 5; i++) {
        rig.cycleAt(i * 5000);
    }

    TEST_ASSERT_EQUAL(5, rig.sink.states.size());
    TEST_ASSERT_EQUAL_UINT32(5, rig.core.getCycleCount());
    TEST_ASSERT_EQUAL_UINT32(1, rig.sink.states[0].cycle);
    TEST_ASSERT_EQUAL_UINT32(5, rig.sink.states[4].cycle);
    TEST_ASSERT_EQUAL_UINT32(20000, rig.sink.states[4].timestampMs);
    TEST_ASSERT_EQUAL_INT16(600, rig.sink.states[4].setpoint);
    TEST_ASSERT_EQUAL_UINT32(5, rig.core.getLastState().cycle);

    // Parameters are read exactly once per cycle
    TEST_ASSERT_EQUAL_UINT32(5, rig.config.snapshotCount);
}

// Manual mode drives the relays straight from the operator flags
void test_core_manual_override_bypasses_hysteresis() {
    ControlRig rig;
    rig.sensors.setAll(70.0f);
    TEST_ASSERT_FALSE(rig.cycleAt(0).heatingActive);

    TEST_ASSERT_TRUE(rig.config.applyManual(true, true, false, "1234").isSuccess());
    SystemState state = rig.cycleAt(5000);

    TEST_ASSERT_TRUE(state.manualOverride);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_FALSE(state.pumpActive);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
    TEST_ASSERT_FALSE(rig.actuators.pumpOn);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::MODE_CHANGE,
                                                 "Manual override enabled (heating=on pump=off)"));

    // Back to auto above the band: heater off, pump runs the overrun
    TEST_ASSERT_TRUE(rig.config.applyManual(false, false, false, "1234").isSuccess());
    state = rig.cycleAt(10000);

    TEST_ASSERT_FALSE(state.manualOverride);
    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.pumpShutoffPending);
    TEST_ASSERT_EQUAL_UINT32(70000, state.pumpShutoffDeadlineMs);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::MODE_CHANGE,
                                                 "Manual override disabled"));
}

void test_core_rejected_manual_change_has_no_effect() {
    ControlRig rig;
    rig.sensors.setAll(70.0f);
    rig.cycleAt(0);

    TEST_ASSERT_TRUE(rig.config.applyManual(true, true, true, "0000").isError());
    SystemState state = rig.cycleAt(5000);

    TEST_ASSERT_FALSE(state.manualOverride);
    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_EQUAL(0, rig.sink.countEvents(ControlEventKind::MODE_CHANGE));
}

void test_core_disabled_system_keeps_heating_off() {
    ControlRig rig;
    rig.sensors.setAll(50.0f);
    TEST_ASSERT_TRUE(rig.cycleAt(0).heatingActive);

    TEST_ASSERT_TRUE(rig.config.setParameter("heating_system_enabled", "false").isSuccess());
    SystemState state = rig.cycleAt(5000);

    TEST_ASSERT_FALSE(state.heatingSystemEnabled);
    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_TRUE(state.pumpShutoffPending);
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::MODE_CHANGE,
                                                 "Heating system disabled"));

    TEST_ASSERT_TRUE(rig.config.setParameter("heating_system_enabled", "true").isSuccess());
    TEST_ASSERT_TRUE(rig.cycleAt(10000).heatingActive);
}

// New parameters take effect on the next cycle
void test_core_picks_up_parameter_changes() {
    ControlRig rig;
    rig.sensors.setAll(60.0f);
    TEST_ASSERT_FALSE(rig.cycleAt(0).heatingActive);

    TEST_ASSERT_TRUE(rig.config.setParameter("setpoint", "65").isSuccess());
    SystemState state = rig.cycleAt(5000);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_EQUAL_INT16(650, state.setpoint);

    TEST_ASSERT_TRUE(rig.config.setParameter("sensor_timeout", "15").isSuccess());
    rig.cycleAt(10000);
    TEST_ASSERT_EQUAL_UINT32(5000, rig.sensors.lastTimeoutMs);
}

// A cycle started from inside a running cycle is refused
void test_core_rejects_overlapping_cycle() {
    ControlRig rig;
    bool attempted = false;
    SystemError nestedError = SystemError::SUCCESS;

    rig.sensors.onRead = [&](uint8_t tankId) {
        if (tankId == 2 && !attempted) {
            attempted = true;
            auto nested = rig.core.runCycle(millis());
            nestedError = nested.error();
        }
    };

    auto result = rig.core.runCycle(0);

    TEST_ASSERT_TRUE(attempted);
    TEST_ASSERT_TRUE(result.isSuccess());
    TEST_ASSERT_EQUAL(SystemError::CYCLE_IN_PROGRESS, nestedError);
    TEST_ASSERT_EQUAL_UINT32(3, rig.sensors.readCount);
    TEST_ASSERT_EQUAL(1, rig.sink.states.size());

    // The guard is released once the cycle completes
    rig.sensors.onRead = nullptr;
    TEST_ASSERT_TRUE(rig.core.runCycle(5000).isSuccess());
}

void test_core_begin_and_shutdown() {
    ControlRig rig;
    rig.sensors.setTankUnavailable(2);

    TEST_ASSERT_TRUE(rig.core.begin(0).isSuccess());
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::SYSTEM,
                                                 "Tank controller started (2/3 sensors)"));
    TEST_ASSERT_EQUAL(0, rig.actuators.writes.size());

    // Tank 2 was already missing at start: no failure event for it
    rig.cycleAt(5000);
    TEST_ASSERT_EQUAL(0, rig.sink.countEvents(ControlEventKind::SENSOR_FAILURE));

    const size_t writes = rig.actuators.writes.size();
    rig.core.shutdown();
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::SYSTEM, "Tank controller stopped"));
    TEST_ASSERT_EQUAL(writes, rig.actuators.writes.size());
}

// Mean 57.967 is below 58.0 even though it displays as 58.0
void test_core_band_uses_exact_mean() {
    ControlRig rig;
    rig.sensors.setTank(1, 57.9f);
    rig.sensors.setTank(2, 58.0f);
    rig.sensors.setTank(3, 58.0f);

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_EQUAL_INT16(580, state.averageTemperature);
    TEST_ASSERT_TRUE(state.heatingActive);

    // Mean 62.033 is above 62.0
    rig.sensors.setTank(1, 62.1f);
    rig.sensors.setTank(2, 62.0f);
    rig.sensors.setTank(3, 62.0f);
    state = rig.cycleAt(5000);
    TEST_ASSERT_EQUAL_INT16(620, state.averageTemperature);
    TEST_ASSERT_FALSE(state.heatingActive);

    // Exactly 62.0 keeps the previous decision
    rig.sensors.setAll(57.0f);
    TEST_ASSERT_TRUE(rig.cycleAt(10000).heatingActive);
    rig.sensors.setAll(62.0f);
    TEST_ASSERT_TRUE(rig.cycleAt(15000).heatingActive);
}

// Mean 84.967 stays under a ceiling of 85.0
void test_core_ceiling_uses_exact_mean() {
    ControlRig rig;
    rig.config.params.setpoint = 870;
    rig.config.params.maxTemperature = 850;
    rig.sensors.setTank(1, 84.9f);
    rig.sensors.setTank(2, 85.0f);
    rig.sensors.setTank(3, 85.0f);

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_EQUAL_INT16(850, state.averageTemperature);
    TEST_ASSERT_FALSE(state.safetyTripped);
    TEST_ASSERT_TRUE(state.heatingActive);

    rig.sensors.setTank(1, 85.0f);
    state = rig.cycleAt(5000);
    TEST_ASSERT_TRUE(state.safetyTripped);
    TEST_ASSERT_FALSE(state.heatingActive);
}

// A busy config store holds heating off without faking mode changes
void test_core_busy_config_store_keeps_mode() {
    ControlRig rig;
    rig.sensors.setAll(70.0f);
    TEST_ASSERT_TRUE(rig.config.applyManual(true, true, true, "1234").isSuccess());

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_TRUE(state.pumpActive);

    rig.config.snapshotBusy = true;
    state = rig.cycleAt(5000);

    TEST_ASSERT_FALSE(state.heatingActive);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_TRUE(state.manualOverride);
    TEST_ASSERT_TRUE(state.heatingSystemEnabled);
    TEST_ASSERT_TRUE(state.pumpActive);
    TEST_ASSERT_TRUE(rig.actuators.pumpOn);
    TEST_ASSERT_EQUAL(0, rig.sink.countEvents(ControlEventKind::MODE_CHANGE));

    rig.config.snapshotBusy = false;
    state = rig.cycleAt(10000);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
    TEST_ASSERT_EQUAL(0, rig.sink.countEvents(ControlEventKind::MODE_CHANGE));
}

// Heater is not switched on while the pump cannot be confirmed running
void test_core_heater_waits_for_pump() {
    ControlRig rig;
    rig.actuators.failPump = true;
    rig.sensors.setAll(57.0f);

    SystemState state = rig.cycleAt(0);
    TEST_ASSERT_TRUE(state.heatingActive);
    TEST_ASSERT_FALSE(state.heatingRelayOn);
    TEST_ASSERT_FALSE(state.pumpRelayOn);
    TEST_ASSERT_FALSE(rig.actuators.heatingOn);
    TEST_ASSERT_EQUAL(0, rig.actuators.countWrites(Actuator::HEATING));
    TEST_ASSERT_TRUE(rig.sink.hasEventContaining(ControlEventKind::ACTUATOR_FAILURE,
                                                 "Failed to switch pump on"));

    rig.actuators.failPump = false;
    rig.actuators.clearWrites();
    state = rig.cycleAt(5000);
    TEST_ASSERT_TRUE(state.heatingRelayOn);
    TEST_ASSERT_TRUE(state.pumpRelayOn);
    TEST_ASSERT_TRUE(rig.actuators.heatingOn);
    TEST_ASSERT_EQUAL(2, rig.actuators.writes.size());
    TEST_ASSERT_TRUE(rig.actuators.writes[0].actuator == Actuator::PUMP);
    TEST_ASSERT_TRUE(rig.actuators.writes[1].actuator == Actuator::HEATING);
}
