/**
 * @file test_pump_delay_timer.cpp
 * @brief Pump overrun state machine
 */

#include <unity.h>

#include "modules/control/PumpDelayTimer.h"

static const uint32_t DELAY_MS = 60000;

void test_pump_idle_until_heating() {
    PumpDelayTimer timer;
    TEST_ASSERT_FALSE(timer.update(false, 0, DELAY_MS));
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::IDLE);
}

void test_pump_runs_with_heating() {
    PumpDelayTimer timer;
    TEST_ASSERT_TRUE(timer.update(true, 0, DELAY_MS));
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::RUNNING);
    TEST_ASSERT_FALSE(timer.isShutoffPending());
}

void test_pump_overrun_after_heating_off() {
    PumpDelayTimer timer;
    timer.update(true, 0, DELAY_MS);

    // Heating drops at t=10s
    TEST_ASSERT_TRUE(timer.update(false, 10000, DELAY_MS));
    TEST_ASSERT_TRUE(timer.isShutoffPending());
    TEST_ASSERT_EQUAL_UINT32(70000, timer.getDeadlineMs());

    // Deadline is not moved by later cycles
    TEST_ASSERT_TRUE(timer.update(false, 40000, DELAY_MS));
    TEST_ASSERT_EQUAL_UINT32(70000, timer.getDeadlineMs());

    TEST_ASSERT_TRUE(timer.update(false, 69999, DELAY_MS));
    TEST_ASSERT_FALSE(timer.update(false, 70000, DELAY_MS));
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::IDLE);
}

void test_pump_heating_resumes_cancels_shutoff() {
    PumpDelayTimer timer;
    timer.update(true, 0, DELAY_MS);
    timer.update(false, 1000, DELAY_MS);
    TEST_ASSERT_TRUE(timer.isShutoffPending());

    TEST_ASSERT_TRUE(timer.update(true, 5000, DELAY_MS));
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::RUNNING);

    // A new off edge restarts the full delay
    timer.update(false, 20000, DELAY_MS);
    TEST_ASSERT_EQUAL_UINT32(80000, timer.getDeadlineMs());
}

void test_pump_zero_delay_stops_same_cycle() {
    PumpDelayTimer timer;
    timer.update(true, 0, 0);
    TEST_ASSERT_FALSE(timer.update(false, 5000, 0));
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::IDLE);
}

// Deadline arithmetic survives millis() wrap after ~49.7 days
void test_pump_deadline_across_millis_wrap() {
    PumpDelayTimer timer;
    const uint32_t start = 0xFFFFF000UL;
    timer.update(true, start, DELAY_MS);
    timer.update(false, start, DELAY_MS);

    TEST_ASSERT_TRUE(timer.update(false, start + 30000UL, DELAY_MS));
    TEST_ASSERT_TRUE(timer.update(false, start + DELAY_MS - 1, DELAY_MS));
    TEST_ASSERT_FALSE(timer.update(false, start + DELAY_MS, DELAY_MS));
}

void test_pump_follow_manual_then_resume_auto() {
    PumpDelayTimer timer;

    // Operator runs the pump with heating on
    timer.followManual(true, true);
    TEST_ASSERT_TRUE(timer.getPhase() == PumpPhase::RUNNING);

    // Back in auto with heating off: fresh overrun, not an instant stop
    TEST_ASSERT_TRUE(timer.update(false, 1000, DELAY_MS));
    TEST_ASSERT_EQUAL_UINT32(61000, timer.getDeadlineMs());

    // Operator had everything off: auto starts idle
    PumpDelayTimer idle;
    idle.followManual(false, false);
    TEST_ASSERT_FALSE(idle.update(false, 1000, DELAY_MS));
}
