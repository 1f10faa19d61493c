/**
 * @file test_tank_sampler.cpp
 * @brief Tank probe sampling and averaging
 */

#include <unity.h>
#include <cmath>

#include "modules/control/TankTemperatureSampler.h"
#include "mocks/MockTankSensorGateway.h"

void test_sampler_averages_all_tanks() {
    MockTankSensorGateway sensors;
    sensors.setTank(1, 56.0f);
    sensors.setTank(2, 57.0f);
    sensors.setTank(3, 58.0f);

    TankTemperatureSampler sampler(sensors);
    TankSample sample = sampler.sample(30000);

    TEST_ASSERT_EQUAL_UINT8(3, sample.availableCount);
    TEST_ASSERT_EQUAL_INT16(570, sample.average);
    for (uint8_t i = 0; i < TankSensorIndex::TANK_COUNT; i++) {
        TEST_ASSERT_EQUAL_UINT8(i + 1, sample.tanks[i].tankId);
        TEST_ASSERT_TRUE(sample.tanks[i].available);
    }
    TEST_ASSERT_EQUAL_INT16(560, sample.tanks[0].temperature);
}

void test_sampler_partial_availability() {
    MockTankSensorGateway sensors;
    sensors.setTank(1, 60.0f);
    sensors.setTankUnavailable(2);
    sensors.setTank(3, 62.0f);

    TankTemperatureSampler sampler(sensors);
    TankSample sample = sampler.sample(30000);

    TEST_ASSERT_EQUAL_UINT8(2, sample.availableCount);
    TEST_ASSERT_EQUAL_INT32(1220, sample.sum);
    TEST_ASSERT_EQUAL_INT16(610, sample.average);
    TEST_ASSERT_FALSE(sample.tanks[1].available);
    TEST_ASSERT_EQUAL_INT16(TEMP_INVALID, sample.tanks[1].temperature);
}

void test_sampler_no_tanks_available() {
    MockTankSensorGateway sensors;
    sensors.setAllUnavailable();

    TankTemperatureSampler sampler(sensors);
    TankSample sample = sampler.sample(30000);

    TEST_ASSERT_EQUAL_UINT8(0, sample.availableCount);
    TEST_ASSERT_EQUAL_INT16(TEMP_INVALID, sample.average);
    TEST_ASSERT_EQUAL_UINT32(3, sensors.readCount);
}

// A probe reporting garbage counts as unavailable, it must not skew the average
void test_sampler_rejects_implausible_readings() {
    MockTankSensorGateway sensors;
    sensors.setTank(1, NAN);
    sensors.setTank(2, 850.0f);   // open circuit on a PT1000 input
    sensors.setTank(3, 55.0f);

    TankTemperatureSampler sampler(sensors);
    TankSample sample = sampler.sample(30000);

    TEST_ASSERT_EQUAL_UINT8(1, sample.availableCount);
    TEST_ASSERT_EQUAL_INT16(550, sample.average);
    TEST_ASSERT_FALSE(sample.tanks[0].available);
    TEST_ASSERT_FALSE(sample.tanks[1].available);

    // Range limits themselves are accepted
    sensors.setTank(1, -30.0f);
    sensors.setTank(2, 150.0f);
    sample = sampler.sample(30000);
    TEST_ASSERT_EQUAL_UINT8(3, sample.availableCount);
}

// The sampling pass as a whole never waits longer than the sensor timeout
void test_sampler_splits_timeout_across_tanks() {
    MockTankSensorGateway sensors;
    TankTemperatureSampler sampler(sensors);

    sampler.sample(30000);
    TEST_ASSERT_EQUAL_UINT32(10000, sensors.maxTimeoutMs);
    TEST_ASSERT_TRUE(sensors.maxTimeoutMs * TankSensorIndex::TANK_COUNT <= 30000);

    sensors.maxTimeoutMs = 0;
    sampler.sample(5000);
    TEST_ASSERT_TRUE(sensors.maxTimeoutMs * TankSensorIndex::TANK_COUNT <= 5000);
}
