// src/modules/control/TankTemperatureSampler.cpp
#include "modules/control/TankTemperatureSampler.h"
#include "LoggingMacros.h"
#include <cmath>

TankTemperatureSampler::TankTemperatureSampler(HAL::ITankSensorGateway& gateway)
    : gateway_(gateway) {}

TankSample TankTemperatureSampler::sample(uint32_t timeoutMs) {
    TankSample result;
    Temperature_t values[TankSensorIndex::TANK_COUNT];

    const uint32_t perTankTimeoutMs = timeoutMs / TankSensorIndex::TANK_COUNT;

    for (uint8_t tankId = 1; tankId <= TankSensorIndex::TANK_COUNT; tankId++) {
        const uint8_t slot = TankSensorIndex::toSlot(tankId);
        TankReading& reading = result.tanks[slot];
        reading.tankId = tankId;
        reading.temperature = TEMP_INVALID;
        reading.available = false;

        HAL::ITankSensorGateway::Reading raw = gateway_.readTank(tankId, perTankTimeoutMs);

        if (raw.valid && !std::isnan(raw.temperature)) {
            if (raw.temperature >= TemperatureConstants::TANK_PROBE_MIN_FLOAT &&
                raw.temperature <= TemperatureConstants::TANK_PROBE_MAX_FLOAT) {
                reading.temperature = tempFromFloat(raw.temperature);
                reading.available = true;
            } else {
                LOG_WARN(TAG, "Tank %u reading %.1f outside plausible range - ignored",
                         tankId, raw.temperature);
            }
        } else {
            LOG_DEBUG(TAG, "Tank %u unavailable from %s", tankId, gateway_.getName());
        }

        values[slot] = reading.temperature;
    }

    result.sum = tempSum(values, TankSensorIndex::TANK_COUNT, &result.availableCount);
    result.average = tempAverage(values, TankSensorIndex::TANK_COUNT);
    return result;
}
