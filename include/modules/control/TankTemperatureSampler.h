// include/modules/control/TankTemperatureSampler.h
#pragma once

#include <cstdint>
#include "hal/ControlGateways.h"
#include "shared/TankControlTypes.h"

/**
 * @brief Result of one sampling pass over all tanks
 */
struct TankSample {
    TankReading tanks[TankSensorIndex::TANK_COUNT];
    uint8_t availableCount;
    int32_t sum;            // tenths, over the available tanks
    Temperature_t average;  // rounded for display, TEMP_INVALID if availableCount == 0
};

/**
 * @brief Reads every tank probe once and averages what answered
 *
 * A probe that times out, returns nothing, or reports a value outside the
 * plausible tank range is marked unavailable for this pass. It does not
 * abort the pass. The total wait is bounded by the timeout handed to
 * sample(): each tank gets an equal share of it.
 */
class TankTemperatureSampler {
public:
    explicit TankTemperatureSampler(HAL::ITankSensorGateway& gateway);

    TankSample sample(uint32_t timeoutMs);

private:
    HAL::ITankSensorGateway& gateway_;
    static constexpr const char* TAG = "TankSampler";
};
