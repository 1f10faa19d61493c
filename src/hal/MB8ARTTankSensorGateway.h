// src/hal/MB8ARTTankSensorGateway.h
// Tank probes on the MB8ART PT1000 module

#pragma once

#include <vector>
#include "hal/ControlGateways.h"

class MB8ART;

namespace HAL {

/**
 * @brief Tank sensor gateway backed by an MB8ART module
 *
 * The MB8ART returns all channels in one Modbus transaction, so the first
 * readTank() of a cycle requests a fresh batch and the following tanks are
 * served from it as long as it is younger than the batch max age. Tank ids
 * map to channels through TankSensorIndex.
 */
class MB8ARTTankSensorGateway : public ITankSensorGateway {
public:
    explicit MB8ARTTankSensorGateway(MB8ART* device);

    Reading readTank(uint8_t tankId, uint32_t timeoutMs) override;

    const char* getName() const override { return "MB8ART"; }

private:
    bool refreshBatch(uint32_t timeoutMs);
    bool batchIsFresh(uint32_t nowMs) const;

    MB8ART* device_;
    std::vector<float> batch_;
    uint32_t batchTimeMs_;
    bool haveBatch_;

    static constexpr const char* TAG = "MB8ARTGw";
};

} // namespace HAL
