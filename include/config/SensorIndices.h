#pragma once
#include <cstdint>

namespace TankSensorIndex {
    // =========================================================
    // SINGLE SOURCE OF TRUTH FOR TANK SENSOR ASSIGNMENTS
    //
    // Tank ids are 1-based (tank 1..3), MB8ART channels 0-based.
    // To move a probe to another channel change ONLY the table below.
    // =========================================================

    constexpr uint8_t TANK_COUNT = 3;

    constexpr uint8_t TANK_1_CHANNEL = 0;  // CH0 - Tank 1 PT1000
    constexpr uint8_t TANK_2_CHANNEL = 1;  // CH1 - Tank 2 PT1000
    constexpr uint8_t TANK_3_CHANNEL = 2;  // CH2 - Tank 3 PT1000

    constexpr uint8_t MAX_MB8ART_CHANNELS = 8;

    constexpr bool isValidTank(uint8_t tankId) {
        return tankId >= 1 && tankId <= TANK_COUNT;
    }

    // Tank id (1..3) -> MB8ART channel
    constexpr uint8_t toChannel(uint8_t tankId) {
        return tankId == 1 ? TANK_1_CHANNEL
             : tankId == 2 ? TANK_2_CHANNEL
             : TANK_3_CHANNEL;
    }

    // Tank id (1..3) -> array slot (0..2)
    constexpr uint8_t toSlot(uint8_t tankId) { return tankId - 1; }
}
