#pragma once
#include <cstdint>

namespace RelayIndex {
    // =========================================================
    // SINGLE SOURCE OF TRUTH FOR RELAY ASSIGNMENTS
    //
    // Array index maps to physical relay: physical = index + 1
    // Remaining RYN4 channels are not driven by this firmware.
    // =========================================================

    constexpr uint8_t HEATING = 0;  // Physical Relay 1 - Heating element contactor
    constexpr uint8_t PUMP    = 1;  // Physical Relay 2 - Circulation pump

    constexpr uint8_t MAX_RELAYS = 8;

    // Convert array index to physical relay number (1-8)
    constexpr uint8_t toPhysical(uint8_t index) { return index + 1; }
}
