// include/modules/control/HysteresisController.h
#pragma once

#include <cstdint>
#include "shared/Temperature.h"

/**
 * @brief Two-point heating decision with memory
 *
 * Turns heating on strictly below (setpoint - hysteresis) and off strictly
 * above (setpoint + hysteresis). Inside the band, and exactly on its edges,
 * the previous decision is kept. The state survives between cycles and is
 * also overwritten by manual override, the safety ceiling and the master
 * switch via force().
 */
class HysteresisController {
public:
    HysteresisController() = default;

    /**
     * @brief Apply the two-point rule to the exact mean sum / count
     * @param sum Sum of the available tank readings in tenths
     * @param count Number of readings in sum, the decision is kept if 0
     * @return Heating decision after the rule
     */
    bool evaluate(int32_t sum, uint8_t count, Temperature_t setpoint, Temperature_t hysteresis);

    /**
     * @brief Single-value form, ignored if average is invalid
     */
    bool evaluate(Temperature_t average, Temperature_t setpoint, Temperature_t hysteresis) {
        if (!tempIsValid(average)) {
            return heatingActive_;
        }
        return evaluate(static_cast<int32_t>(average), 1, setpoint, hysteresis);
    }

    /**
     * @brief Overwrite the remembered decision
     */
    void force(bool active) { heatingActive_ = active; }

    bool isActive() const { return heatingActive_; }

private:
    bool heatingActive_ = false;
};
