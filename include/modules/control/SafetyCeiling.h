// include/modules/control/SafetyCeiling.h
#pragma once

#include <cstdint>
#include "shared/Temperature.h"

/**
 * @brief Safety verdict on the averaged tank temperature
 *
 * Evaluated every cycle after the heating decision, including under manual
 * override. Anything but OK forces heating off.
 */
namespace SafetyCeiling {

enum class Verdict {
    OK,
    CEILING_REACHED,      // average >= max temperature
    NO_VALID_TEMPERATURE  // cannot prove we are below the ceiling
};

/**
 * @brief Verdict on the exact mean sum / count (sum in tenths)
 */
inline Verdict evaluate(int32_t sum, uint8_t count, Temperature_t maxTemperature) {
    if (count == 0) {
        return Verdict::NO_VALID_TEMPERATURE;
    }
    return (sum >= static_cast<int32_t>(maxTemperature) * count) ? Verdict::CEILING_REACHED
                                                                 : Verdict::OK;
}

inline Verdict evaluate(Temperature_t average, Temperature_t maxTemperature) {
    if (!tempIsValid(average)) {
        return Verdict::NO_VALID_TEMPERATURE;
    }
    return evaluate(static_cast<int32_t>(average), 1, maxTemperature);
}

inline bool allowsHeating(Verdict verdict) {
    return verdict == Verdict::OK;
}

} // namespace SafetyCeiling
