// src/modules/control/HysteresisController.cpp
#include "modules/control/HysteresisController.h"

bool HysteresisController::evaluate(int32_t sum, uint8_t count, Temperature_t setpoint,
                                    Temperature_t hysteresis) {
    if (count == 0) {
        return heatingActive_;
    }

    // mean < edge  <=>  sum < count * edge, no rounding involved
    const int32_t onBelow = (static_cast<int32_t>(setpoint) - hysteresis) * count;
    const int32_t offAbove = (static_cast<int32_t>(setpoint) + hysteresis) * count;

    if (!heatingActive_ && sum < onBelow) {
        heatingActive_ = true;
    } else if (heatingActive_ && sum > offAbove) {
        heatingActive_ = false;
    }
    return heatingActive_;
}
