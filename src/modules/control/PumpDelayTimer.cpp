// src/modules/control/PumpDelayTimer.cpp
#include "modules/control/PumpDelayTimer.h"
#include "utils/Utils.h"

bool PumpDelayTimer::update(bool heatingActive, uint32_t nowMs, uint32_t pumpDelayMs) {
    if (heatingActive) {
        phase_ = PumpPhase::RUNNING;
        deadlineMs_ = 0;
    } else {
        if (phase_ == PumpPhase::RUNNING || lastHeating_) {
            phase_ = PumpPhase::PENDING_SHUTOFF;
            deadlineMs_ = nowMs + pumpDelayMs;
        }
        if (phase_ == PumpPhase::PENDING_SHUTOFF && Utils::deadlineReached(deadlineMs_, nowMs)) {
            phase_ = PumpPhase::IDLE;
            deadlineMs_ = 0;
        }
    }

    lastHeating_ = heatingActive;
    return isPumpOn();
}

void PumpDelayTimer::followManual(bool heatingActive, bool pumpOn) {
    phase_ = pumpOn ? PumpPhase::RUNNING : PumpPhase::IDLE;
    deadlineMs_ = 0;
    lastHeating_ = heatingActive;
}
