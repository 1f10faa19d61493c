// include/modules/control/PumpDelayTimer.h
#pragma once

#include <cstdint>
#include "shared/TankControlTypes.h"

/**
 * @brief Circulation pump overrun after the heater switches off
 *
 * IDLE -> RUNNING when heating turns on.
 * RUNNING -> PENDING_SHUTOFF(now + delay) when heating turns off.
 * PENDING_SHUTOFF -> IDLE once now >= deadline. With a zero delay this
 * happens in the same update.
 * PENDING_SHUTOFF -> RUNNING if heating comes back, deadline dropped.
 *
 * Under manual override the timer is parked with followManual() and the
 * pump mirrors the operator's choice.
 */
class PumpDelayTimer {
public:
    PumpDelayTimer() = default;

    /**
     * @brief Advance the timer with this cycle's heating decision
     * @param heatingActive Final heating decision (after safety)
     * @param nowMs Cycle timestamp
     * @param pumpDelayMs Overrun duration
     * @return true if the pump must run
     */
    bool update(bool heatingActive, uint32_t nowMs, uint32_t pumpDelayMs);

    /**
     * @brief Park the timer while an operator drives the outputs
     *
     * RUNNING if the operator keeps the pump on, otherwise IDLE. A later
     * automatic cycle that sees heating off starts a fresh overrun.
     */
    void followManual(bool heatingActive, bool pumpOn);

    PumpPhase getPhase() const { return phase_; }
    bool isPumpOn() const { return phase_ != PumpPhase::IDLE; }
    bool isShutoffPending() const { return phase_ == PumpPhase::PENDING_SHUTOFF; }
    uint32_t getDeadlineMs() const { return deadlineMs_; }

private:
    PumpPhase phase_ = PumpPhase::IDLE;
    bool lastHeating_ = false;
    uint32_t deadlineMs_ = 0;
};
