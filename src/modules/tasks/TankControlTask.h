// src/modules/tasks/TankControlTask.h
#ifndef TANK_CONTROL_TASK_H
#define TANK_CONTROL_TASK_H

#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

class TankControlCore;

/**
 * @brief Periodic FreeRTOS task driving TankControlCore
 *
 * Control Flow:
 *   1. runCycle() with the current millis()
 *   2. mirror fail-safe / safety trip into the system state event group
 *   3. sleep until the next period (update_interval, re-read every cycle)
 *
 * The sleep is split into slices so the watchdog is fed and a stop request
 * is noticed while waiting. A cycle that overruns its period re-anchors the
 * schedule instead of running catch-up cycles back to back.
 */
class TankControlTask {
public:
    /**
     * @brief Create the task (pinned, critical watchdog)
     * @param core Control core, must outlive the task
     */
    static bool start(TankControlCore* core);

    /**
     * @brief Request a stop. The current cycle completes, then shutdown()
     * is called and the task deletes itself.
     */
    static void stop();

    static bool isRunning();

private:
    TankControlTask() = delete;

    static void taskFunction(void* parameter);
    static uint32_t currentIntervalMs();
    static void sleepUntilNextCycle(TickType_t& lastWake, TickType_t period);

    static TankControlCore* core_;
    static std::atomic<bool> running_;
    static std::atomic<bool> stopRequested_;
};

#endif // TANK_CONTROL_TASK_H
