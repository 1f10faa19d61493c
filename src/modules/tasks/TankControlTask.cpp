// src/modules/tasks/TankControlTask.cpp
// Tank control task - runs the hysteresis loop every update_interval
#include "modules/tasks/TankControlTask.h"

#include <Arduino.h>
#include <TaskManager.h>
#include <esp_task_wdt.h>
#include "config/ControlLimits.h"
#include "config/NvsConfigStore.h"
#include "config/ProjectConfig.h"
#include "config/SystemConstants.h"
#include "core/SystemResourceProvider.h"
#include "events/SystemEvents.h"
#include "modules/control/TankControlCore.h"
#include "utils/ErrorHandler.h"
#include "utils/Utils.h"
#include "LoggingMacros.h"

static const char* TAG = "TankCtrlTask";

TankControlCore* TankControlTask::core_ = nullptr;
std::atomic<bool> TankControlTask::running_{false};
std::atomic<bool> TankControlTask::stopRequested_{false};

namespace TankConstants = SystemConstants::Tasks::TankControl;

uint32_t TankControlTask::currentIntervalMs() {
    auto params = SRP::getConfigStore().snapshot();
    if (params.isError()) {
        return Utils::secondsToMs(ControlLimits::Defaults::UPDATE_INTERVAL_S);
    }
    return Utils::secondsToMs(params.value().updateIntervalSeconds);
}

void TankControlTask::sleepUntilNextCycle(TickType_t& lastWake, TickType_t period) {
    const TickType_t maxSlice = pdMS_TO_TICKS(TankConstants::MAX_SLEEP_SLICE_MS);
    TickType_t remaining = period;

    while (remaining > 0 && !stopRequested_.load()) {
        TickType_t slice = remaining < maxSlice ? remaining : maxSlice;
        vTaskDelayUntil(&lastWake, slice);
        remaining -= slice;
        (void)SRP::getTaskManager().feedWatchdog();
    }
}

void TankControlTask::taskFunction(void* parameter) {
    (void)parameter;

    LOG_INFO(TAG, "Started C%d Stk:%d", xPortGetCoreID(), uxTaskGetStackHighWaterMark(NULL));

    TaskManager::WatchdogConfig wdtConfig = TaskManager::WatchdogConfig::enabled(
        true,  // critical - relays must not freeze in an unknown state
        SystemConstants::System::WDT_TANK_CONTROL_MS
    );
    if (!SRP::getTaskManager().registerCurrentTaskWithWatchdog("TankControl", wdtConfig)) {
        LOG_ERROR(TAG, "WDT reg failed");
    } else {
        LOG_INFO(TAG, "WDT OK %lums", static_cast<unsigned long>(SystemConstants::System::WDT_TANK_CONTROL_MS));
        (void)SRP::getTaskManager().feedWatchdog();
    }

    auto beginResult = core_->begin(millis());
    if (beginResult.isError()) {
        ErrorHandler::logError(TAG, beginResult.error(), beginResult.message().c_str());
    }
    (void)SRP::getTaskManager().feedWatchdog();

    SRP::setSystemStateEventBits(SystemEvents::SystemState::CONTROL_RUNNING);

    TickType_t lastWake = xTaskGetTickCount();

    while (!stopRequested_.load()) {
        auto result = core_->runCycle(millis());
        if (result.isError()) {
            ErrorHandler::logError(TAG, result.error(), result.message().c_str());
        } else {
            const SystemState& state = result.value();
            if (state.failSafe) {
                SRP::setSystemStateEventBits(SystemEvents::SystemState::FAILSAFE_ACTIVE);
            } else {
                SRP::clearSystemStateEventBits(SystemEvents::SystemState::FAILSAFE_ACTIVE);
            }
            if (state.safetyTripped) {
                SRP::setSystemStateEventBits(SystemEvents::SystemState::SAFETY_TRIPPED);
            } else {
                SRP::clearSystemStateEventBits(SystemEvents::SystemState::SAFETY_TRIPPED);
            }
        }

        (void)SRP::getTaskManager().feedWatchdog();

        const uint32_t intervalMs = currentIntervalMs();
        const TickType_t period = pdMS_TO_TICKS(intervalMs);
        const TickType_t now = xTaskGetTickCount();
        const TickType_t elapsed = now - lastWake;

        if (elapsed >= period) {
            // No catch-up burst: next cycle one full period from now
            LOG_WARN(TAG, "Cycle overran interval (%lu ms > %lu ms) - re-anchoring schedule",
                     static_cast<unsigned long>(elapsed * portTICK_PERIOD_MS),
                     static_cast<unsigned long>(intervalMs));
            lastWake = now;
        }

        sleepUntilNextCycle(lastWake, period);
    }

    LOG_INFO(TAG, "Stop requested - shutting down after %lu cycles",
             static_cast<unsigned long>(core_->getCycleCount()));
    core_->shutdown();

    SRP::clearSystemStateEventBits(SystemEvents::SystemState::CONTROL_RUNNING);
    (void)esp_task_wdt_delete(NULL);
    running_.store(false);
    vTaskDelete(NULL);
}

bool TankControlTask::start(TankControlCore* core) {
    if (running_.load()) {
        return true;
    }
    if (core == nullptr) {
        LOG_ERROR(TAG, "No control core");
        return false;
    }

    core_ = core;
    stopRequested_.store(false);
    running_.store(true);

    // Task will register its own watchdog
    TaskManager::WatchdogConfig wdtConfig = TaskManager::WatchdogConfig::disabled();
    bool result = SRP::getTaskManager().startTaskPinned(
        taskFunction,
        "TankControl",
        STACK_SIZE_TANK_CONTROL_TASK,
        nullptr,
        PRIORITY_TANK_CONTROL_TASK,
        CORE_TANK_CONTROL_TASK,
        wdtConfig
    );

    if (!result) {
        LOG_ERROR(TAG, "Failed to create task");
        running_.store(false);
        return false;
    }
    return true;
}

void TankControlTask::stop() {
    if (!running_.load()) {
        return;
    }
    stopRequested_.store(true);
}

bool TankControlTask::isRunning() {
    return running_.load();
}
