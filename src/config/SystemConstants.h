// src/config/SystemConstants.h
#ifndef SYSTEM_CONSTANTS_H
#define SYSTEM_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace SystemConstants {

    // ===========================
    // Timing Constants
    // ===========================
    namespace Timing {
        // Mutex timeouts - IMPORTANT: Never use portMAX_DELAY to prevent deadlocks
        // - SHORT (50ms): status reads
        // - DEFAULT (100ms): parameter snapshots and updates
        // - LONG (1000ms): initialization
        constexpr uint32_t MUTEX_SHORT_TIMEOUT_MS = 50;
        constexpr uint32_t MUTEX_DEFAULT_TIMEOUT_MS = 100;
        constexpr uint32_t MUTEX_LONG_TIMEOUT_MS = 1000;

        constexpr uint32_t FAILSAFE_LED_BLINK_MS = 250;
    }

    // ===========================
    // Task Constants
    // ===========================
    namespace Tasks {
        namespace TankControl {
            // Poll step while waiting for a Modbus batch (also feeds the watchdog)
            constexpr uint32_t SENSOR_POLL_INTERVAL_MS = 100;
            // A batch younger than this is reused for the remaining tanks of a pass
            constexpr uint32_t SENSOR_BATCH_MAX_AGE_MS = 2000;
            // Longest single sleep between cycles, watchdog is fed in between
            constexpr uint32_t MAX_SLEEP_SLICE_MS = 1000;
        }

        namespace MQTT {
            constexpr uint32_t MIN_RECONNECT_INTERVAL_MS = 5000;
            constexpr uint32_t MAX_RECONNECT_INTERVAL_MS = 300000;  // 5 minutes
            constexpr uint8_t MAX_RECONNECT_ATTEMPTS = 10;
            constexpr uint32_t EVENT_WAIT_MS = 100;
            constexpr uint8_t PUBLISH_QUEUE_SIZE = 8;
        }
    }

    // ===========================
    // System Constants
    // ===========================
    namespace System {
        // Watchdog timeouts per task
        constexpr uint32_t WDT_TANK_CONTROL_MS = 15000;  // 15s: 1s sleep slices + sensor poll steps
        constexpr uint32_t WDT_MQTT_TASK_MS = 30000;     // 30s: network operations

        // Heap thresholds for the loop() memory report
        constexpr size_t MIN_FREE_HEAP_WARNING = 30000;
        constexpr size_t MIN_FREE_HEAP_CRITICAL = 15000;
        constexpr uint32_t MEMORY_REPORT_INTERVAL_MS = 300000;

        // Status LED: slow heartbeat when healthy, fast while fail-safe / tripped
        constexpr uint32_t LED_HEARTBEAT_MS = 1000;
    }
}

#endif // SYSTEM_CONSTANTS_H
