// include/events/SystemEvents.h
// Event bit definitions using namespaced constants
#pragma once

#include <freertos/event_groups.h>

namespace SystemEvents {

    // ===== System State Events (systemStateEventGroup) =====
    namespace SystemState {
        constexpr EventBits_t NETWORK_READY    = (1 << 0);  // Ethernet link up with IP
        constexpr EventBits_t MQTT_OPERATIONAL = (1 << 1);  // Broker connected, subscribed
        constexpr EventBits_t CONTROL_RUNNING  = (1 << 2);  // Tank control loop active
        constexpr EventBits_t FAILSAFE_ACTIVE  = (1 << 3);  // No tank probe answering
        constexpr EventBits_t SAFETY_TRIPPED   = (1 << 4);  // Ceiling reached, heating forced off
        // Next free bit: 5
    }

    // ===== MQTT Task Events (mqttTaskEventGroup) =====
    namespace MQTTTask {
        constexpr EventBits_t CONNECTED        = (1 << 0);
        constexpr EventBits_t DISCONNECTED     = (1 << 1);
        constexpr EventBits_t PUBLISH_PENDING  = (1 << 2);  // Publish queue not empty
        constexpr EventBits_t STOP             = (1 << 3);
        // Next free bit: 4

        constexpr EventBits_t ALL = CONNECTED | DISCONNECTED | PUBLISH_PENDING | STOP;
    }
}
