// src/config/ProjectConfig.h
#ifndef PROJECT_CONFIG_H
#define PROJECT_CONFIG_H

// Project information
#define PROJECT_NAME "Tank Heating Controller"

#define PROJECT_VERSION "1.0.0"

#ifdef AUTO_VERSION
#define FIRMWARE_VERSION PROJECT_VERSION "-" AUTO_VERSION
#else
#define FIRMWARE_VERSION PROJECT_VERSION
#endif

// Device identification
// If not defined by the build, set defaults
#ifndef DEVICE_HOSTNAME
#define DEVICE_HOSTNAME "tankctl"
#endif

#ifndef LED_BUILTIN
#define LED_BUILTIN 2  // Default ESP32 LED pin
#endif

#define SERIAL_BAUD_RATE 921600

// RS485 / Modbus RTU (8E1)
#define RS485_RX_PIN 36
#define RS485_TX_PIN 4
#define MODBUS_BAUD_RATE 9600

// Modbus device addresses
#define RYN4_ADDRESS 0x02
#define MB8ART_ADDRESS 0x03

// FRAM on the shared I2C bus (pins chosen to avoid the Ethernet PHY)
#define I2C_SDA_PIN 33
#define I2C_SCL_PIN 32
#define FRAM_I2C_ADDRESS 0x50

// Ethernet PHY (LAN8720)
#define ETH_PHY_ADDR 0
#define ETH_PHY_MDC_PIN 23
#define ETH_PHY_MDIO_PIN 18
#define ETH_PHY_POWER_PIN -1  // No power pin
#define ETH_CLOCK_MODE ETH_CLOCK_GPIO17_OUT
#define ETH_CONNECTION_TIMEOUT_MS 15000

// Uncomment for a fixed address instead of DHCP
// #define USE_STATIC_IP
#ifdef USE_STATIC_IP
#define ETH_STATIC_IP      192, 168, 20, 41
#define ETH_GATEWAY        192, 168, 20, 1
#define ETH_SUBNET         255, 255, 255, 0
#define ETH_DNS1           192, 168, 20, 1
#define ETH_DNS2           8, 8, 8, 8
#endif

// MQTT broker
#ifndef MQTT_SERVER
#define MQTT_SERVER "192.168.20.27"
#endif
#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif
#ifndef MQTT_USERNAME
#define MQTT_USERNAME ""
#endif
#ifndef MQTT_PASSWORD
#define MQTT_PASSWORD ""
#endif

// Operator PIN for manual override until one is stored in NVS.
// Shorter than 4 characters disables manual override, and it cannot be
// set over MQTT then: provision it here or in the "tankctl" NVS namespace.
#ifndef TANKCTL_MANUAL_PIN
#define TANKCTL_MANUAL_PIN ""
#endif

// Log mode selection (define only one)
// #define LOG_MODE_DEBUG_FULL      // Full debug logging
// #define LOG_MODE_DEBUG_SELECTIVE // Selective debug logging

// Only define LOG_MODE_RELEASE if no other log mode is defined
#if !defined(LOG_MODE_DEBUG_FULL) && !defined(LOG_MODE_DEBUG_SELECTIVE) && !defined(LOG_MODE_RELEASE)
    #define LOG_MODE_RELEASE         // Production logging (default)
#endif

// Task stack sizes (bytes)
#if defined(LOG_MODE_DEBUG_FULL) || defined(LOG_MODE_DEBUG_SELECTIVE)
    #define STACK_SIZE_TANK_CONTROL_TASK     4096  // float formatting in transition logs
    #define STACK_SIZE_MQTT_TASK             4096  // JSON state serialization
    #define STACK_SIZE_LOOP_TASK             4096
#else
    #define STACK_SIZE_TANK_CONTROL_TASK     3072
    #define STACK_SIZE_MQTT_TASK             3584
    #define STACK_SIZE_LOOP_TASK             2048
#endif

// Task priorities
#define PRIORITY_TANK_CONTROL_TASK 4  // Safety-critical: above communication
#define PRIORITY_MQTT_TASK 2

// Task cores
#define CORE_TANK_CONTROL_TASK 1
#define CORE_MQTT_TASK 0

#endif // PROJECT_CONFIG_H
