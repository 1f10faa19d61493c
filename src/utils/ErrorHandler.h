// src/utils/ErrorHandler.h
#ifndef ERROR_HANDLER_H
#define ERROR_HANDLER_H

#include <cstdint>
#include <string>

/**
 * @brief Error Return Type Conventions
 *
 * Use Result<void> for:
 * - Action functions that can fail (relay writes, config updates, task start)
 * - Operations that need to communicate WHY they failed
 *
 * Use bool for:
 * - Predicates and checks (isReady, isAuthorized, isRunning)
 * - Low-level operations that log internally
 *
 * IMPORTANT: Always check Result<void> returns from:
 * - IActuatorGateway::setActuator
 * - IConfigStore::applyManual / applyParameters / setParameter
 */

/**
 * @brief Unified error codes for the system
 */
enum class SystemError : uint32_t {
    SUCCESS = 0,

    // General errors (1-99)
    UNKNOWN_ERROR = 1,
    INVALID_PARAMETER = 2,
    TIMEOUT = 3,
    NOT_INITIALIZED = 4,
    CYCLE_IN_PROGRESS = 7,

    // Mutex/Thread errors (100-199)
    MUTEX_CREATE_FAILED = 100,
    MUTEX_TIMEOUT = 101,
    TASK_CREATE_FAILED = 110,

    // MQTT errors (300-399)
    MQTT_NOT_CONNECTED = 300,
    MQTT_PUBLISH_FAILED = 302,

    // Device errors (450-499)
    DEVICE_NOT_INITIALIZED = 450,

    // Sensor errors (500-599)
    SENSOR_READ_FAILED = 500,
    SENSOR_TIMEOUT = 505,
    ALL_SENSORS_UNAVAILABLE = 506,

    // Relay errors (600-699)
    RELAY_OPERATION_FAILED = 600,

    // System errors (700-799)
    SYSTEM_FAILSAFE_TRIGGERED = 703,
    TEMPERATURE_CRITICAL = 704,

    // Configuration errors (800-899)
    CONFIG_INVALID = 800,
    CONFIG_MISSING = 801,
    UNAUTHORIZED = 810
};

/**
 * @brief Application Result type for error handling
 */
template<typename T>
class Result {
private:
    bool success_;
    T value_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    explicit Result(const T& value)
        : success_(true), value_(value), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), value_{}, error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    const T& value() const { return value_; }
    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

// Specialization for void
template<>
class Result<void> {
private:
    bool success_;
    SystemError error_;
    std::string message_;

public:
    // Success constructor
    Result() : success_(true), error_(SystemError::SUCCESS), message_("") {}

    // Error constructor
    Result(SystemError error, const std::string& message = "")
        : success_(false), error_(error), message_(message) {}

    bool isSuccess() const { return success_; }
    bool isError() const { return !success_; }

    SystemError error() const { return error_; }
    const std::string& message() const { return message_; }
};

/**
 * @brief Error handler utility class
 */
class ErrorHandler {
public:
    /**
     * @brief Convert error code to string
     */
    static const char* errorToString(SystemError error) {
        switch (error) {
            case SystemError::SUCCESS: return "Success";
            case SystemError::UNKNOWN_ERROR: return "Unknown error";
            case SystemError::INVALID_PARAMETER: return "Invalid parameter";
            case SystemError::TIMEOUT: return "Operation timeout";
            case SystemError::NOT_INITIALIZED: return "Not initialized";
            case SystemError::CYCLE_IN_PROGRESS: return "Control cycle already in progress";

            case SystemError::MUTEX_CREATE_FAILED: return "Mutex creation failed";
            case SystemError::MUTEX_TIMEOUT: return "Mutex timeout";
            case SystemError::TASK_CREATE_FAILED: return "Task creation failed";

            case SystemError::MQTT_NOT_CONNECTED: return "MQTT not connected";
            case SystemError::MQTT_PUBLISH_FAILED: return "MQTT publish failed";

            case SystemError::DEVICE_NOT_INITIALIZED: return "Device not initialized";

            case SystemError::SENSOR_READ_FAILED: return "Sensor read failed";
            case SystemError::SENSOR_TIMEOUT: return "Sensor timeout";
            case SystemError::ALL_SENSORS_UNAVAILABLE: return "All tank sensors unavailable";

            case SystemError::RELAY_OPERATION_FAILED: return "Relay operation failed";

            case SystemError::SYSTEM_FAILSAFE_TRIGGERED: return "System failsafe triggered";
            case SystemError::TEMPERATURE_CRITICAL: return "Temperature critical";

            case SystemError::CONFIG_INVALID: return "Config invalid";
            case SystemError::CONFIG_MISSING: return "Config missing";
            case SystemError::UNAUTHORIZED: return "Unauthorized";

            default: return "Unknown error code";
        }
    }

    /**
     * @brief Log error with context
     */
    static void logError(const char* tag, SystemError error, const char* context = nullptr);
};

#endif // ERROR_HANDLER_H
