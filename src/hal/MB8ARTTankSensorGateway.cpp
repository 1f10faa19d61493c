// src/hal/MB8ARTTankSensorGateway.cpp

#include "hal/MB8ARTTankSensorGateway.h"
#include <Arduino.h>
#include <MB8ART.h>
#include <TaskManager.h>
#include <cmath>
#include "config/SensorIndices.h"
#include "config/SystemConstants.h"
#include "core/SystemResourceProvider.h"
#include "LoggingMacros.h"

namespace HAL {

MB8ARTTankSensorGateway::MB8ARTTankSensorGateway(MB8ART* device)
    : device_(device), batchTimeMs_(0), haveBatch_(false) {}

bool MB8ARTTankSensorGateway::batchIsFresh(uint32_t nowMs) const {
    return haveBatch_ &&
           (nowMs - batchTimeMs_) < SystemConstants::Tasks::TankControl::SENSOR_BATCH_MAX_AGE_MS;
}

bool MB8ARTTankSensorGateway::refreshBatch(uint32_t timeoutMs) {
    if (!device_ || !device_->isInitialized()) {
        LOG_WARN(TAG, "MB8ART not initialized");
        return false;
    }

    const uint32_t start = millis();

    // May block waiting for the bus, feed watchdog after
    auto reqResult = device_->requestTemperatures();
    (void)SRP::getTaskManager().feedWatchdog();
    if (!reqResult) {
        LOG_WARN(TAG, "Failed to request temperatures");
        return false;
    }

    while (!device_->hasAnyUpdatePending()) {
        if ((millis() - start) >= timeoutMs) {
            LOG_WARN(TAG, "No temperature update within %lu ms",
                     static_cast<unsigned long>(timeoutMs));
            return false;
        }
        vTaskDelay(pdMS_TO_TICKS(SystemConstants::Tasks::TankControl::SENSOR_POLL_INTERVAL_MS));
        (void)SRP::getTaskManager().feedWatchdog();
    }

    auto result = device_->getData(IDeviceInstance::DeviceDataType::TEMPERATURE);
    if (!result.isOk() || result.value().empty()) {
        LOG_ERROR(TAG, "Failed to get temperature data - error: %d",
                  static_cast<int>(result.error()));
        return false;
    }

    batch_ = result.value();
    batchTimeMs_ = millis();
    haveBatch_ = true;
    LOG_DEBUG(TAG, "Got %u channel values", static_cast<unsigned>(batch_.size()));
    return true;
}

ITankSensorGateway::Reading MB8ARTTankSensorGateway::readTank(uint8_t tankId, uint32_t timeoutMs) {
    Reading reading = {0.0f, false, 0};

    if (!TankSensorIndex::isValidTank(tankId)) {
        LOG_ERROR(TAG, "Invalid tank id %u", tankId);
        return reading;
    }

    if (!batchIsFresh(millis()) && !refreshBatch(timeoutMs)) {
        return reading;
    }

    const uint8_t channel = TankSensorIndex::toChannel(tankId);
    if (channel >= batch_.size()) {
        LOG_WARN(TAG, "Tank %u: channel %u missing from batch", tankId, channel);
        return reading;
    }

    const float value = batch_[channel];
    if (!std::isfinite(value)) {
        LOG_DEBUG(TAG, "Tank %u: channel %u has no value", tankId, channel);
        return reading;
    }

    reading.temperature = value;
    reading.valid = true;
    reading.timestamp = batchTimeMs_;
    return reading;
}

} // namespace HAL
