/**
 * @file MockActuatorGateway.h
 * @brief Relay gateway that records every write and can be told to fail
 */

#ifndef MOCK_ACTUATOR_GATEWAY_H
#define MOCK_ACTUATOR_GATEWAY_H

#include <vector>
#include "hal/ControlGateways.h"

class MockActuatorGateway : public HAL::IActuatorGateway {
public:
    struct Write {
        Actuator actuator;
        bool on;
        bool succeeded;
    };

    std::vector<Write> writes;
    bool heatingOn = false;
    bool pumpOn = false;
    bool failHeating = false;
    bool failPump = false;

    Result<void> setActuator(Actuator actuator, bool on) override {
        bool fail = (actuator == Actuator::HEATING) ? failHeating : failPump;
        writes.push_back({actuator, on, !fail});
        if (fail) {
            return Result<void>(SystemError::RELAY_OPERATION_FAILED, "injected failure");
        }
        if (actuator == Actuator::HEATING) {
            heatingOn = on;
        } else {
            pumpOn = on;
        }
        return Result<void>();
    }

    const char* getName() const override {
        return "MockRelays";
    }

    size_t countWrites(Actuator actuator) const {
        size_t n = 0;
        for (const auto& w : writes) {
            if (w.actuator == actuator) n++;
        }
        return n;
    }

    void clearWrites() {
        writes.clear();
    }
};

#endif // MOCK_ACTUATOR_GATEWAY_H
