/**
 * @file MockEventSink.h
 * @brief Captures published states and events
 */

#ifndef MOCK_EVENT_SINK_H
#define MOCK_EVENT_SINK_H

#include <string>
#include <vector>
#include "events/IEventSink.h"

class MockEventSink : public IEventSink {
public:
    struct Event {
        ControlEventKind kind;
        std::string description;
    };

    std::vector<SystemState> states;
    std::vector<Event> events;

    void publishState(const SystemState& state) override {
        states.push_back(state);
    }

    void publishEvent(ControlEventKind kind, const char* description) override {
        events.push_back({kind, description ? description : ""});
    }

    size_t countEvents(ControlEventKind kind) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.kind == kind) n++;
        }
        return n;
    }

    bool hasEventContaining(ControlEventKind kind, const char* text) const {
        for (const auto& e : events) {
            if (e.kind == kind && e.description.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void clear() {
        states.clear();
        events.clear();
    }
};

#endif // MOCK_EVENT_SINK_H
