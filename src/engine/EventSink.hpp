#pragma once

#include "../shared/DTOs.hpp"
#include <string>

namespace WordleChain {

    // Receives one notification per successful registry call.
    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void publish(const GameEvent& event) = 0;
    };

    // Event name as used in logs and on the wire.
    std::string eventName(const GameEvent& event);

    std::string describe(const GameEvent& event);
}
