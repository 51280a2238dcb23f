#pragma once

#include <memory>
#include "../engine/EventSink.hpp"
#include "../infra/TaskQueue.hpp"
#include "SubscriptionManager.hpp"

namespace WordleChain {

    // Logs each notification and pushes it to the puzzle's WebSocket
    // subscribers on the worker pool.
    class WebSocketEventSink : public EventSink {
    public:
        WebSocketEventSink(
            std::shared_ptr<SubscriptionManager> subscriptions,
            std::shared_ptr<TaskQueue> taskQueue
        );

        void publish(const GameEvent& event) override;

    private:
        std::shared_ptr<SubscriptionManager> subscriptions;
        std::shared_ptr<TaskQueue> taskQueue;
    };
}
