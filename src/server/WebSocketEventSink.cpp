#include "WebSocketEventSink.hpp"
#include "JsonCodec.hpp"

using namespace WordleChain;

WebSocketEventSink::WebSocketEventSink(
    std::shared_ptr<SubscriptionManager> subscriptions,
    std::shared_ptr<TaskQueue> taskQueue
) : subscriptions(std::move(subscriptions)),
taskQueue(std::move(taskQueue)) {
}

void WebSocketEventSink::publish(const GameEvent& event) {
    PuzzleId puzzleId = std::visit([](const auto& e) { return e.puzzleId; }, event);
    std::string message = JsonCodec::eventToJson(event).dump();

    SubscriptionManager::log("[EVENT] " + eventName(event) + " puzzle " + std::to_string(puzzleId));

    taskQueue->enqueue([subs = subscriptions, puzzleId, message]() {
        subs->broadcastToPuzzle(puzzleId, message);
    });
}
