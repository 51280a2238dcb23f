#pragma once

#include "crow.h"
#include "../shared/DTOs.hpp"
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace WordleChain {

    // WebSocket connections interested in a puzzle's notifications.
    class SubscriptionManager {
    public:
        explicit SubscriptionManager() = default;
		~SubscriptionManager() = default;

		void subscribe(PuzzleId puzzleId, crow::websocket::connection* conn);
		bool unsubscribe(PuzzleId puzzleId, crow::websocket::connection* conn);
		void unregisterConnection(crow::websocket::connection* conn);

		void broadcastToPuzzle(PuzzleId puzzleId, const std::string& message);

		static void sendTo(crow::websocket::connection* conn, const std::string& message);
		static void log(const std::string& message);

    private:
		mutable std::mutex mutex_;
		std::unordered_map<PuzzleId, std::unordered_set<crow::websocket::connection*>> subscribers_;
    };

}
