#pragma once

#include <memory>
#include <mutex>
#include <crow.h>
#include <string>

#include "../engine/AccessPolicy.hpp"
#include "../engine/PuzzleRegistry.hpp"
#include "../infra/TaskQueue.hpp"
#include "Config.hpp"
#include "SubscriptionManager.hpp"

namespace WordleChain {

    class HttpServer {
    public:
        HttpServer(
            std::shared_ptr<PuzzleRegistry> registry,
            AccessPolicy accessPolicy,
            std::string adminToken,
            std::shared_ptr<SubscriptionManager> subscriptions,
            std::shared_ptr<TaskQueue> taskQueue
            );
        ~HttpServer() = default;

        void run(uint16_t port = 8080);
    private:

		// Admin and player operations
		crow::response handleCreatePuzzle(const crow::request& req);
		crow::response handleSubmitGuess(const crow::request& req, PuzzleId puzzleId);
		crow::response handleReveal(const crow::request& req, PuzzleId puzzleId);
		crow::response handleFinalize(const crow::request& req, PuzzleId puzzleId);

		// Reads
		crow::response handleGetPuzzle(PuzzleId puzzleId);
		crow::response handleGetPlayers(PuzzleId puzzleId);
		crow::response handleGetAttempts(PuzzleId puzzleId, const std::string& player);
		crow::response handleIsWinner(PuzzleId puzzleId, const std::string& player);

		// WebSocket handlers
		void handleWebSocketOpen(crow::websocket::connection& conn);
		void handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason);
		void handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary);

        // Helpers
		Caller resolveCaller(const crow::request& req) const;
		static crow::response badRequest(const std::string& message);

		// Components
        std::shared_ptr<PuzzleRegistry> registry;
        AccessPolicy accessPolicy;
        std::string adminToken;
        std::shared_ptr<SubscriptionManager> subscriptions;
        std::shared_ptr<TaskQueue> taskQueue;

        // The engine runs one call at a time.
        std::mutex registryMutex;
    };
}
