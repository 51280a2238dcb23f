#include "HttpServer.hpp"
#include "JsonCodec.hpp"
#include "../shared/Encoding.hpp"

#include <functional>
#include <openssl/crypto.h>
#include <print>

using namespace WordleChain;

static constexpr std::string_view BEARER_PREFIX = "Bearer ";

HttpServer::HttpServer(
    std::shared_ptr<PuzzleRegistry> registry,
    AccessPolicy accessPolicy,
    std::string adminToken,
    std::shared_ptr<SubscriptionManager> subscriptions,
    std::shared_ptr<TaskQueue> taskQueue
) : registry(std::move(registry)),
accessPolicy(std::move(accessPolicy)),
adminToken(std::move(adminToken)),
subscriptions(std::move(subscriptions)),
taskQueue(std::move(taskQueue))
{
    SubscriptionManager::log("[INIT] HttpServer ready, admin " + this->accessPolicy.config().admin);
}

void HttpServer::run(uint16_t port) {

    SubscriptionManager::log("[INIT] HttpServer::run on port " + std::to_string(port));

    crow::SimpleApp app;

    CROW_ROUTE(app, "/health")
        ([]() {
        crow::json::wvalue body;
        body["status"] = "ok";
        return JsonCodec::respond(200, body);
            });

    CROW_ROUTE(app, "/puzzles").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req) {
        SubscriptionManager::log("[HTTP] POST /puzzles");
        return this->handleCreatePuzzle(req);
            });

    CROW_ROUTE(app, "/puzzles/<uint>").methods(crow::HTTPMethod::GET)
        ([this](uint64_t puzzleId) {
        return this->handleGetPuzzle(puzzleId);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/players").methods(crow::HTTPMethod::GET)
        ([this](uint64_t puzzleId) {
        return this->handleGetPlayers(puzzleId);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/attempts").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, uint64_t puzzleId) {
        SubscriptionManager::log("[HTTP] POST /puzzles/" + std::to_string(puzzleId) + "/attempts");
        return this->handleSubmitGuess(req, puzzleId);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/attempts/<string>").methods(crow::HTTPMethod::GET)
        ([this](uint64_t puzzleId, const std::string& player) {
        return this->handleGetAttempts(puzzleId, player);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/winners/<string>").methods(crow::HTTPMethod::GET)
        ([this](uint64_t puzzleId, const std::string& player) {
        return this->handleIsWinner(puzzleId, player);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/reveal").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, uint64_t puzzleId) {
        SubscriptionManager::log("[HTTP] POST /puzzles/" + std::to_string(puzzleId) + "/reveal");
        return this->handleReveal(req, puzzleId);
            });

    CROW_ROUTE(app, "/puzzles/<uint>/finalize").methods(crow::HTTPMethod::POST)
        ([this](const crow::request& req, uint64_t puzzleId) {
        SubscriptionManager::log("[HTTP] POST /puzzles/" + std::to_string(puzzleId) + "/finalize");
        return this->handleFinalize(req, puzzleId);
            });

    auto wsOpenHandler = std::bind(&HttpServer::handleWebSocketOpen, this, std::placeholders::_1);
    auto wsCloseHandler = std::bind(&HttpServer::handleWebSocketClose, this,
        std::placeholders::_1, std::placeholders::_2);
    auto wsMessageHandler = std::bind(&HttpServer::handleWebSocketMessage, this,
        std::placeholders::_1, std::placeholders::_2,
        std::placeholders::_3);

    CROW_WEBSOCKET_ROUTE(app, "/ws")
        .onopen(wsOpenHandler)
        .onclose(wsCloseHandler)
        .onmessage(wsMessageHandler);

    app.port(port).multithreaded().run();

    taskQueue->waitIdle();
}

// Admin and player operations

crow::response HttpServer::handleCreatePuzzle(const crow::request& req) {
    auto allowed = accessPolicy.authorize(Operation::CreatePuzzle, resolveCaller(req));
    if (!allowed) return JsonCodec::respondError(allowed.error());

    auto body = crow::json::load(req.body);
    if (!body || !body.has("puzzleId") || !body.has("commitment")) {
        return badRequest("Body requires puzzleId and commitment");
    }
    if (body["puzzleId"].t() != crow::json::type::Number) {
        return badRequest("puzzleId must be a number");
    }

    auto commitment = digestFromHex(std::string(body["commitment"].s()));
    if (!commitment) {
        return badRequest("commitment must be 64 hex characters");
    }

    PuzzleId puzzleId = body["puzzleId"].u();

    std::lock_guard lock(registryMutex);
    auto result = registry->createPuzzle(puzzleId, *commitment);
    if (!result) return JsonCodec::respondError(result.error());

    auto puzzle = registry->getPuzzle(puzzleId);
    return JsonCodec::respond(201, puzzle ? JsonCodec::puzzleToJson(*puzzle) : crow::json::wvalue{});
}

crow::response HttpServer::handleSubmitGuess(const crow::request& req, PuzzleId puzzleId) {
    std::string player = req.get_header_value("X-Player-Id");

    auto allowed = accessPolicy.authorize(Operation::SubmitGuess, resolveCaller(req), player);
    if (!allowed) return JsonCodec::respondError(allowed.error());

    auto body = crow::json::load(req.body);
    if (!body || !body.has("guess")) {
        return badRequest("Body requires guess");
    }
    Bytes guess = bytesOf(std::string(body["guess"].s()));

    std::lock_guard lock(registryMutex);
    auto attemptNumber = registry->submitGuess(puzzleId, player, guess);
    if (!attemptNumber) return JsonCodec::respondError(attemptNumber.error());

    crow::json::wvalue response;
    response["puzzleId"] = puzzleId;
    response["player"] = player;
    response["attemptNumber"] = *attemptNumber;
    return JsonCodec::respond(201, response);
}

crow::response HttpServer::handleReveal(const crow::request& req, PuzzleId puzzleId) {
    auto allowed = accessPolicy.authorize(Operation::RevealAnswer, resolveCaller(req));
    if (!allowed) return JsonCodec::respondError(allowed.error());

    auto body = crow::json::load(req.body);
    if (!body || !body.has("answer")) {
        return badRequest("Body requires answer");
    }
    Bytes answer = bytesOf(std::string(body["answer"].s()));

    std::lock_guard lock(registryMutex);
    auto result = registry->revealAnswer(puzzleId, answer);
    if (!result) return JsonCodec::respondError(result.error());

    auto puzzle = registry->getPuzzle(puzzleId);
    return JsonCodec::respond(200, puzzle ? JsonCodec::puzzleToJson(*puzzle) : crow::json::wvalue{});
}

crow::response HttpServer::handleFinalize(const crow::request& req, PuzzleId puzzleId) {
    auto allowed = accessPolicy.authorize(Operation::FinalizePuzzle, resolveCaller(req));
    if (!allowed) return JsonCodec::respondError(allowed.error());

    // A "player" field is accepted for interface compatibility; every player is scored.
    std::lock_guard lock(registryMutex);
    auto winners = registry->finalizePuzzle(puzzleId);
    if (!winners) return JsonCodec::respondError(winners.error());

    auto puzzle = registry->getPuzzle(puzzleId);
    return JsonCodec::respond(200, puzzle ? JsonCodec::puzzleToJson(*puzzle) : crow::json::wvalue{});
}

// Reads

crow::response HttpServer::handleGetPuzzle(PuzzleId puzzleId) {
    std::lock_guard lock(registryMutex);
    auto puzzle = registry->getPuzzle(puzzleId);
    if (!puzzle) {
        return JsonCodec::respondError({ .code = ErrorCode::NotFound, .message = "Puzzle not found" });
    }
    return JsonCodec::respond(200, JsonCodec::puzzleToJson(*puzzle));
}

crow::response HttpServer::handleGetPlayers(PuzzleId puzzleId) {
    std::lock_guard lock(registryMutex);
    return JsonCodec::respond(200, JsonCodec::playersToJson(puzzleId, registry->listPlayers(puzzleId)));
}

crow::response HttpServer::handleGetAttempts(PuzzleId puzzleId, const std::string& player) {
    std::lock_guard lock(registryMutex);
    auto attempts = registry->getAttempts(puzzleId, player);
    return JsonCodec::respond(200, JsonCodec::attemptsToJson(puzzleId, player, attempts));
}

crow::response HttpServer::handleIsWinner(PuzzleId puzzleId, const std::string& player) {
    std::lock_guard lock(registryMutex);

    crow::json::wvalue body;
    body["puzzleId"] = puzzleId;
    body["player"] = player;
    body["winner"] = registry->isWinner(puzzleId, player);
    return JsonCodec::respond(200, body);
}

// WebSocket handlers

void HttpServer::handleWebSocketOpen(crow::websocket::connection& conn) {
    SubscriptionManager::log("[WS] New connection: " + std::to_string((uintptr_t)&conn));
}

void HttpServer::handleWebSocketClose(crow::websocket::connection& conn, const std::string& reason) {
    subscriptions->unregisterConnection(&conn);
    SubscriptionManager::log("[WS] Closed (" + reason + ")");
}

void HttpServer::handleWebSocketMessage(crow::websocket::connection& conn, const std::string& data, bool is_binary) {
    if (is_binary) return;

    auto msg = crow::json::load(data);
    if (!msg || !msg.has("type")) {
        SubscriptionManager::sendTo(&conn, "{\"type\":\"ERROR\",\"message\":\"Invalid JSON\"}");
        return;
    }

    std::string type = msg["type"].s();

    if (!msg.has("puzzleId") || msg["puzzleId"].t() != crow::json::type::Number) {
        SubscriptionManager::sendTo(&conn, "{\"type\":\"ERROR\",\"message\":\"puzzleId required\"}");
        return;
    }
    PuzzleId puzzleId = msg["puzzleId"].u();

    crow::json::wvalue ack;
    ack["puzzleId"] = puzzleId;

    if (type == "SUBSCRIBE") {
        subscriptions->subscribe(puzzleId, &conn);
        ack["type"] = "SUBSCRIBED";
    }
    else if (type == "UNSUBSCRIBE") {
        ack["type"] = "UNSUBSCRIBED";
        ack["removed"] = subscriptions->unsubscribe(puzzleId, &conn);
    }
    else {
        SubscriptionManager::sendTo(&conn, "{\"type\":\"ERROR\",\"message\":\"Unknown message type\"}");
        return;
    }

    SubscriptionManager::sendTo(&conn, ack.dump());
}

// Helpers

Caller HttpServer::resolveCaller(const crow::request& req) const {
    const std::string& authorization = req.get_header_value("Authorization");
    if (authorization.starts_with(BEARER_PREFIX)) {
        std::string token = authorization.substr(BEARER_PREFIX.size());
        if (!adminToken.empty() && token.size() == adminToken.size() &&
            CRYPTO_memcmp(token.data(), adminToken.data(), token.size()) == 0) {
            return { .id = accessPolicy.config().admin, .authenticated = true };
        }
        return { .id = "", .authenticated = false };
    }

    // Player identity is asserted by the gateway in front of this service.
    std::string player = req.get_header_value("X-Player-Id");
    if (!player.empty()) {
        return { .id = player, .authenticated = true };
    }
    return {};
}

crow::response HttpServer::badRequest(const std::string& message) {
    crow::json::wvalue body;
    body["error"] = "BadRequest";
    body["message"] = message;
    return JsonCodec::respond(400, body);
}
