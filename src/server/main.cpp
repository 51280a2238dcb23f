#include "crow.h"
#include <iostream>
#include <string>
#include <memory>

#include "../storage/MongoStore.hpp"
#include "../engine/AccessPolicy.hpp"
#include "../engine/PuzzleRegistry.hpp"
#include "../infra/TaskQueue.hpp"
#include "Config.hpp"
#include "SubscriptionManager.hpp"
#include "WebSocketEventSink.hpp"
#include "HttpServer.hpp"

using namespace WordleChain;

int main()
{
    try
    {
        ServerConfig config = ServerConfig::fromEnvironment();

        auto problems = config.validate();
        if (!problems.empty()) {
            for (const auto& problem : problems) {
                std::cerr << "[FATAL] " << problem << "\n";
            }
            return -1;
        }

        auto accessPolicy = AccessPolicy::create(config.game);
        if (!accessPolicy) {
            std::cerr << "[FATAL] " << accessPolicy.error().message << "\n";
            return -1;
        }

        auto taskQueue = std::make_shared<TaskQueue>(config.workers, "Notify");

        auto storage = std::make_shared<MongoStore>(config.mongoUri, config.dbName);

        auto subscriptions = std::make_shared<SubscriptionManager>();

        auto events = std::make_shared<WebSocketEventSink>(subscriptions, taskQueue);

        auto registry = std::make_shared<PuzzleRegistry>(storage, events);

        HttpServer server(registry, std::move(*accessPolicy), config.adminToken, subscriptions, taskQueue);

        server.run(config.port);

    }
    catch (const std::exception& e) {
        std::cerr << "[CRASH] Main: " << e.what() << "\n";
        return -1;
    }

    return 0;
}
