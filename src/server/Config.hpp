#pragma once

#include "../shared/DTOs.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace WordleChain {

    struct ServerConfig {
        std::uint16_t port{ 8080 };
        std::string mongoUri;
        std::string dbName{ "WordleChainDB" };
        std::string adminToken;
        size_t workers{ 4 };
        GameConfig game;

        static ServerConfig fromEnvironment();

        // Human-readable problems; empty when the config is usable.
        std::vector<std::string> validate() const;
    };

    std::string getEnvVar(const char* key, const char* defaultValue = "");
}
