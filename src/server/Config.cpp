#include "Config.hpp"
#include <cstdlib>
#include <limits>
#include <print>

using namespace WordleChain;

std::string WordleChain::getEnvVar(const char* key, const char* defaultValue) {
    char* val = std::getenv(key);
    return val ? std::string(val) : std::string(defaultValue);
}

static unsigned long parseNumber(const char* key, const char* defaultValue, unsigned long max) {
    std::string raw = getEnvVar(key, defaultValue);
    try {
        unsigned long value = std::stoul(raw);
        if (value <= max) return value;
    }
    catch (const std::exception&) {
        // falls through to the default below
    }
    std::print("[CONFIG] Invalid {}='{}', using {}\n", key, raw, defaultValue);
    return std::stoul(defaultValue);
}

ServerConfig ServerConfig::fromEnvironment() {
    ServerConfig config;
    config.port = static_cast<std::uint16_t>(parseNumber("PORT", "8080", std::numeric_limits<std::uint16_t>::max()));
    config.mongoUri = getEnvVar("MONGO_URI");
    config.dbName = getEnvVar("DB_NAME", "WordleChainDB");
    config.adminToken = getEnvVar("ADMIN_TOKEN");
    config.workers = parseNumber("WORKERS", "4", 64);

    config.game.admin = getEnvVar("ADMIN_ID");
    config.game.prizePoolContract = getEnvVar("PRIZE_POOL_CONTRACT");
    config.game.balanceContract = getEnvVar("BALANCE_CONTRACT");
    return config;
}

std::vector<std::string> ServerConfig::validate() const {
    std::vector<std::string> problems;
    if (mongoUri.empty()) problems.push_back("MONGO_URI is not set");
    if (game.admin.empty()) problems.push_back("ADMIN_ID is not set");
    if (adminToken.empty()) problems.push_back("ADMIN_TOKEN is not set");
    if (workers == 0) problems.push_back("WORKERS must be at least 1");
    return problems;
}
