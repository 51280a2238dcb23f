#pragma once

#include "crow.h"
#include "../engine/PuzzleRecord.hpp"
#include "../engine/Types.hpp"
#include <vector>

namespace WordleChain {

    namespace JsonCodec {
        crow::json::wvalue eventToJson(const GameEvent& event);
        crow::json::wvalue puzzleToJson(const PuzzleData& puzzle);
        crow::json::wvalue attemptsToJson(PuzzleId puzzleId, const PlayerId& player, const std::vector<Attempt>& attempts);
        crow::json::wvalue playersToJson(PuzzleId puzzleId, const std::vector<PlayerId>& players);
        crow::json::wvalue errorToJson(const EngineError& error);

        int httpStatusFor(ErrorCode code);

        crow::response respond(int status, const crow::json::wvalue& body);
        crow::response respondError(const EngineError& error);
    }
}
