#include "JsonCodec.hpp"
#include "../engine/EventSink.hpp"
#include "../shared/Encoding.hpp"

#include <algorithm>

namespace WordleChain::JsonCodec {

    namespace {
        void putWord(crow::json::wvalue& json, const std::string& key, const Word& word) {
            json[key + "Hex"] = toHex(word);

            bool printable = std::all_of(word.begin(), word.end(),
                [](std::uint8_t b) { return b >= 0x20 && b < 0x7F; });
            if (printable) {
                json[key] = wordToString(word);
            }
        }

        struct EventVisitor {
            crow::json::wvalue& json;

            void operator()(const PuzzleCreated& e) const {
                json["puzzleId"] = e.puzzleId;
                json["commitment"] = toHex(e.commitment);
            }
            void operator()(const AttemptSubmitted& e) const {
                json["puzzleId"] = e.puzzleId;
                json["player"] = e.player;
                json["attemptNumber"] = e.attemptNumber;
                putWord(json, "guess", e.guess);
            }
            void operator()(const AnswerRevealed& e) const {
                json["puzzleId"] = e.puzzleId;
            }
            void operator()(const PuzzleFinalized& e) const {
                json["puzzleId"] = e.puzzleId;
                json["winnerCount"] = e.winnerCount;
                putWord(json, "answer", e.answer);
            }
        };
    }

    crow::json::wvalue eventToJson(const GameEvent& event) {
        crow::json::wvalue json;
        json["type"] = eventName(event);
        std::visit(EventVisitor{ json }, event);
        return json;
    }

    crow::json::wvalue puzzleToJson(const PuzzleData& puzzle) {
        crow::json::wvalue json;
        json["puzzleId"] = puzzle.id;
        json["state"] = std::string(toString(puzzle.state));
        json["commitment"] = toHex(puzzle.answer.commitment());
        json["winnerCount"] = puzzle.winnerCount;
        json["playerCount"] = puzzle.playerCount;

        if (const auto& answer = puzzle.answer.revealed()) {
            putWord(json, "answer", *answer);
        }
        return json;
    }

    crow::json::wvalue attemptsToJson(PuzzleId puzzleId, const PlayerId& player, const std::vector<Attempt>& attempts) {
        crow::json::wvalue json;
        json["puzzleId"] = puzzleId;
        json["player"] = player;

        crow::json::wvalue list = crow::json::wvalue::list();
        int index = 0;
        for (const auto& attempt : attempts) {
            crow::json::wvalue item;
            putWord(item, "guess", attempt.guess);

            crow::json::wvalue scores = crow::json::wvalue::list();
            int s = 0;
            for (LetterScore score : attempt.scores) {
                scores[s++] = static_cast<int>(score);
            }
            item["scores"] = std::move(scores);
            list[index++] = std::move(item);
        }
        json["attempts"] = std::move(list);
        return json;
    }

    crow::json::wvalue playersToJson(PuzzleId puzzleId, const std::vector<PlayerId>& players) {
        crow::json::wvalue json;
        json["puzzleId"] = puzzleId;

        crow::json::wvalue list = crow::json::wvalue::list();
        int index = 0;
        for (const auto& player : players) {
            list[index++] = player;
        }
        json["players"] = std::move(list);
        return json;
    }

    crow::json::wvalue errorToJson(const EngineError& error) {
        crow::json::wvalue json;
        json["error"] = std::string(toString(error.code));
        json["message"] = error.message;
        return json;
    }

    int httpStatusFor(ErrorCode code) {
        switch (code) {
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::AlreadyExists:
        case ErrorCode::NotOpen:
        case ErrorCode::AlreadyFinalized:
        case ErrorCode::AnswerNotRevealed:
            return 409;
        case ErrorCode::InvalidLength:
            return 400;
        case ErrorCode::NotAuthorized:
            return 403;
        case ErrorCode::TooManyAttempts:
        case ErrorCode::RosterFull:
        case ErrorCode::CommitmentMismatch:
            return 422;
        case ErrorCode::NotInitialized:
        case ErrorCode::Overflow:
        case ErrorCode::StorageFailure:
            return 500;
        }
        return 500;
    }

    crow::response respond(int status, const crow::json::wvalue& body) {
        crow::response res(status);
        res.set_header("Content-Type", "application/json");
        res.body = body.dump();
        return res;
    }

    crow::response respondError(const EngineError& error) {
        return respond(httpStatusFor(error.code), errorToJson(error));
    }
}
