#include <catch2/catch.hpp>
#include "server/JsonCodec.hpp"
#include "Fixtures.hpp"

using namespace WordleChain;
using WordleChain::testing::commitmentFor;
using WordleChain::testing::word;

TEST_CASE("Error codes map to HTTP statuses", "[json][http]")
{
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::NotFound) == 404);

    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::AlreadyExists) == 409);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::NotOpen) == 409);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::AlreadyFinalized) == 409);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::AnswerNotRevealed) == 409);

    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::InvalidLength) == 400);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::NotAuthorized) == 403);

    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::TooManyAttempts) == 422);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::RosterFull) == 422);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::CommitmentMismatch) == 422);

    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::NotInitialized) == 500);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::Overflow) == 500);
    REQUIRE(JsonCodec::httpStatusFor(ErrorCode::StorageFailure) == 500);
}

TEST_CASE("Error responses carry the code name and message", "[json][http]")
{
    crow::response res = JsonCodec::respondError({ .code = ErrorCode::RosterFull, .message = "full" });
    REQUIRE(res.code == 422);

    auto body = crow::json::load(res.body);
    REQUIRE(body);
    REQUIRE(std::string(body["error"].s()) == toString(ErrorCode::RosterFull));
    REQUIRE(std::string(body["message"].s()) == "full");
}

TEST_CASE("Events serialize with their type and payload", "[json][events]")
{
    SECTION("attempt submitted")
    {
        auto json = crow::json::load(JsonCodec::eventToJson(AttemptSubmitted{
            .puzzleId = 4, .player = "P1", .attemptNumber = 2, .guess = word("CRANE") }).dump());
        REQUIRE(json);
        REQUIRE(std::string(json["type"].s()) == "ATTEMPT_SUBMITTED");
        REQUIRE(json["puzzleId"].u() == 4);
        REQUIRE(std::string(json["player"].s()) == "P1");
        REQUIRE(json["attemptNumber"].u() == 2);
        REQUIRE(std::string(json["guess"].s()) == "CRANE");
        REQUIRE(std::string(json["guessHex"].s()) == toHex(word("CRANE")));
    }

    SECTION("puzzle created")
    {
        auto json = crow::json::load(JsonCodec::eventToJson(PuzzleCreated{
            .puzzleId = 9, .commitment = commitmentFor("ABCDE") }).dump());
        REQUIRE(std::string(json["type"].s()) == "PUZZLE_CREATED");
        REQUIRE(std::string(json["commitment"].s()) == toHex(commitmentFor("ABCDE")));
    }

    SECTION("puzzle finalized")
    {
        auto json = crow::json::load(JsonCodec::eventToJson(PuzzleFinalized{
            .puzzleId = 9, .answer = word("ABCDE"), .winnerCount = 3 }).dump());
        REQUIRE(std::string(json["type"].s()) == "PUZZLE_FINALIZED");
        REQUIRE(json["winnerCount"].u() == 3);
        REQUIRE(std::string(json["answer"].s()) == "ABCDE");
    }
}
