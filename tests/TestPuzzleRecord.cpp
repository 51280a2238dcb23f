#include <catch2/catch.hpp>
#include "engine/PuzzleRegistry.hpp"
#include "storage/MemoryStore.hpp"
#include "Fixtures.hpp"

using namespace WordleChain;
using WordleChain::testing::RecordingEventSink;
using WordleChain::testing::commitmentFor;
using WordleChain::testing::word;

namespace {

    // Record as the registry leaves it after the given stage.
    PuzzleRecord playedRecord(PuzzleState stage) {
        auto store = std::make_shared<MemoryStore>();
        PuzzleRegistry registry(store, std::make_shared<RecordingEventSink>());

        REQUIRE(registry.createPuzzle(1, commitmentFor("ABCDE")).has_value());
        REQUIRE(registry.submitGuess(1, "P1", bytesOf("WRONG")).has_value());
        REQUIRE(registry.submitGuess(1, "P1", bytesOf("ABCDE")).has_value());
        REQUIRE(registry.submitGuess(1, "P2", bytesOf("ZZZZZ")).has_value());

        if (stage != PuzzleState::Open) {
            REQUIRE(registry.revealAnswer(1, bytesOf("ABCDE")).has_value());
        }
        if (stage == PuzzleState::Finalized) {
            REQUIRE(registry.finalizePuzzle(1).has_value());
        }
        return *store->getPuzzle(1);
    }
}

TEST_CASE("Stored integers decode only inside the enum range", "[record][decode]")
{
    REQUIRE(puzzleStateFrom(0) == PuzzleState::Open);
    REQUIRE(puzzleStateFrom(2) == PuzzleState::Finalized);
    REQUIRE_FALSE(puzzleStateFrom(3).has_value());
    REQUIRE_FALSE(puzzleStateFrom(7).has_value());
    REQUIRE_FALSE(puzzleStateFrom(-1).has_value());

    REQUIRE(letterScoreFrom(0) == LetterScore::Absent);
    REQUIRE(letterScoreFrom(2) == LetterScore::Correct);
    REQUIRE_FALSE(letterScoreFrom(9).has_value());
    REQUIRE_FALSE(letterScoreFrom(-2).has_value());
}

TEST_CASE("Registry-produced records are consistent", "[record]")
{
    REQUIRE_FALSE(findInconsistency(playedRecord(PuzzleState::Open)).has_value());
    REQUIRE_FALSE(findInconsistency(playedRecord(PuzzleState::Revealed)).has_value());
    REQUIRE_FALSE(findInconsistency(playedRecord(PuzzleState::Finalized)).has_value());
}

TEST_CASE("State must agree with the revealed answer", "[record]")
{
    SECTION("open state with a revealed answer")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Revealed);
        record.puzzle.state = PuzzleState::Open;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("finalized state with a sealed answer")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Open);
        record.puzzle.state = PuzzleState::Finalized;
        REQUIRE(findInconsistency(record).has_value());
    }
}

TEST_CASE("Scores must match the lifecycle stage", "[record]")
{
    SECTION("short score vector in a finalized puzzle")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        REQUIRE(record.ledger.setScores("P2", 1, ScoreVector{ LetterScore::Absent }).has_value());
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("unscored attempt in a finalized puzzle")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        REQUIRE(record.ledger.setScores("P2", 1, {}).has_value());
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("scores before finalize")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Revealed);
        REQUIRE(record.ledger.setScores("P2", 1, ScoreVector(WORD_LENGTH, LetterScore::Absent)).has_value());
        REQUIRE(findInconsistency(record).has_value());
    }
}

TEST_CASE("Counters and winner flags must match the roster and scores", "[record]")
{
    SECTION("player count drift")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Open);
        record.puzzle.playerCount = 5;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("winner who never solved")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        record.winners.insert("P2");
        record.puzzle.winnerCount = 2;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("solver not flagged")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        record.winners.clear();
        record.puzzle.winnerCount = 0;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("winner count disagrees with flags")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        record.puzzle.winnerCount = 3;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("winners before finalize")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Revealed);
        record.winners.insert("P1");
        record.puzzle.winnerCount = 1;
        REQUIRE(findInconsistency(record).has_value());
    }

    SECTION("winner outside the roster")
    {
        PuzzleRecord record = playedRecord(PuzzleState::Finalized);
        record.winners.insert("ghost");
        record.puzzle.winnerCount = 2;
        REQUIRE(findInconsistency(record).has_value());
    }
}

TEST_CASE("A finalized record keeps its revealed answer", "[record]")
{
    PuzzleRecord record = playedRecord(PuzzleState::Finalized);
    REQUIRE(*record.puzzle.answer.revealed() == word("ABCDE"));
    REQUIRE(record.isWinner("P1"));
    REQUIRE_FALSE(record.isWinner("P2"));
}
