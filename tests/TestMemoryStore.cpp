#include <catch2/catch.hpp>
#include "storage/MemoryStore.hpp"
#include "Fixtures.hpp"

using namespace WordleChain;
using WordleChain::testing::commitmentFor;

namespace {
    PuzzleRecord openRecord(PuzzleId id, const char* answer) {
        PuzzleRecord record;
        record.puzzle.id = id;
        record.puzzle.answer = SealedAnswer(commitmentFor(answer));
        return record;
    }
}

TEST_CASE("Insert adds a record once", "[storage][memory]")
{
    MemoryStore store;
    REQUIRE(store.insertPuzzle(openRecord(1, "ABCDE")) == InsertOutcome::Inserted);
    REQUIRE(store.puzzleExists(1));
    REQUIRE(store.size() == 1);

    REQUIRE(store.insertPuzzle(openRecord(1, "VWXYZ")) == InsertOutcome::Duplicate);
    REQUIRE(store.getPuzzle(1)->puzzle.answer.commitment() == commitmentFor("ABCDE"));
    REQUIRE(store.size() == 1);
}

TEST_CASE("Save only replaces an existing record", "[storage][memory]")
{
    MemoryStore store;
    REQUIRE_FALSE(store.savePuzzle(openRecord(2, "ABCDE")));
    REQUIRE_FALSE(store.puzzleExists(2));

    REQUIRE(store.insertPuzzle(openRecord(2, "ABCDE")) == InsertOutcome::Inserted);

    PuzzleRecord updated = *store.getPuzzle(2);
    REQUIRE(updated.roster.insertIfAbsent("alice").has_value());
    updated.puzzle.playerCount = 1;
    REQUIRE(store.savePuzzle(updated));
    REQUIRE(store.getPuzzle(2)->roster.contains("alice"));
}

TEST_CASE("Refused writes leave the store untouched", "[storage][memory]")
{
    MemoryStore store;
    store.setRejectWrites(true);
    REQUIRE(store.insertPuzzle(openRecord(3, "ABCDE")) == InsertOutcome::Failed);
    REQUIRE(store.size() == 0);

    store.setRejectWrites(false);
    REQUIRE(store.insertPuzzle(openRecord(3, "ABCDE")) == InsertOutcome::Inserted);

    store.setRejectWrites(true);
    PuzzleRecord updated = *store.getPuzzle(3);
    updated.puzzle.playerCount = 5;
    REQUIRE_FALSE(store.savePuzzle(updated));
    REQUIRE(store.getPuzzle(3)->puzzle.playerCount == 0);
}
