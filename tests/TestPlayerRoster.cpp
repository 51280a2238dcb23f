#include <catch2/catch.hpp>
#include "engine/PlayerRoster.hpp"

#include <string>

using namespace WordleChain;

TEST_CASE("Roster records distinct players in arrival order", "[roster]")
{
    PlayerRoster roster;
    REQUIRE(roster.capacity() == MAX_PLAYERS_PER_PUZZLE);

    auto first = roster.insertIfAbsent("alice");
    REQUIRE(first.has_value());
    REQUIRE(*first);

    auto second = roster.insertIfAbsent("bob");
    REQUIRE(second.has_value());
    REQUIRE(*second);

    auto again = roster.insertIfAbsent("alice");
    REQUIRE(again.has_value());
    REQUIRE_FALSE(*again);

    REQUIRE(roster.count() == 2);
    REQUIRE(roster.contains("bob"));
    REQUIRE_FALSE(roster.contains("carol"));
    REQUIRE(roster.players() == std::vector<PlayerId>{ "alice", "bob" });
}

TEST_CASE("The 1001st distinct player is refused", "[roster][capacity]")
{
    PlayerRoster roster;
    for (std::size_t i = 0; i < MAX_PLAYERS_PER_PUZZLE; ++i) {
        REQUIRE(roster.insertIfAbsent("player-" + std::to_string(i)).has_value());
    }
    REQUIRE(roster.count() == MAX_PLAYERS_PER_PUZZLE);

    auto overflow = roster.insertIfAbsent("late-comer");
    REQUIRE_FALSE(overflow.has_value());
    REQUIRE(overflow.error().code == ErrorCode::RosterFull);

    REQUIRE(roster.count() == MAX_PLAYERS_PER_PUZZLE);
    REQUIRE_FALSE(roster.contains("late-comer"));

    SECTION("existing players are still accepted when full")
    {
        auto existing = roster.insertIfAbsent("player-0");
        REQUIRE(existing.has_value());
        REQUIRE_FALSE(*existing);
    }
}
