#pragma once

#include "Types.hpp"
#include <unordered_set>
#include <vector>

namespace WordleChain {

    // Distinct players of one puzzle, in first-submission order.
    class PlayerRoster {
    public:
        explicit PlayerRoster(std::size_t capacity = MAX_PLAYERS_PER_PUZZLE);

        bool contains(const PlayerId& player) const;

        // true when newly added, false when already present. RosterFull when a
        // new player does not fit.
        Outcome<bool> insertIfAbsent(const PlayerId& player);

        std::size_t count() const { return players_.size(); }
        std::size_t capacity() const { return capacity_; }

        const std::vector<PlayerId>& players() const { return players_; }

    private:
        std::size_t capacity_;
        std::vector<PlayerId> players_;
        std::unordered_set<PlayerId> index_;
    };
}
