#pragma once

#include "Types.hpp"
#include <unordered_map>
#include <vector>

namespace WordleChain {

    class AttemptLedger {
    public:
        explicit AttemptLedger(std::size_t perPlayerCapacity = MAX_ATTEMPTS);

        // Empty when the player never submitted.
        const std::vector<Attempt>& attemptsFor(const PlayerId& player) const;

        bool isFull(const PlayerId& player) const;

        // Returns the 1-based index of the new attempt.
        Outcome<std::uint32_t> append(const PlayerId& player, const Word& guess);

        // index is 1-based, matching append().
        VoidOutcome setScores(const PlayerId& player, std::uint32_t index, ScoreVector scores);

        // Players in order of their first attempt.
        const std::vector<PlayerId>& players() const { return order_; }

    private:
        std::size_t capacity_;
        std::vector<PlayerId> order_;
        std::unordered_map<PlayerId, std::vector<Attempt>> attempts_;
    };
}
