#include "AttemptLedger.hpp"
#include <format>

using namespace WordleChain;

AttemptLedger::AttemptLedger(std::size_t perPlayerCapacity)
    : capacity_(perPlayerCapacity) {
}

const std::vector<Attempt>& AttemptLedger::attemptsFor(const PlayerId& player) const {
    static const std::vector<Attempt> none;

    auto it = attempts_.find(player);
    return it != attempts_.end() ? it->second : none;
}

bool AttemptLedger::isFull(const PlayerId& player) const {
    return attemptsFor(player).size() >= capacity_;
}

Outcome<std::uint32_t> AttemptLedger::append(const PlayerId& player, const Word& guess) {
    if (isFull(player)) {
        return makeError(ErrorCode::TooManyAttempts,
            std::format("Player {} already has {} attempts", player, capacity_));
    }

    auto [it, inserted] = attempts_.try_emplace(player);
    if (inserted) {
        order_.push_back(player);
    }

    it->second.push_back(Attempt{ .guess = guess, .scores = {} });
    return static_cast<std::uint32_t>(it->second.size());
}

VoidOutcome AttemptLedger::setScores(const PlayerId& player, std::uint32_t index, ScoreVector scores) {
    auto it = attempts_.find(player);
    if (it == attempts_.end() || index == 0 || index > it->second.size()) {
        return makeError(ErrorCode::NotFound,
            std::format("No attempt #{} for player {}", index, player));
    }

    it->second[index - 1].scores = std::move(scores);
    return {};
}
