#include "PlayerRoster.hpp"
#include <format>

using namespace WordleChain;

PlayerRoster::PlayerRoster(std::size_t capacity)
    : capacity_(capacity) {
}

bool PlayerRoster::contains(const PlayerId& player) const {
    return index_.find(player) != index_.end();
}

Outcome<bool> PlayerRoster::insertIfAbsent(const PlayerId& player) {
    if (contains(player)) return false;

    if (players_.size() >= capacity_) {
        return makeError(ErrorCode::RosterFull,
            std::format("Roster full ({} players)", capacity_));
    }

    players_.push_back(player);
    index_.insert(player);
    return true;
}
