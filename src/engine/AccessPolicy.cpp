#include "AccessPolicy.hpp"
#include <format>

using namespace WordleChain;

AccessPolicy::AccessPolicy(GameConfig config)
    : config_(std::move(config)) {
}

Outcome<AccessPolicy> AccessPolicy::create(GameConfig config) {
    if (config.admin.empty()) {
        return makeError(ErrorCode::NotInitialized, "No admin identity configured");
    }
    return AccessPolicy(std::move(config));
}

Privilege AccessPolicy::requiredPrivilege(Operation op) {
    switch (op) {
    case Operation::CreatePuzzle:
    case Operation::RevealAnswer:
    case Operation::FinalizePuzzle:
        return Privilege::Admin;
    case Operation::SubmitGuess:
        return Privilege::Player;
    case Operation::Read:
        return Privilege::Public;
    }
    return Privilege::Admin;
}

VoidOutcome AccessPolicy::authorize(Operation op, const Caller& caller, const PlayerId& actingPlayer) const {
    switch (requiredPrivilege(op)) {
    case Privilege::Public:
        return {};

    case Privilege::Player:
        if (!caller.authenticated || caller.id.empty() || caller.id != actingPlayer) {
            return makeError(ErrorCode::NotAuthorized,
                std::format("Caller '{}' cannot act for player '{}'", caller.id, actingPlayer));
        }
        return {};

    case Privilege::Admin:
        if (!caller.authenticated || caller.id != config_.admin) {
            return makeError(ErrorCode::NotAuthorized,
                std::format("Caller '{}' is not the admin", caller.id));
        }
        return {};
    }
    return makeError(ErrorCode::NotAuthorized, "Unknown privilege");
}
