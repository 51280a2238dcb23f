#pragma once

#include "AttemptLedger.hpp"
#include "CommitmentVerifier.hpp"
#include "PlayerRoster.hpp"
#include <optional>
#include <string>
#include <unordered_set>

namespace WordleChain {

	// answer.isRevealed() holds exactly when state != Open.
	struct PuzzleData {
		PuzzleId id{ 0 };
		PuzzleState state{ PuzzleState::Open };
		SealedAnswer answer;
		std::uint32_t winnerCount{ 0 };
		std::uint32_t playerCount{ 0 };
	};

	// Everything persisted for one puzzle. Loaded and saved as a unit so a
	// call either commits all of its mutations or none.
	struct PuzzleRecord {
		PuzzleData puzzle;
		PlayerRoster roster;
		AttemptLedger ledger;
		std::unordered_set<PlayerId> winners;

		bool isWinner(const PlayerId& player) const {
			return winners.find(player) != winners.end();
		}
	};

	// First broken invariant of a record rebuilt from outside the engine, or
	// nullopt when the record could have been produced by the registry.
	std::optional<std::string> findInconsistency(const PuzzleRecord& record);
}
