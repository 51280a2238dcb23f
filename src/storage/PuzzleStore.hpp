#pragma once

#include "../engine/PuzzleRecord.hpp"
#include <optional>

namespace WordleChain {

	enum class InsertOutcome {
		Inserted,
		Duplicate,
		Failed
	};

	class PuzzleStore {
	public:
		virtual ~PuzzleStore() = default;

		virtual bool puzzleExists(PuzzleId puzzleId) const = 0;
		virtual std::optional<PuzzleRecord> getPuzzle(PuzzleId puzzleId) const = 0;

		// Adds a new record. Never touches one already stored under the same id.
		virtual InsertOutcome insertPuzzle(const PuzzleRecord& record) = 0;

		// Replaces an existing record. false when the write did not happen,
		// including when no record with that id is stored.
		virtual bool savePuzzle(const PuzzleRecord& record) = 0;
	};
}
