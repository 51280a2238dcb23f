#pragma once

#include "PuzzleStore.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace WordleChain {

	class MemoryStore : public PuzzleStore {
	public:
		MemoryStore() = default;

		bool puzzleExists(PuzzleId puzzleId) const override;
		std::optional<PuzzleRecord> getPuzzle(PuzzleId puzzleId) const override;
		InsertOutcome insertPuzzle(const PuzzleRecord& record) override;
		bool savePuzzle(const PuzzleRecord& record) override;

		std::size_t size() const;

		// While set, every insertPuzzle and savePuzzle call is refused.
		void setRejectWrites(bool reject) { rejectWrites_ = reject; }

	private:
		mutable std::mutex mutex_;
		std::map<PuzzleId, PuzzleRecord> puzzles_;
		std::atomic<bool> rejectWrites_{ false };
	};
}
