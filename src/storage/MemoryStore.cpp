#include "MemoryStore.hpp"
#include <print>

using namespace WordleChain;

bool MemoryStore::puzzleExists(PuzzleId puzzleId) const {
	std::lock_guard lock(mutex_);
	return puzzles_.find(puzzleId) != puzzles_.end();
}

std::optional<PuzzleRecord> MemoryStore::getPuzzle(PuzzleId puzzleId) const {
	std::lock_guard lock(mutex_);

	auto it = puzzles_.find(puzzleId);
	if (it != puzzles_.end()) return it->second;

	return std::nullopt;
}

InsertOutcome MemoryStore::insertPuzzle(const PuzzleRecord& record) {
	if (rejectWrites_) {
		std::print("[MEMORY] Insert refused for puzzle {}\n", record.puzzle.id);
		return InsertOutcome::Failed;
	}

	std::lock_guard lock(mutex_);
	bool inserted = puzzles_.try_emplace(record.puzzle.id, record).second;
	return inserted ? InsertOutcome::Inserted : InsertOutcome::Duplicate;
}

bool MemoryStore::savePuzzle(const PuzzleRecord& record) {
	if (rejectWrites_) {
		std::print("[MEMORY] Write refused for puzzle {}\n", record.puzzle.id);
		return false;
	}

	std::lock_guard lock(mutex_);
	auto it = puzzles_.find(record.puzzle.id);
	if (it == puzzles_.end()) return false;

	it->second = record;
	return true;
}

std::size_t MemoryStore::size() const {
	std::lock_guard lock(mutex_);
	return puzzles_.size();
}
