#pragma once

#include "PuzzleStore.hpp"
#include <memory>
#include <string>

namespace WordleChain {
	class MongoStore : public PuzzleStore {
	public:
		explicit MongoStore(const std::string& connectionUri, const std::string& dbName);
		~MongoStore() override;

		bool puzzleExists(PuzzleId puzzleId) const override;
		std::optional<PuzzleRecord> getPuzzle(PuzzleId puzzleId) const override;
		InsertOutcome insertPuzzle(const PuzzleRecord& record) override;
		bool savePuzzle(const PuzzleRecord& record) override;

	private:
		class Impl;
		std::unique_ptr<Impl> pImpl;
	};
}
