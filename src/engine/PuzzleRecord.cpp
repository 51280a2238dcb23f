#include "PuzzleRecord.hpp"
#include "ScoringEngine.hpp"
#include <format>

namespace WordleChain {

    std::optional<std::string> findInconsistency(const PuzzleRecord& record) {
        const PuzzleData& puzzle = record.puzzle;
        const bool finalized = puzzle.state == PuzzleState::Finalized;

        if (puzzle.answer.isRevealed() != (puzzle.state != PuzzleState::Open)) {
            return std::format("state {} inconsistent with answer", toString(puzzle.state));
        }

        if (puzzle.playerCount != record.roster.count()) {
            return std::format("playerCount {} but {} players listed", puzzle.playerCount, record.roster.count());
        }

        for (const auto& player : record.ledger.players()) {
            if (!record.roster.contains(player)) {
                return std::format("attempts for {} who is not on the roster", player);
            }

            bool solved = false;
            for (const auto& attempt : record.ledger.attemptsFor(player)) {
                if (finalized && attempt.scores.size() != WORD_LENGTH) {
                    return std::format("unscored attempt for {} in a finalized puzzle", player);
                }
                if (!finalized && !attempt.scores.empty()) {
                    return std::format("scored attempt for {} before finalize", player);
                }
                solved = solved || ScoringEngine::isSolved(attempt.scores);
            }

            if (finalized && solved != record.isWinner(player)) {
                return std::format("winner flag for {} disagrees with the scores", player);
            }
        }

        for (const auto& winner : record.winners) {
            if (!record.roster.contains(winner)) {
                return std::format("winner {} is not on the roster", winner);
            }
            if (record.ledger.attemptsFor(winner).empty()) {
                return std::format("winner {} has no attempts", winner);
            }
        }

        if (!finalized && (!record.winners.empty() || puzzle.winnerCount != 0)) {
            return "winners recorded before finalize";
        }
        if (puzzle.winnerCount != record.winners.size()) {
            return std::format("winnerCount {} but {} winners flagged", puzzle.winnerCount, record.winners.size());
        }

        return std::nullopt;
    }
}
