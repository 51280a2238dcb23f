#pragma once

#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "../storage/PuzzleStore.hpp"
#include "EventSink.hpp"
#include "Types.hpp"

namespace WordleChain {

    /*
     * Owns the lifecycle of every puzzle: Open -> Revealed -> Finalized.
     *
     * Each call loads the puzzle record, checks the lifecycle gate, mutates a
     * private copy and saves it back in one write. Events are published only
     * after that write succeeds. Calls are expected one at a time; the
     * registry does no locking of its own.
     */
    class PuzzleRegistry {
    public:
        PuzzleRegistry(std::shared_ptr<PuzzleStore> storage, std::shared_ptr<EventSink> events);
        ~PuzzleRegistry();

        VoidOutcome createPuzzle(PuzzleId puzzleId, const Digest& commitment);

        // Returns the 1-based attempt number.
        Outcome<std::uint32_t> submitGuess(
            PuzzleId puzzleId,
            const PlayerId& player,
            std::span<const std::uint8_t> guess
        );

        VoidOutcome revealAnswer(PuzzleId puzzleId, std::span<const std::uint8_t> answer);

        // Scores every attempt and returns the number of winners.
        Outcome<std::uint32_t> finalizePuzzle(PuzzleId puzzleId);

        std::optional<PuzzleData> getPuzzle(PuzzleId puzzleId) const;
        std::vector<Attempt> getAttempts(PuzzleId puzzleId, const PlayerId& player) const;
        std::vector<PlayerId> listPlayers(PuzzleId puzzleId) const;
        bool isWinner(PuzzleId puzzleId, const PlayerId& player) const;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl;
    };
}
