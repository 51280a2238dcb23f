#include "PuzzleRegistry.hpp"
#include "ScoringEngine.hpp"
#include "../shared/Encoding.hpp"

#include <format>
#include <limits>
#include <print>

namespace WordleChain {

    namespace {
        bool checkedIncrement(std::uint32_t& value) {
            if (value == std::numeric_limits<std::uint32_t>::max()) return false;
            ++value;
            return true;
        }
    }

    class PuzzleRegistry::Impl {
    public:
        std::shared_ptr<PuzzleStore> storage;
        std::shared_ptr<EventSink> events;
        ScoringEngine scoring;

        std::unexpected<EngineError> reject(PuzzleId puzzleId, ErrorCode code, std::string message) const {
            std::print("[ENGINE] Puzzle {} rejected ({}): {}\n", puzzleId, toString(code), message);
            return makeError(code, std::move(message));
        }

        Outcome<PuzzleRecord> load(PuzzleId puzzleId) const {
            auto record = storage->getPuzzle(puzzleId);
            if (!record) {
                return reject(puzzleId, ErrorCode::NotFound, std::format("Puzzle {} not found", puzzleId));
            }
            return std::move(*record);
        }

        void announce(const GameEvent& event) {
            std::print("[ENGINE] {}\n", describe(event));
            events->publish(event);
        }

        VoidOutcome commit(const PuzzleRecord& record, const GameEvent& event) {
            if (!storage->savePuzzle(record)) {
                return reject(record.puzzle.id, ErrorCode::StorageFailure, "Critical error while saving puzzle state");
            }
            announce(event);
            return {};
        }

        // Open -> Revealed, only when the candidate opens the commitment.
        static bool markRevealed(PuzzleData& puzzle, const Word& candidate) {
            if (puzzle.state != PuzzleState::Open) return false;
            if (!puzzle.answer.unseal(candidate)) return false;
            puzzle.state = PuzzleState::Revealed;
            return true;
        }

        // Revealed -> Finalized.
        static bool markFinalized(PuzzleData& puzzle, std::uint32_t winnerCount) {
            if (puzzle.state != PuzzleState::Revealed) return false;
            puzzle.winnerCount = winnerCount;
            puzzle.state = PuzzleState::Finalized;
            return true;
        }
    };

    PuzzleRegistry::PuzzleRegistry(std::shared_ptr<PuzzleStore> storage, std::shared_ptr<EventSink> events)
        : pImpl(std::make_unique<Impl>()) {
        pImpl->storage = std::move(storage);
        pImpl->events = std::move(events);
    }

    PuzzleRegistry::~PuzzleRegistry() = default;

    VoidOutcome PuzzleRegistry::createPuzzle(PuzzleId puzzleId, const Digest& commitment) {
        if (pImpl->storage->puzzleExists(puzzleId)) {
            return pImpl->reject(puzzleId, ErrorCode::AlreadyExists, std::format("Puzzle {} already exists", puzzleId));
        }

        PuzzleRecord record;
        record.puzzle.id = puzzleId;
        record.puzzle.state = PuzzleState::Open;
        record.puzzle.answer = SealedAnswer(commitment);

        // The existence check above is only a fast path; the insert itself
        // refuses to replace a stored puzzle.
        switch (pImpl->storage->insertPuzzle(record)) {
        case InsertOutcome::Inserted:
            break;
        case InsertOutcome::Duplicate:
            return pImpl->reject(puzzleId, ErrorCode::AlreadyExists, std::format("Puzzle {} already exists", puzzleId));
        case InsertOutcome::Failed:
            return pImpl->reject(puzzleId, ErrorCode::StorageFailure, "Critical error while storing new puzzle");
        }

        pImpl->announce(PuzzleCreated{ .puzzleId = puzzleId, .commitment = commitment });
        return {};
    }

    Outcome<std::uint32_t> PuzzleRegistry::submitGuess(
        PuzzleId puzzleId,
        const PlayerId& player,
        std::span<const std::uint8_t> guess) {

        auto loaded = pImpl->load(puzzleId);
        if (!loaded) return std::unexpected(loaded.error());
        auto& record = *loaded;

        if (record.puzzle.state != PuzzleState::Open) {
            return pImpl->reject(puzzleId, ErrorCode::NotOpen,
                std::format("Puzzle is {}, guesses are closed", toString(record.puzzle.state)));
        }

        auto word = toWord(guess);
        if (!word) {
            return pImpl->reject(puzzleId, ErrorCode::InvalidLength,
                std::format("Guess must be {} bytes, got {}", WORD_LENGTH, guess.size()));
        }

        auto inserted = record.roster.insertIfAbsent(player);
        if (!inserted) return pImpl->reject(puzzleId, inserted.error().code, inserted.error().message);

        if (*inserted && !checkedIncrement(record.puzzle.playerCount)) {
            return pImpl->reject(puzzleId, ErrorCode::Overflow, "Player count overflow");
        }

        auto attemptNumber = record.ledger.append(player, *word);
        if (!attemptNumber) return pImpl->reject(puzzleId, attemptNumber.error().code, attemptNumber.error().message);

        auto committed = pImpl->commit(record, AttemptSubmitted{
            .puzzleId = puzzleId,
            .player = player,
            .attemptNumber = *attemptNumber,
            .guess = *word
            });
        if (!committed) return std::unexpected(committed.error());

        return *attemptNumber;
    }

    VoidOutcome PuzzleRegistry::revealAnswer(PuzzleId puzzleId, std::span<const std::uint8_t> answer) {
        auto loaded = pImpl->load(puzzleId);
        if (!loaded) return std::unexpected(loaded.error());
        auto& record = *loaded;

        if (record.puzzle.state != PuzzleState::Open) {
            return pImpl->reject(puzzleId, ErrorCode::NotOpen,
                std::format("Puzzle is {}, answer already revealed", toString(record.puzzle.state)));
        }

        auto word = toWord(answer);
        if (!word) {
            return pImpl->reject(puzzleId, ErrorCode::InvalidLength,
                std::format("Answer must be {} bytes, got {}", WORD_LENGTH, answer.size()));
        }

        if (!Impl::markRevealed(record.puzzle, *word)) {
            return pImpl->reject(puzzleId, ErrorCode::CommitmentMismatch, "Answer does not match the commitment");
        }

        return pImpl->commit(record, AnswerRevealed{ .puzzleId = puzzleId });
    }

    Outcome<std::uint32_t> PuzzleRegistry::finalizePuzzle(PuzzleId puzzleId) {
        auto loaded = pImpl->load(puzzleId);
        if (!loaded) return std::unexpected(loaded.error());
        auto& record = *loaded;

        if (record.puzzle.state == PuzzleState::Finalized) {
            return pImpl->reject(puzzleId, ErrorCode::AlreadyFinalized, "Puzzle already finalized");
        }
        if (record.puzzle.state != PuzzleState::Revealed) {
            return pImpl->reject(puzzleId, ErrorCode::AnswerNotRevealed, "Answer must be revealed before finalizing");
        }

        const Word answer = *record.puzzle.answer.revealed();
        std::uint32_t winnerCount = 0;

        for (const auto& player : record.roster.players()) {
            const auto& attempts = record.ledger.attemptsFor(player);
            bool solved = false;

            for (std::uint32_t index = 1; index <= attempts.size(); ++index) {
                ScoreVector scores = pImpl->scoring.score(attempts[index - 1].guess, answer);
                if (ScoringEngine::isSolved(scores)) {
                    solved = true;
                }

                auto written = record.ledger.setScores(player, index, std::move(scores));
                if (!written) return pImpl->reject(puzzleId, written.error().code, written.error().message);
            }

            if (solved) {
                record.winners.insert(player);
                if (!checkedIncrement(winnerCount)) {
                    return pImpl->reject(puzzleId, ErrorCode::Overflow, "Winner count overflow");
                }
            }
        }

        if (!Impl::markFinalized(record.puzzle, winnerCount)) {
            return pImpl->reject(puzzleId, ErrorCode::AnswerNotRevealed, "Puzzle left the Revealed state");
        }

        auto committed = pImpl->commit(record, PuzzleFinalized{
            .puzzleId = puzzleId,
            .answer = answer,
            .winnerCount = winnerCount
            });
        if (!committed) return std::unexpected(committed.error());

        return winnerCount;
    }

    std::optional<PuzzleData> PuzzleRegistry::getPuzzle(PuzzleId puzzleId) const {
        auto record = pImpl->storage->getPuzzle(puzzleId);
        if (!record) return std::nullopt;
        return record->puzzle;
    }

    std::vector<Attempt> PuzzleRegistry::getAttempts(PuzzleId puzzleId, const PlayerId& player) const {
        auto record = pImpl->storage->getPuzzle(puzzleId);
        if (!record) return {};
        return record->ledger.attemptsFor(player);
    }

    std::vector<PlayerId> PuzzleRegistry::listPlayers(PuzzleId puzzleId) const {
        auto record = pImpl->storage->getPuzzle(puzzleId);
        if (!record) return {};
        return record->roster.players();
    }

    bool PuzzleRegistry::isWinner(PuzzleId puzzleId, const PlayerId& player) const {
        auto record = pImpl->storage->getPuzzle(puzzleId);
        return record && record->isWinner(player);
    }
}
