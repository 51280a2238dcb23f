#include "EventSink.hpp"
#include "../shared/Encoding.hpp"
#include <format>

namespace WordleChain {

    namespace {
        struct NameVisitor {
            std::string operator()(const PuzzleCreated&) const { return "PUZZLE_CREATED"; }
            std::string operator()(const AttemptSubmitted&) const { return "ATTEMPT_SUBMITTED"; }
            std::string operator()(const AnswerRevealed&) const { return "ANSWER_REVEALED"; }
            std::string operator()(const PuzzleFinalized&) const { return "PUZZLE_FINALIZED"; }
        };

        struct DescribeVisitor {
            std::string operator()(const PuzzleCreated& e) const {
                return std::format("puzzle {} created, commitment {}", e.puzzleId, toHex(e.commitment));
            }
            std::string operator()(const AttemptSubmitted& e) const {
                return std::format("puzzle {} attempt #{} by {}: {}",
                    e.puzzleId, e.attemptNumber, e.player, toHex(e.guess));
            }
            std::string operator()(const AnswerRevealed& e) const {
                return std::format("puzzle {} answer revealed", e.puzzleId);
            }
            std::string operator()(const PuzzleFinalized& e) const {
                return std::format("puzzle {} finalized, answer {}, {} winner(s)",
                    e.puzzleId, toHex(e.answer), e.winnerCount);
            }
        };
    }

    std::string eventName(const GameEvent& event) {
        return std::visit(NameVisitor{}, event);
    }

    std::string describe(const GameEvent& event) {
        return std::visit(DescribeVisitor{}, event);
    }
}
