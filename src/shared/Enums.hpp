#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace WordleChain {

	enum class PuzzleState : std::uint8_t {
		Open = 0,
		Revealed = 1,
		Finalized = 2
	};

	enum class LetterScore : std::uint8_t {
		Absent = 0,
		Present = 1,
		Correct = 2
	};

	// Decoding of the stored integer forms; nullopt outside the known range.
	constexpr std::optional<PuzzleState> puzzleStateFrom(std::int64_t value) {
		if (value < 0 || value > static_cast<std::int64_t>(PuzzleState::Finalized)) return std::nullopt;
		return static_cast<PuzzleState>(value);
	}

	constexpr std::optional<LetterScore> letterScoreFrom(std::int64_t value) {
		if (value < 0 || value > static_cast<std::int64_t>(LetterScore::Correct)) return std::nullopt;
		return static_cast<LetterScore>(value);
	}

	enum class ErrorCode {
		NotInitialized,
		NotAuthorized,
		AlreadyExists,
		NotFound,
		NotOpen,
		AlreadyFinalized,
		AnswerNotRevealed,
		TooManyAttempts,
		RosterFull,
		InvalidLength,
		CommitmentMismatch,
		Overflow,
		StorageFailure
	};

	enum class Operation {
		CreatePuzzle,
		SubmitGuess,
		RevealAnswer,
		FinalizePuzzle,
		Read
	};

	enum class Privilege {
		Public,
		Player,
		Admin
	};

	constexpr std::string_view toString(PuzzleState state) {
		switch (state) {
		case PuzzleState::Open: return "Open";
		case PuzzleState::Revealed: return "Revealed";
		case PuzzleState::Finalized: return "Finalized";
		}
		return "Unknown";
	}

	constexpr std::string_view toString(ErrorCode code) {
		switch (code) {
		case ErrorCode::NotInitialized: return "NotInitialized";
		case ErrorCode::NotAuthorized: return "NotAuthorized";
		case ErrorCode::AlreadyExists: return "AlreadyExists";
		case ErrorCode::NotFound: return "NotFound";
		case ErrorCode::NotOpen: return "NotOpen";
		case ErrorCode::AlreadyFinalized: return "AlreadyFinalized";
		case ErrorCode::AnswerNotRevealed: return "AnswerNotRevealed";
		case ErrorCode::TooManyAttempts: return "TooManyAttempts";
		case ErrorCode::RosterFull: return "RosterFull";
		case ErrorCode::InvalidLength: return "InvalidLength";
		case ErrorCode::CommitmentMismatch: return "CommitmentMismatch";
		case ErrorCode::Overflow: return "Overflow";
		case ErrorCode::StorageFailure: return "StorageFailure";
		}
		return "Unknown";
	}
}
