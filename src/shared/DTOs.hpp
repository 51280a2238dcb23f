#pragma once

#include "Enums.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace WordleChain {

	inline constexpr std::size_t WORD_LENGTH = 5;
	inline constexpr std::size_t MAX_ATTEMPTS = 6;
	inline constexpr std::size_t MAX_PLAYERS_PER_PUZZLE = 1000;
	inline constexpr std::size_t DIGEST_LENGTH = 32;

	using PuzzleId = std::uint64_t;
	using PlayerId = std::string;
	using Bytes = std::vector<std::uint8_t>;
	using Word = std::array<std::uint8_t, WORD_LENGTH>;
	using Digest = std::array<std::uint8_t, DIGEST_LENGTH>;
	using ScoreVector = std::vector<LetterScore>;

	struct Attempt {
		Word guess{};
		// Empty until the puzzle is finalized.
		ScoreVector scores;
	};

	// Admin identity and collaborator addresses, resolved once at startup.
	struct GameConfig {
		PlayerId admin;
		std::string prizePoolContract;
		std::string balanceContract;
	};

	struct Caller {
		PlayerId id;
		bool authenticated{ false };
	};

	struct PuzzleCreated {
		PuzzleId puzzleId{ 0 };
		Digest commitment{};
	};

	struct AttemptSubmitted {
		PuzzleId puzzleId{ 0 };
		PlayerId player;
		std::uint32_t attemptNumber{ 0 };
		Word guess{};
	};

	struct AnswerRevealed {
		PuzzleId puzzleId{ 0 };
	};

	struct PuzzleFinalized {
		PuzzleId puzzleId{ 0 };
		Word answer{};
		std::uint32_t winnerCount{ 0 };
	};

	using GameEvent = std::variant<PuzzleCreated, AttemptSubmitted, AnswerRevealed, PuzzleFinalized>;
}
