#pragma once

#include "../shared/DTOs.hpp"
#include <expected>
#include <string>

namespace WordleChain {

	struct EngineError {
		ErrorCode code{ ErrorCode::NotFound };
		std::string message;
	};

	template <typename T>
	using Outcome = std::expected<T, EngineError>;

	using VoidOutcome = Outcome<void>;

	inline std::unexpected<EngineError> makeError(ErrorCode code, std::string message) {
		return std::unexpected<EngineError>(EngineError{ .code = code, .message = std::move(message) });
	}

}
