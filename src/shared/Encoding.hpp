#pragma once

#include "DTOs.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace WordleChain {

    std::string toHex(std::span<const std::uint8_t> bytes);

    // Accepts upper or lower case, no prefix. Odd length or non-hex input yields nullopt.
    std::optional<Bytes> fromHex(std::string_view hex);

    std::optional<Digest> digestFromHex(std::string_view hex);

    Bytes bytesOf(std::string_view text);

    std::optional<Word> toWord(std::span<const std::uint8_t> bytes);

    std::string wordToString(const Word& word);
}
