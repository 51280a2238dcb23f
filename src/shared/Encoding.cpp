#include "Encoding.hpp"
#include <algorithm>

using namespace WordleChain;

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string WordleChain::toHex(std::span<const std::uint8_t> bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += digits[b >> 4];
        result += digits[b & 0x0F];
    }
    return result;
}

std::optional<Bytes> WordleChain::fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;

    Bytes result;
    result.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hexValue(hex[i]);
        int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        result.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return result;
}

std::optional<Digest> WordleChain::digestFromHex(std::string_view hex) {
    auto bytes = fromHex(hex);
    if (!bytes || bytes->size() != DIGEST_LENGTH) return std::nullopt;

    Digest digest{};
    std::copy(bytes->begin(), bytes->end(), digest.begin());
    return digest;
}

Bytes WordleChain::bytesOf(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

std::optional<Word> WordleChain::toWord(std::span<const std::uint8_t> bytes) {
    if (bytes.size() != WORD_LENGTH) return std::nullopt;

    Word word{};
    std::copy(bytes.begin(), bytes.end(), word.begin());
    return word;
}

std::string WordleChain::wordToString(const Word& word) {
    return std::string(word.begin(), word.end());
}
