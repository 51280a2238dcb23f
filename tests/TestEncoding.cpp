#include <catch2/catch.hpp>
#include "shared/Encoding.hpp"

using namespace WordleChain;

TEST_CASE("Hex encoding is lower case", "[encoding]")
{
    Bytes bytes{ 0x00, 0x0f, 0xa0, 0xff };
    REQUIRE(toHex(bytes) == "000fa0ff");
    REQUIRE(toHex(Bytes{}).empty());
}

TEST_CASE("Hex decoding accepts either case and rejects junk", "[encoding]")
{
    REQUIRE(fromHex("DEADbeef") == Bytes{ 0xde, 0xad, 0xbe, 0xef });
    REQUIRE(fromHex("")->empty());
    REQUIRE_FALSE(fromHex("abc").has_value());
    REQUIRE_FALSE(fromHex("zz").has_value());
    REQUIRE_FALSE(fromHex("0x00").has_value());
}

TEST_CASE("Digests must be exactly 32 bytes", "[encoding]")
{
    std::string hex(64, 'a');
    auto digest = digestFromHex(hex);
    REQUIRE(digest.has_value());
    REQUIRE((*digest)[0] == 0xaa);
    REQUIRE(toHex(*digest) == hex);

    REQUIRE_FALSE(digestFromHex(std::string(62, 'a')).has_value());
    REQUIRE_FALSE(digestFromHex(std::string(66, 'a')).has_value());
}

TEST_CASE("Words are exactly five bytes", "[encoding]")
{
    auto w = toWord(bytesOf("CRANE"));
    REQUIRE(w.has_value());
    REQUIRE(wordToString(*w) == "CRANE");

    REQUIRE_FALSE(toWord(bytesOf("CRAN")).has_value());
    REQUIRE_FALSE(toWord(bytesOf("CRANES")).has_value());
}
