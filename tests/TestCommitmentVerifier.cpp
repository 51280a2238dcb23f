#include <catch2/catch.hpp>
#include "engine/CommitmentVerifier.hpp"
#include "Fixtures.hpp"

using namespace WordleChain;
using WordleChain::testing::commitmentFor;
using WordleChain::testing::word;

TEST_CASE("Digest matches the SHA-256 test vector", "[commitment]")
{
    Digest d = CommitmentVerifier::digest(bytesOf("abc"));
    REQUIRE(toHex(d) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("verify accepts only the committed answer", "[commitment]")
{
    CommitmentVerifier verifier;
    Digest commitment = commitmentFor("ABCDE");

    REQUIRE(verifier.verify(bytesOf("ABCDE"), commitment));
    REQUIRE_FALSE(verifier.verify(bytesOf("abcde"), commitment));
    REQUIRE_FALSE(verifier.verify(bytesOf("ABCD"), commitment));
    REQUIRE_FALSE(verifier.verify(bytesOf("ABCDEF"), commitment));

    SECTION("any single-byte mutation is rejected")
    {
        Bytes answer = bytesOf("ABCDE");
        for (std::size_t i = 0; i < answer.size(); ++i) {
            Bytes mutated = answer;
            mutated[i] ^= 0x01;
            REQUIRE_FALSE(verifier.verify(mutated, commitment));
        }
    }
}

TEST_CASE("SealedAnswer unseals once with the committed word", "[commitment][sealed]")
{
    SealedAnswer sealed(commitmentFor("CRANE"));
    REQUIRE_FALSE(sealed.isRevealed());
    REQUIRE_FALSE(sealed.revealed().has_value());

    REQUIRE_FALSE(sealed.unseal(word("CRATE")));
    REQUIRE_FALSE(sealed.isRevealed());

    REQUIRE(sealed.unseal(word("CRANE")));
    REQUIRE(sealed.isRevealed());
    REQUIRE(*sealed.revealed() == word("CRANE"));

    SECTION("a second unseal is refused and leaves the answer intact")
    {
        REQUIRE_FALSE(sealed.unseal(word("CRANE")));
        REQUIRE(*sealed.revealed() == word("CRANE"));
    }
}
