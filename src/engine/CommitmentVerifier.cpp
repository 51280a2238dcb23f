#include "CommitmentVerifier.hpp"

#include <openssl/crypto.h>
#include <openssl/sha.h>

using namespace WordleChain;

Digest CommitmentVerifier::digest(std::span<const std::uint8_t> data) {
    Digest out{};
    SHA256(data.data(), data.size(), out.data());
    return out;
}

bool CommitmentVerifier::verify(std::span<const std::uint8_t> answer, const Digest& commitment) const {
    Digest candidate = digest(answer);
    return CRYPTO_memcmp(candidate.data(), commitment.data(), DIGEST_LENGTH) == 0;
}

SealedAnswer::SealedAnswer(const Digest& commitment)
    : commitment_(commitment) {
}

bool SealedAnswer::unseal(const Word& candidate) {
    if (answer_) return false;

    CommitmentVerifier verifier;
    if (!verifier.verify(candidate, commitment_)) return false;

    answer_ = candidate;
    return true;
}
