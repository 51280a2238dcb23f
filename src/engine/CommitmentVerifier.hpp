#pragma once

#include "../shared/DTOs.hpp"
#include <optional>
#include <span>

namespace WordleChain {

    class CommitmentVerifier {
    public:
        // SHA-256 of the given bytes.
        static Digest digest(std::span<const std::uint8_t> data);

        // Constant-time comparison of digest(answer) against the commitment.
        bool verify(std::span<const std::uint8_t> answer, const Digest& commitment) const;
    };

    /*
     * Holds only the commitment until a candidate answer hashing to it is
     * presented. The plaintext is never stored before that point and cannot
     * change afterwards.
     */
    class SealedAnswer {
    public:
        SealedAnswer() = default;
        explicit SealedAnswer(const Digest& commitment);

        const Digest& commitment() const { return commitment_; }
        bool isRevealed() const { return answer_.has_value(); }
        const std::optional<Word>& revealed() const { return answer_; }

        bool unseal(const Word& candidate);

    private:
        Digest commitment_{};
        std::optional<Word> answer_;
    };
}
