#pragma once

#include "../shared/DTOs.hpp"

namespace WordleChain {

    class ScoringEngine {
    public:
        /*
         * Exact matches are resolved first and consume their answer slot. Each
         * remaining guess byte, left to right, then consumes the lowest-index
         * unconsumed answer slot holding the same byte, so a physical answer
         * letter backs at most one Correct or Present mark.
         */
        ScoreVector score(const Word& guess, const Word& answer) const;

        static bool isSolved(const ScoreVector& scores);
    };
}
