#include "ScoringEngine.hpp"
#include <algorithm>

using namespace WordleChain;

ScoreVector ScoringEngine::score(const Word& guess, const Word& answer) const {
    ScoreVector scores(WORD_LENGTH, LetterScore::Absent);
    std::array<bool, WORD_LENGTH> consumed{};

    for (std::size_t i = 0; i < WORD_LENGTH; ++i) {
        if (guess[i] == answer[i]) {
            scores[i] = LetterScore::Correct;
            consumed[i] = true;
        }
    }

    for (std::size_t i = 0; i < WORD_LENGTH; ++i) {
        if (scores[i] == LetterScore::Correct) continue;

        for (std::size_t j = 0; j < WORD_LENGTH; ++j) {
            if (!consumed[j] && answer[j] == guess[i]) {
                scores[i] = LetterScore::Present;
                consumed[j] = true;
                break;
            }
        }
    }

    return scores;
}

bool ScoringEngine::isSolved(const ScoreVector& scores) {
    return scores.size() == WORD_LENGTH &&
        std::all_of(scores.begin(), scores.end(),
            [](LetterScore s) { return s == LetterScore::Correct; });
}
