// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef scoring_scheme_hpp
#define scoring_scheme_hpp

#include <cstddef>
#include <iosfwd>

namespace polyscan {

/*
    Scores for pairwise alignment. The defaults count identities only: mismatches and gaps are free.
    A gap of length n scores gap_open_score + (n - 1) * gap_extend_score, so equal open and extend
    scores give a linear gap model.
*/
struct ScoringScheme
{
    using ScoreType = double;
    ScoreType match_score      = 1;
    ScoreType mismatch_score   = 0;
    ScoreType gap_open_score   = 0;
    ScoreType gap_extend_score = 0;
};

inline ScoringScheme::ScoreType substitution_score(const ScoringScheme& scheme, const char lhs, const char rhs) noexcept
{
    return lhs == rhs ? scheme.match_score : scheme.mismatch_score;
}

// Score of a gap of gap_length given score, the score of the same gap one position shorter.
ScoringScheme::ScoreType extend_gap(ScoringScheme::ScoreType score, std::size_t gap_length,
                                    const ScoringScheme& scheme) noexcept;

// Summed one position at a time, so equal to the border of a global alignment matrix bit for bit.
ScoringScheme::ScoreType gap_score(const ScoringScheme& scheme, std::size_t gap_length) noexcept;

bool is_linear(const ScoringScheme& scheme) noexcept;

bool operator==(const ScoringScheme& lhs, const ScoringScheme& rhs) noexcept;
bool operator!=(const ScoringScheme& lhs, const ScoringScheme& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const ScoringScheme& scheme);

} // namespace polyscan

#endif
