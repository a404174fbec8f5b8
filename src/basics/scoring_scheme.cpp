// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "scoring_scheme.hpp"

#include <ostream>

namespace polyscan {

ScoringScheme::ScoreType extend_gap(const ScoringScheme::ScoreType score, const std::size_t gap_length,
                                    const ScoringScheme& scheme) noexcept
{
    return gap_length == 1 ? scheme.gap_open_score : score + scheme.gap_extend_score;
}

ScoringScheme::ScoreType gap_score(const ScoringScheme& scheme, const std::size_t gap_length) noexcept
{
    ScoringScheme::ScoreType result {0};
    for (std::size_t n {1}; n <= gap_length; ++n) {
        result = extend_gap(result, n, scheme);
    }
    return result;
}

bool is_linear(const ScoringScheme& scheme) noexcept
{
    return scheme.gap_open_score == scheme.gap_extend_score;
}

bool operator==(const ScoringScheme& lhs, const ScoringScheme& rhs) noexcept
{
    return lhs.match_score == rhs.match_score
        && lhs.mismatch_score == rhs.mismatch_score
        && lhs.gap_open_score == rhs.gap_open_score
        && lhs.gap_extend_score == rhs.gap_extend_score;
}

bool operator!=(const ScoringScheme& lhs, const ScoringScheme& rhs) noexcept
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ScoringScheme& scheme)
{
    os << "match=" << scheme.match_score
       << " mismatch=" << scheme.mismatch_score
       << " gap-open=" << scheme.gap_open_score
       << " gap-extend=" << scheme.gap_extend_score;
    return os;
}

} // namespace polyscan
