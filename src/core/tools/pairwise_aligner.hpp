// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef pairwise_aligner_hpp
#define pairwise_aligner_hpp

#include <string>
#include <array>

#include "basics/scoring_scheme.hpp"
#include "basics/aligned_pair.hpp"

namespace polyscan { namespace coretools {

enum class TracebackMove { diagonal, up, left };

/*
    Traceback tie-break policy. Several paths through the score matrix can be optimal; at every cell
    the first move in this list that reproduces the cell score is taken. Up consumes a reference base
    against a gap, left a query base against a gap. Local alignments start from the first cell in
    row-major order holding the maximum score.
*/
constexpr std::array<TracebackMove, 3> TracebackPreference {{
    TracebackMove::diagonal, TracebackMove::up, TracebackMove::left
}};

// Needleman-Wunsch. Both sequences are aligned end to end.
AlignedPair global_align(const std::string& reference, const std::string& query,
                         const ScoringScheme& scheme = ScoringScheme {});

// Smith-Waterman. Only the best scoring pair of substrings is aligned; the flanks are dropped.
AlignedPair local_align(const std::string& reference, const std::string& query,
                        const ScoringScheme& scheme = ScoringScheme {});

} // namespace coretools
} // namespace polyscan

#endif
