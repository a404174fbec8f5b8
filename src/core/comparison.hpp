// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef comparison_hpp
#define comparison_hpp

#include <iosfwd>

#include "config/common.hpp"
#include "basics/scoring_scheme.hpp"
#include "basics/aligned_pair.hpp"
#include "core/tools/sequence_similarity.hpp"
#include "core/tools/classifier.hpp"

namespace polyscan {

struct ComparisonOptions
{
    ScoringScheme scoring = ScoringScheme {};
    double threshold = coretools::DefaultDivergenceThreshold;
    coretools::AutoJunkPolicy junk_policy = coretools::AutoJunkPolicy::none;
};

struct ComparisonResult
{
    double similarity;
    bool is_divergent;
    AlignedPair global_alignment, local_alignment;
};

/*
    Scores, classifies and aligns query against reference. Both sequences must be over {A, C, G, T}
    (empty sequences are allowed); otherwise InvalidReferenceSequence or InvalidQuerySequence is thrown.
*/
ComparisonResult compare(const NucleotideSequence& reference, const NucleotideSequence& query,
                         const ComparisonOptions& options = ComparisonOptions {});

std::ostream& operator<<(std::ostream& os, const ComparisonResult& result);

} // namespace polyscan

#endif
