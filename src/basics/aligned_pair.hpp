// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef aligned_pair_hpp
#define aligned_pair_hpp

#include <string>
#include <cstddef>
#include <iosfwd>

#include "sequence_region.hpp"

namespace polyscan {

/*
    A pairwise alignment of a reference and a query. Both aligned sequences have the same length
    and use gap_symbol for positions where the other sequence has a base. The regions give the
    offsets of the original sequences covered by the alignment.
*/
struct AlignedPair
{
    using AlignedSequence = std::string;
    using ScoreType       = double;
    
    static constexpr char gap_symbol {'-'};
    
    AlignedSequence aligned_reference, aligned_query;
    ScoreType score = 0;
    SequenceRegion reference_region, query_region;
};

inline std::size_t alignment_length(const AlignedPair& alignment) noexcept
{
    return alignment.aligned_reference.size();
}

inline bool is_empty(const AlignedPair& alignment) noexcept
{
    return alignment.aligned_reference.empty();
}

std::size_t count_identities(const AlignedPair& alignment) noexcept;
std::size_t count_substitutions(const AlignedPair& alignment) noexcept;
std::size_t count_gaps(const AlignedPair& alignment) noexcept;

// Run-length encoded operations, e.g. "3=1X2I": '=' identity, 'X' substitution,
// 'I' query base against a gap, 'D' reference base against a gap.
std::string make_cigar(const AlignedPair& alignment);

bool operator==(const AlignedPair& lhs, const AlignedPair& rhs) noexcept;
bool operator!=(const AlignedPair& lhs, const AlignedPair& rhs) noexcept;

std::ostream& operator<<(std::ostream& os, const AlignedPair& alignment);

} // namespace polyscan

#endif
