// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sequence_similarity_hpp
#define sequence_similarity_hpp

#include <string>
#include <vector>
#include <cstddef>
#include <iosfwd>

namespace polyscan { namespace coretools {

// A run of identical symbols, lhs[lhs_begin, lhs_begin + length) == rhs[rhs_begin, rhs_begin + length).
struct MatchingBlock
{
    std::size_t lhs_begin, rhs_begin, length;
};

bool operator==(const MatchingBlock& lhs, const MatchingBlock& rhs) noexcept;
inline bool operator!=(const MatchingBlock& lhs, const MatchingBlock& rhs) noexcept { return !(lhs == rhs); }
std::ostream& operator<<(std::ostream& os, const MatchingBlock& block);

/*
    With AutoJunkPolicy::popular_symbols, and rhs at least 200 symbols long, any symbol occurring more
    than rhs.size() / 100 + 1 times in rhs cannot seed a matching block. Found blocks are still extended
    over such symbols. For DNA this usually removes every base, so the policy is off by default.
*/
enum class AutoJunkPolicy { none, popular_symbols };

/*
    Ratcliff/Obershelp matching blocks: the longest block in the whole range is taken (the earliest in lhs,
    then in rhs, among equally long blocks), and the ranges either side of it are searched in the same way.
    Blocks are ordered by position, adjacent blocks are merged, and the list always ends with the
    zero-length block {lhs.size(), rhs.size(), 0}.
*/
std::vector<MatchingBlock>
find_matching_blocks(const std::string& lhs, const std::string& rhs,
                     AutoJunkPolicy junk_policy = AutoJunkPolicy::none);

// Percentage 200 * M / (lhs.size() + rhs.size()) where M is the total length of the matching blocks.
// Two empty sequences are 100% similar.
double similarity(const std::string& lhs, const std::string& rhs,
                  AutoJunkPolicy junk_policy = AutoJunkPolicy::none);

} // namespace coretools
} // namespace polyscan

#endif
