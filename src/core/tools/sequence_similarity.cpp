// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "sequence_similarity.hpp"

#include <unordered_map>
#include <algorithm>
#include <numeric>
#include <iterator>
#include <tuple>
#include <ostream>

namespace polyscan { namespace coretools {

bool operator==(const MatchingBlock& lhs, const MatchingBlock& rhs) noexcept
{
    return lhs.lhs_begin == rhs.lhs_begin && lhs.rhs_begin == rhs.rhs_begin && lhs.length == rhs.length;
}

std::ostream& operator<<(std::ostream& os, const MatchingBlock& block)
{
    os << '(' << block.lhs_begin << ',' << block.rhs_begin << ',' << block.length << ')';
    return os;
}

namespace {

using Position = std::size_t;

struct SearchRange
{
    Position lhs_begin, lhs_end, rhs_begin, rhs_end;
};

// Which positions of rhs may seed a block
std::vector<char> make_seed_mask(const std::string& rhs, const AutoJunkPolicy junk_policy)
{
    std::vector<char> result(rhs.size(), true);
    static constexpr std::size_t min_junk_sequence_size {200};
    if (junk_policy == AutoJunkPolicy::popular_symbols && rhs.size() >= min_junk_sequence_size) {
        std::unordered_map<char, std::size_t> counts {};
        for (const char c : rhs) ++counts[c];
        const auto max_count = rhs.size() / 100 + 1;
        std::transform(std::cbegin(rhs), std::cend(rhs), std::begin(result),
                       [&] (const char c) -> char { return counts[c] <= max_count; });
    }
    return result;
}

MatchingBlock
find_longest_match(const std::string& lhs, const std::string& rhs, const std::vector<char>& seedable,
                   const SearchRange& range)
{
    MatchingBlock result {range.lhs_begin, range.rhs_begin, 0};
    const auto width = range.rhs_end - range.rhs_begin;
    // run_lengths[k + 1] is the length of the run ending at lhs[i], rhs[rhs_begin + k]
    std::vector<Position> prev_run_lengths(width + 1, 0), run_lengths(width + 1, 0);
    for (Position i {range.lhs_begin}; i < range.lhs_end; ++i) {
        for (Position k {0}; k < width; ++k) {
            const auto j = range.rhs_begin + k;
            if (seedable[j] && lhs[i] == rhs[j]) {
                const auto run_length = prev_run_lengths[k] + 1;
                run_lengths[k + 1] = run_length;
                if (run_length > result.length) {
                    result = {i + 1 - run_length, j + 1 - run_length, run_length};
                }
            } else {
                run_lengths[k + 1] = 0;
            }
        }
        std::swap(prev_run_lengths, run_lengths);
    }
    // Only has an effect when junk symbols were excluded from seeding
    while (result.lhs_begin > range.lhs_begin && result.rhs_begin > range.rhs_begin
           && lhs[result.lhs_begin - 1] == rhs[result.rhs_begin - 1]) {
        --result.lhs_begin;
        --result.rhs_begin;
        ++result.length;
    }
    while (result.lhs_begin + result.length < range.lhs_end && result.rhs_begin + result.length < range.rhs_end
           && lhs[result.lhs_begin + result.length] == rhs[result.rhs_begin + result.length]) {
        ++result.length;
    }
    return result;
}

bool are_adjacent(const MatchingBlock& lhs, const MatchingBlock& rhs) noexcept
{
    return lhs.lhs_begin + lhs.length == rhs.lhs_begin && lhs.rhs_begin + lhs.length == rhs.rhs_begin;
}

std::vector<MatchingBlock> merge_adjacent(const std::vector<MatchingBlock>& blocks)
{
    std::vector<MatchingBlock> result {};
    result.reserve(blocks.size() + 1);
    for (const auto& block : blocks) {
        if (!result.empty() && are_adjacent(result.back(), block)) {
            result.back().length += block.length;
        } else {
            result.push_back(block);
        }
    }
    return result;
}

} // namespace

std::vector<MatchingBlock>
find_matching_blocks(const std::string& lhs, const std::string& rhs, const AutoJunkPolicy junk_policy)
{
    const auto seedable = make_seed_mask(rhs, junk_policy);
    std::vector<MatchingBlock> blocks {};
    std::vector<SearchRange> pending {{0, lhs.size(), 0, rhs.size()}};
    while (!pending.empty()) {
        const auto range = pending.back();
        pending.pop_back();
        const auto block = find_longest_match(lhs, rhs, seedable, range);
        if (block.length > 0) {
            blocks.push_back(block);
            if (range.lhs_begin < block.lhs_begin && range.rhs_begin < block.rhs_begin) {
                pending.push_back({range.lhs_begin, block.lhs_begin, range.rhs_begin, block.rhs_begin});
            }
            if (block.lhs_begin + block.length < range.lhs_end && block.rhs_begin + block.length < range.rhs_end) {
                pending.push_back({block.lhs_begin + block.length, range.lhs_end,
                                   block.rhs_begin + block.length, range.rhs_end});
            }
        }
    }
    std::sort(std::begin(blocks), std::end(blocks), [] (const MatchingBlock& a, const MatchingBlock& b) {
        return std::tie(a.lhs_begin, a.rhs_begin, a.length) < std::tie(b.lhs_begin, b.rhs_begin, b.length);
    });
    auto result = merge_adjacent(blocks);
    result.push_back({lhs.size(), rhs.size(), 0});
    return result;
}

double similarity(const std::string& lhs, const std::string& rhs, const AutoJunkPolicy junk_policy)
{
    const auto total_length = lhs.size() + rhs.size();
    if (total_length == 0) return 100.0;
    const auto blocks = find_matching_blocks(lhs, rhs, junk_policy);
    const auto num_matches = std::accumulate(std::cbegin(blocks), std::cend(blocks), std::size_t {0},
                                             [] (const auto curr, const MatchingBlock& block) { return curr + block.length; });
    return 100.0 * (2.0 * num_matches / total_length);
}

} // namespace coretools
} // namespace polyscan
