// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "aligned_pair.hpp"

#include <algorithm>
#include <iterator>
#include <functional>
#include <ostream>

namespace polyscan {

constexpr char AlignedPair::gap_symbol;

namespace {

char operation(const char ref, const char query) noexcept
{
    if (ref == AlignedPair::gap_symbol) return 'I';
    if (query == AlignedPair::gap_symbol) return 'D';
    return ref == query ? '=' : 'X';
}

std::string make_operations(const AlignedPair& alignment)
{
    std::string result(alignment_length(alignment), '=');
    std::transform(std::cbegin(alignment.aligned_reference), std::cend(alignment.aligned_reference),
                   std::cbegin(alignment.aligned_query), std::begin(result), operation);
    return result;
}

} // namespace

std::size_t count_identities(const AlignedPair& alignment) noexcept
{
    std::size_t result {0};
    for (std::size_t i {0}; i < alignment_length(alignment); ++i) {
        if (operation(alignment.aligned_reference[i], alignment.aligned_query[i]) == '=') ++result;
    }
    return result;
}

std::size_t count_substitutions(const AlignedPair& alignment) noexcept
{
    std::size_t result {0};
    for (std::size_t i {0}; i < alignment_length(alignment); ++i) {
        if (operation(alignment.aligned_reference[i], alignment.aligned_query[i]) == 'X') ++result;
    }
    return result;
}

std::size_t count_gaps(const AlignedPair& alignment) noexcept
{
    return std::count(std::cbegin(alignment.aligned_reference), std::cend(alignment.aligned_reference), AlignedPair::gap_symbol)
         + std::count(std::cbegin(alignment.aligned_query), std::cend(alignment.aligned_query), AlignedPair::gap_symbol);
}

std::string make_cigar(const AlignedPair& alignment)
{
    const auto operations = make_operations(alignment);
    std::string result {};
    auto itr = std::cbegin(operations);
    const auto last = std::cend(operations);
    while (itr != last) {
        auto next_unique = std::adjacent_find(itr, last, std::not_equal_to<> {});
        if (next_unique != last) ++next_unique;
        result += std::to_string(std::distance(itr, next_unique));
        result += *itr;
        itr = next_unique;
    }
    return result;
}

bool operator==(const AlignedPair& lhs, const AlignedPair& rhs) noexcept
{
    return lhs.aligned_reference == rhs.aligned_reference
        && lhs.aligned_query == rhs.aligned_query
        && lhs.score == rhs.score
        && lhs.reference_region == rhs.reference_region
        && lhs.query_region == rhs.query_region;
}

bool operator!=(const AlignedPair& lhs, const AlignedPair& rhs) noexcept
{
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const AlignedPair& alignment)
{
    os << alignment.reference_region << ' ' << alignment.query_region
       << ' ' << make_cigar(alignment) << " score=" << alignment.score;
    return os;
}

} // namespace polyscan
