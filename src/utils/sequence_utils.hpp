// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sequence_utils_hpp
#define sequence_utils_hpp

#include <cstddef>
#include <iterator>
#include <algorithm>

#include <boost/optional.hpp>

namespace polyscan { namespace utils {

namespace detail {

inline constexpr char capitalise_base(const char base) noexcept
{
    switch (base) {
        case 'a': return 'A';
        case 'c': return 'C';
        case 'g': return 'G';
        case 't': return 'T';
        case 'n': return 'N';
        default : return base;
    }
}

inline bool is_dna_nucleotide(const char b) noexcept
{
    return b == 'A' || b == 'C' || b == 'G' || b == 'T';
}

} // namespace detail

// Offset of the first symbol that is not one of A, C, G, T.
template <typename SequenceType>
boost::optional<std::size_t> find_non_canonical_base(const SequenceType& sequence) noexcept
{
    const auto itr = std::find_if_not(std::cbegin(sequence), std::cend(sequence), detail::is_dna_nucleotide);
    if (itr == std::cend(sequence)) return boost::none;
    return static_cast<std::size_t>(std::distance(std::cbegin(sequence), itr));
}

template <typename SequenceType>
void capitalise(SequenceType& sequence)
{
    std::transform(std::begin(sequence), std::end(sequence), std::begin(sequence),
                   [] (auto base) { return detail::capitalise_base(base); });
}

template <typename SequenceType>
std::size_t count_bases(const SequenceType& sequence, const char base) noexcept
{
    return std::count(std::cbegin(sequence), std::cend(sequence), base);
}

template <typename SequenceType>
double gc_content(const SequenceType& sequence) noexcept
{
    if (sequence.empty()) return 0.0;
    const auto gc_count = count_bases(sequence, 'G') + count_bases(sequence, 'C');
    return static_cast<double>(gc_count) / sequence.size();
}

} // namespace utils
} // namespace polyscan

#endif
