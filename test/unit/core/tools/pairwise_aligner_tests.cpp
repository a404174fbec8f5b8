// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>
#include <utility>
#include <algorithm>

#include "core/tools/pairwise_aligner.hpp"

namespace polyscan { namespace test {

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(pairwise_aligner)

BOOST_AUTO_TEST_CASE(global_align_handles_empty_sequences)
{
    using coretools::global_align;
    
    const std::string empty {}, nonempty {"ACG"};
    
    BOOST_REQUIRE_NO_THROW(global_align(empty, empty));
    auto alignment = global_align(empty, empty);
    BOOST_CHECK(is_empty(alignment));
    BOOST_CHECK_EQUAL(alignment.score, 0);
    
    alignment = global_align(empty, nonempty);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "---");
    BOOST_CHECK_EQUAL(alignment.aligned_query, nonempty);
    BOOST_CHECK_EQUAL(alignment.score, 0);
    BOOST_CHECK_EQUAL(alignment.reference_region, SequenceRegion(0, 0));
    BOOST_CHECK_EQUAL(alignment.query_region, SequenceRegion(0, 3));
    
    const ScoringScheme scheme {1, -1, -3, -1};
    alignment = global_align(nonempty, empty, scheme);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, nonempty);
    BOOST_CHECK_EQUAL(alignment.aligned_query, "---");
    BOOST_CHECK_EQUAL(alignment.score, -5);
}

BOOST_AUTO_TEST_CASE(local_align_of_empty_sequences_is_empty)
{
    using coretools::local_align;
    
    const std::string empty {}, nonempty {"ACG"};
    
    for (const auto& p : std::vector<std::pair<std::string, std::string>> {{empty, empty}, {empty, nonempty}, {nonempty, empty}}) {
        const auto alignment = local_align(p.first, p.second);
        BOOST_CHECK(is_empty(alignment));
        BOOST_CHECK_EQUAL(alignment.score, 0);
    }
}

BOOST_AUTO_TEST_CASE(global_align_of_identical_sequences_is_all_matches)
{
    const auto alignment = coretools::global_align("ATGC", "ATGC");
    BOOST_CHECK_EQUAL(alignment.score, 4);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ATGC");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "ATGC");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "4=");
}

BOOST_AUTO_TEST_CASE(global_align_prefers_substitutions_to_gaps_when_scores_tie)
{
    const auto alignment = coretools::global_align("ATGC", "ATGG");
    BOOST_CHECK_EQUAL(alignment.score, 3);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ATGC");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "ATGG");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "3=1X");
}

BOOST_AUTO_TEST_CASE(global_align_covers_both_sequences)
{
    const std::string reference {"AAATGCAAA"}, query {"TGC"};
    const auto alignment = coretools::global_align(reference, query);
    BOOST_CHECK_EQUAL(alignment.reference_region, full_region(reference.size()));
    BOOST_CHECK_EQUAL(alignment.query_region, full_region(query.size()));
    BOOST_CHECK_EQUAL(alignment.aligned_reference.size(), alignment.aligned_query.size());
    BOOST_CHECK_EQUAL(alignment.score, 3);
}

BOOST_AUTO_TEST_CASE(local_align_finds_the_embedded_match)
{
    const auto alignment = coretools::local_align("AAATGCAAA", "TGC");
    BOOST_CHECK_EQUAL(alignment.score, 3);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "TGC");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "TGC");
    BOOST_CHECK_EQUAL(alignment.reference_region, SequenceRegion(3, 6));
    BOOST_CHECK_EQUAL(alignment.query_region, SequenceRegion(0, 3));
}

BOOST_AUTO_TEST_CASE(local_align_stops_at_zero_scoring_cells)
{
    const ScoringScheme scheme {1, -1, -1, -1};
    const auto alignment = coretools::local_align("TTTTACGTTTTT", "GGACGGG", scheme);
    BOOST_CHECK_EQUAL(alignment.score, 3);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ACG");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "ACG");
    BOOST_CHECK_EQUAL(alignment.reference_region, SequenceRegion(4, 7));
    BOOST_CHECK_EQUAL(alignment.query_region, SequenceRegion(2, 5));
}

BOOST_AUTO_TEST_CASE(local_align_of_unrelated_sequences_is_empty)
{
    const auto alignment = coretools::local_align("AAAA", "CCCC");
    BOOST_CHECK(is_empty(alignment));
    BOOST_CHECK_EQUAL(alignment.score, 0);
}

BOOST_AUTO_TEST_CASE(global_align_uses_linear_gap_penalties)
{
    const ScoringScheme scheme {1, -1, -1, -1};
    const auto alignment = coretools::global_align("ACGT", "AGT", scheme);
    BOOST_CHECK_EQUAL(alignment.score, 2);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ACGT");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "A-GT");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "1=1D2=");
}

BOOST_AUTO_TEST_CASE(global_align_uses_affine_gap_penalties)
{
    const ScoringScheme scheme {2, -1, -3, -1};
    const auto alignment = coretools::global_align("AACCGGTT", "AAGGTT", scheme);
    BOOST_CHECK_EQUAL(alignment.score, 8);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "AACCGGTT");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "AA--GGTT");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "2=2D4=");
}

BOOST_AUTO_TEST_CASE(global_align_puts_query_bases_against_reference_gaps)
{
    const ScoringScheme scheme {2, -1, -3, -1};
    const auto alignment = coretools::global_align("AAGGTT", "AACCGGTT", scheme);
    BOOST_CHECK_EQUAL(alignment.score, 8);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "AA--GGTT");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "AACCGGTT");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "2=2I4=");
}

BOOST_AUTO_TEST_CASE(global_align_border_gaps_are_summed_cell_by_cell)
{
    const ScoringScheme scheme {1, -0.3, -0.7, -0.7};
    const auto alignment = coretools::global_align(std::string(26, 'A'), std::string(6, 'A'), scheme);
    BOOST_CHECK_EQUAL(alignment.score, -7.999999999999995);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, std::string(26, 'A'));
    BOOST_CHECK_EQUAL(alignment.aligned_query, "--------------------AAAAAA");
    BOOST_CHECK_EQUAL(make_cigar(alignment), "20D6=");
}

BOOST_AUTO_TEST_CASE(global_align_with_fractional_gap_scores)
{
    const ScoringScheme scheme {1, -0.5, -0.1, -0.1};
    const auto alignment = coretools::global_align("ACGTTACG", "AGTCG", scheme);
    BOOST_CHECK_EQUAL(alignment.score, 4.699999999999999);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ACGTTACG");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "A-G-T-CG");
}

BOOST_AUTO_TEST_CASE(traceback_prefers_up_to_left_when_diagonal_fails)
{
    auto alignment = coretools::global_align("AC", "CA");
    BOOST_CHECK_EQUAL(alignment.score, 1);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "-AC");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "CA-");
    alignment = coretools::global_align("ACGTACG", "ACG");
    BOOST_CHECK_EQUAL(alignment.score, 3);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ACGTACG");
    BOOST_CHECK_EQUAL(alignment.aligned_query, "----ACG");
}

BOOST_AUTO_TEST_CASE(local_align_starts_from_the_first_maximum_in_row_major_order)
{
    const auto alignment = coretools::local_align("ACGTACG", "ACG");
    BOOST_CHECK_EQUAL(alignment.score, 3);
    BOOST_CHECK_EQUAL(alignment.aligned_reference, "ACG");
    BOOST_CHECK_EQUAL(alignment.reference_region, SequenceRegion(0, 3));
    BOOST_CHECK_EQUAL(alignment.query_region, SequenceRegion(0, 3));
}

BOOST_AUTO_TEST_CASE(local_score_never_exceeds_global_score_with_default_scoring)
{
    const std::vector<std::pair<std::string, std::string>> pairs {
        {"ATGC", "ATGC"}, {"ATGC", "GCAT"}, {"AAATGCAAA", "TGC"}, {"ACGTACGT", "TTTT"},
        {"GATTACA", "GCATGCT"}, {"A", "C"}
    };
    for (const auto& p : pairs) {
        const auto global = coretools::global_align(p.first, p.second);
        const auto local  = coretools::local_align(p.first, p.second);
        BOOST_CHECK_LE(0, local.score);
        BOOST_CHECK_LE(local.score, global.score);
        BOOST_CHECK_LE(global.score, std::min(p.first.size(), p.second.size()));
        BOOST_CHECK_EQUAL(global.aligned_reference.size(), global.aligned_query.size());
        BOOST_CHECK_EQUAL(local.aligned_reference.size(), local.aligned_query.size());
    }
}

BOOST_AUTO_TEST_CASE(alignments_are_deterministic)
{
    const std::string reference {"GATTACAGATTACA"}, query {"GCATGCTACA"};
    const ScoringScheme scheme {2, -1, -2, -1};
    BOOST_CHECK_EQUAL(coretools::global_align(reference, query, scheme), coretools::global_align(reference, query, scheme));
    BOOST_CHECK_EQUAL(coretools::local_align(reference, query, scheme), coretools::local_align(reference, query, scheme));
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
