// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>

#include "config/common.hpp"
#include "core/comparison.hpp"
#include "exceptions/invalid_sequence_error.hpp"
#include "exceptions/user_error.hpp"

namespace polyscan { namespace test {

namespace {

struct VerboseLogging
{
    VerboseLogging() { DEBUG_MODE = true; TRACE_MODE = true; }
    ~VerboseLogging() { DEBUG_MODE = false; TRACE_MODE = false; }
};

} // namespace

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(comparison)

BOOST_AUTO_TEST_CASE(identical_sequences_match_the_reference)
{
    const NucleotideSequence sequence {"ATGCGTACGTTAGC"};
    const auto result = compare(sequence, sequence);
    BOOST_CHECK_EQUAL(result.similarity, 100);
    BOOST_CHECK(!result.is_divergent);
    BOOST_CHECK_EQUAL(result.global_alignment.score, 14);
    BOOST_CHECK_EQUAL(result.local_alignment.score, 14);
    BOOST_CHECK_EQUAL(result.global_alignment.aligned_query, sequence);
}

BOOST_AUTO_TEST_CASE(dissimilar_sequences_are_divergent)
{
    const auto result = compare("AAAAAAAAAA", "CCCCCCCCCC");
    BOOST_CHECK_EQUAL(result.similarity, 0);
    BOOST_CHECK(result.is_divergent);
    BOOST_CHECK_EQUAL(result.global_alignment.score, 0);
    BOOST_CHECK_EQUAL(result.local_alignment.score, 0);
}

BOOST_AUTO_TEST_CASE(compare_uses_the_given_threshold)
{
    ComparisonOptions options {};
    options.threshold = 70;
    const auto result = compare("ATGC", "ATGG", options);
    BOOST_CHECK_CLOSE(result.similarity, 75.0, 1e-9);
    BOOST_CHECK(!result.is_divergent);
    options.threshold = 80;
    BOOST_CHECK(compare("ATGC", "ATGG", options).is_divergent);
}

BOOST_AUTO_TEST_CASE(compare_uses_the_given_scoring_scheme)
{
    ComparisonOptions options {};
    options.scoring = ScoringScheme {1, -1, -1, -1};
    const auto result = compare("ACGT", "AGT", options);
    BOOST_CHECK_EQUAL(result.global_alignment.score, 2);
    BOOST_CHECK_EQUAL(result.global_alignment.aligned_query, "A-GT");
}

BOOST_AUTO_TEST_CASE(compare_accepts_empty_sequences)
{
    BOOST_CHECK_NO_THROW(compare("", ""));
    const auto result = compare("ACGT", "");
    BOOST_CHECK_EQUAL(result.similarity, 0);
    BOOST_CHECK(result.is_divergent);
    BOOST_CHECK_EQUAL(result.global_alignment.aligned_query, "----");
    BOOST_CHECK(is_empty(result.local_alignment));
}

BOOST_AUTO_TEST_CASE(compare_rejects_non_dna_queries)
{
    BOOST_CHECK_THROW(compare("ACGT", "ACGU"), InvalidQuerySequence);
    BOOST_CHECK_THROW(compare("ACGT", "acgt"), UserError);
    try {
        compare("ACGT", "ACNT");
        BOOST_FAIL("expected InvalidQuerySequence");
    } catch (const InvalidQuerySequence& e) {
        BOOST_CHECK_EQUAL(e.symbol(), 'N');
        BOOST_CHECK_EQUAL(e.position(), 2);
        BOOST_CHECK_EQUAL(e.sequence_name(), "query");
        BOOST_CHECK_EQUAL(e.type(), "user");
    }
}

BOOST_AUTO_TEST_CASE(compare_rejects_non_dna_references)
{
    BOOST_CHECK_THROW(compare("ACGR", "ACGT"), InvalidReferenceSequence);
}

BOOST_FIXTURE_TEST_CASE(verbose_logging_does_not_change_the_result, VerboseLogging)
{
    BOOST_REQUIRE(logging::get_debug_log());
    BOOST_REQUIRE(logging::get_trace_log());
    const auto result = compare("ACGTTACG", "AGTCG");
    BOOST_CHECK_CLOSE(result.similarity, 200.0 * 3 / 13, 1e-9);
    BOOST_CHECK_EQUAL(result.global_alignment.aligned_query, "A-G-T-CG");
    BOOST_CHECK_EQUAL(count_identities(result.global_alignment), 5);
    BOOST_CHECK_EQUAL(count_gaps(result.global_alignment), 3);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
