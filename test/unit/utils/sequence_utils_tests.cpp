// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>

#include "utils/sequence_utils.hpp"

namespace polyscan { namespace test {

using polyscan::utils::find_non_canonical_base;
using polyscan::utils::capitalise;
using polyscan::utils::count_bases;
using polyscan::utils::gc_content;

BOOST_AUTO_TEST_SUITE(utils)
BOOST_AUTO_TEST_SUITE(sequence_utils)

BOOST_AUTO_TEST_CASE(find_non_canonical_base_reports_the_first_offending_offset)
{
    BOOST_CHECK(!find_non_canonical_base(std::string {}));
    BOOST_CHECK(!find_non_canonical_base(std::string {"GATTACA"}));
    BOOST_CHECK_EQUAL(*find_non_canonical_base(std::string {"acgt"}), 0);
    BOOST_CHECK_EQUAL(*find_non_canonical_base(std::string {"ACG T"}), 3);
    const auto offset = find_non_canonical_base(std::string {"GATXACN"});
    BOOST_REQUIRE(offset);
    BOOST_CHECK_EQUAL(*offset, 3);
    BOOST_CHECK_EQUAL(*find_non_canonical_base(std::string {"U"}), 0);
}

BOOST_AUTO_TEST_CASE(capitalise_only_changes_nucleotide_symbols)
{
    std::string sequence {"acgtn"};
    capitalise(sequence);
    BOOST_CHECK_EQUAL(sequence, "ACGTN");
    std::string other {"aCgTxyz"};
    capitalise(other);
    BOOST_CHECK_EQUAL(other, "ACGTxyz");
}

BOOST_AUTO_TEST_CASE(gc_content_is_the_fraction_of_g_and_c)
{
    BOOST_CHECK_EQUAL(count_bases(std::string {"GGCA"}, 'G'), 2);
    BOOST_CHECK_EQUAL(gc_content(std::string {}), 0.0);
    BOOST_CHECK_EQUAL(gc_content(std::string {"ATAT"}), 0.0);
    BOOST_CHECK_EQUAL(gc_content(std::string {"GCGC"}), 1.0);
    BOOST_CHECK_CLOSE(gc_content(std::string {"ACGTAA"}), 1.0 / 3, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
