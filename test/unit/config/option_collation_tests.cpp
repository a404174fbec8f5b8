// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>
#include <sstream>
#include <iostream>
#include <fstream>

#include <boost/filesystem/operations.hpp>

#include "config/option_parser.hpp"
#include "config/option_collation.hpp"
#include "exceptions/user_error.hpp"
#include "exceptions/missing_file_error.hpp"
#include "io/query/query_reader.hpp"

namespace polyscan { namespace test {

namespace {

options::OptionMap parse(std::vector<const char*> arguments)
{
    arguments.insert(arguments.begin(), "polyscan");
    return options::parse_options(static_cast<int>(arguments.size()), arguments.data());
}

} // namespace

BOOST_AUTO_TEST_SUITE(config)
BOOST_AUTO_TEST_SUITE(option_collation)

BOOST_AUTO_TEST_CASE(default_options_give_the_default_comparison)
{
    const auto options = parse({"--reference", "reference.fa", "--query", "ACGT"});
    BOOST_CHECK(options::is_run_command(options));
    BOOST_CHECK(!options::is_debug_mode(options));
    BOOST_CHECK_EQUAL(options::make_scoring_scheme(options), ScoringScheme {});
    BOOST_CHECK_EQUAL(options::get_threshold(options), 90);
    BOOST_CHECK(options::get_junk_policy(options) == coretools::AutoJunkPolicy::none);
    BOOST_CHECK(!options::get_output_path(options));
    BOOST_CHECK_EQUAL(options::get_line_width(options), 0);
}

BOOST_AUTO_TEST_CASE(gap_extend_score_defaults_to_gap_open_score)
{
    auto options = parse({"-R", "reference.fa", "-q", "ACGT", "--gap-open-score=-2", "--mismatch-score=-1"});
    auto scheme = options::make_scoring_scheme(options);
    BOOST_CHECK_EQUAL(scheme.gap_open_score, -2);
    BOOST_CHECK_EQUAL(scheme.gap_extend_score, -2);
    BOOST_CHECK_EQUAL(scheme.mismatch_score, -1);
    BOOST_CHECK(is_linear(scheme));
    options = parse({"-R", "reference.fa", "-q", "ACGT", "--gap-open-score=-5", "--gap-extend-score=-1"});
    scheme = options::make_scoring_scheme(options);
    BOOST_CHECK_EQUAL(scheme.gap_extend_score, -1);
    BOOST_CHECK(!is_linear(scheme));
}

BOOST_AUTO_TEST_CASE(classification_options_are_collated)
{
    const auto options = parse({"-R", "reference.fa", "-q", "ACGT", "--threshold", "75.5", "--autojunk", "--line-width", "60"});
    const auto comparison_options = options::make_comparison_options(options);
    BOOST_CHECK_EQUAL(comparison_options.threshold, 75.5);
    BOOST_CHECK(comparison_options.junk_policy == coretools::AutoJunkPolicy::popular_symbols);
    BOOST_CHECK_EQUAL(options::get_line_width(options), 60);
}

BOOST_AUTO_TEST_CASE(inline_queries_are_normalised)
{
    const auto options = parse({"-R", "reference.fa", "-q", " acgt "});
    BOOST_CHECK_EQUAL(options::get_query(options), "ACGT");
}

BOOST_AUTO_TEST_CASE(missing_queries_are_read_from_the_input_stream)
{
    const auto options = parse({"-R", "reference.fa"});
    std::istringstream in {"ttgca\n"};
    std::ostringstream prompt {};
    BOOST_CHECK_EQUAL(options::get_query(options, in, prompt), "TTGCA");
    BOOST_CHECK_EQUAL(prompt.str(), io::QueryPrompt);
}

BOOST_AUTO_TEST_CASE(invalid_command_lines_are_user_errors)
{
    BOOST_CHECK_THROW(parse({"-q", "ACGT"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "-q", "ACGT", "-Q", "query.fa"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "--threshold", "101"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "--threshold=-1"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "--line-width=-1"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "--no-such-option"}), UserError);
    BOOST_CHECK_THROW(parse({"-R", "reference.fa", "--match-score", "high"}), UserError);
}

BOOST_AUTO_TEST_CASE(command_line_values_take_precedence_over_the_config_file)
{
    namespace fs = boost::filesystem;
    const auto config_path = fs::temp_directory_path() / fs::unique_path("polyscan-%%%%-%%%%.config");
    {
        std::ofstream config {config_path.string()};
        config << "threshold = 50\nline-width = 80\n";
    }
    const auto options = parse({"-R", "reference.fa", "-q", "ACGT", "--config", config_path.c_str(), "--threshold", "75"});
    fs::remove(config_path);
    BOOST_CHECK_EQUAL(options::get_threshold(options), 75);
    BOOST_CHECK_EQUAL(options::get_line_width(options), 80);
}

BOOST_AUTO_TEST_CASE(missing_reference_errors_name_the_option_that_gave_the_file)
{
    namespace fs = boost::filesystem;
    const auto reference_path = fs::temp_directory_path() / fs::unique_path("polyscan-%%%%-%%%%.fa");
    const auto options = parse({"-R", reference_path.c_str(), "-q", "ACGT"});
    try {
        options::load_reference(options);
        BOOST_FAIL("expected MissingFileError");
    } catch (const MissingFileError& e) {
        BOOST_CHECK(e.file() == reference_path);
        BOOST_CHECK(e.why().find("--reference") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(help_is_not_a_run_command)
{
    std::streambuf* const cout_buffer {std::cout.rdbuf()};
    std::ostringstream discard {};
    std::cout.rdbuf(discard.rdbuf());
    const auto options = parse({"--help"});
    std::cout.rdbuf(cout_buffer);
    BOOST_CHECK(!options::is_run_command(options));
    BOOST_CHECK(discard.str().find("--reference") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
