// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>
#include <utility>

#include "logging/error_handler.hpp"
#include "exceptions/user_error.hpp"
#include "exceptions/program_error.hpp"

namespace polyscan { namespace test {

namespace {

class ShortQueryError : public UserError
{
    std::string do_where() const override { return "compare"; }
    std::string do_why() const override { return "the query sequence was too short to compare against the reference"; }
    std::string do_help() const override { return help_; }
    
    std::string help_;
    
public:
    ShortQueryError(std::string help) : help_ {std::move(help)} {}
};

class BrokenTraceback : public ProgramError
{
    std::string do_where() const override { return "global_align"; }
    std::string do_why() const override { return "traceback left the matrix!"; }
};

} // namespace

BOOST_AUTO_TEST_SUITE(logging)
BOOST_AUTO_TEST_SUITE(error_handler)

BOOST_AUTO_TEST_CASE(error_reports_have_a_heading_and_wrapped_paragraphs)
{
    const ShortQueryError error {"Provide a longer query"};
    const std::vector<std::string> expected {
        "A user error has occurred:",
        "",
        "    The query sequence was too",
        "    short to compare against",
        "    the reference.",
        "",
        "To resolve this error, provide",
        "a longer query."
    };
    const auto report = make_error_report(error, 30);
    BOOST_CHECK_EQUAL_COLLECTIONS(report.cbegin(), report.cend(), expected.cbegin(), expected.cend());
}

BOOST_AUTO_TEST_CASE(error_reports_skip_empty_help)
{
    const ShortQueryError error {""};
    const auto report = make_error_report(error, 200);
    BOOST_REQUIRE_EQUAL(report.size(), 3);
    BOOST_CHECK_EQUAL(report.back(), "    The query sequence was too short to compare against the reference.");
}

BOOST_AUTO_TEST_CASE(program_error_reports_ask_for_a_bug_report)
{
    const BrokenTraceback error {};
    const auto report = make_error_report(error, 1000);
    BOOST_REQUIRE_EQUAL(report.size(), 5);
    BOOST_CHECK_EQUAL(report[0], "A program error has occurred:");
    BOOST_CHECK_EQUAL(report[2], "    Traceback left the matrix!");
    BOOST_CHECK(report[4].find("To resolve this error, rerun with --debug") == 0);
    BOOST_CHECK_EQUAL(report[4].back(), '.');
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
