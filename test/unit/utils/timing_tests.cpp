// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <sstream>
#include <string>

#include "utils/timing.hpp"

namespace polyscan { namespace test {

using polyscan::utils::TimeInterval;
using polyscan::utils::time_call;

namespace {

std::string format_elapsed(const std::chrono::milliseconds elapsed)
{
    TimeInterval interval {};
    interval.end = interval.start + elapsed;
    std::ostringstream ss {};
    ss << interval;
    return ss.str();
}

} // namespace

BOOST_AUTO_TEST_SUITE(utils)
BOOST_AUTO_TEST_SUITE(timing)

BOOST_AUTO_TEST_CASE(intervals_are_printed_in_the_largest_sensible_unit)
{
    using std::chrono::milliseconds;
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {0}), "0ms");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {250}), "250ms");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {4250}), "4.2s");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {60000}), "1m");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {187000}), "3m 7s");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {2 * 3600000 + 15 * 60000}), "2h 15m");
    BOOST_CHECK_EQUAL(format_elapsed(milliseconds {3 * 3600000}), "3h");
}

BOOST_AUTO_TEST_CASE(time_call_returns_the_result_and_records_the_interval)
{
    TimeInterval interval {};
    const auto result = time_call([] () { return 42; }, interval);
    BOOST_CHECK_EQUAL(result, 42);
    BOOST_CHECK(interval.start <= interval.end);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace polyscan
