// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <chrono>
#include <sstream>
#include <string>

#include "utils/timing.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(utils)
BOOST_AUTO_TEST_SUITE(timing)

namespace {

template <typename Duration>
std::string print_elapsed(const Duration elapsed)
{
    const auto start = std::chrono::system_clock::now();
    std::ostringstream ss {};
    ss << varcanon::utils::TimeInterval {start, start + elapsed};
    return ss.str();
}

} // namespace

BOOST_AUTO_TEST_CASE(intervals_print_their_two_largest_units)
{
    using namespace std::chrono;
    BOOST_CHECK_EQUAL(print_elapsed(milliseconds {950}), "950ms");
    BOOST_CHECK_EQUAL(print_elapsed(seconds {42}), "42s");
    BOOST_CHECK_EQUAL(print_elapsed(seconds {192}), "3m 12s");
    BOOST_CHECK_EQUAL(print_elapsed(minutes {3}), "3m");
    BOOST_CHECK_EQUAL(print_elapsed(minutes {125}), "2h 5m");
    BOOST_CHECK_EQUAL(print_elapsed(hours {1}), "1h");
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
