// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "utils/string_utils.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(utils)
BOOST_AUTO_TEST_SUITE(string_utils)

BOOST_AUTO_TEST_CASE(split_keeps_inner_empty_fields)
{
    const std::vector<std::string> expected {"a", "", "c"};
    const auto fields = varcanon::utils::split("a\t\tc", '\t');
    BOOST_CHECK_EQUAL_COLLECTIONS(fields.cbegin(), fields.cend(), expected.cbegin(), expected.cend());
}

BOOST_AUTO_TEST_CASE(split_on_any_of_several_delimiters)
{
    const std::vector<std::string> expected {"0", "1", "1"};
    const auto fields = varcanon::utils::split("0/1|1", "/|");
    BOOST_CHECK_EQUAL_COLLECTIONS(fields.cbegin(), fields.cend(), expected.cbegin(), expected.cend());
}

BOOST_AUTO_TEST_CASE(join_inserts_the_delimiter_between_elements)
{
    BOOST_CHECK_EQUAL(varcanon::utils::join({"a", "b", "c"}, ','), "a,b,c");
    BOOST_CHECK_EQUAL(varcanon::utils::join({}, ","), "");
}

BOOST_AUTO_TEST_CASE(is_prefix_works)
{
    BOOST_CHECK(varcanon::utils::is_prefix("DRAGEN", "DRAGEN_CNV"));
    BOOST_CHECK(!varcanon::utils::is_prefix("DRAGEN_CNV", "DRAGEN"));
    BOOST_CHECK(varcanon::utils::is_prefix("", "anything"));
}

BOOST_AUTO_TEST_CASE(strip_removes_every_occurrence)
{
    std::string str {"1,000,000"};
    BOOST_CHECK_EQUAL(varcanon::utils::strip(str, ','), "1000000");
}

BOOST_AUTO_TEST_CASE(format_with_commas_groups_thousands)
{
    BOOST_CHECK_EQUAL(varcanon::utils::format_with_commas(1234567), "1,234,567");
    BOOST_CHECK_EQUAL(varcanon::utils::format_with_commas(12), "12");
}

BOOST_AUTO_TEST_CASE(capitalise_front_only_changes_the_first_character)
{
    BOOST_CHECK_EQUAL(varcanon::utils::capitalise_front(std::string {"exac"}), "Exac");
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
