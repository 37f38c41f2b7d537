// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <ostream>
#include <string>
#include <utility>

#include "concepts/comparable.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(concepts)
BOOST_AUTO_TEST_SUITE(comparable)

namespace {

struct SampleId : public Comparable<SampleId>
{
    explicit SampleId(std::string name) : name {std::move(name)} {}
    std::string name;
};

bool operator==(const SampleId& lhs, const SampleId& rhs) noexcept { return lhs.name == rhs.name; }

std::ostream& operator<<(std::ostream& os, const SampleId& id) { return os << id.name; }

struct Depth : public Comparable<Depth>
{
    explicit Depth(unsigned reads) : reads {reads} {}
    unsigned reads;
};

bool operator==(const Depth& lhs, const Depth& rhs) noexcept { return lhs.reads == rhs.reads; }
bool operator<(const Depth& lhs, const Depth& rhs) noexcept { return lhs.reads < rhs.reads; }

std::ostream& operator<<(std::ostream& os, const Depth& depth) { return os << depth.reads << 'x'; }

} // namespace

BOOST_AUTO_TEST_CASE(inequality_is_derived_from_equality)
{
    const SampleId father {"FATHER"}, mother {"MOTHER"};
    BOOST_CHECK_NE(father, mother);
    BOOST_CHECK(!(father != SampleId {"FATHER"}));
}

BOOST_AUTO_TEST_CASE(ordering_operators_are_derived_from_less_than)
{
    const Depth shallow {10}, deep {30}, also_deep {30};
    BOOST_CHECK_GT(deep, shallow);
    BOOST_CHECK_LE(shallow, deep);
    BOOST_CHECK_GE(deep, also_deep);
    BOOST_CHECK_LE(deep, also_deep);
    BOOST_CHECK(!(shallow >= deep));
    BOOST_CHECK(!(deep > also_deep));
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
