// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include "test_common.hpp"
#include "io/coverage/maelstrom_coverage_reader.hpp"
#include "exceptions/malformed_file_error.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(io)
BOOST_AUTO_TEST_SUITE(maelstrom_coverage_reader)

BOOST_AUTO_TEST_CASE(the_sample_is_taken_from_the_header)
{
    const MaelstromCoverageReader reader {coverage_vcf};
    BOOST_CHECK_EQUAL(reader.sample(), "SAMPLE");
}

BOOST_AUTO_TEST_CASE(summaries_average_the_overlapping_windows)
{
    const MaelstromCoverageReader reader {coverage_vcf};
    const auto summary = reader.fetch(GenomicRegion {"chr1", 9, 30});
    BOOST_REQUIRE(summary.average_normalized_coverage);
    BOOST_REQUIRE(summary.average_mapping_quality);
    BOOST_CHECK_CLOSE(*summary.average_normalized_coverage, 1.0, 1e-6);
    BOOST_CHECK_CLOSE(*summary.average_mapping_quality, 40.0, 1e-6);
    const auto single = reader.fetch(GenomicRegion {"chr2", 5, 6});
    BOOST_REQUIRE(single.average_mapping_quality);
    BOOST_CHECK_CLOSE(*single.average_mapping_quality, 60.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(regions_without_values_give_empty_summaries)
{
    const MaelstromCoverageReader reader {coverage_vcf};
    const auto missing = reader.fetch(GenomicRegion {"chr1", 22, 28});
    BOOST_CHECK(!missing.average_normalized_coverage);
    BOOST_CHECK(!missing.average_mapping_quality);
    const auto uncovered = reader.fetch(GenomicRegion {"chr1", 40, 50});
    BOOST_CHECK(!uncovered.average_normalized_coverage);
}

BOOST_AUTO_TEST_CASE(windows_are_loaded_once_and_shared_by_every_fetch)
{
    const MaelstromCoverageReader reader {coverage_vcf};
    BOOST_CHECK_EQUAL(reader.num_windows(), 4u);
    for (int i {0}; i < 3; ++i) {
        const auto first = reader.fetch(GenomicRegion {"chr1", 0, 5});
        BOOST_REQUIRE(first.average_normalized_coverage);
        BOOST_CHECK_CLOSE(*first.average_normalized_coverage, 0.5, 1e-6);
        const auto second = reader.fetch(GenomicRegion {"chr1", 12, 15});
        BOOST_REQUIRE(second.average_mapping_quality);
        BOOST_CHECK_CLOSE(*second.average_mapping_quality, 50.0, 1e-6);
        const auto spanning = reader.fetch(GenomicRegion {"chr1", 0, 54});
        BOOST_REQUIRE(spanning.average_normalized_coverage);
        BOOST_CHECK_CLOSE(*spanning.average_normalized_coverage, 1.0, 1e-6);
        BOOST_CHECK(!reader.fetch(GenomicRegion {"chr3", 0, 10}).average_normalized_coverage);
    }
}

BOOST_AUTO_TEST_CASE(coverage_files_must_have_exactly_one_sample)
{
    BOOST_CHECK_THROW(MaelstromCoverageReader {manta_vcf}, MalformedFileError);
    BOOST_CHECK_THROW(MaelstromCoverageReader {exac_vcf}, MalformedFileError);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
