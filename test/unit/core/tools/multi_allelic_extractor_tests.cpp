// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include "mock/mock_reference.hpp"
#include "mock/captured_log.hpp"
#include "io/variant/vcf_record.hpp"
#include "core/tools/variant_normaliser.hpp"
#include "core/tools/multi_allelic_extractor.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(tools)
BOOST_AUTO_TEST_SUITE(multi_allelic_extractor)

namespace {

VcfRecord make_record(GenomicRegion::Position pos, std::string ref, std::vector<std::string> alts)
{
    VcfRecord::Builder builder {};
    builder.set_chrom("chr1").set_pos(pos).set_ref(std::move(ref)).set_alt(std::move(alts));
    return builder.build_once();
}

} // namespace

BOOST_AUTO_TEST_CASE(each_alt_allele_is_normalised_separately)
{
    const auto reference = mock::make_mock_reference();
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    const auto alleles = extractor.extract(make_record(5, "T", {"TT", "TTT", "A"}));
    BOOST_REQUIRE_EQUAL(alleles.size(), 3);
    BOOST_CHECK_EQUAL(alleles[0].alt_index, 1);
    BOOST_CHECK_EQUAL(alleles[0].variant, (VariantKey {"chr1", 2, "G", "GT"}));
    BOOST_CHECK_EQUAL(alleles[1].alt_index, 2);
    BOOST_CHECK_EQUAL(alleles[1].variant, (VariantKey {"chr1", 2, "G", "GTT"}));
    BOOST_CHECK_EQUAL(alleles[2].alt_index, 3);
    BOOST_CHECK_EQUAL(alleles[2].variant, (VariantKey {"chr1", 4, "T", "A"}));
}

BOOST_AUTO_TEST_CASE(symbolic_alleles_are_skipped_but_keep_the_indices_of_others)
{
    const auto reference = mock::make_mock_reference();
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 500};
    const auto alleles = extractor.extract(make_record(7, "G", {"<DEL>", "*", "C"}));
    BOOST_REQUIRE_EQUAL(alleles.size(), 1);
    BOOST_CHECK_EQUAL(alleles.front().alt_index, 3);
    BOOST_CHECK_EQUAL(alleles.front().variant, (VariantKey {"chr1", 6, "G", "C"}));
    BOOST_CHECK(is_symbolic_allele("<DUP:TANDEM>"));
    BOOST_CHECK(is_symbolic_allele("G]chr2:10]"));
    BOOST_CHECK(is_symbolic_allele("."));
    BOOST_CHECK(!is_symbolic_allele("ACGT"));
}

BOOST_AUTO_TEST_CASE(alleles_longer_than_the_maximum_are_skipped_after_normalisation)
{
    const auto reference = mock::make_mock_reference();
    const VariantNormaliser normaliser {reference};
    const MultiAllelicExtractor extractor {normaliser, 2};
    BOOST_CHECK_EQUAL(extractor.max_allele_length(), 2);
    const auto alleles = extractor.extract(make_record(5, "T", {"TT", "TTT"}));
    BOOST_REQUIRE_EQUAL(alleles.size(), 1);
    BOOST_CHECK_EQUAL(alleles.front().alt_index, 1);
    BOOST_CHECK(!extractor.extract(VariantKey {"chr1", 6, "GCA", "G"}));
    BOOST_CHECK(extractor.extract(VariantKey {"chr1", 6, "GC", "G"}));
}

BOOST_AUTO_TEST_CASE(biallelic_stats_are_read_as_scalars)
{
    VcfRecord::Builder builder {};
    builder.set_chrom("chr1").set_pos(5).set_ref("T").set_alt("A").set_info("AC", "5");
    const auto record = builder.build_once();
    BOOST_CHECK_EQUAL(*find_per_allele_stat(record, "AC", 1), 5);
    BOOST_CHECK(!find_per_allele_stat(record, "AC", 2));
    BOOST_CHECK(!find_per_allele_stat(record, "AN", 1));
    BOOST_CHECK_EQUAL(resolve_per_allele_stat(record, "AN", 1), 0);
}

BOOST_AUTO_TEST_CASE(multiallelic_stats_are_indexed_by_allele)
{
    VcfRecord::Builder builder {};
    builder.set_chrom("chr1").set_pos(5).set_ref("T").set_alt(std::vector<std::string> {"A", "C", "G"})
           .set_info("AC", std::vector<std::string> {"1", ".", "3"})
           .set_info("Het", std::vector<std::string> {"4"});
    const auto record = builder.build_once();
    BOOST_CHECK_EQUAL(*find_per_allele_stat(record, "AC", 1), 1);
    BOOST_CHECK(!find_per_allele_stat(record, "AC", 2));
    BOOST_CHECK_EQUAL(*find_per_allele_stat(record, "AC", 3), 3);
    BOOST_CHECK_EQUAL(resolve_per_allele_stat(record, "AC", 2), 0);
    BOOST_CHECK_EQUAL(resolve_per_allele_stat(record, "Het", 1), 4);
}

BOOST_AUTO_TEST_CASE(short_multiallelic_stats_resolve_to_zero_with_a_warning)
{
    VcfRecord::Builder builder {};
    builder.set_chrom("chr1").set_pos(5).set_ref("T").set_alt(std::vector<std::string> {"A", "C", "G"})
           .set_info("Het", std::vector<std::string> {"4"});
    const auto record = builder.build_once();
    const mock::CapturedLog log {};
    double resolved {-1};
    BOOST_CHECK_NO_THROW(resolved = resolve_per_allele_stat(record, "Het", 3));
    BOOST_CHECK_EQUAL(resolved, 0);
    BOOST_CHECK(log.contains("INFO/Het has 1 values but allele 3 was requested at chr1:5"));
    BOOST_CHECK(log.contains("<WARN>"));
}

BOOST_AUTO_TEST_CASE(non_numeric_stats_are_ignored)
{
    VcfRecord::Builder builder {};
    builder.set_chrom("chr1").set_pos(5).set_ref("T").set_alt("A").set_info("AC", "many");
    const auto record = builder.build_once();
    BOOST_CHECK(!find_per_allele_stat(record, "AC", 1));
    BOOST_CHECK_EQUAL(resolve_per_allele_stat(record, "AC", 1), 0);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
