// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>
#include <stdexcept>

#include "test_common.hpp"
#include "mock/mock_coverage_source.hpp"
#include "io/variant/vcf_reader.hpp"
#include "io/variant/vcf_record.hpp"
#include "io/coverage/maelstrom_coverage_reader.hpp"
#include "core/callers/sv/caller_support.hpp"
#include "core/callers/sv/dragen_cnv_support.hpp"
#include "core/callers/sv/dragen_sv_support.hpp"
#include "core/callers/sv/delly2_support.hpp"
#include "core/callers/sv/manta_support.hpp"
#include "core/callers/sv/gatk_gcnv_support.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(callers)
BOOST_AUTO_TEST_SUITE(caller_support)

namespace {

VcfRecord first_record(const fs::path& vcf)
{
    const auto records = VcfReader {vcf}.fetch_records();
    BOOST_REQUIRE(!records.empty());
    return records.front();
}

bool is_compatible(const CallerSupport& support, const fs::path& vcf)
{
    return support.is_compatible(VcfReader {vcf}.fetch_header());
}

} // namespace

BOOST_AUTO_TEST_CASE(dragen_cnv_headers_are_recognised)
{
    const DragenCnvSupport support {};
    BOOST_CHECK_EQUAL(support.caller(), SvCaller::dragen_cnv);
    BOOST_CHECK(is_compatible(support, dragen_cnv_vcf));
    BOOST_CHECK(!is_compatible(support, delly2_vcf));
    BOOST_CHECK_EQUAL(support.version(VcfReader {dragen_cnv_vcf}), "SW: 07.021.624.3.10.4, HW: 07.021.624");
}

BOOST_AUTO_TEST_CASE(dragen_cnv_genotypes_use_the_segment_mean_without_a_coverage_source)
{
    const DragenCnvSupport support {};
    const auto genotype = support.build_sample_genotype(first_record(dragen_cnv_vcf), 1, "SAMPLE");
    BOOST_CHECK_EQUAL(to_string(genotype),
                      "SampleGenotype{sampleName='SAMPLE', genotype='0/1', filters=[], genotypeQuality=null, "
                      "pairedEndCoverage=null, pairedEndVariantSupport=2, splitReadCoverage=null, "
                      "splitReadVariantSupport=null, averageMappingQuality=null, copyNumber=null, "
                      "averageNormalizedCoverage=0.321909, pointCount=1}");
}

BOOST_AUTO_TEST_CASE(dragen_cnv_genotypes_take_mapping_quality_from_the_coverage_source)
{
    auto coverage = std::make_shared<mock::MockCoverageSource>(CoverageSummary {boost::none, 40.0});
    const DragenCnvSupport support {CoverageSourceMap {{"SAMPLE", coverage}}};
    const auto genotype = support.build_sample_genotype(first_record(dragen_cnv_vcf), 1, "SAMPLE");
    BOOST_CHECK_EQUAL(to_string(genotype),
                      "SampleGenotype{sampleName='SAMPLE', genotype='0/1', filters=[], genotypeQuality=null, "
                      "pairedEndCoverage=null, pairedEndVariantSupport=2, splitReadCoverage=null, "
                      "splitReadVariantSupport=null, averageMappingQuality=40, copyNumber=null, "
                      "averageNormalizedCoverage=0.321909, pointCount=1}");
    BOOST_REQUIRE_EQUAL(coverage->requests().size(), 1);
    BOOST_CHECK_EQUAL(coverage->requests().front(), (GenomicRegion {"chr1", 9, 30}));
}

BOOST_AUTO_TEST_CASE(dragen_cnv_coverage_source_values_are_preferred_over_the_segment_mean)
{
    const DragenCnvSupport support {CoverageSourceMap {{"SAMPLE", std::make_shared<MaelstromCoverageReader>(coverage_vcf)}}};
    const auto genotype = support.build_sample_genotype(first_record(dragen_cnv_vcf), 1, "SAMPLE");
    BOOST_REQUIRE(genotype.average_normalized_coverage());
    BOOST_CHECK_CLOSE(*genotype.average_normalized_coverage(), 1.0, 1e-6);
    BOOST_REQUIRE(genotype.average_mapping_quality());
    BOOST_CHECK_CLOSE(*genotype.average_mapping_quality(), 40.0, 1e-6);
}

BOOST_AUTO_TEST_CASE(dragen_cnv_coverage_sources_of_other_samples_are_ignored)
{
    auto coverage = std::make_shared<mock::MockCoverageSource>(CoverageSummary {2.0, 60.0});
    const DragenCnvSupport support {CoverageSourceMap {{"OTHER", coverage}}};
    const auto genotype = support.build_sample_genotype(first_record(dragen_cnv_vcf), 1, "SAMPLE");
    BOOST_CHECK(!genotype.average_mapping_quality());
    BOOST_CHECK(coverage->requests().empty());
}

BOOST_AUTO_TEST_CASE(missing_alleles_are_kept_in_genotype_strings)
{
    const DragenCnvSupport support {};
    const auto records = VcfReader {dragen_cnv_vcf}.fetch_records();
    BOOST_REQUIRE_EQUAL(records.size(), 2);
    const auto genotype = support.build_sample_genotype(records.back(), 1, "SAMPLE");
    BOOST_CHECK_EQUAL(genotype.genotype(), "./1");
    BOOST_CHECK_EQUAL(*genotype.paired_end_variant_support(), 2);
    BOOST_CHECK_EQUAL(*genotype.point_count(), 4);
}

BOOST_AUTO_TEST_CASE(dragen_sv_read_pairs_are_ref_alt_pairs)
{
    const DragenSvSupport support {};
    BOOST_CHECK(is_compatible(support, dragen_sv_vcf));
    BOOST_CHECK(!is_compatible(support, dragen_cnv_vcf));
    BOOST_CHECK_EQUAL(support.version(VcfReader {dragen_sv_vcf}), "SW: 07.021.624.3.10.4, HW: 07.021.624");
    const auto genotype = support.build_sample_genotype(first_record(dragen_sv_vcf), 1, "SAMPLE");
    BOOST_CHECK_EQUAL(to_string(genotype),
                      "SampleGenotype{sampleName='SAMPLE', genotype='0/1', filters=[PASS], genotypeQuality=45, "
                      "pairedEndCoverage=13, pairedEndVariantSupport=3, splitReadCoverage=12, "
                      "splitReadVariantSupport=4, averageMappingQuality=null, copyNumber=null, "
                      "averageNormalizedCoverage=null, pointCount=null}");
}

BOOST_AUTO_TEST_CASE(manta_versions_come_from_the_source_line)
{
    const MantaSupport support {};
    BOOST_CHECK(is_compatible(support, manta_vcf));
    BOOST_CHECK(!is_compatible(support, dragen_sv_vcf));
    BOOST_CHECK_EQUAL(support.version(VcfReader {manta_vcf}), "1.6.0");
}

BOOST_AUTO_TEST_CASE(manta_genotypes_split_sample_filters)
{
    const MantaSupport support {};
    const auto record = first_record(manta_vcf);
    const auto father = support.build_sample_genotype(record, 1, "FATHER");
    BOOST_CHECK_EQUAL(father.genotype(), "1/1");
    BOOST_REQUIRE_EQUAL(father.filters().size(), 2);
    BOOST_CHECK_EQUAL(father.filters()[0], "MinGQ");
    BOOST_CHECK_EQUAL(father.filters()[1], "Ploidy");
    BOOST_CHECK_EQUAL(*father.genotype_quality(), 12);
    BOOST_CHECK_EQUAL(*father.paired_end_coverage(), 7);
    BOOST_CHECK_EQUAL(*father.paired_end_variant_support(), 7);
    BOOST_CHECK_EQUAL(*father.split_read_coverage(), 10);
    BOOST_CHECK_EQUAL(*father.split_read_variant_support(), 9);
    const auto mother = support.build_sample_genotype(record, 1, "MOTHER");
    BOOST_CHECK_EQUAL(mother.genotype(), "0/0");
    BOOST_CHECK_EQUAL(*mother.paired_end_variant_support(), 0);
    BOOST_CHECK_THROW(support.build_sample_genotype(record, 1, "CHILD"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(delly2_versions_come_from_the_first_record)
{
    const Delly2Support support {};
    BOOST_CHECK(is_compatible(support, delly2_vcf));
    BOOST_CHECK(!is_compatible(support, manta_vcf));
    BOOST_CHECK_EQUAL(support.version(VcfReader {delly2_vcf}), "EMBL.DELLYv0.8.1");
    const auto genotype = support.build_sample_genotype(first_record(delly2_vcf), 1, "SAMPLE");
    BOOST_CHECK_EQUAL(to_string(genotype),
                      "SampleGenotype{sampleName='SAMPLE', genotype='0/1', filters=[PASS], genotypeQuality=33, "
                      "pairedEndCoverage=17, pairedEndVariantSupport=5, splitReadCoverage=26, "
                      "splitReadVariantSupport=6, averageMappingQuality=null, copyNumber=1, "
                      "averageNormalizedCoverage=null, pointCount=null}");
}

BOOST_AUTO_TEST_CASE(gatk_gcnv_genotypes_depend_on_the_alt_index)
{
    const GatkGcnvSupport support {};
    BOOST_CHECK(is_compatible(support, gatk_gcnv_vcf));
    BOOST_CHECK(!is_compatible(support, dragen_cnv_vcf));
    BOOST_CHECK_EQUAL(support.version(VcfReader {gatk_gcnv_vcf}), "4.1.4.1");
    const auto record = first_record(gatk_gcnv_vcf);
    const auto del = support.build_sample_genotype(record, 1, "SAMPLE");
    const auto dup = support.build_sample_genotype(record, 2, "SAMPLE");
    BOOST_CHECK_EQUAL(del.genotype(), "1");
    BOOST_CHECK_EQUAL(dup.genotype(), "0");
    BOOST_CHECK_EQUAL(*del.copy_number(), 1);
    BOOST_CHECK_EQUAL(*del.point_count(), 5);
    BOOST_CHECK_EQUAL(*del.genotype_quality(), 60);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
