// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>

#include "test_common.hpp"
#include "io/variant/vcf_reader.hpp"
#include "io/variant/vcf_header.hpp"
#include "core/callers/sv/sv_caller_registry.hpp"

namespace varcanon { namespace test {

BOOST_AUTO_TEST_SUITE(core)
BOOST_AUTO_TEST_SUITE(callers)
BOOST_AUTO_TEST_SUITE(sv_caller_registry)

namespace {

// Recognises any header with the given ##source
class FakeSupport : public CallerSupport
{
public:
    FakeSupport(SvCaller caller, std::string source) : caller_ {caller}, source_ {std::move(source)} {}
private:
    SvCaller caller_;
    std::string source_;
    
    SvCaller do_caller() const noexcept override { return caller_; }
    bool do_is_compatible(const VcfHeader& header) const override { return has_source(header, source_); }
    std::string do_version(const VcfReader&) const override { return "fake"; }
    void do_build_sample_genotype(const VcfRecord&, unsigned, const SampleName&, SampleGenotype::Builder&) const override {}
};

SvCaller detect(const SvCallerRegistry& registry, const fs::path& vcf)
{
    return registry.detect(VcfReader {vcf}.fetch_header(), vcf).caller();
}

} // namespace

BOOST_AUTO_TEST_CASE(the_default_registry_holds_every_caller_once)
{
    const auto registry = make_sv_caller_registry();
    BOOST_CHECK_EQUAL(registry.size(), 5);
    const auto callers = registry.callers();
    const auto all = all_sv_callers();
    BOOST_CHECK(callers == all);
    BOOST_CHECK_EQUAL(registry.get(SvCaller::manta).caller(), SvCaller::manta);
}

BOOST_AUTO_TEST_CASE(each_caller_is_detected_from_its_header)
{
    const auto registry = make_sv_caller_registry();
    BOOST_CHECK_EQUAL(detect(registry, dragen_cnv_vcf), SvCaller::dragen_cnv);
    BOOST_CHECK_EQUAL(detect(registry, dragen_sv_vcf), SvCaller::dragen_sv);
    BOOST_CHECK_EQUAL(detect(registry, delly2_vcf), SvCaller::delly2);
    BOOST_CHECK_EQUAL(detect(registry, manta_vcf), SvCaller::manta);
    BOOST_CHECK_EQUAL(detect(registry, gatk_gcnv_vcf), SvCaller::gatk_gcnv);
}

BOOST_AUTO_TEST_CASE(headers_no_caller_recognises_are_rejected)
{
    const auto registry = make_sv_caller_registry();
    BOOST_CHECK_THROW(detect(registry, unknown_caller_vcf), UnsupportedCaller);
    BOOST_CHECK_THROW(detect(registry, exac_vcf), UnsupportedCaller);
}

BOOST_AUTO_TEST_CASE(headers_several_callers_recognise_are_rejected)
{
    const auto registry = make_sv_caller_registry();
    const auto vcf = resource("ambiguous_caller.vcf");
    const auto header = VcfReader {vcf}.fetch_header();
    BOOST_CHECK_EQUAL(registry.find_compatible(header).size(), 2);
    try {
        registry.detect(header, vcf);
        BOOST_FAIL("expected AmbiguousCaller");
    } catch (const AmbiguousCaller& e) {
        const std::vector<SvCaller> expected {SvCaller::dragen_cnv, SvCaller::dragen_sv};
        BOOST_CHECK(e.matches() == expected);
    }
}

BOOST_AUTO_TEST_CASE(ambiguity_holds_even_when_one_support_is_registered_first)
{
    SvCallerRegistry registry {};
    registry.add(std::make_unique<FakeSupport>(SvCaller::manta, "DRAGEN_CNV"));
    registry.add(std::make_unique<FakeSupport>(SvCaller::delly2, "DRAGEN_CNV"));
    BOOST_CHECK_THROW(detect(registry, dragen_cnv_vcf), AmbiguousCaller);
    SvCallerRegistry single {};
    single.add(std::make_unique<FakeSupport>(SvCaller::manta, "DRAGEN_CNV"));
    BOOST_CHECK_EQUAL(detect(single, dragen_cnv_vcf), SvCaller::manta);
    BOOST_CHECK_THROW(detect(single, dragen_sv_vcf), UnsupportedCaller);
}

BOOST_AUTO_TEST_CASE(callers_cannot_be_registered_twice)
{
    SvCallerRegistry registry {};
    registry.add(std::make_unique<FakeSupport>(SvCaller::manta, "A"));
    BOOST_CHECK_THROW(registry.add(std::make_unique<FakeSupport>(SvCaller::manta, "B")), std::invalid_argument);
    BOOST_CHECK_THROW(registry.add(nullptr), std::invalid_argument);
    BOOST_CHECK_THROW(registry.get(SvCaller::delly2), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(empty_registries_support_nothing)
{
    const SvCallerRegistry registry {};
    BOOST_CHECK_THROW(detect(registry, dragen_cnv_vcf), UnsupportedCaller);
}

BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()

} // namespace test
} // namespace varcanon
