// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "manta_support.hpp"

#include <algorithm>
#include <iterator>

#include <boost/algorithm/string/trim.hpp>

#include "utils/string_utils.hpp"
#include "io/variant/vcf_spec.hpp"

namespace varcanon {

namespace {

static const std::string mantaSource {"GenerateSVCandidates"};

bool is_manta_source(const std::string& source)
{
    return utils::is_prefix(mantaSource, source);
}

} // namespace

SvCaller MantaSupport::do_caller() const noexcept
{
    return SvCaller::manta;
}

bool MantaSupport::do_is_compatible(const VcfHeader& header) const
{
    const auto sources = header.get_all(vcfspec::header::source);
    return std::any_of(std::cbegin(sources), std::cend(sources), is_manta_source);
}

std::string MantaSupport::do_version(const VcfReader& reader) const
{
    const auto sources = reader.fetch_header().get_all(vcfspec::header::source);
    const auto itr = std::find_if(std::cbegin(sources), std::cend(sources), is_manta_source);
    if (itr == std::cend(sources)) return "";
    return boost::algorithm::trim_copy(itr->substr(mantaSource.size()));
}

void MantaSupport::do_build_sample_genotype(const VcfRecord& record, const unsigned,
                                            const SampleName& sample, SampleGenotype::Builder& result) const
{
    result.set_genotype_quality(get_double(record, sample, "GQ"));
    const auto pr_ref = get_int(record, sample, "PR", 0), pr_alt = get_int(record, sample, "PR", 1);
    if (pr_ref && pr_alt) result.set_paired_end_coverage(*pr_ref + *pr_alt);
    result.set_paired_end_variant_support(pr_alt);
    const auto sr_ref = get_int(record, sample, "SR", 0), sr_alt = get_int(record, sample, "SR", 1);
    if (sr_ref && sr_alt) result.set_split_read_coverage(*sr_ref + *sr_alt);
    result.set_split_read_variant_support(sr_alt);
}

} // namespace varcanon
