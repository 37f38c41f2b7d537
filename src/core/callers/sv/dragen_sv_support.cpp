// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "dragen_sv_support.hpp"

namespace varcanon {

SvCaller DragenSvSupport::do_caller() const noexcept
{
    return SvCaller::dragen_sv;
}

bool DragenSvSupport::do_is_compatible(const VcfHeader& header) const
{
    return has_source(header, "DRAGEN_SV");
}

std::string DragenSvSupport::do_version(const VcfReader& reader) const
{
    return find_structured_value(reader.fetch_header(), "DRAGENVersion", "Version").value_or("");
}

void DragenSvSupport::do_build_sample_genotype(const VcfRecord& record, const unsigned,
                                               const SampleName& sample, SampleGenotype::Builder& result) const
{
    result.set_genotype_quality(get_double(record, sample, "GQ"));
    // PR and SR are ref,alt pairs
    const auto pr_ref = get_int(record, sample, "PR", 0), pr_alt = get_int(record, sample, "PR", 1);
    if (pr_ref && pr_alt) result.set_paired_end_coverage(*pr_ref + *pr_alt);
    result.set_paired_end_variant_support(pr_alt);
    const auto sr_ref = get_int(record, sample, "SR", 0), sr_alt = get_int(record, sample, "SR", 1);
    if (sr_ref && sr_alt) result.set_split_read_coverage(*sr_ref + *sr_alt);
    result.set_split_read_variant_support(sr_alt);
}

} // namespace varcanon
