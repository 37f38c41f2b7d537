// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "dragen_cnv_support.hpp"

#include <utility>

namespace varcanon {

DragenCnvSupport::DragenCnvSupport(CoverageSourceMap coverage)
: coverage_ {std::move(coverage)}
{}

SvCaller DragenCnvSupport::do_caller() const noexcept
{
    return SvCaller::dragen_cnv;
}

bool DragenCnvSupport::do_is_compatible(const VcfHeader& header) const
{
    return has_source(header, "DRAGEN_CNV");
}

std::string DragenCnvSupport::do_version(const VcfReader& reader) const
{
    return find_structured_value(reader.fetch_header(), "DRAGENVersion", "Version").value_or("");
}

void DragenCnvSupport::do_build_sample_genotype(const VcfRecord& record, const unsigned,
                                                const SampleName& sample, SampleGenotype::Builder& result) const
{
    result.set_average_normalized_coverage(get_double(record, sample, "SM"));
    result.set_point_count(get_int(record, sample, "BC"));
    result.set_paired_end_variant_support(sum_ints(record, sample, "PE"));
    const auto coverage_itr = coverage_.find(sample);
    if (coverage_itr != std::cend(coverage_) && coverage_itr->second) {
        const auto summary = coverage_itr->second->fetch(record.mapped_region());
        if (summary.average_normalized_coverage) {
            result.set_average_normalized_coverage(summary.average_normalized_coverage);
        }
        result.set_average_mapping_quality(summary.average_mapping_quality);
    }
}

} // namespace varcanon
