// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#include "gatk_gcnv_support.hpp"

namespace varcanon {

namespace {

static const std::string commandLineTag {"GATKCommandLine"};
static const std::string postprocessTool {"PostprocessGermlineCNVCalls"};

} // namespace

SvCaller GatkGcnvSupport::do_caller() const noexcept
{
    return SvCaller::gatk_gcnv;
}

bool GatkGcnvSupport::do_is_compatible(const VcfHeader& header) const
{
    return header.has_structured_field(commandLineTag, postprocessTool);
}

std::string GatkGcnvSupport::do_version(const VcfReader& reader) const
{
    return reader.fetch_header().find(commandLineTag, postprocessTool, "Version").value_or("");
}

void GatkGcnvSupport::do_build_sample_genotype(const VcfRecord& record, const unsigned,
                                               const SampleName& sample, SampleGenotype::Builder& result) const
{
    result.set_copy_number(get_int(record, sample, "CN"));
    result.set_point_count(get_int(record, sample, "NP"));
    result.set_genotype_quality(get_double(record, sample, "QS"));
}

} // namespace varcanon
